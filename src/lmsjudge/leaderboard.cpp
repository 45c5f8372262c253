#include <lmsjudge/leaderboard.h>

#include <map>
#include <tuple>
#include <algorithm>
#include <unordered_map>
#include <unordered_set>

#include <spdlog/spdlog.h>
#include <lmsjudge/lifecycle.h>

namespace {

struct UserStanding {
  LeaderboardEntry entry;
  std::unordered_map<int, int64_t> best; // question -> best marks so far
};

} // namespace

std::vector<LeaderboardEntry> AggregateLeaderboard(
    const std::vector<Submission>& submissions, int64_t max_possible_score) {
  std::map<int, UserStanding> standings;
  for (auto& sub : submissions) {
    auto [it, inserted] = standings.try_emplace(sub.user_id);
    LeaderboardEntry& entry = it->second.entry;
    if (inserted) {
      entry = LeaderboardEntry{
        .user_id = sub.user_id,
        .total_score = 0,
        .problems_solved = 0,
        .total_time = 0,
        .last_submission = sub.submitted_at,
        .max_possible_score = max_possible_score,
      };
    }
    int64_t& best = it->second.best[sub.question_id];
    if (sub.marks_awarded > best) {
      if (best == 0) entry.problems_solved++;
      entry.total_score += sub.marks_awarded - best;
      best = sub.marks_awarded;
    }
    entry.total_time += sub.execution_time;
    entry.last_submission = std::max(entry.last_submission, sub.submitted_at);
  }

  std::vector<LeaderboardEntry> ret;
  ret.reserve(standings.size());
  for (auto& i : standings) ret.push_back(i.second.entry);
  std::sort(ret.begin(), ret.end(), [](const LeaderboardEntry& a, const LeaderboardEntry& b) {
    return std::make_tuple(-a.total_score, -a.problems_solved, a.total_time, a.user_id) <
           std::make_tuple(-b.total_score, -b.problems_solved, b.total_time, b.user_id);
  });
  return ret;
}

std::vector<LeaderboardEntry> LeaderboardAggregator::BuildLeaderboard(int contest_id) const {
  std::optional<Contest> contest = contests_.GetContest(contest_id);
  if (!contest) throw SubmitError(SubmitErrorCode::CONTEST_NOT_FOUND);
  std::vector<Submission> submissions = store_.ListByContest(contest_id);
  auto ret = AggregateLeaderboard(submissions, contest->MaxPossibleScore());
  spdlog::debug("Leaderboard of contest {}: {} submissions, {} users",
                contest_id, submissions.size(), ret.size());
  return ret;
}

std::vector<Participant> LeaderboardAggregator::Participants(int contest_id) const {
  if (!contests_.GetContest(contest_id)) throw SubmitError(SubmitErrorCode::CONTEST_NOT_FOUND);
  std::vector<Participant> ret;
  std::unordered_set<int> seen;
  for (auto& sub : store_.ListByContest(contest_id)) {
    if (seen.insert(sub.user_id).second) {
      ret.push_back(Participant{.user_id = sub.user_id, .registered_at = sub.submitted_at});
    }
  }
  return ret;
}
