#ifndef INCLUDE_LMSJUDGE_LEADERBOARD_H_
#define INCLUDE_LMSJUDGE_LEADERBOARD_H_

#include <vector>
#include <cstdint>

#include "contest.h"
#include "submission.h"

struct LeaderboardEntry {
  int user_id;
  int64_t total_score; // sum of the best marks of each question
  int problems_solved; // questions with a positive best
  int64_t total_time; // ms, over every submission scanned
  int64_t last_submission; // UNIX timestamp, microseconds
  int64_t max_possible_score;
};

struct Participant {
  int user_id;
  int64_t registered_at; // first submission
};

// Fold submissions (in submission order) into standings, sorted by
// total_score desc, problems_solved desc, total_time asc, user_id asc.
std::vector<LeaderboardEntry> AggregateLeaderboard(
    const std::vector<Submission>& submissions, int64_t max_possible_score);

class LeaderboardAggregator {
  const ContestSource& contests_;
  const SubmissionStore& store_;
 public:
  LeaderboardAggregator(const ContestSource& contests, const SubmissionStore& store) :
      contests_(contests), store_(store) {}

  // both throw SubmitError(CONTEST_NOT_FOUND) if the contest does not exist
  std::vector<LeaderboardEntry> BuildLeaderboard(int contest_id) const;
  // users in order of their first submission
  std::vector<Participant> Participants(int contest_id) const;
};

#endif  // INCLUDE_LMSJUDGE_LEADERBOARD_H_
