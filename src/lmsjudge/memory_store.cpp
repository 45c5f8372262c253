#include <lmsjudge/memory_store.h>

#include <tuple>
#include <stdexcept>
#include <algorithm>

namespace {

inline bool SubmissionOrder(const Submission& a, const Submission& b) {
  return std::tie(a.submitted_at, a.id) < std::tie(b.submitted_at, b.id);
}

} // namespace

long MemorySubmissionStore::Create(Submission& sub) {
  std::lock_guard lck(mtx_);
  sub.id = next_id_++;
  submissions_.emplace(sub.id, sub);
  return sub.id;
}

void MemorySubmissionStore::Update(const Submission& sub) {
  std::lock_guard lck(mtx_);
  auto it = submissions_.find(sub.id);
  if (it == submissions_.end()) throw std::out_of_range("Submission " + std::to_string(sub.id) + " not found");
  it->second = sub;
}

std::optional<Submission> MemorySubmissionStore::Get(long id) const {
  std::lock_guard lck(mtx_);
  auto it = submissions_.find(id);
  if (it == submissions_.end()) return std::nullopt;
  return it->second;
}

size_t MemorySubmissionStore::CountAttempts(int contest_id, int question_id, int user_id) const {
  std::lock_guard lck(mtx_);
  return std::count_if(submissions_.begin(), submissions_.end(), [&](const auto& i) {
    return i.second.contest_id == contest_id && i.second.question_id == question_id &&
           i.second.user_id == user_id;
  });
}

std::vector<Submission> MemorySubmissionStore::ListByContest(int contest_id) const {
  std::vector<Submission> ret;
  {
    std::lock_guard lck(mtx_);
    for (auto& i : submissions_) {
      if (i.second.contest_id == contest_id) ret.push_back(i.second);
    }
  }
  std::sort(ret.begin(), ret.end(), SubmissionOrder);
  return ret;
}

std::vector<Submission> MemorySubmissionStore::ListByUser(
    int contest_id, int user_id, std::optional<int> question_id) const {
  std::vector<Submission> ret;
  {
    std::lock_guard lck(mtx_);
    for (auto& i : submissions_) {
      auto& sub = i.second;
      if (sub.contest_id != contest_id || sub.user_id != user_id) continue;
      if (question_id && sub.question_id != *question_id) continue;
      ret.push_back(sub);
    }
  }
  std::sort(ret.begin(), ret.end(), [](const Submission& a, const Submission& b) {
    return SubmissionOrder(b, a);
  });
  return ret;
}
