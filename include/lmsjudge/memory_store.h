#ifndef INCLUDE_LMSJUDGE_MEMORY_STORE_H_
#define INCLUDE_LMSJUDGE_MEMORY_STORE_H_

#include <map>
#include <mutex>

#include "submission.h"

// Submission store kept in process memory.
class MemorySubmissionStore : public SubmissionStore {
  mutable std::mutex mtx_;
  std::map<long, Submission> submissions_;
  long next_id_ = 1;
 public:
  long Create(Submission& sub) override;
  void Update(const Submission& sub) override;
  std::optional<Submission> Get(long id) const override;
  size_t CountAttempts(int contest_id, int question_id, int user_id) const override;
  std::vector<Submission> ListByContest(int contest_id) const override;
  std::vector<Submission> ListByUser(
      int contest_id, int user_id, std::optional<int> question_id = std::nullopt) const override;
};

#endif  // INCLUDE_LMSJUDGE_MEMORY_STORE_H_
