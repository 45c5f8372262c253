#ifndef INCLUDE_LMSJUDGE_SUBMISSION_H_
#define INCLUDE_LMSJUDGE_SUBMISSION_H_

#include <string>
#include <vector>
#include <cstdint>
#include <optional>

#include "contest.h"

#define ENUM_SUBMISSION_STATUS_ \
  X(PENDING, "pending") \
  X(RUNNING, "running") \
  /* terminal states */ \
  X(COMPLETED, "completed") \
  X(ERROR, "error")
enum class SubmissionStatus {
#define X(name, str) name,
  ENUM_SUBMISSION_STATUS_
#undef X
};

#define ENUM_TEST_CASE_STATUS_ \
  X(PASSED, "passed", "Passed") \
  X(FAILED, "failed", "Wrong Answer") \
  X(RUNTIME_ERROR, "runtime_error", "Runtime Error") \
  X(TIME_LIMIT_EXCEEDED, "time_limit_exceeded", "Time Limit Exceeded") \
  X(MEMORY_LIMIT_EXCEEDED, "memory_limit_exceeded", "Memory Limit Exceeded")
enum class TestCaseStatus {
#define X(name, str, desc) name,
  ENUM_TEST_CASE_STATUS_
#undef X
};

struct TestCaseResult {
  int test_case_id;
  TestCaseStatus status;
  int64_t execution_time; // ms
  int64_t memory_used; // KiB
  std::string output, error;
  int64_t marks_awarded, max_marks;
  bool is_hidden;

  TestCaseResult() :
      test_case_id(0), status(TestCaseStatus::FAILED),
      execution_time(0), memory_used(0),
      marks_awarded(0), max_marks(0), is_hidden(false) {}
};

class Submission {
 public:
  long id;
  int contest_id;
  int question_id;
  int user_id;
  std::string code;
  Language lang;
  SubmissionStatus status;
  int64_t submitted_at; // UNIX timestamp, microseconds

  // grading result; same order as the question's test cases
  std::vector<TestCaseResult> test_case_results;
  int64_t total_marks, marks_awarded;
  int score_percentage;
  int passed_test_cases, total_test_cases;
  int64_t execution_time; // ms, sum over test cases
  int64_t memory_used; // KiB, max over test cases
  std::string error_message; // set when status == ERROR

  Submission() :
      id(0), contest_id(0), question_id(0), user_id(0),
      lang(Language::UNSUPPORTED), status(SubmissionStatus::PENDING), submitted_at(0),
      total_marks(0), marks_awarded(0), score_percentage(0),
      passed_test_cases(0), total_test_cases(0),
      execution_time(0), memory_used(0) {}

  bool IsTerminal() const;
};

bool CanTransition(SubmissionStatus from, SubmissionStatus to);
// throw std::logic_error if the transition is not allowed; sub is untouched in that case
void Transition(Submission& sub, SubmissionStatus to);

// round(awarded / total * 100), 0 if total is 0
int ScorePercentage(int64_t marks_awarded, int64_t total_marks);

// Persistence of submission records. Implementations must be safe to call from
// multiple threads.
class SubmissionStore {
 public:
  virtual ~SubmissionStore() = default;

  // assign sub.id and store it; return the new id
  virtual long Create(Submission& sub) = 0;
  // replace the stored record (including results) with the same id
  virtual void Update(const Submission& sub) = 0;
  virtual std::optional<Submission> Get(long id) const = 0;
  virtual size_t CountAttempts(int contest_id, int question_id, int user_id) const = 0;
  // ordered by (submitted_at, id) ascending
  virtual std::vector<Submission> ListByContest(int contest_id) const = 0;
  // ordered by (submitted_at, id) descending; question_id filters if present
  virtual std::vector<Submission> ListByUser(
      int contest_id, int user_id, std::optional<int> question_id = std::nullopt) const = 0;
};

#endif  // INCLUDE_LMSJUDGE_SUBMISSION_H_
