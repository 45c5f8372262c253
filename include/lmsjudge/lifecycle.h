#ifndef INCLUDE_LMSJUDGE_LIFECYCLE_H_
#define INCLUDE_LMSJUDGE_LIFECYCLE_H_

#include <map>
#include <mutex>
#include <tuple>
#include <string>
#include <vector>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <functional>

#include "contest.h"
#include "reporter.h"
#include "submission.h"
#include "dispatcher.h"

extern long kRunTimeLimit; // ms, for runs without a target question

#define ENUM_SUBMIT_ERROR_CODE_ \
  X(INVALID_REQUEST, 400, "All fields are required") \
  X(CONTEST_NOT_FOUND, 404, "Contest not found") \
  X(CONTEST_NOT_ACCESSIBLE, 403, "Contest is not accessible") \
  X(QUESTION_NOT_FOUND, 404, "Question not found") \
  X(CONTEST_NOT_STARTED, 403, "Contest has not started yet") \
  X(LANGUAGE_NOT_ALLOWED, 400, "Programming language not allowed for this contest") \
  X(ATTEMPTS_EXCEEDED, 403, "Maximum submission attempts reached") \
  X(SUBMISSION_NOT_FOUND, 404, "Submission not found") \
  X(ACCESS_DENIED, 403, "Access denied")
enum class SubmitErrorCode {
#define X(name, http, desc) name,
  ENUM_SUBMIT_ERROR_CODE_
#undef X
};

// Rejection of a request before any state change.
class SubmitError : public std::runtime_error {
  SubmitErrorCode code_;
 public:
  explicit SubmitError(SubmitErrorCode code);
  SubmitErrorCode code() const { return code_; }
};

struct Viewer {
  int user_id;
  bool privileged; // admin or instructor; may see hidden test case details
};

struct SubmitRequest {
  int contest_id;
  int question_id;
  std::string code;
  std::string language;
};

struct SubmitResponse {
  long submission_id;
  SubmissionStatus status;
  int64_t marks_awarded, total_marks;
  int score_percentage;
  int64_t execution_time;
  int64_t submitted_at;
  std::string error_message;
  std::vector<TestCaseResult> test_case_results; // redacted for the viewer
};

struct RunRequest {
  std::string code;
  std::string language;
  std::string input; // used only without a target question
  std::optional<int> contest_id, question_id;
};

struct RunCaseResult {
  std::string input, expected_output, actual_output;
  ExecutionStatus status;
  std::string error;
  int64_t execution_time;
  bool is_correct;
  int64_t marks;
};

struct RunResponse {
  // with a target question: one entry per visible test case
  std::vector<RunCaseResult> test_results;
  int total_visible, passed_visible;
  // without a target question
  std::optional<ExecutionOutcome> result;
};

// Empty output and error of hidden results unless the viewer is privileged.
std::vector<TestCaseResult> RedactResults(const std::vector<TestCaseResult>& results, const Viewer& viewer);
Submission RedactSubmission(Submission&& sub, const Viewer& viewer);

// Owns the submission state machine: validates a submit request, creates the
// PENDING record and grades it inline before returning.
class SubmissionManager {
 public:
  using Clock = std::function<int64_t()>; // UNIX timestamp, microseconds

 private:
  const ContestSource& contests_;
  SubmissionStore& store_;
  ExecutionDispatcher& dispatcher_;
  Clock clock_;
  LifecycleReporter reporter_;

  // serializes the attempt check & record creation of one (contest, question, user);
  // an entry lives only while some request holds or waits for it
  using AttemptKey = std::tuple<int, int, int>;
  struct AttemptLock {
    std::mutex mtx;
    int users = 0;
  };
  class AttemptGuard {
    SubmissionManager& manager_;
    std::map<AttemptKey, AttemptLock>::iterator it_;
   public:
    AttemptGuard(SubmissionManager& manager, const AttemptKey& key);
    ~AttemptGuard();
    AttemptGuard(const AttemptGuard&) = delete;
    AttemptGuard& operator=(const AttemptGuard&) = delete;
  };
  mutable std::mutex attempt_global_lock_;
  std::map<AttemptKey, AttemptLock> attempt_locks_;

 public:
  SubmissionManager(const ContestSource& contests, SubmissionStore& store,
                    ExecutionDispatcher& dispatcher, Clock clock = nullptr);

  void SetReporter(LifecycleReporter reporter) { reporter_ = std::move(reporter); }
  size_t AttemptLockCount() const;

  // throw SubmitError on validation failure
  SubmitResponse Submit(const SubmitRequest& req, const Viewer& viewer);
  RunResponse Run(const RunRequest& req);

  Submission GetSubmission(long id, const Viewer& viewer) const;
  // newest first, redacted for the owner
  std::vector<Submission> ListUserSubmissions(
      int contest_id, const Viewer& viewer, std::optional<int> question_id = std::nullopt) const;
  // every submission of the contest, newest first, unredacted; for privileged viewers
  std::vector<Submission> ListContestSubmissions(int contest_id) const;
};

int64_t CurrentTimestamp();

#endif  // INCLUDE_LMSJUDGE_LIFECYCLE_H_
