#ifndef INCLUDE_LMSJUDGE_GRADER_H_
#define INCLUDE_LMSJUDGE_GRADER_H_

#include <string>
#include <vector>
#include <functional>

#include "contest.h"
#include "reporter.h"
#include "submission.h"
#include "dispatcher.h"

// Accumulated result of grading a sequence of test cases.
struct GradeSummary {
  std::vector<TestCaseResult> results;
  int64_t total_marks, marks_awarded;
  int passed;
  int64_t execution_time; // ms
  int64_t memory_used; // KiB

  GradeSummary() : total_marks(0), marks_awarded(0), passed(0), execution_time(0), memory_used(0) {}

  GradeSummary Add(TestCaseResult&& result) &&;
  int ScorePercentage() const;
};

// trimmed (leading & trailing whitespace) comparison; internal whitespace is significant
bool OutputMatches(const std::string& output, const std::string& expected);

TestCaseStatus ClassifyOutcome(const ExecutionOutcome& outcome, const std::string& expected);

// Run one test case; an exception from the dispatcher is recorded as RUNTIME_ERROR.
TestCaseResult GradeTestCase(ExecutionDispatcher& dispatcher, const Question& question,
                             const TestCase& test_case, const std::string& code, Language lang);

// Fold all test cases of the question, in order, into a summary.
GradeSummary GradeTestCases(
    ExecutionDispatcher& dispatcher, const Question& question, const std::string& code, Language lang,
    const std::function<void(const TestCaseResult&, int position)>& on_result = nullptr);

class Grader {
  ExecutionDispatcher& dispatcher_;
  SubmissionStore& store_;
  const LifecycleReporter& reporter_;

  void Fail_(Submission& sub, const std::string& message);
 public:
  Grader(ExecutionDispatcher& dispatcher, SubmissionStore& store, const LifecycleReporter& reporter) :
      dispatcher_(dispatcher), store_(store), reporter_(reporter) {}

  // Grade the submission against every test case of the question and persist
  // the final state, which is also returned. Never throws for grading faults;
  // those end in ERROR.
  Submission Grade(Submission sub, const Question& question, const std::string& code, Language lang);
  // Load the submission first; a missing or unreadable record is logged and skipped.
  void Grade(long submission_id, const Question& question, const std::string& code, Language lang);
};

#endif  // INCLUDE_LMSJUDGE_GRADER_H_
