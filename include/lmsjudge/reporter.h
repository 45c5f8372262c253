#ifndef INCLUDE_LMSJUDGE_REPORTER_H_
#define INCLUDE_LMSJUDGE_REPORTER_H_

#include <functional>

class Submission;
struct TestCaseResult;

struct LifecycleReporter {
  // these functions should not block
  std::function<void(const Submission&)> ReportCreated;
  std::function<void(const Submission&)> ReportRunning;
  // called in test case order while the submission is still RUNNING
  std::function<void(const Submission&, const TestCaseResult&, int position)> ReportTestCaseResult;
  std::function<void(const Submission&)> ReportFinished; // COMPLETED or ERROR
};

#endif  // INCLUDE_LMSJUDGE_REPORTER_H_
