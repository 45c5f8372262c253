#include "utils.h"

#include <thread>
#include <chrono>
#include <stdexcept>

namespace {

bool StartsWith(const std::string& str, const std::string& prefix) {
  return str.compare(0, prefix.size(), prefix) == 0;
}

} // namespace

InvokeResult FakeInvoker::Invoke(Language lang, const std::string& code, const std::string& input) {
  {
    std::lock_guard lck(mtx_);
    calls_.push_back({lang, code, input});
  }
  size_t pos = code.rfind('\n');
  std::string program = pos == std::string::npos ? code : code.substr(pos + 1);
  InvokeResult ret;
  if (program == "echo") {
    ret.output = input;
  } else if (program == "empty") {
    ret.output = "";
  } else if (program == "wrong") {
    ret.output = "wrong\n";
  } else if (program == "pad") {
    ret.output = " \t" + input + "\n\n";
  } else if (StartsWith(program, "print:")) {
    ret.output = program.substr(6);
  } else if (program == "crash") {
    ret.output = "partial";
    ret.error = "Segmentation fault";
  } else if (program == "throw") {
    throw std::runtime_error("invoker unavailable");
  } else if (StartsWith(program, "sleep:")) {
    std::this_thread::sleep_for(std::chrono::milliseconds(std::stol(program.substr(6))));
    ret.output = input;
  } else if (StartsWith(program, "slowcrash:")) {
    std::this_thread::sleep_for(std::chrono::milliseconds(std::stol(program.substr(10))));
    ret.output = "partial";
    ret.error = "Segmentation fault";
  } else if (StartsWith(program, "memory:")) {
    ret.output = input;
    ret.memory_kb = std::stol(program.substr(7));
  } else {
    ret.error = "unknown program: " + program;
  }
  return ret;
}

std::vector<FakeInvoker::Call> FakeInvoker::Calls() const {
  std::lock_guard lck(mtx_);
  return calls_;
}

size_t FakeInvoker::CallCount() const {
  std::lock_guard lck(mtx_);
  return calls_.size();
}

void RecordingReporter::Push_(std::string event) {
  std::lock_guard lck(mtx_);
  events_.push_back(std::move(event));
}

std::vector<std::string> RecordingReporter::Events() {
  std::lock_guard lck(mtx_);
  return events_;
}

LifecycleReporter RecordingReporter::GetReporter() {
  LifecycleReporter reporter;
  reporter.ReportCreated = [this](const Submission& sub) {
    EXPECT_EQ(sub.status, SubmissionStatus::PENDING);
    Push_("created");
  };
  reporter.ReportRunning = [this](const Submission& sub) {
    EXPECT_EQ(sub.status, SubmissionStatus::RUNNING);
    Push_("running");
  };
  reporter.ReportTestCaseResult = [this](const Submission& sub, const TestCaseResult& res, int position) {
    EXPECT_EQ(sub.status, SubmissionStatus::RUNNING);
    Push_("case:" + std::to_string(res.test_case_id) + ":" + std::to_string(position));
  };
  reporter.ReportFinished = [this](const Submission& sub) {
    Push_(std::string("finished:") + SubmissionStatusName(sub.status));
  };
  return reporter;
}

TestCaseResult MakeResult(int test_case_id, TestCaseStatus status, int64_t marks, int64_t max_marks,
                          bool is_hidden) {
  TestCaseResult ret;
  ret.test_case_id = test_case_id;
  ret.status = status;
  ret.marks_awarded = marks;
  ret.max_marks = max_marks;
  ret.is_hidden = is_hidden;
  ret.output = "out" + std::to_string(test_case_id);
  ret.error = status == TestCaseStatus::RUNTIME_ERROR ? "boom" : "";
  return ret;
}

Submission MakeSubmission(int contest_id, int question_id, int user_id, int64_t submitted_at,
                          int64_t marks_awarded, int64_t execution_time) {
  Submission sub;
  sub.contest_id = contest_id;
  sub.question_id = question_id;
  sub.user_id = user_id;
  sub.code = "echo";
  sub.lang = Language::CPP;
  sub.status = SubmissionStatus::COMPLETED;
  sub.submitted_at = submitted_at;
  sub.marks_awarded = marks_awarded;
  sub.execution_time = execution_time;
  return sub;
}
