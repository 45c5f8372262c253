#ifndef TEST_UTILS_H_
#define TEST_UTILS_H_

#include <mutex>
#include <string>
#include <vector>

#include <gtest/gtest.h>
#include <lmsjudge/utils.h>
#include <lmsjudge/invoker.h>
#include <lmsjudge/reporter.h>
#include <lmsjudge/submission.h>

// Deterministic invoker. The last line of the code selects the behavior:
//   echo        output the input
//   empty       output nothing
//   wrong       output "wrong"
//   pad         output the input surrounded by whitespace
//   print:TEXT  output TEXT
//   crash       report an error with partial output
//   throw       throw std::runtime_error
//   sleep:N     sleep N ms, then echo
//   slowcrash:N sleep N ms, then crash
//   memory:N    echo and report N KiB
class FakeInvoker : public RuntimeInvoker {
 public:
  struct Call {
    Language lang;
    std::string code, input;
  };

 private:
  mutable std::mutex mtx_;
  std::vector<Call> calls_;

 public:
  bool stdin_supported = true;

  InvokeResult Invoke(Language lang, const std::string& code, const std::string& input) override;
  bool SupportsStdin(Language) const override { return stdin_supported; }

  std::vector<Call> Calls() const;
  size_t CallCount() const;
};

class RecordingReporter {
  std::mutex mtx_;
  std::vector<std::string> events_;

  void Push_(std::string event);
 public:
  // "created", "running", "case:<test case id>:<position>", "finished:<status>"
  std::vector<std::string> Events();
  LifecycleReporter GetReporter();
};

TestCaseResult MakeResult(int test_case_id, TestCaseStatus status, int64_t marks, int64_t max_marks,
                          bool is_hidden = false);

Submission MakeSubmission(int contest_id, int question_id, int user_id, int64_t submitted_at,
                          int64_t marks_awarded, int64_t execution_time = 0);

#endif // TEST_UTILS_H_
