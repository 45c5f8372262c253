#include <lmsjudge/grader.h>

#include <numeric>
#include <algorithm>
#include <stdexcept>

#include <spdlog/spdlog.h>
#include "utils.h"

GradeSummary GradeSummary::Add(TestCaseResult&& result) && {
  total_marks += result.max_marks;
  marks_awarded += result.marks_awarded;
  if (result.status == TestCaseStatus::PASSED) passed++;
  execution_time += result.execution_time;
  memory_used = std::max(memory_used, result.memory_used);
  results.push_back(std::move(result));
  return std::move(*this);
}

int GradeSummary::ScorePercentage() const {
  return ::ScorePercentage(marks_awarded, total_marks);
}

bool OutputMatches(const std::string& output, const std::string& expected) {
  return Trim(output) == Trim(expected);
}

TestCaseStatus ClassifyOutcome(const ExecutionOutcome& outcome, const std::string& expected) {
  switch (outcome.status) {
    case ExecutionStatus::SUCCESS:
      return OutputMatches(outcome.output, expected) ? TestCaseStatus::PASSED : TestCaseStatus::FAILED;
    case ExecutionStatus::TIMEOUT: return TestCaseStatus::TIME_LIMIT_EXCEEDED;
    case ExecutionStatus::ERROR: return TestCaseStatus::RUNTIME_ERROR;
  }
  __builtin_unreachable();
}

TestCaseResult GradeTestCase(ExecutionDispatcher& dispatcher, const Question& question,
                             const TestCase& test_case, const std::string& code, Language lang) {
  TestCaseResult ret;
  ret.test_case_id = test_case.id;
  ret.max_marks = test_case.marks;
  ret.is_hidden = test_case.is_hidden;
  try {
    ExecutionOutcome outcome = dispatcher.Execute(code, lang, test_case.input, question.time_limit);
    ret.status = ClassifyOutcome(outcome, test_case.expected_output);
    ret.execution_time = outcome.execution_time;
    ret.memory_used = outcome.memory_used;
    ret.output = std::move(outcome.output);
    ret.error = std::move(outcome.error);
  } catch (const std::exception& e) {
    spdlog::warn("Test case {} of question {} failed to execute: {}", test_case.id, question.id, e.what());
    ret.status = TestCaseStatus::RUNTIME_ERROR;
    ret.error = e.what();
  }
  ret.marks_awarded = ret.status == TestCaseStatus::PASSED ? test_case.marks : 0;
  return ret;
}

GradeSummary GradeTestCases(
    ExecutionDispatcher& dispatcher, const Question& question, const std::string& code, Language lang,
    const std::function<void(const TestCaseResult&, int position)>& on_result) {
  int position = 0;
  return std::accumulate(question.test_cases().begin(), question.test_cases().end(), GradeSummary(),
      [&](GradeSummary&& summary, const TestCase& test_case) {
        TestCaseResult result = GradeTestCase(dispatcher, question, test_case, code, lang);
        spdlog::debug("Test case {}: {} ({}ms)", test_case.id, TestCaseStatusName(result.status),
                      result.execution_time);
        if (on_result) on_result(result, position);
        position++;
        return std::move(summary).Add(std::move(result));
      });
}

void Grader::Fail_(Submission& sub, const std::string& message) {
  if (sub.IsTerminal()) {
    spdlog::warn("Submission {} is already {}: {}", sub.id, SubmissionStatusName(sub.status), message);
    return;
  }
  spdlog::warn("Submission {} failed: {}", sub.id, message);
  try {
    Transition(sub, SubmissionStatus::ERROR);
    sub.error_message = message;
    store_.Update(sub);
  } catch (const std::exception& e) {
    spdlog::error("Unable to record failure of submission {}: {}", sub.id, e.what());
    return;
  }
  if (reporter_.ReportFinished) reporter_.ReportFinished(sub);
}

void Grader::Grade(long submission_id, const Question& question, const std::string& code, Language lang) {
  std::optional<Submission> loaded;
  try {
    loaded = store_.Get(submission_id);
  } catch (const std::exception& e) {
    spdlog::error("Unable to load submission {}: {}", submission_id, e.what());
    return;
  }
  if (!loaded) {
    spdlog::warn("Submission {} not found, skipping grading", submission_id);
    return;
  }
  Grade(std::move(*loaded), question, code, lang);
}

Submission Grader::Grade(Submission sub, const Question& question, const std::string& code, Language lang) {
  try {
    Transition(sub, SubmissionStatus::RUNNING);
    store_.Update(sub);
    spdlog::info("Submission {} running: {} test cases", sub.id, question.test_cases().size());
    if (reporter_.ReportRunning) reporter_.ReportRunning(sub);

    GradeSummary summary = GradeTestCases(dispatcher_, question, code, lang,
        [&](const TestCaseResult& result, int position) {
          if (reporter_.ReportTestCaseResult) reporter_.ReportTestCaseResult(sub, result, position);
        });

    // sub stays RUNNING until the completed record is stored
    Submission done = sub;
    done.total_marks = summary.total_marks;
    done.marks_awarded = summary.marks_awarded;
    done.score_percentage = summary.ScorePercentage();
    done.passed_test_cases = summary.passed;
    done.total_test_cases = (int)summary.results.size();
    done.execution_time = summary.execution_time;
    done.memory_used = summary.memory_used;
    done.test_case_results = std::move(summary.results);
    Transition(done, SubmissionStatus::COMPLETED);
    store_.Update(done);
    sub = std::move(done);
  } catch (const std::exception& e) {
    Fail_(sub, e.what());
    return sub;
  }
  spdlog::info("Submission {} completed: {}/{} marks ({}%), {}/{} passed", sub.id,
               sub.marks_awarded, sub.total_marks, sub.score_percentage,
               sub.passed_test_cases, sub.total_test_cases);
  if (reporter_.ReportFinished) reporter_.ReportFinished(sub);
  return sub;
}
