#include <lmsjudge/serialize.h>

#include <nlohmann/json.hpp>
#include "utils.h"

nlohmann::json TestCaseResultJSON(const TestCaseResult& res) {
  return nlohmann::json{
      {"test_case_id", res.test_case_id},
      {"status", TestCaseStatusName(res.status)},
      {"verdict", TestCaseStatusDesc(res.status)},
      {"execution_time", res.execution_time},
      {"memory_used", res.memory_used},
      {"output", res.output},
      {"error", res.error},
      {"marks_awarded", res.marks_awarded},
      {"max_marks", res.max_marks},
      {"is_hidden", res.is_hidden}};
}

nlohmann::json TestCaseResultsJSON(const std::vector<TestCaseResult>& results) {
  nlohmann::json ret = nlohmann::json::array();
  for (auto& i : results) ret.push_back(TestCaseResultJSON(i));
  return ret;
}

nlohmann::json SubmissionJSON(const Submission& sub) {
  nlohmann::json ret{
      {"id", sub.id},
      {"contest_id", sub.contest_id},
      {"question_id", sub.question_id},
      {"user_id", sub.user_id},
      {"code", sub.code},
      {"language", LanguageTag(sub.lang)},
      {"status", SubmissionStatusName(sub.status)},
      {"submitted_at", sub.submitted_at},
      {"test_case_results", TestCaseResultsJSON(sub.test_case_results)},
      {"total_marks", sub.total_marks},
      {"marks_awarded", sub.marks_awarded},
      {"score_percentage", sub.score_percentage},
      {"passed_test_cases", sub.passed_test_cases},
      {"total_test_cases", sub.total_test_cases},
      {"execution_time", sub.execution_time},
      {"memory_used", sub.memory_used}};
  if (!sub.error_message.empty()) ret["error_message"] = sub.error_message;
  return ret;
}

nlohmann::json SubmitResponseJSON(const SubmitResponse& res) {
  nlohmann::json ret{
      {"submission_id", res.submission_id},
      {"status", SubmissionStatusName(res.status)},
      {"marks_awarded", res.marks_awarded},
      {"total_marks", res.total_marks},
      {"score_percentage", res.score_percentage},
      {"execution_time", res.execution_time},
      {"submitted_at", res.submitted_at},
      {"test_case_results", TestCaseResultsJSON(res.test_case_results)}};
  if (!res.error_message.empty()) ret["error_message"] = res.error_message;
  return ret;
}

nlohmann::json RunResponseJSON(const RunResponse& res) {
  if (res.result) {
    return nlohmann::json{{"result", {
        {"status", ExecutionStatusName(res.result->status)},
        {"output", res.result->output},
        {"error", res.result->error},
        {"execution_time", res.result->execution_time}}}};
  }
  nlohmann::json results = nlohmann::json::array();
  for (auto& i : res.test_results) {
    results.push_back({
        {"input", i.input},
        {"expected_output", i.expected_output},
        {"actual_output", i.actual_output},
        {"status", ExecutionStatusName(i.status)},
        {"error", i.error},
        {"execution_time", i.execution_time},
        {"is_correct", i.is_correct},
        {"marks", i.marks}});
  }
  return nlohmann::json{
      {"test_results", std::move(results)},
      {"total_visible", res.total_visible},
      {"passed_visible", res.passed_visible}};
}

nlohmann::json LeaderboardJSON(const std::vector<LeaderboardEntry>& entries) {
  nlohmann::json ret = nlohmann::json::array();
  for (size_t i = 0; i < entries.size(); i++) {
    auto& entry = entries[i];
    ret.push_back({
        {"rank", i + 1},
        {"user_id", entry.user_id},
        {"total_score", entry.total_score},
        {"problems_solved", entry.problems_solved},
        {"total_time", entry.total_time},
        {"last_submission", entry.last_submission},
        {"max_possible_score", entry.max_possible_score}});
  }
  return ret;
}

nlohmann::json ParticipantsJSON(const std::vector<Participant>& participants) {
  nlohmann::json ret = nlohmann::json::array();
  for (auto& i : participants) {
    ret.push_back({{"user_id", i.user_id}, {"registered_at", i.registered_at}});
  }
  return ret;
}
