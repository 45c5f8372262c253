#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <lmsjudge/serialize.h>

#include "utils.h"

TEST(SerializeTest, Submission) {
  Submission sub = MakeSubmission(1, 10, 7, 1234, 30, 15);
  sub.id = 5;
  sub.total_marks = 40;
  sub.score_percentage = 75;
  sub.test_case_results = {MakeResult(3, TestCaseStatus::FAILED, 0, 10, true)};
  auto data = SubmissionJSON(sub);
  EXPECT_EQ(data["id"], 5);
  EXPECT_EQ(data["language"], "cpp");
  EXPECT_EQ(data["status"], "completed");
  EXPECT_EQ(data["submitted_at"], 1234);
  EXPECT_EQ(data["score_percentage"], 75);
  EXPECT_FALSE(data.contains("error_message"));
  ASSERT_EQ(data["test_case_results"].size(), 1);
  auto& res = data["test_case_results"][0];
  EXPECT_EQ(res["status"], "failed");
  EXPECT_EQ(res["verdict"], "Wrong Answer");
  EXPECT_EQ(res["max_marks"], 10);
  EXPECT_EQ(res["is_hidden"], true);

  sub.status = SubmissionStatus::ERROR;
  sub.error_message = "disk full";
  EXPECT_EQ(SubmissionJSON(sub)["error_message"], "disk full");
}

TEST(SerializeTest, RunResponse) {
  RunResponse custom;
  custom.total_visible = custom.passed_visible = 0;
  custom.result = ExecutionOutcome();
  custom.result->status = ExecutionStatus::TIMEOUT;
  custom.result->error = "Time limit exceeded";
  auto data = RunResponseJSON(custom);
  EXPECT_EQ(data["result"]["status"], "timeout");
  EXPECT_FALSE(data.contains("test_results"));

  RunResponse visible;
  visible.total_visible = 1;
  visible.passed_visible = 1;
  visible.test_results.push_back(RunCaseResult{
    .input = "1", .expected_output = "1", .actual_output = "1\n",
    .status = ExecutionStatus::SUCCESS, .error = "", .execution_time = 3,
    .is_correct = true, .marks = 10,
  });
  data = RunResponseJSON(visible);
  EXPECT_EQ(data["total_visible"], 1);
  EXPECT_EQ(data["test_results"][0]["is_correct"], true);
  EXPECT_EQ(data["test_results"][0]["status"], "success");
}

TEST(SerializeTest, Leaderboard) {
  std::vector<LeaderboardEntry> entries{
    {.user_id = 3, .total_score = 50, .problems_solved = 2, .total_time = 9,
     .last_submission = 100, .max_possible_score = 60},
    {.user_id = 1, .total_score = 10, .problems_solved = 1, .total_time = 4,
     .last_submission = 90, .max_possible_score = 60},
  };
  auto data = LeaderboardJSON(entries);
  ASSERT_EQ(data.size(), 2);
  EXPECT_EQ(data[0]["rank"], 1);
  EXPECT_EQ(data[0]["user_id"], 3);
  EXPECT_EQ(data[1]["rank"], 2);
  EXPECT_EQ(data[1]["max_possible_score"], 60);
  auto participants = ParticipantsJSON({{.user_id = 4, .registered_at = 77}});
  EXPECT_EQ(participants[0]["registered_at"], 77);
}
