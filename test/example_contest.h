#ifndef EXAMPLE_CONTEST_H_
#define EXAMPLE_CONTEST_H_

#include <gtest/gtest.h>
#include <lmsjudge/catalog.h>
#include <lmsjudge/lifecycle.h>
#include <lmsjudge/dispatcher.h>
#include <lmsjudge/memory_store.h>

#include "utils.h"

// Contest 1, open in [kStart, kEnd), max 3 attempts:
//   question 10: "1\n" (10 marks), "2\n" (20 marks), hidden "3\n" (70 marks); expected == input
//   question 20: "5\n" (5 marks), hidden "6\n" (5 marks)
// Contest 2 is inactive. Contest 3 starts at kEnd.
class ExampleContest : public ::testing::Test {
 protected:
  static constexpr int64_t kStart = 1'000'000;
  static constexpr int64_t kEnd = 9'000'000;

  void SetUp() override;

  SubmitRequest Request(int question_id, const std::string& code,
                        const std::string& language = "cpp", int contest_id = 1) const;

  ContestCatalog contests;
  MemorySubmissionStore store;
  FakeInvoker invoker;
  ExecutionDispatcher dispatcher{invoker};
  int64_t now = kStart + 1000;
  SubmissionManager manager{contests, store, dispatcher, [this]() { return now; }};
  const Viewer user{.user_id = 7, .privileged = false};
  const Viewer admin{.user_id = 1, .privileged = true};
};

#endif  // EXAMPLE_CONTEST_H_
