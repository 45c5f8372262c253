#include <fstream>
#include <stdexcept>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <lmsjudge/paths.h>
#include <lmsjudge/utils.h>
#include <lmsjudge/catalog.h>
#include <lmsjudge/contest.h>

TEST(QuestionTest, TotalMarksFollowsTestCases) {
  Question q;
  EXPECT_EQ(q.total_marks(), 0);
  q.SetTestCases({TestCase(1, "", "", 5), TestCase(2, "", "", 7)});
  EXPECT_EQ(q.total_marks(), 12);
  q.AddTestCase(TestCase(3, "", "", 30));
  EXPECT_EQ(q.total_marks(), 42);
  q.SetTestCases({TestCase(4, "", "", 1)});
  EXPECT_EQ(q.total_marks(), 1);
  q.ClearTestCases();
  EXPECT_EQ(q.total_marks(), 0);
  EXPECT_TRUE(q.test_cases().empty());
}

TEST(QuestionTest, RejectNegativeMarks) {
  Question q;
  q.SetTestCases({TestCase(1, "", "", 5)});
  EXPECT_THROW(q.SetTestCases({TestCase(2, "", "", 3), TestCase(3, "", "", -1)}), std::invalid_argument);
  EXPECT_THROW(q.AddTestCase(TestCase(4, "", "", -2)), std::invalid_argument);
  ASSERT_EQ(q.test_cases().size(), 1);
  EXPECT_EQ(q.test_cases()[0].id, 1);
  EXPECT_EQ(q.total_marks(), 5);
}

TEST(ContestTest, TimeWindow) {
  Contest contest;
  contest.start_time = 100;
  contest.end_time = 200;
  EXPECT_FALSE(contest.HasStarted(99));
  EXPECT_TRUE(contest.HasStarted(100));
  EXPECT_TRUE(contest.IsAccessible(199));
  EXPECT_FALSE(contest.IsAccessible(200));
  // not started yet still counts as accessible
  EXPECT_TRUE(contest.IsAccessible(50));
  contest.is_active = false;
  EXPECT_FALSE(contest.IsAccessible(150));
}

TEST(ContestTest, LanguagesAndScore) {
  Contest contest;
  EXPECT_TRUE(contest.AllowsLanguage(Language::C));
  EXPECT_TRUE(contest.AllowsLanguage(Language::PYTHON));
  EXPECT_FALSE(contest.AllowsLanguage(Language::JAVASCRIPT));
  EXPECT_FALSE(contest.AllowsLanguage(Language::UNSUPPORTED));
  contest.allowed_languages.insert(Language::UNSUPPORTED);
  EXPECT_FALSE(contest.AllowsLanguage(Language::UNSUPPORTED));

  Question q1, q2;
  q1.id = 1;
  q1.SetTestCases({TestCase(1, "", "", 40), TestCase(2, "", "", 60)});
  q2.id = 2;
  q2.SetTestCases({TestCase(3, "", "", 25)});
  contest.questions = {q1, q2};
  EXPECT_EQ(contest.MaxPossibleScore(), 125);
  ASSERT_NE(contest.FindQuestion(2), nullptr);
  EXPECT_EQ(contest.FindQuestion(2)->total_marks(), 25);
  EXPECT_EQ(contest.FindQuestion(3), nullptr);
}

TEST(UtilsTest, LanguageTags) {
  EXPECT_EQ(GetLanguage("c"), Language::C);
  EXPECT_EQ(GetLanguage("cpp"), Language::CPP);
  EXPECT_EQ(GetLanguage("java"), Language::JAVA);
  EXPECT_EQ(GetLanguage("python"), Language::PYTHON);
  EXPECT_EQ(GetLanguage("javascript"), Language::JAVASCRIPT);
  EXPECT_EQ(GetLanguage("rust"), Language::UNSUPPORTED);
  EXPECT_EQ(GetLanguage(""), Language::UNSUPPORTED);
  EXPECT_STREQ(LanguageTag(Language::CPP), "cpp");
}

TEST(UtilsTest, Trim) {
  EXPECT_EQ(Trim("  5\n"), "5");
  EXPECT_EQ(Trim("\t\r\f\v"), "");
  EXPECT_EQ(Trim("5  5"), "5  5");
  EXPECT_EQ(Trim(""), "");
}

TEST(UtilsTest, ParseId) {
  EXPECT_EQ(ParseId<int>("42"), 42);
  EXPECT_EQ(ParseId<long>("9000000000"), 9000000000L);
  // too large for the id type
  EXPECT_FALSE(ParseId<int>("99999999999999999999"));
  EXPECT_FALSE(ParseId<long>("99999999999999999999"));
  EXPECT_FALSE(ParseId<int>(""));
  EXPECT_FALSE(ParseId<int>("12a"));
  EXPECT_FALSE(ParseId<int>(" 1"));
}

namespace {

const char kCatalog[] = R"([
  {
    "id": 4,
    "name": "Weekly",
    "start_time": 1000,
    "end_time": 2000,
    "allowed_languages": ["python", "javascript"],
    "max_attempts": 2,
    "questions": [
      {
        "id": 1,
        "title": "A",
        "time_limit": 500,
        "test_cases": [
          {"id": 1, "input": "1", "expected_output": "2", "marks": 3},
          {"id": 2, "input": "2", "expected_output": "4", "marks": 7, "is_hidden": true}
        ]
      },
      {"id": 2, "test_cases": []}
    ]
  },
  {"id": 5, "start_time": 0, "end_time": 1, "is_active": false}
])";

} // namespace

TEST(CatalogTest, LoadArray) {
  ContestCatalog catalog;
  ASSERT_TRUE(catalog.Load(nlohmann::json::parse(kCatalog)));
  EXPECT_EQ(catalog.Size(), 2);
  auto contest = catalog.GetContest(4);
  ASSERT_TRUE(contest);
  EXPECT_EQ(contest->name, "Weekly");
  EXPECT_EQ(contest->max_attempts, 2);
  EXPECT_TRUE(contest->is_active);
  EXPECT_EQ(contest->allowed_languages, (std::set<Language>{Language::PYTHON, Language::JAVASCRIPT}));
  ASSERT_EQ(contest->questions.size(), 2);
  auto& q = contest->questions[0];
  EXPECT_EQ(q.time_limit, 500);
  EXPECT_EQ(q.memory_limit, 256);
  EXPECT_EQ(q.total_marks(), 10);
  EXPECT_TRUE(q.test_cases()[1].is_hidden);
  EXPECT_EQ(contest->questions[1].time_limit, 2000);
  EXPECT_EQ(contest->MaxPossibleScore(), 10);

  auto inactive = catalog.GetContest(5);
  ASSERT_TRUE(inactive);
  EXPECT_FALSE(inactive->is_active);
  EXPECT_EQ(inactive->max_attempts, 1);
  EXPECT_FALSE(catalog.GetContest(6));
}

TEST(CatalogTest, LoadObject) {
  ContestCatalog catalog;
  nlohmann::json data{{"contests", nlohmann::json::parse(kCatalog)}};
  ASSERT_TRUE(catalog.Load(data));
  EXPECT_EQ(catalog.Size(), 2);
}

TEST(CatalogTest, RejectMalformedAndKeepContents) {
  ContestCatalog catalog;
  ASSERT_TRUE(catalog.Load(nlohmann::json::parse(kCatalog)));
  // missing end_time
  EXPECT_FALSE(catalog.Load(nlohmann::json::parse(R"([{"id": 1, "start_time": 0}])")));
  // unknown language
  EXPECT_FALSE(catalog.Load(nlohmann::json::parse(
      R"([{"id": 1, "start_time": 0, "end_time": 1, "allowed_languages": ["cobol"]}])")));
  // negative marks
  EXPECT_FALSE(catalog.Load(nlohmann::json::parse(R"([{"id": 1, "start_time": 0, "end_time": 1,
      "questions": [{"id": 1, "test_cases": [{"id": 1, "expected_output": "", "marks": -1}]}]}])")));
  // duplicate id
  EXPECT_FALSE(catalog.Load(nlohmann::json::parse(
      R"([{"id": 1, "start_time": 0, "end_time": 1}, {"id": 1, "start_time": 0, "end_time": 1}])")));
  EXPECT_FALSE(catalog.Load(nlohmann::json::parse(R"({"contest": []})")));
  EXPECT_FALSE(catalog.Load(nlohmann::json::parse("42")));
  EXPECT_EQ(catalog.Size(), 2);
  EXPECT_TRUE(catalog.GetContest(4));
}

TEST(CatalogTest, LoadFile) {
  ContestCatalog catalog;
  fs::path path = fs::temp_directory_path() / "lmsjudge_catalog_test.json";
  {
    std::ofstream fout(path);
    fout << kCatalog;
  }
  EXPECT_TRUE(catalog.LoadFile(path));
  EXPECT_EQ(catalog.Size(), 2);
  {
    std::ofstream fout(path);
    fout << "[{";
  }
  EXPECT_FALSE(catalog.LoadFile(path));
  fs::remove(path);
  EXPECT_FALSE(catalog.LoadFile(path));
  EXPECT_EQ(catalog.Size(), 2);
}
