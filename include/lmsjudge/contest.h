#ifndef INCLUDE_LMSJUDGE_CONTEST_H_
#define INCLUDE_LMSJUDGE_CONTEST_H_

#include <set>
#include <string>
#include <vector>
#include <cstdint>
#include <optional>

#define ENUM_LANGUAGE_ \
  X(C, "c") \
  X(CPP, "cpp") \
  X(JAVA, "java") \
  X(PYTHON, "python") \
  X(JAVASCRIPT, "javascript") \
  X(UNSUPPORTED, "") // should be the last one
enum class Language {
#define X(name, tag) name,
  ENUM_LANGUAGE_
#undef X
};

struct TestCase {
  int id;
  std::string input, expected_output;
  int64_t marks;
  bool is_hidden;

  TestCase() : id(0), marks(0), is_hidden(false) {}
  TestCase(int id, std::string input, std::string expected_output, int64_t marks, bool is_hidden = false) :
      id(id), input(std::move(input)), expected_output(std::move(expected_output)),
      marks(marks), is_hidden(is_hidden) {}
};

class Question {
  std::vector<TestCase> test_cases_;
  int64_t total_marks_;

  void RecomputeTotalMarks();
 public:
  int id;
  std::string title;
  int64_t time_limit; // ms
  int64_t memory_limit; // MB; advisory, never enforced

  Question() : total_marks_(0), id(0), time_limit(2000), memory_limit(256) {}

  const std::vector<TestCase>& test_cases() const { return test_cases_; }
  // sum of all test case marks; always up to date with test_cases()
  int64_t total_marks() const { return total_marks_; }

  // throw std::invalid_argument on negative marks, leaving the question unchanged
  void SetTestCases(std::vector<TestCase>&&);
  void AddTestCase(TestCase&&);
  void ClearTestCases();
};

class Contest {
 public:
  int id;
  std::string name;
  std::vector<Question> questions;
  int64_t start_time, end_time; // UNIX timestamp, microseconds; window is [start, end)
  bool is_active;
  std::set<Language> allowed_languages;
  int max_attempts; // per (user, question)

  Contest() :
      id(0), start_time(0), end_time(0), is_active(true),
      allowed_languages{Language::C, Language::CPP, Language::JAVA, Language::PYTHON},
      max_attempts(1) {}

  const Question* FindQuestion(int question_id) const;
  bool IsAccessible(int64_t now) const; // active and not yet ended
  bool HasStarted(int64_t now) const;
  bool AllowsLanguage(Language lang) const;
  int64_t MaxPossibleScore() const;
};

// Read-only view of the contests known to the judge.
class ContestSource {
 public:
  virtual ~ContestSource() = default;
  virtual std::optional<Contest> GetContest(int contest_id) const = 0;
};

#endif  // INCLUDE_LMSJUDGE_CONTEST_H_
