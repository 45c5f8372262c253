#include <lmsjudge/contest.h>

#include <numeric>
#include <stdexcept>

namespace {

void CheckMarks(const TestCase& test_case) {
  if (test_case.marks < 0) {
    throw std::invalid_argument("Test case " + std::to_string(test_case.id) + " has negative marks");
  }
}

} // namespace

void Question::RecomputeTotalMarks() {
  total_marks_ = std::accumulate(test_cases_.begin(), test_cases_.end(), (int64_t)0,
      [](int64_t sum, const TestCase& test_case) { return sum + test_case.marks; });
}

void Question::SetTestCases(std::vector<TestCase>&& test_cases) {
  for (auto& i : test_cases) CheckMarks(i);
  test_cases_ = std::move(test_cases);
  RecomputeTotalMarks();
}

void Question::AddTestCase(TestCase&& test_case) {
  CheckMarks(test_case);
  test_cases_.push_back(std::move(test_case));
  total_marks_ += test_cases_.back().marks;
}

void Question::ClearTestCases() {
  test_cases_.clear();
  total_marks_ = 0;
}

const Question* Contest::FindQuestion(int question_id) const {
  for (auto& i : questions) {
    if (i.id == question_id) return &i;
  }
  return nullptr;
}

bool Contest::IsAccessible(int64_t now) const {
  return is_active && now < end_time;
}

bool Contest::HasStarted(int64_t now) const {
  return now >= start_time;
}

bool Contest::AllowsLanguage(Language lang) const {
  return lang != Language::UNSUPPORTED && allowed_languages.count(lang);
}

int64_t Contest::MaxPossibleScore() const {
  int64_t ret = 0;
  for (auto& i : questions) ret += i.total_marks();
  return ret;
}
