#include "database.h"

#include <stdexcept>

#include <spdlog/spdlog.h>
#include <lmsjudge/utils.h>

namespace {

SubmissionRow ToRow(const Submission& sub) {
  return SubmissionRow{
    .id = sub.id,
    .contest_id = sub.contest_id,
    .question_id = sub.question_id,
    .user_id = sub.user_id,
    .code = sub.code,
    .language = LanguageTag(sub.lang),
    .status = SubmissionStatusName(sub.status),
    .submitted_at = sub.submitted_at,
    .total_marks = sub.total_marks,
    .marks_awarded = sub.marks_awarded,
    .score_percentage = sub.score_percentage,
    .passed_test_cases = sub.passed_test_cases,
    .total_test_cases = sub.total_test_cases,
    .execution_time = sub.execution_time,
    .memory_used = sub.memory_used,
    .error_message = sub.error_message,
  };
}

std::vector<TestCaseResultRow> ToResultRows(const Submission& sub) {
  std::vector<TestCaseResultRow> ret;
  for (size_t i = 0; i < sub.test_case_results.size(); i++) {
    auto& res = sub.test_case_results[i];
    ret.push_back(TestCaseResultRow{
      .submission_id = sub.id,
      .position = (int)i,
      .test_case_id = res.test_case_id,
      .status = TestCaseStatusName(res.status),
      .execution_time = res.execution_time,
      .memory_used = res.memory_used,
      .output = res.output,
      .error = res.error,
      .marks_awarded = res.marks_awarded,
      .max_marks = res.max_marks,
      .is_hidden = res.is_hidden,
    });
  }
  return ret;
}

} // namespace

SqliteSubmissionStore::Storage& SqliteSubmissionStore::Init_() const {
  if (!db_) {
    spdlog::info("Opening submission database {}", path_);
    db_ = std::make_unique<Storage>(InitStorage(path_));
  }
  return *db_;
}

Submission SqliteSubmissionStore::Load_(const SubmissionRow& row) const {
  using namespace sqlite_orm;
  Submission sub;
  sub.id = row.id;
  sub.contest_id = row.contest_id;
  sub.question_id = row.question_id;
  sub.user_id = row.user_id;
  sub.code = row.code;
  sub.lang = GetLanguage(row.language);
  sub.status = GetSubmissionStatus(row.status);
  sub.submitted_at = row.submitted_at;
  sub.total_marks = row.total_marks;
  sub.marks_awarded = row.marks_awarded;
  sub.score_percentage = row.score_percentage;
  sub.passed_test_cases = row.passed_test_cases;
  sub.total_test_cases = row.total_test_cases;
  sub.execution_time = row.execution_time;
  sub.memory_used = row.memory_used;
  sub.error_message = row.error_message;
  for (auto& i : db_->iterate<TestCaseResultRow>(
           where(c(&TestCaseResultRow::submission_id) == row.id),
           order_by(&TestCaseResultRow::position))) {
    TestCaseResult res;
    res.test_case_id = i.test_case_id;
    res.status = GetTestCaseStatus(i.status);
    res.execution_time = i.execution_time;
    res.memory_used = i.memory_used;
    res.output = i.output;
    res.error = i.error;
    res.marks_awarded = i.marks_awarded;
    res.max_marks = i.max_marks;
    res.is_hidden = i.is_hidden;
    sub.test_case_results.push_back(std::move(res));
  }
  return sub;
}

long SqliteSubmissionStore::Create(Submission& sub) {
  std::lock_guard lck(mtx_);
  auto& db = Init_();
  db.transaction([&] {
    sub.id = db.insert(ToRow(sub));
    auto rows = ToResultRows(sub);
    if (!rows.empty()) db.replace_range(rows.begin(), rows.end());
    return true;
  });
  return sub.id;
}

void SqliteSubmissionStore::Update(const Submission& sub) {
  using namespace sqlite_orm;
  std::lock_guard lck(mtx_);
  auto& db = Init_();
  if (!db.count<SubmissionRow>(where(c(&SubmissionRow::id) == sub.id))) {
    throw std::out_of_range("Submission " + std::to_string(sub.id) + " not found");
  }
  db.transaction([&] {
    db.update(ToRow(sub));
    db.remove_all<TestCaseResultRow>(where(c(&TestCaseResultRow::submission_id) == sub.id));
    auto rows = ToResultRows(sub);
    if (!rows.empty()) db.replace_range(rows.begin(), rows.end());
    return true;
  });
}

std::optional<Submission> SqliteSubmissionStore::Get(long id) const {
  std::lock_guard lck(mtx_);
  auto row = Init_().get_pointer<SubmissionRow>(id);
  if (!row) return std::nullopt;
  return Load_(*row);
}

size_t SqliteSubmissionStore::CountAttempts(int contest_id, int question_id, int user_id) const {
  using namespace sqlite_orm;
  std::lock_guard lck(mtx_);
  return Init_().count<SubmissionRow>(where(
      c(&SubmissionRow::contest_id) == contest_id &&
      c(&SubmissionRow::question_id) == question_id &&
      c(&SubmissionRow::user_id) == user_id));
}

std::vector<Submission> SqliteSubmissionStore::ListByContest(int contest_id) const {
  using namespace sqlite_orm;
  std::lock_guard lck(mtx_);
  std::vector<Submission> ret;
  auto rows = Init_().get_all<SubmissionRow>(
      where(c(&SubmissionRow::contest_id) == contest_id),
      multi_order_by(order_by(&SubmissionRow::submitted_at), order_by(&SubmissionRow::id)));
  for (auto& i : rows) ret.push_back(Load_(i));
  return ret;
}

std::vector<Submission> SqliteSubmissionStore::ListByUser(
    int contest_id, int user_id, std::optional<int> question_id) const {
  using namespace sqlite_orm;
  std::lock_guard lck(mtx_);
  auto& db = Init_();
  auto order = multi_order_by(order_by(&SubmissionRow::submitted_at).desc(), order_by(&SubmissionRow::id).desc());
  std::vector<SubmissionRow> rows;
  if (question_id) {
    rows = db.get_all<SubmissionRow>(where(
        c(&SubmissionRow::contest_id) == contest_id &&
        c(&SubmissionRow::user_id) == user_id &&
        c(&SubmissionRow::question_id) == *question_id), order);
  } else {
    rows = db.get_all<SubmissionRow>(where(
        c(&SubmissionRow::contest_id) == contest_id &&
        c(&SubmissionRow::user_id) == user_id), order);
  }
  std::vector<Submission> ret;
  for (auto& i : rows) ret.push_back(Load_(i));
  return ret;
}
