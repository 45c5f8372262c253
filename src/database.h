#ifndef DATABASE_H_
#define DATABASE_H_

#include <mutex>
#include <memory>
#include <filesystem>

#include <sqlite_orm/sqlite_orm.h>
#include <lmsjudge/submission.h>

// enums are stored by their string tags
struct SubmissionRow {
  long id;
  int contest_id;
  int question_id;
  int user_id;
  std::string code;
  std::string language;
  std::string status;
  int64_t submitted_at;
  int64_t total_marks;
  int64_t marks_awarded;
  int score_percentage;
  int passed_test_cases;
  int total_test_cases;
  int64_t execution_time;
  int64_t memory_used;
  std::string error_message;
};

struct TestCaseResultRow {
  long submission_id;
  int position;
  int test_case_id;
  std::string status;
  int64_t execution_time;
  int64_t memory_used;
  std::string output;
  std::string error;
  int64_t marks_awarded;
  int64_t max_marks;
  bool is_hidden;
};

namespace {

inline auto InitStorage(const std::string& path) {
  using namespace sqlite_orm;
  auto storage = make_storage(path,
      make_index("idx_submissions_contest_question_user",
                 &SubmissionRow::contest_id, &SubmissionRow::question_id, &SubmissionRow::user_id),
      make_table("submissions",
                 make_column("id", &SubmissionRow::id, primary_key()),
                 make_column("contest_id", &SubmissionRow::contest_id),
                 make_column("question_id", &SubmissionRow::question_id),
                 make_column("user_id", &SubmissionRow::user_id),
                 make_column("code", &SubmissionRow::code),
                 make_column("language", &SubmissionRow::language),
                 make_column("status", &SubmissionRow::status),
                 make_column("submitted_at", &SubmissionRow::submitted_at),
                 make_column("total_marks", &SubmissionRow::total_marks, default_value(0)),
                 make_column("marks_awarded", &SubmissionRow::marks_awarded, default_value(0)),
                 make_column("score_percentage", &SubmissionRow::score_percentage, default_value(0)),
                 make_column("passed_test_cases", &SubmissionRow::passed_test_cases, default_value(0)),
                 make_column("total_test_cases", &SubmissionRow::total_test_cases, default_value(0)),
                 make_column("execution_time", &SubmissionRow::execution_time, default_value(0)),
                 make_column("memory_used", &SubmissionRow::memory_used, default_value(0)),
                 make_column("error_message", &SubmissionRow::error_message, default_value(""))),
      make_table("test_case_results",
                 make_column("submission_id", &TestCaseResultRow::submission_id),
                 make_column("position", &TestCaseResultRow::position),
                 make_column("test_case_id", &TestCaseResultRow::test_case_id),
                 make_column("status", &TestCaseResultRow::status),
                 make_column("execution_time", &TestCaseResultRow::execution_time),
                 make_column("memory_used", &TestCaseResultRow::memory_used),
                 make_column("output", &TestCaseResultRow::output),
                 make_column("error", &TestCaseResultRow::error),
                 make_column("marks_awarded", &TestCaseResultRow::marks_awarded),
                 make_column("max_marks", &TestCaseResultRow::max_marks),
                 make_column("is_hidden", &TestCaseResultRow::is_hidden, default_value(false)),
                 primary_key(&TestCaseResultRow::submission_id, &TestCaseResultRow::position),
                 foreign_key(&TestCaseResultRow::submission_id).references(&SubmissionRow::id).on_delete.cascade()));
  storage.sync_schema(true);
  return storage;
}

} // namespace

// Submission store backed by an SQLite file. The database is opened lazily on
// first use.
class SqliteSubmissionStore : public SubmissionStore {
 public:
  using Storage = decltype(InitStorage(""));

 private:
  std::string path_;
  mutable std::mutex mtx_;
  mutable std::unique_ptr<Storage> db_;

  Storage& Init_() const;
  Submission Load_(const SubmissionRow& row) const;

 public:
  explicit SqliteSubmissionStore(const std::filesystem::path& path) : path_(path.string()) {}

  long Create(Submission& sub) override;
  void Update(const Submission& sub) override;
  std::optional<Submission> Get(long id) const override;
  size_t CountAttempts(int contest_id, int question_id, int user_id) const override;
  std::vector<Submission> ListByContest(int contest_id) const override;
  std::vector<Submission> ListByUser(
      int contest_id, int user_id, std::optional<int> question_id = std::nullopt) const override;
};

#endif  // DATABASE_H_
