#include <lmsjudge/lifecycle.h>

#include <chrono>
#include <algorithm>

#include <spdlog/spdlog.h>
#include <lmsjudge/grader.h>
#include "utils.h"

long kRunTimeLimit = 10'000;

SubmitError::SubmitError(SubmitErrorCode code) :
    std::runtime_error(SubmitErrorCodeDesc(code)), code_(code) {}

int64_t CurrentTimestamp() {
  return std::chrono::duration_cast<std::chrono::microseconds>(
      std::chrono::system_clock::now().time_since_epoch()).count();
}

std::vector<TestCaseResult> RedactResults(const std::vector<TestCaseResult>& results, const Viewer& viewer) {
  std::vector<TestCaseResult> ret = results;
  if (viewer.privileged) return ret;
  for (auto& i : ret) {
    if (!i.is_hidden) continue;
    i.output.clear();
    i.error.clear();
  }
  return ret;
}

Submission RedactSubmission(Submission&& sub, const Viewer& viewer) {
  if (!viewer.privileged) sub.test_case_results = RedactResults(sub.test_case_results, viewer);
  return std::move(sub);
}

SubmissionManager::SubmissionManager(const ContestSource& contests, SubmissionStore& store,
                                     ExecutionDispatcher& dispatcher, Clock clock) :
    contests_(contests), store_(store), dispatcher_(dispatcher),
    clock_(clock ? std::move(clock) : Clock(CurrentTimestamp)) {}

SubmissionManager::AttemptGuard::AttemptGuard(SubmissionManager& manager, const AttemptKey& key) :
    manager_(manager) {
  {
    std::lock_guard lck(manager_.attempt_global_lock_);
    it_ = manager_.attempt_locks_.try_emplace(key).first;
    it_->second.users++;
  }
  it_->second.mtx.lock();
}

SubmissionManager::AttemptGuard::~AttemptGuard() {
  it_->second.mtx.unlock();
  std::lock_guard lck(manager_.attempt_global_lock_);
  if (--it_->second.users == 0) manager_.attempt_locks_.erase(it_);
}

size_t SubmissionManager::AttemptLockCount() const {
  std::lock_guard lck(attempt_global_lock_);
  return attempt_locks_.size();
}

SubmitResponse SubmissionManager::Submit(const SubmitRequest& req, const Viewer& viewer) {
  if (req.code.empty() || req.language.empty()) throw SubmitError(SubmitErrorCode::INVALID_REQUEST);
  int64_t now = clock_();
  std::optional<Contest> contest = contests_.GetContest(req.contest_id);
  if (!contest) throw SubmitError(SubmitErrorCode::CONTEST_NOT_FOUND);
  if (!contest->IsAccessible(now)) throw SubmitError(SubmitErrorCode::CONTEST_NOT_ACCESSIBLE);
  const Question* question = contest->FindQuestion(req.question_id);
  if (!question) throw SubmitError(SubmitErrorCode::QUESTION_NOT_FOUND);
  if (!contest->HasStarted(now)) throw SubmitError(SubmitErrorCode::CONTEST_NOT_STARTED);
  Language lang = GetLanguage(req.language);
  if (!contest->AllowsLanguage(lang)) throw SubmitError(SubmitErrorCode::LANGUAGE_NOT_ALLOWED);

  Submission sub;
  sub.contest_id = contest->id;
  sub.question_id = question->id;
  sub.user_id = viewer.user_id;
  sub.code = req.code;
  sub.lang = lang;
  sub.status = SubmissionStatus::PENDING;
  sub.total_marks = question->total_marks();
  sub.total_test_cases = (int)question->test_cases().size();
  {
    AttemptGuard guard(*this, std::make_tuple(contest->id, question->id, viewer.user_id));
    size_t attempts = store_.CountAttempts(contest->id, question->id, viewer.user_id);
    if (attempts >= (size_t)std::max(contest->max_attempts, 0)) {
      spdlog::info("Submission rejected: user={} contest={} question={} attempts={}",
                   viewer.user_id, contest->id, question->id, attempts);
      throw SubmitError(SubmitErrorCode::ATTEMPTS_EXCEEDED);
    }
    sub.submitted_at = clock_();
    store_.Create(sub);
  }
  spdlog::info("Submission created: id={} user={} contest={} question={} lang={}",
               sub.id, sub.user_id, sub.contest_id, sub.question_id, LanguageName(lang));
  if (reporter_.ReportCreated) reporter_.ReportCreated(sub);

  // the created record is handed over so a store fault cannot strand it in PENDING
  Submission graded = Grader(dispatcher_, store_, reporter_).Grade(
      std::move(sub), *question, req.code, lang);
  SubmitResponse ret;
  ret.submission_id = graded.id;
  ret.status = graded.status;
  ret.marks_awarded = graded.marks_awarded;
  ret.total_marks = graded.total_marks;
  ret.score_percentage = graded.score_percentage;
  ret.execution_time = graded.execution_time;
  ret.submitted_at = graded.submitted_at;
  ret.error_message = graded.error_message;
  ret.test_case_results = RedactResults(graded.test_case_results, viewer);
  return ret;
}

RunResponse SubmissionManager::Run(const RunRequest& req) {
  if (req.code.empty() || req.language.empty()) throw SubmitError(SubmitErrorCode::INVALID_REQUEST);
  Language lang = GetLanguage(req.language);
  RunResponse ret;
  ret.total_visible = ret.passed_visible = 0;
  if (!req.contest_id || !req.question_id) {
    ret.result = dispatcher_.Execute(req.code, lang, req.input, kRunTimeLimit);
    spdlog::debug("Custom run: lang={} status={}", LanguageName(lang), ExecutionStatusName(ret.result->status));
    return ret;
  }

  std::optional<Contest> contest = contests_.GetContest(*req.contest_id);
  if (!contest) throw SubmitError(SubmitErrorCode::CONTEST_NOT_FOUND);
  const Question* question = contest->FindQuestion(*req.question_id);
  if (!question) throw SubmitError(SubmitErrorCode::QUESTION_NOT_FOUND);
  for (auto& test_case : question->test_cases()) {
    if (test_case.is_hidden) continue;
    RunCaseResult res;
    res.input = test_case.input;
    res.expected_output = test_case.expected_output;
    try {
      ExecutionOutcome outcome = dispatcher_.Execute(req.code, lang, test_case.input, question->time_limit);
      res.status = outcome.status;
      res.actual_output = std::move(outcome.output);
      res.error = std::move(outcome.error);
      res.execution_time = outcome.execution_time;
      res.is_correct = outcome.status == ExecutionStatus::SUCCESS &&
          OutputMatches(res.actual_output, test_case.expected_output);
    } catch (const std::exception& e) {
      spdlog::warn("Run of test case {} failed: {}", test_case.id, e.what());
      res.status = ExecutionStatus::ERROR;
      res.error = e.what();
      res.execution_time = 0;
      res.is_correct = false;
    }
    res.marks = res.is_correct ? test_case.marks : 0;
    ret.total_visible++;
    if (res.is_correct) ret.passed_visible++;
    ret.test_results.push_back(std::move(res));
  }
  return ret;
}

Submission SubmissionManager::GetSubmission(long id, const Viewer& viewer) const {
  std::optional<Submission> sub = store_.Get(id);
  if (!sub) throw SubmitError(SubmitErrorCode::SUBMISSION_NOT_FOUND);
  if (sub->user_id != viewer.user_id && !viewer.privileged) {
    throw SubmitError(SubmitErrorCode::ACCESS_DENIED);
  }
  return RedactSubmission(std::move(*sub), viewer);
}

std::vector<Submission> SubmissionManager::ListUserSubmissions(
    int contest_id, const Viewer& viewer, std::optional<int> question_id) const {
  std::vector<Submission> ret = store_.ListByUser(contest_id, viewer.user_id, question_id);
  for (auto& i : ret) i = RedactSubmission(std::move(i), viewer);
  return ret;
}

std::vector<Submission> SubmissionManager::ListContestSubmissions(int contest_id) const {
  if (!contests_.GetContest(contest_id)) throw SubmitError(SubmitErrorCode::CONTEST_NOT_FOUND);
  std::vector<Submission> ret = store_.ListByContest(contest_id);
  std::reverse(ret.begin(), ret.end());
  return ret;
}
