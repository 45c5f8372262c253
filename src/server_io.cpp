#include "server_io.h"

#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

#include "http_utils.h"
#include <lmsjudge/utils.h>
#include <lmsjudge/serialize.h>

std::string kListenHost = "127.0.0.1";
int kListenPort = 8080;
size_t kServerThreads = 8;

namespace {

const char kAuthRequired[] = "Authentication required";
const char kAdminRequired[] = "Admin access required";

// Run a handler and turn its exceptions into error replies.
template <class Func>
void Handle(httplib::Response& res, Func&& func) {
  try {
    func();
  } catch (const SubmitError& err) {
    ReplyError(res, SubmitErrorCodeHttpStatus(err.code()), err.what());
  } catch (const nlohmann::json::exception& err) {
    spdlog::info("Malformed request body: {}", err.what());
    ReplyError(res, 400, SubmitErrorCodeDesc(SubmitErrorCode::INVALID_REQUEST));
  }
}

// run the handler only for an identified viewer
template <class Func>
httplib::Server::Handler Authenticated(Func&& func, bool privileged_only = false) {
  return [func = std::forward<Func>(func), privileged_only](const httplib::Request& req, httplib::Response& res) {
    auto viewer = ParseViewer(req);
    if (!viewer) return ReplyError(res, 401, kAuthRequired);
    if (privileged_only && !viewer->privileged) return ReplyError(res, 403, kAdminRequired);
    Handle(res, [&]() { func(req, res, *viewer); });
  };
}

template <class T>
std::optional<T> OptionalField(const nlohmann::json& body, const char* key) {
  if (!body.contains(key) || body[key].is_null()) return std::nullopt;
  return body[key].get<T>();
}

// a path id too large for T cannot name an existing record
template <class T>
T PathId(const httplib::Request& req, size_t idx, SubmitErrorCode not_found) {
  auto id = ParseId<T>(req.matches[idx].str());
  if (!id) throw SubmitError(not_found);
  return *id;
}

void PostSubmission(const httplib::Request& req, httplib::Response& res, const Viewer& viewer,
                    SubmissionManager& manager) {
  nlohmann::json body = nlohmann::json::parse(req.body);
  auto contest_id = OptionalField<int>(body, "contest_id");
  auto question_id = OptionalField<int>(body, "question_id");
  if (!contest_id || !question_id) throw SubmitError(SubmitErrorCode::INVALID_REQUEST);
  SubmitRequest sreq{
    .contest_id = *contest_id,
    .question_id = *question_id,
    .code = body.value("code", ""),
    .language = body.value("language", ""),
  };
  SubmitResponse sres = manager.Submit(sreq, viewer);
  nlohmann::json data = SubmitResponseJSON(sres);
  data["message"] = sres.status == SubmissionStatus::COMPLETED ?
      "Code submitted successfully" : "Code submitted but processing failed";
  ReplyJSON(res, 201, data);
}

void PostRun(const httplib::Request& req, httplib::Response& res, SubmissionManager& manager) {
  nlohmann::json body = nlohmann::json::parse(req.body);
  RunRequest rreq{
    .code = body.value("code", ""),
    .language = body.value("language", ""),
    .input = body.value("input", ""),
    .contest_id = OptionalField<int>(body, "contest_id"),
    .question_id = OptionalField<int>(body, "question_id"),
  };
  nlohmann::json data = RunResponseJSON(manager.Run(rreq));
  data["success"] = true;
  ReplyJSON(res, 200, data);
}

nlohmann::json SubmissionsJSON(const std::vector<Submission>& subs) {
  nlohmann::json ret = nlohmann::json::array();
  for (auto& i : subs) ret.push_back(SubmissionJSON(i));
  return ret;
}

} // namespace

void RegisterRoutes(httplib::Server& svr, SubmissionManager& manager, const LeaderboardAggregator& leaderboard) {
  svr.set_logger(LogRequest);
  svr.set_exception_handler([](const httplib::Request& req, httplib::Response& res, std::exception_ptr ep) {
    std::string message = "Internal server error";
    try {
      std::rethrow_exception(ep);
    } catch (const std::exception& err) {
      message = err.what();
    }
    spdlog::error("{} {} failed: {}", req.method, req.path, message);
    ReplyError(res, 500, message);
  });

  svr.Post("/submissions/run", [&manager](const httplib::Request& req, httplib::Response& res) {
    Handle(res, [&]() { PostRun(req, res, manager); });
  });
  svr.Post("/submissions", Authenticated(
      [&manager](const httplib::Request& req, httplib::Response& res, const Viewer& viewer) {
    PostSubmission(req, res, viewer, manager);
  }));
  svr.Get(R"(/submissions/(\d+))", Authenticated(
      [&manager](const httplib::Request& req, httplib::Response& res, const Viewer& viewer) {
    long id = PathId<long>(req, 1, SubmitErrorCode::SUBMISSION_NOT_FOUND);
    Submission sub = manager.GetSubmission(id, viewer);
    ReplyJSON(res, 200, nlohmann::json{{"submission", SubmissionJSON(sub)}});
  }));
  svr.Get(R"(/contests/(\d+)/submissions/user)", Authenticated(
      [&manager](const httplib::Request& req, httplib::Response& res, const Viewer& viewer) {
    auto subs = manager.ListUserSubmissions(
        PathId<int>(req, 1, SubmitErrorCode::CONTEST_NOT_FOUND), viewer);
    ReplyJSON(res, 200, nlohmann::json{{"submissions", SubmissionsJSON(subs)}});
  }));
  svr.Get(R"(/contests/(\d+)/questions/(\d+)/submissions/user)", Authenticated(
      [&manager](const httplib::Request& req, httplib::Response& res, const Viewer& viewer) {
    auto subs = manager.ListUserSubmissions(
        PathId<int>(req, 1, SubmitErrorCode::CONTEST_NOT_FOUND), viewer,
        PathId<int>(req, 2, SubmitErrorCode::QUESTION_NOT_FOUND));
    ReplyJSON(res, 200, nlohmann::json{{"submissions", SubmissionsJSON(subs)}});
  }));
  svr.Get(R"(/contests/(\d+)/submissions)", Authenticated(
      [&manager](const httplib::Request& req, httplib::Response& res, const Viewer&) {
    auto subs = manager.ListContestSubmissions(PathId<int>(req, 1, SubmitErrorCode::CONTEST_NOT_FOUND));
    ReplyJSON(res, 200, nlohmann::json{{"submissions", SubmissionsJSON(subs)}});
  }, true));
  svr.Get(R"(/contests/(\d+)/leaderboard)", Authenticated(
      [&leaderboard](const httplib::Request& req, httplib::Response& res, const Viewer&) {
    auto entries = leaderboard.BuildLeaderboard(PathId<int>(req, 1, SubmitErrorCode::CONTEST_NOT_FOUND));
    ReplyJSON(res, 200, nlohmann::json{{"leaderboard", LeaderboardJSON(entries)}});
  }, true));
  svr.Get(R"(/contests/(\d+)/participants)", Authenticated(
      [&leaderboard](const httplib::Request& req, httplib::Response& res, const Viewer&) {
    auto participants = leaderboard.Participants(PathId<int>(req, 1, SubmitErrorCode::CONTEST_NOT_FOUND));
    ReplyJSON(res, 200, nlohmann::json{{"participants", ParticipantsJSON(participants)}});
  }, true));
}

bool ServerWorkLoop(SubmissionManager& manager, const LeaderboardAggregator& leaderboard) {
  httplib::Server svr;
  size_t threads = kServerThreads;
  svr.new_task_queue = [threads] { return new httplib::ThreadPool(threads); };
  RegisterRoutes(svr, manager, leaderboard);
  spdlog::info("Listening on {}:{}", kListenHost, kListenPort);
  if (!svr.listen(kListenHost, kListenPort)) {
    spdlog::error("Unable to listen on {}:{}", kListenHost, kListenPort);
    return false;
  }
  return true;
}
