#include "http_utils.h"

#include <fmt/ranges.h>
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <lmsjudge/utils.h>

namespace {

const char kUserIdHeader[] = "X-User-Id";
const char kUserRoleHeader[] = "X-User-Role";

} // namespace

namespace http_utils {

std::string FormatOneParam(const char* str) {
  return str;
}
std::string FormatOneParam(const std::string& str) {
  return str;
}
std::string FormatOneParam(const httplib::Params& params) {
  return fmt::format("{}", params);
}
std::string FormatOneParam(const httplib::Headers& headers) {
  std::string ret;
  for (const char* name : {kUserIdHeader, kUserRoleHeader}) {
    auto it = headers.find(name);
    if (it != headers.end()) ret += fmt::format("{}={} ", name, it->second);
  }
  return ret.empty() ? "(anonymous)" : ret.substr(0, ret.size() - 1);
}

std::string FormatParam() {
  return "";
}

bool IsSuccess(int code) {
  return code >= 200 && code < 299;
}

} // namespace http_utils

void LogRequest(const httplib::Request& req, const httplib::Response& res) {
  std::string params = http_utils::FormatParam(req.params, req.headers);
  if (http_utils::IsSuccess(res.status)) {
    spdlog::debug("{} {} {} params {}", req.method, req.path, res.status, params);
  } else {
    spdlog::info("{} {} {} params {}", req.method, req.path, res.status, params);
  }
}

void ReplyJSON(httplib::Response& res, int status, const nlohmann::json& body) {
  res.status = status;
  res.set_content(body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace), "application/json");
}

void ReplyError(httplib::Response& res, int status, const std::string& message) {
  ReplyJSON(res, status, nlohmann::json{{"error", message}});
}

std::optional<Viewer> ParseViewer(const httplib::Request& req) {
  if (!req.has_header(kUserIdHeader)) return std::nullopt;
  auto user_id = ParseId<int>(req.get_header_value(kUserIdHeader));
  if (!user_id) return std::nullopt;
  std::string role = req.get_header_value(kUserRoleHeader);
  return Viewer{.user_id = *user_id, .privileged = role == "admin" || role == "instructor"};
}
