#ifndef HTTP_UTILS_H_
#define HTTP_UTILS_H_

/// Log HTTP requests and build JSON replies

#include <string>
#include <optional>
#include <httplib.h>
#include <nlohmann/json_fwd.hpp>
#include <lmsjudge/lifecycle.h>

namespace http_utils {

std::string FormatOneParam(const char*);
std::string FormatOneParam(const std::string&);
std::string FormatOneParam(const httplib::Params&);
std::string FormatOneParam(const httplib::Headers&);
template <class T>
std::string FormatOneParam(const T&) { return "(unknown)"; }

std::string FormatParam();
template <class T, class... U>
std::string FormatParam(T&& head, U&&... tail) {
  return FormatOneParam(std::forward<T>(head)) + ' ' + FormatParam(std::forward<U>(tail)...);
}

bool IsSuccess(int code);

} // namespace http_utils

// server logger; successful requests at debug level, failures at info
void LogRequest(const httplib::Request& req, const httplib::Response& res);

void ReplyJSON(httplib::Response& res, int status, const nlohmann::json& body);
void ReplyError(httplib::Response& res, int status, const std::string& message);

// from X-User-Id and X-User-Role; nullopt if X-User-Id is missing or malformed
std::optional<Viewer> ParseViewer(const httplib::Request& req);

#endif  // HTTP_UTILS_H_
