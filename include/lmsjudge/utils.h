#ifndef INCLUDE_LMSJUDGE_UTILS_H_
#define INCLUDE_LMSJUDGE_UTILS_H_

#include <string>
#include <charconv>
#include <optional>
#include <string_view>

#include "lifecycle.h"
#include "submission.h"
#include "dispatcher.h"

long GetUniqueBoxId();

const char* LanguageTag(Language);
// unknown tags map to Language::UNSUPPORTED
Language GetLanguage(const std::string&);
const char* LanguageName(Language); // logging

const char* SubmissionStatusName(SubmissionStatus);
SubmissionStatus GetSubmissionStatus(const std::string&);
const char* TestCaseStatusName(TestCaseStatus);
const char* TestCaseStatusDesc(TestCaseStatus);
TestCaseStatus GetTestCaseStatus(const std::string&);
const char* ExecutionStatusName(ExecutionStatus);

const char* SubmitErrorCodeName(SubmitErrorCode);
const char* SubmitErrorCodeDesc(SubmitErrorCode);
int SubmitErrorCodeHttpStatus(SubmitErrorCode);

// strip leading & trailing " \t\n\r\f\v"
std::string Trim(const std::string&);

// decimal id spanning the whole string; nullopt if malformed or out of range for T
template <class T>
std::optional<T> ParseId(std::string_view str) {
  T val{};
  auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), val);
  if (ec != std::errc() || ptr != str.data() + str.size()) return std::nullopt;
  return val;
}

#endif  // INCLUDE_LMSJUDGE_UTILS_H_
