#include "utils.h"

#include <atomic>
#include <cerrno>
#include <cstring>
#include <fstream>

#include <spdlog/spdlog.h>

namespace {

std::atomic_long box_id_seq = 0;

} // namespace

long GetUniqueBoxId() {
  return ++box_id_seq;
}

#define ENUM_SWITCH_FUNCTION(DEF, typ, mac) \
  DEF(typ param) { \
    switch (param) { \
      mac \
    } \
    __builtin_unreachable(); \
  }
#define X_RETURN_ARG1(cls, x, ...) case cls::x: return #x;
#define X_RETURN_ARG2(cls, x, y, ...) case cls::x: return y;
#define X_RETURN_ARG3(cls, x, y, z, ...) case cls::x: return z;

#define X(...) X_RETURN_ARG1(Language, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* LanguageName, Language, ENUM_LANGUAGE_)
#undef X

#define X(...) X_RETURN_ARG2(SubmissionStatus, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* SubmissionStatusName, SubmissionStatus, ENUM_SUBMISSION_STATUS_)
#undef X

#define X(...) X_RETURN_ARG3(TestCaseStatus, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* TestCaseStatusDesc, TestCaseStatus, ENUM_TEST_CASE_STATUS_)
#undef X

#define X(...) X_RETURN_ARG2(ExecutionStatus, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* ExecutionStatusName, ExecutionStatus, ENUM_EXECUTION_STATUS_)
#undef X

#define X(...) X_RETURN_ARG1(SubmitErrorCode, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* SubmitErrorCodeName, SubmitErrorCode, ENUM_SUBMIT_ERROR_CODE_)
#undef X

#define X(...) X_RETURN_ARG3(SubmitErrorCode, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* SubmitErrorCodeDesc, SubmitErrorCode, ENUM_SUBMIT_ERROR_CODE_)
#undef X

#undef ENUM_SWITCH_FUNCTION
#undef X_RETURN_ARG1
#undef X_RETURN_ARG2
#undef X_RETURN_ARG3

static const char* kLanguageTagTable[] = {
#define X(name, tag) tag,
  ENUM_LANGUAGE_
#undef X
};

const char* LanguageTag(Language lang) {
  return kLanguageTagTable[(int)lang];
}

Language GetLanguage(const std::string& str) {
  for (int i = 0; i < (int)Language::UNSUPPORTED; i++) {
    if (str == kLanguageTagTable[i]) return (Language)i;
  }
  return Language::UNSUPPORTED;
}

SubmissionStatus GetSubmissionStatus(const std::string& str) {
#define X(name, s) if (str == s) return SubmissionStatus::name;
  ENUM_SUBMISSION_STATUS_
#undef X
  return SubmissionStatus::ERROR;
}

static const char* kTestCaseStatusTable[] = {
#define X(name, str, desc) str,
  ENUM_TEST_CASE_STATUS_
#undef X
};

const char* TestCaseStatusName(TestCaseStatus status) {
  return kTestCaseStatusTable[(int)status];
}

TestCaseStatus GetTestCaseStatus(const std::string& str) {
  for (size_t i = 0; i < sizeof(kTestCaseStatusTable) / sizeof(kTestCaseStatusTable[0]); i++) {
    if (str == kTestCaseStatusTable[i]) return (TestCaseStatus)i;
  }
  return TestCaseStatus::RUNTIME_ERROR;
}

int SubmitErrorCodeHttpStatus(SubmitErrorCode code) {
  switch (code) {
#define X(name, http, desc) case SubmitErrorCode::name: return http;
    ENUM_SUBMIT_ERROR_CODE_
#undef X
  }
  __builtin_unreachable();
}

std::string Trim(const std::string& str) {
  constexpr char kWhites[] = " \t\n\r\f\v";
  size_t begin = str.find_first_not_of(kWhites);
  if (begin == std::string::npos) return "";
  return str.substr(begin, str.find_last_not_of(kWhites) - begin + 1);
}

bool CreateDirs(const fs::path& path, fs::perms perms) {
  spdlog::debug("Create directories {}", path.c_str());
  std::error_code ec;
  fs::create_directories(path, ec);
  if (ec) goto err;
  if (perms == fs::perms::unknown) return true;
  fs::permissions(path, perms, ec);
  if (ec) goto err;
  return true;
err:
  spdlog::warn("Failed creating directory {}: {}", path.c_str(), ec.message());
  return false;
}

bool RemoveAll(const fs::path& path) {
  spdlog::debug("Delete {}", path.c_str());
  std::error_code ec;
  fs::remove_all(path, ec);
  if (ec) {
    spdlog::warn("Failed deleting {}: {}", path.c_str(), ec.message());
    return false;
  }
  return true;
}

bool WriteFile(const fs::path& path, const std::string& content) {
  std::ofstream fout(path, std::ios::binary);
  if (!fout || !fout.write(content.data(), content.size())) {
    spdlog::warn("Failed writing {}: {}", path.c_str(), strerror(errno));
    return false;
  }
  return true;
}

std::string ReadFile(const fs::path& path, size_t max_len, bool* truncated) {
  if (truncated) *truncated = false;
  std::error_code ec;
  if (!fs::is_regular_file(path, ec)) return "";
  size_t size = fs::file_size(path, ec);
  if (ec) return "";
  if (size > max_len) {
    if (truncated) *truncated = true;
    size = max_len;
  }
  std::ifstream fin(path, std::ios::binary);
  std::string ret(size, '\0');
  fin.read(ret.data(), size);
  ret.resize(fin.gcount());
  return ret;
}
