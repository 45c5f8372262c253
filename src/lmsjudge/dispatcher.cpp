#include <lmsjudge/dispatcher.h>

#include <chrono>
#include <sstream>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include "utils.h"

const char kTimeLimitExceededMessage[] = "Time limit exceeded";
const char kUnsupportedLanguageMessage[] = "Unsupported language";

std::string PythonInputPreamble(const std::string& input) {
  nlohmann::json lines = nlohmann::json::array();
  std::istringstream stream(Trim(input));
  for (std::string line; std::getline(stream, line);) lines.push_back(line);
  if (lines.empty()) lines.push_back("");
  // JSON strings are valid Python literals; non-ASCII stays raw UTF-8 since
  // \u escapes of astral characters would decode to lone surrogates
  std::string literal = lines.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
  return "# Simulated input\n"
         "input_lines = " + literal + "\n"
         "input_index = 0\n"
         "\n"
         "def input(prompt=''):\n"
         "    global input_index\n"
         "    if input_index < len(input_lines):\n"
         "        line = input_lines[input_index]\n"
         "        input_index += 1\n"
         "        return line\n"
         "    return \"\"\n"
         "\n";
}

InvokeResult ExecutionDispatcher::InvokePython_(const std::string& code, const std::string& input) {
  if (invoker_.SupportsStdin(Language::PYTHON)) {
    return invoker_.Invoke(Language::PYTHON, code, input);
  }
  return invoker_.Invoke(Language::PYTHON, PythonInputPreamble(input) + code, input);
}

ExecutionOutcome ExecutionDispatcher::Execute(const std::string& code, Language lang,
                                              const std::string& input, int64_t time_limit_ms) {
  ExecutionOutcome ret;
  auto start = std::chrono::steady_clock::now();
  InvokeResult res;
  switch (lang) {
    case Language::C: [[fallthrough]];
    case Language::CPP: [[fallthrough]];
    case Language::JAVA: [[fallthrough]];
    case Language::JAVASCRIPT:
      res = invoker_.Invoke(lang, code, input);
      break;
    case Language::PYTHON:
      res = InvokePython_(code, input);
      break;
    case Language::UNSUPPORTED:
      ret.status = ExecutionStatus::ERROR;
      ret.error = kUnsupportedLanguageMessage;
      return ret;
  }
  ret.execution_time = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - start).count();
  ret.output = std::move(res.output);
  ret.memory_used = res.memory_kb.value_or(0);
  if (ret.execution_time > time_limit_ms) {
    ret.status = ExecutionStatus::TIMEOUT;
    ret.error = kTimeLimitExceededMessage;
  } else if (res.error) {
    ret.status = ExecutionStatus::ERROR;
    ret.error = std::move(*res.error);
  } else {
    ret.status = ExecutionStatus::SUCCESS;
  }
  spdlog::debug("Execute: lang={} status={} time={}ms mem={}KiB",
                LanguageName(lang), ExecutionStatusName(ret.status), ret.execution_time, ret.memory_used);
  return ret;
}
