#include <lmsjudge/invoker.h>

#include <csignal>
#include <cstring>
#include <stdexcept>

#include <spdlog/spdlog.h>
#include "paths.h"
#include "utils.h"
#include "process_exec.h"

long kInvokeWallLimit = 10'000;
long kCompileWallLimit = 60'000;
long kMaxOutput = 64 * 1024; // 64M

namespace {

constexpr size_t kMaxMsgLen = 4000;

bool NeedsCompile(Language lang) {
  switch (lang) {
    case Language::C: [[fallthrough]];
    case Language::CPP: [[fallthrough]];
    case Language::JAVA: return true;
    case Language::PYTHON: [[fallthrough]];
    case Language::JAVASCRIPT: [[fallthrough]];
    case Language::UNSUPPORTED: return false;
  }
  __builtin_unreachable();
}

std::vector<std::string> CompileCommand(long id, Language lang) {
  std::string input = BoxSource(id, lang);
  std::string output = BoxProgram(id, lang);
  switch (lang) {
    case Language::C:
      return {"/usr/bin/env", "gcc", "-std=c11", "-O2", "-w", "-o", output, input, "-lm"};
    case Language::CPP:
      return {"/usr/bin/env", "g++", "-std=c++17", "-O2", "-w", "-o", output, input};
    case Language::JAVA:
      return {"/usr/bin/env", "javac", "-encoding", "UTF-8", "-d", BoxPath(id).string(), input};
    default: __builtin_unreachable();
  }
}

std::vector<std::string> ExecuteCommand(long id, Language lang) {
  std::string program = BoxProgram(id, lang);
  switch (lang) {
    case Language::C: [[fallthrough]];
    case Language::CPP: return {program};
    case Language::JAVA: return {"/usr/bin/env", "java", "-cp", BoxPath(id).string(), "Main"};
    case Language::PYTHON: return {"/usr/bin/env", "python3", "-u", program};
    case Language::JAVASCRIPT: return {"/usr/bin/env", "node", program};
    case Language::UNSUPPORTED: break;
  }
  __builtin_unreachable();
}

std::string ReadMessage(const fs::path& path) {
  bool truncated;
  std::string message = ReadFile(path, kMaxMsgLen, &truncated);
  if (truncated) {
    message += "\n[Error message truncated after " + std::to_string(kMaxMsgLen) + " bytes]";
  }
  return message;
}

// removes the box when the invocation returns or throws
class BoxGuard {
  fs::path path_;
 public:
  explicit BoxGuard(fs::path path) : path_(std::move(path)) {}
  ~BoxGuard() { RemoveAll(path_); }
  BoxGuard(const BoxGuard&) = delete;
  BoxGuard& operator=(const BoxGuard&) = delete;
};

} // namespace

InvokeResult ProcessInvoker::Invoke(Language lang, const std::string& code, const std::string& input) {
  InvokeResult ret;
  if (lang == Language::UNSUPPORTED) {
    ret.error = "Unsupported language";
    return ret;
  }
  long id = GetUniqueBoxId();
  if (!CreateDirs(BoxPath(id))) throw std::runtime_error("Failed to create box directory");
  BoxGuard guard(BoxPath(id));
  if (!WriteFile(BoxSource(id, lang), code) || !WriteFile(BoxInput(id), input)) {
    throw std::runtime_error("Failed to write box files");
  }

  if (NeedsCompile(lang)) {
    ExecOptions opt;
    opt.command = CompileCommand(id, lang);
    opt.workdir = BoxPath(id);
    opt.output = opt.error = BoxCompileMessage(id);
    opt.wall_time = kCompileWallLimit;
    opt.fsize = kMaxOutput;
    ExecResult res = ProcessExec(opt);
    if (!res.started) {
      throw std::runtime_error(std::string("Failed to start compiler: ") + strerror(res.error_no));
    }
    if (res.timekill || res.signal || res.exit_code != 0) {
      std::string message = ReadMessage(BoxCompileMessage(id));
      if (res.timekill) message += "\n[Compilation killed after " + std::to_string(kCompileWallLimit) + " ms]";
      spdlog::info("Compilation failed: box={} lang={} code={} signal={}",
                   id, LanguageName(lang), res.exit_code, res.signal);
      ret.error = message.empty() ? "Compilation failed" : message;
      return ret;
    }
    spdlog::debug("Compilation successful: box={} lang={}", id, LanguageName(lang));
  }

  ExecOptions opt;
  opt.command = ExecuteCommand(id, lang);
  opt.workdir = BoxPath(id);
  opt.input = BoxInput(id);
  opt.output = BoxOutput(id);
  opt.error = BoxError(id);
  opt.wall_time = kInvokeWallLimit;
  opt.fsize = kMaxOutput;
  ExecResult res = ProcessExec(opt);
  if (!res.started) {
    throw std::runtime_error(std::string("Failed to start program: ") + strerror(res.error_no));
  }
  ret.output = ReadFile(BoxOutput(id), (size_t)kMaxOutput * 1024);
  ret.memory_kb = res.max_rss;
  std::string stderr_message = ReadMessage(BoxError(id));
  if (res.timekill) {
    ret.error = "Execution killed after " + std::to_string(kInvokeWallLimit) + " ms";
  } else if (res.signal == SIGXFSZ) {
    ret.error = "Output limit exceeded";
  } else if (res.signal) {
    ret.error = stderr_message.empty() ?
        std::string("Killed by signal ") + strsignal(res.signal) : stderr_message;
  } else if (res.exit_code != 0) {
    ret.error = stderr_message.empty() ?
        "Exited with status " + std::to_string(res.exit_code) : stderr_message;
  }
  spdlog::debug("Execution finished: box={} lang={} code={} signal={} time={} rss={}",
                id, LanguageName(lang), res.exit_code, res.signal, res.real_time, res.max_rss);
  return ret;
}
