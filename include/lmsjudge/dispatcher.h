#ifndef INCLUDE_LMSJUDGE_DISPATCHER_H_
#define INCLUDE_LMSJUDGE_DISPATCHER_H_

#include <string>
#include <cstdint>

#include "invoker.h"

#define ENUM_EXECUTION_STATUS_ \
  X(SUCCESS, "success") \
  X(ERROR, "error") \
  X(TIMEOUT, "timeout")
enum class ExecutionStatus {
#define X(name, str) name,
  ENUM_EXECUTION_STATUS_
#undef X
};

extern const char kTimeLimitExceededMessage[];
extern const char kUnsupportedLanguageMessage[];

struct ExecutionOutcome {
  ExecutionStatus status;
  std::string output, error;
  int64_t execution_time; // ms, wall clock
  int64_t memory_used; // KiB, 0 if not reported

  ExecutionOutcome() : status(ExecutionStatus::ERROR), execution_time(0), memory_used(0) {}
};

// Normalizes one invocation into an ExecutionOutcome. The time limit is checked
// after the invocation returns; a slow invocation is not cancelled, only
// reclassified as TIMEOUT.
class ExecutionDispatcher {
  RuntimeInvoker& invoker_;

  InvokeResult InvokePython_(const std::string& code, const std::string& input);
 public:
  explicit ExecutionDispatcher(RuntimeInvoker& invoker) : invoker_(invoker) {}

  // exceptions thrown by the invoker are propagated
  ExecutionOutcome Execute(const std::string& code, Language lang,
                           const std::string& input, int64_t time_limit_ms);
};

// Prepend a definition of input() that replays the given input line by line and
// returns "" once exhausted. Prints nothing.
std::string PythonInputPreamble(const std::string& input);

#endif  // INCLUDE_LMSJUDGE_DISPATCHER_H_
