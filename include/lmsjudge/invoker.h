#ifndef INCLUDE_LMSJUDGE_INVOKER_H_
#define INCLUDE_LMSJUDGE_INVOKER_H_

#include <string>
#include <cstdint>
#include <optional>

#include "contest.h"

// ms
extern long kInvokeWallLimit;
extern long kCompileWallLimit;
// KiB
extern long kMaxOutput;

struct InvokeResult {
  std::string output;
  std::optional<std::string> error; // set on compile or runtime failure
  std::optional<int64_t> memory_kb; // unset if not measured
};

// Runs code in some isolated environment. Invoke must not hang indefinitely and
// may throw on infrastructure failure.
class RuntimeInvoker {
 public:
  virtual ~RuntimeInvoker() = default;
  virtual InvokeResult Invoke(Language lang, const std::string& code, const std::string& input) = 0;
  // false if the invoker cannot feed input to the program's stdin
  virtual bool SupportsStdin(Language) const { return true; }
};

// Compiles and runs code as a child process inside a scratch directory under
// kBoxRoot. This is not a security boundary; only wall time and output size are
// limited.
class ProcessInvoker : public RuntimeInvoker {
 public:
  InvokeResult Invoke(Language lang, const std::string& code, const std::string& input) override;
};

#endif  // INCLUDE_LMSJUDGE_INVOKER_H_
