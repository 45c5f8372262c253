#ifndef LMSJUDGE_PROCESS_EXEC_H_
#define LMSJUDGE_PROCESS_EXEC_H_

#include <string>
#include <vector>
#include <filesystem>

class ExecOptions {
 public:
  std::vector<std::string> command; // resolved through PATH
  std::filesystem::path workdir;
  // empty for /dev/null; error == output shares one descriptor
  std::filesystem::path input, output, error;
  long wall_time; // ms; the process group is killed after this
  long fsize; // KiB; 0 for unlimited

  ExecOptions() : wall_time(0), fsize(0) {}
};

struct ExecResult {
  bool started; // false if fork or exec failed; error_no is set
  int error_no;
  bool timekill;
  int exit_code; // valid if signal == 0
  int signal;
  long real_time; // ms
  long max_rss; // KiB

  ExecResult() :
      started(false), error_no(0), timekill(false),
      exit_code(0), signal(0), real_time(0), max_rss(0) {}
};

ExecResult ProcessExec(const ExecOptions&);

#endif  // LMSJUDGE_PROCESS_EXEC_H_
