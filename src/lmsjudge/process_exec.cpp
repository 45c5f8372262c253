#include "process_exec.h"

#include <fcntl.h>
#include <signal.h>
#include <unistd.h>
#include <sys/wait.h>
#include <sys/resource.h>
#include <cerrno>
#include <chrono>
#include <thread>
#include <cstring>

#include <fmt/ranges.h>
#include <spdlog/spdlog.h>
#include "utils.h"

namespace {

inline const char* PathOrNull(const std::string& path) {
  return path.empty() ? "/dev/null" : path.c_str();
}

// child side; report errno through the CLOEXEC pipe so the parent can tell
// exec failures apart from the program's own exit status
[[noreturn]] void ChildFail(int status_fd) {
  int err = errno;
  IGNORE_RETURN(write(status_fd, &err, sizeof(err)));
  _exit(127);
}

// child side; the child must not inherit descriptors of the server
void CloseFrom(int minfd) {
  if (close_range(minfd, ~0U, 0) == 0) return;
  struct rlimit nofile{};
  int max_fd = getrlimit(RLIMIT_NOFILE, &nofile) == 0 && nofile.rlim_cur != RLIM_INFINITY ?
      (int)nofile.rlim_cur : 65536;
  for (int fd = minfd; fd < max_fd; fd++) close(fd);
}

} // namespace

ExecResult ProcessExec(const ExecOptions& opt) {
  ExecResult ret;
  auto Fail = [&ret](const char* what) -> ExecResult {
    ret.error_no = errno;
    spdlog::warn("ProcessExec error: {} errno={} {}", what, errno, strerror(errno));
    return ret;
  };
  if (opt.command.empty()) {
    errno = EINVAL;
    return Fail("empty command");
  }

  // everything the child needs is prepared before fork
  std::vector<char*> argv;
  for (auto& i : opt.command) argv.push_back(const_cast<char*>(i.c_str()));
  argv.push_back(nullptr);
  const std::string workdir = opt.workdir.string();
  const std::string input = opt.input.string(), output = opt.output.string(), error = opt.error.string();
  struct rlimit fsize_limit{}, core_limit{};
  fsize_limit.rlim_cur = fsize_limit.rlim_max = opt.fsize > 0 ? (rlim_t)opt.fsize * 1024 : RLIM_INFINITY;

  int status_pipe[2];
  if (pipe2(status_pipe, O_CLOEXEC) < 0) return Fail("pipe");
  auto start = std::chrono::steady_clock::now();
  pid_t pid = fork();
  if (pid < 0) {
    close(status_pipe[0]);
    close(status_pipe[1]);
    return Fail("fork");
  }
  if (pid == 0) {
    close(status_pipe[0]);
    int status_fd = status_pipe[1];
    setpgid(0, 0);
    int fd_in = open(PathOrNull(input), O_RDONLY);
    int fd_out = open(PathOrNull(output), O_WRONLY | O_CREAT | O_TRUNC, 0644);
    int fd_err = !error.empty() && error == output ?
        fd_out : open(PathOrNull(error), O_WRONLY | O_CREAT | O_TRUNC, 0644);
    if (fd_in < 0 || fd_out < 0 || fd_err < 0) ChildFail(status_fd);
    if (dup2(fd_in, 0) < 0 || dup2(fd_out, 1) < 0 || dup2(fd_err, 2) < 0) ChildFail(status_fd);
    if (!workdir.empty() && chdir(workdir.c_str()) < 0) ChildFail(status_fd);
    if (setrlimit(RLIMIT_FSIZE, &fsize_limit) < 0 || setrlimit(RLIMIT_CORE, &core_limit) < 0) {
      ChildFail(status_fd);
    }
    // only stdio reaches the program; the CLOEXEC status pipe moves to fd 3
    if (status_fd != 3) {
      if (dup3(status_fd, 3, O_CLOEXEC) < 0) ChildFail(status_fd);
      status_fd = 3;
    }
    CloseFrom(4);
    execvp(argv[0], argv.data());
    ChildFail(status_fd);
  }
  close(status_pipe[1]);
  setpgid(pid, pid); // both sides set it to avoid racing with kill below
  spdlog::debug("ProcessExec pid={} workdir={} command={}", pid, workdir, fmt::format("{}", opt.command));

  int child_errno = 0;
  ssize_t len;
  while ((len = read(status_pipe[0], &child_errno, sizeof(child_errno))) < 0 && errno == EINTR);
  close(status_pipe[0]);
  bool exec_failed = len == (ssize_t)sizeof(child_errno);

  int status = 0;
  struct rusage rus{};
  auto deadline = start + std::chrono::milliseconds(opt.wall_time);
  while (true) {
    pid_t res = wait4(pid, &status, WNOHANG, &rus);
    if (res == pid) break;
    if (res < 0 && errno != EINTR) {
      kill(-pid, SIGKILL);
      return Fail("wait4");
    }
    if (opt.wall_time > 0 && !ret.timekill && std::chrono::steady_clock::now() >= deadline) {
      spdlog::info("ProcessExec pid={} exceeded wall time {}ms, killing", pid, opt.wall_time);
      kill(-pid, SIGKILL);
      ret.timekill = true;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }
  ret.real_time = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - start).count();
  if (exec_failed) {
    ret.error_no = child_errno;
    spdlog::warn("ProcessExec failed to start {}: {}", opt.command[0], strerror(child_errno));
    return ret;
  }
  ret.started = true;
  ret.max_rss = rus.ru_maxrss;
  if (WIFSIGNALED(status)) {
    ret.signal = WTERMSIG(status);
  } else {
    ret.exit_code = WEXITSTATUS(status);
  }
  spdlog::debug("ProcessExec finished: pid={} code={} signal={} timekill={} time={} rss={}",
                pid, ret.exit_code, ret.signal, ret.timekill, ret.real_time, ret.max_rss);
  return ret;
}
