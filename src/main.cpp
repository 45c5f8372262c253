#include <fcntl.h>
#include <unistd.h>
#include <fstream>
#include <iostream>
#include <filesystem>

#include <tortellini.hh>
#include <spdlog/spdlog.h>
#include <argparse/argparse.hpp>
#include <lmsjudge/paths.h>
#include <lmsjudge/logger.h>
#include <lmsjudge/utils.h>
#include <lmsjudge/invoker.h>
#include <lmsjudge/catalog.h>
#include <lmsjudge/lifecycle.h>
#include <lmsjudge/dispatcher.h>
#include <lmsjudge/leaderboard.h>
#include "database.h"
#include "server_io.h"

namespace {

bool to_lock = true;
fs::path database_path = "/var/lib/lmsjudge/db.sqlite";
fs::path contests_file = "/etc/lmsjudge-contests.json";

bool ParseConfig(const fs::path& conf_path) {
  std::ifstream fin(conf_path);
  if (!fin) return false;
  tortellini::ini ini;
  fin >> ini;
  std::string box_root = ini[""]["box_root"] | "";
  std::string database = ini[""]["database"] | "";
  std::string contests = ini[""]["contests_file"] | "";
  if (box_root.size()) kBoxRoot = box_root;
  if (database.size()) database_path = database;
  if (contests.size()) contests_file = contests;
  kListenHost = ini[""]["host"] | kListenHost;
  kListenPort = ini[""]["port"] | kListenPort;
  kServerThreads = ini[""]["threads"] | kServerThreads;
  kInvokeWallLimit = ini[""]["invoke_wall_limit_ms"] | kInvokeWallLimit;
  kCompileWallLimit = ini[""]["compile_wall_limit_ms"] | kCompileWallLimit;
  kMaxOutput = ini[""]["max_output_kb"] | kMaxOutput;
  kRunTimeLimit = ini[""]["run_time_limit_ms"] | kRunTimeLimit;
  return true;
}

void ParseArgs(int argc, char** argv) {
  int verbosity = 0;
  argparse::ArgumentParser parser(argc ? argv[0] : "lmsjudge-server");
  parser.add_argument("-c", "--config")
    .required().default_value(std::string("/etc/lmsjudge.conf"))
    .help("Path of configuration file");
  parser.add_argument("-v", "--verbose")
    .action([&](const auto &) { ++verbosity; })
    .append().default_value(false).implicit_value(true).nargs(0)
    .help("Verbose level");
  parser.add_argument("-p", "--port")
    .scan<'d', int>()
    .help("Port to listen on");
  parser.add_argument("--no-lock")
    .default_value(false)
    .implicit_value(true)
    .help("Not check for other running instances");

  try {
    parser.parse_args(argc, argv);
  } catch (const std::runtime_error& err) {
    std::cerr << err.what() << std::endl;
    std::cerr << parser;
    exit(1);
  }

  switch (verbosity) {
    case 0: spdlog::set_level(spdlog::level::warn); break;
    case 1: spdlog::set_level(spdlog::level::info); break;
    default: spdlog::set_level(spdlog::level::debug); break;
  }
  fs::path config_file = parser.get<std::string>("--config");
  if (!ParseConfig(config_file)) {
    spdlog::error("Failed to parse configuration file {}", std::string(config_file));
    exit(1);
  }
  if (auto val = parser.present<int>("--port")) {
    kListenPort = val.value();
  }
  to_lock = parser["--no-lock"] == false;
}

bool LockFile() {
  fs::path lock_file = database_path;
  lock_file += ".lock";
  int fd = open(lock_file.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
  if (fd < 0) return false;
  struct flock lock{};
  lock.l_type = F_WRLCK;
  lock.l_whence = SEEK_SET;
  lock.l_start = lock.l_len = 0;
  if (fcntl(fd, F_SETLK, &lock) < 0) return false;
  return true;
}

LifecycleReporter ServerReporter() {
  LifecycleReporter reporter;
  reporter.ReportTestCaseResult = [](const Submission& sub, const TestCaseResult& res, int position) {
    spdlog::debug("Submission {} test case #{} (id {}): {}", sub.id, position, res.test_case_id,
                  TestCaseStatusDesc(res.status));
  };
  reporter.ReportFinished = [](const Submission& sub) {
    spdlog::info("Submission {} finished: status={} score={}%", sub.id,
                 SubmissionStatusName(sub.status), sub.score_percentage);
  };
  return reporter;
}

} // namespace

int main(int argc, char** argv) {
  spdlog::set_pattern("[%t] %+");
  InitLogger();
  ParseArgs(argc, argv);
  std::error_code ec;
  if (database_path.has_parent_path()) fs::create_directories(database_path.parent_path(), ec);
  if (ec) {
    spdlog::error("Unable to create database directory: {}", ec.message());
    return 1;
  }
  if (to_lock && !LockFile()) {
    spdlog::error("Another judge instance is running.");
    return 1;
  }

  ContestCatalog contests;
  if (!contests.LoadFile(contests_file)) {
    spdlog::error("Failed to load contests from {}", contests_file.string());
    return 1;
  }
  SqliteSubmissionStore store(database_path);
  ProcessInvoker invoker;
  ExecutionDispatcher dispatcher(invoker);
  SubmissionManager manager(contests, store, dispatcher);
  manager.SetReporter(ServerReporter());
  LeaderboardAggregator leaderboard(contests, store);
  return ServerWorkLoop(manager, leaderboard) ? 0 : 1;
}
