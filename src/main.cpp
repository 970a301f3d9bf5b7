#include <fcntl.h>
#include <signal.h>
#include <unistd.h>
#include <sys/sysinfo.h>
#include <thread>
#include <sstream>
#include <fstream>
#include <iostream>
#include <filesystem>

#include <tortellini.hh>
#include <spdlog/spdlog.h>
#include <argparse/argparse.hpp>
#include <jrunner/utils.h>
#include <jrunner/paths.h>
#include <jrunner/logger.h>
#include <jrunner/limits.h>
#include <jrunner/toolchain.h>
#include <jrunner/submission.h>
#include "cpuset.h"
#include "server_io.h"

namespace {

bool to_lock = true;
std::vector<Language> disabled_languages;

bool SetPinnedCpus(const std::string& str) {
  if (!CpusetParse(str.c_str(), &kPinnedCpus, get_nprocs())) {
    spdlog::error("Invalid CPU list \"{}\"", str);
    return false;
  }
  return true;
}

bool ParseLanguageList(const std::string& str) {
  std::istringstream sin(str);
  std::string name;
  while (std::getline(sin, name, ',')) {
    if (name.empty()) continue;
    auto lang = GetLanguage(name);
    if (!lang) {
      spdlog::error("Unknown language \"{}\" in disabled_languages", name);
      return false;
    }
    disabled_languages.push_back(lang.value());
  }
  return true;
}

bool ParseConfig(const fs::path& conf_path) {
  std::ifstream fin(conf_path);
  if (!fin) return false;
  tortellini::ini ini;
  fin >> ini;
  std::string box_root = ini[""]["box_root"] | "";
  std::string submission_root = ini[""]["submission_root"] | "";
  std::string data_dir = ini[""]["data_dir"] | "";
  if (box_root.size()) kBoxRoot = box_root;
  if (submission_root.size()) kSubmissionRoot = submission_root;
  if (data_dir.size()) internal::kDataDir = data_dir;
  kMaxParallel = ini[""]["parallel"] | kMaxParallel;
  std::string pinned_cpus = ini[""]["pinned_cpus"] | "";
  if (pinned_cpus.size() && !SetPinnedCpus(pinned_cpus)) return false;
  kMaxRSS = (ini[""]["max_rss_per_task_mb"] | (kMaxRSS / 1024)) * 1024;
  kMaxOutput = (ini[""]["max_output_per_task_mb"] | (kMaxOutput / 1024)) * 1024;
  kMaxCpuTime = (ini[""]["max_cpu_time_per_task_ms"] | (kMaxCpuTime / 1000)) * 1000;
  kMaxWallTime = (ini[""]["max_wall_time_per_task_ms"] | (kMaxWallTime / 1000)) * 1000;
  kMaxBinarySize = (ini[""]["max_binary_size_mb"] | (kMaxBinarySize / 1024 / 1024)) * 1024 * 1024;
  kMaxQueue = ini[""]["max_queue"] | kMaxQueue;
  kTimeMultiplier = ini[""]["time_multiplier"] | kTimeMultiplier;
  kUidBase = ini[""]["uid_base"] | kUidBase;
  if (!ParseLanguageList(ini[""]["disabled_languages"] | "")) return false;

  kListenHost = ini[""]["listen_host"] | kListenHost;
  kListenPort = ini[""]["listen_port"] | kListenPort;
  kTlsCert = ini[""]["tls_cert"] | kTlsCert;
  kTlsKey = ini[""]["tls_key"] | kTlsKey;
  kTlsClientCa = ini[""]["tls_client_ca"] | kTlsClientCa;
  kRunnerKey = ini[""]["runner_key"] | kRunnerKey;
  kOrchestratorUrl = ini[""]["orchestrator_url"] | kOrchestratorUrl;
  kOrchestratorKey = ini[""]["orchestrator_key"] | kOrchestratorKey;
  kOrchestratorInsecure = ini[""]["orchestrator_insecure"] | kOrchestratorInsecure;
  kReportRetries = ini[""]["report_retries"] | kReportRetries;

  // default limits are given in ms / MiB / KiB
  kDefaultLimits.cpu_time = (ini[""]["default_cpu_time_ms"] | (kDefaultLimits.cpu_time / 1000)) * 1000;
  kDefaultLimits.wall_time = (ini[""]["default_wall_time_ms"] | (kDefaultLimits.wall_time / 1000)) * 1000;
  kDefaultLimits.memory = (ini[""]["default_memory_mb"] | (kDefaultLimits.memory / 1024)) * 1024;
  kDefaultLimits.output = ini[""]["default_output_kb"] | kDefaultLimits.output;
  kDefaultLimits.proc_num = ini[""]["default_processes"] | kDefaultLimits.proc_num;
  int64_t checker_time_ms = ini[""]["checker_time_ms"] | (kDefaultCheckerLimits.cpu_time / 1000);
  kDefaultCheckerLimits.cpu_time = checker_time_ms * 1000;
  kDefaultCheckerLimits.wall_time = checker_time_ms * 2000;
  return true;
}

bool CheckConfig() {
  if (kMaxParallel <= 0) {
    spdlog::error("parallel must be positive");
    return false;
  }
  if (kTimeMultiplier <= 0) {
    spdlog::error("time_multiplier must be positive");
    return false;
  }
  if (kReportRetries < 0) {
    spdlog::error("report_retries must not be negative");
    return false;
  }
  if (kRunnerKey.empty()) {
    spdlog::error("runner_key is required");
    return false;
  }
  if (kTlsCert.size() && kTlsKey.empty()) {
    spdlog::error("tls_key is required with tls_cert");
    return false;
  }
  if (kMaxCpuTime <= 0 || kMaxWallTime <= 0) {
    spdlog::error("max_cpu_time_per_task_ms and max_wall_time_per_task_ms must be positive");
    return false;
  }
  if (!IsValidLimits(kDefaultLimits) || !IsValidLimits(kDefaultCheckerLimits)) {
    spdlog::error("Default limits must not be negative");
    return false;
  }
  if (kOrchestratorUrl.empty()) {
    spdlog::warn("orchestrator_url is not set; results will only be stored locally");
  }
  return true;
}

void ParseArgs(int argc, char** argv) {
  int verbosity = 0;
  argparse::ArgumentParser parser(argc ? argv[0] : "jrunner");
  parser.add_argument("-c", "--config")
    .required().default_value(std::string("/etc/jrunner.conf"))
    .help("Path of configuration file");
  parser.add_argument("-v", "--verbose")
    .action([&](const auto &) { ++verbosity; })
    .append().default_value(false).implicit_value(true).nargs(0)
    .help("Verbose level");
  parser.add_argument("-p", "--parallel")
    .scan<'d', int>()
    .help("Number of worker slots");
  parser.add_argument("-m", "--time-multiplier")
    .scan<'g', double>()
    .help("Ratio of real time to indicated time");
  parser.add_argument("--port")
    .scan<'d', int>()
    .help("Port of the grading endpoint");
  parser.add_argument("--no-lock")
    .default_value(false)
    .implicit_value(true)
    .help("Not check for other running instances");
  parser.add_argument("--pinned-cpus")
    .default_value(std::string(""))
    .help("Comma-separated list of CPUs to pin or simply \"all\"");

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
  if (auto val = parser.present<int>("--parallel")) {
    kMaxParallel = val.value();
  }
  if (auto val = parser.present<double>("--time-multiplier")) {
    kTimeMultiplier = val.value();
  }
  if (auto val = parser.present<int>("--port")) {
    kListenPort = val.value();
  }
  to_lock = parser["--no-lock"] == false;
  if (auto pinned_cpus = parser.get<std::string>("--pinned-cpus"); pinned_cpus.size()) {
    if (!SetPinnedCpus(pinned_cpus)) exit(1);
  }
  if (!CheckConfig()) exit(1);
}

bool LockFile() {
  fs::path lock_file = internal::kDataDir / "lock";
  int fd = open(lock_file.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
  if (fd < 0) return false;
  struct flock lock{};
  lock.l_type = F_WRLCK;
  lock.l_whence = SEEK_SET;
  lock.l_start = lock.l_len = 0;
  if (fcntl(fd, F_SETLK, &lock) < 0) return false;
  return true;
}

} // namespace

int main(int argc, char** argv) {
  InitLogger();
  if (geteuid() != 0) {
    spdlog::error("Must be run as root.");
    return 1;
  }
  ParseArgs(argc, argv);
  if (to_lock && !LockFile()) {
    spdlog::error("Another runner instance is running.");
    return 1;
  }
  // a vanished peer must not kill the runner
  signal(SIGPIPE, SIG_IGN);
  InitToolchains(disabled_languages);
  auto svr = CreateServer();
  if (!svr) return 1;
  std::thread server_thread(ServerWorkLoop, std::move(svr));
  server_thread.detach();
  WorkLoop();
}
