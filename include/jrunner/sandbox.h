#ifndef INCLUDE_JRUNNER_SANDBOX_H_
#define INCLUDE_JRUNNER_SANDBOX_H_

#include <string>
#include <vector>
#include <cstdint>

class SandboxOptions {
 public:
  std::string boxdir;
  std::vector<std::string> command;
  bool preserve_env; // override envs
  std::vector<std::string> envs;
  // inside box (relative to boxdir but start with /)
  std::string workdir, input, output, error;
  std::vector<int> cpu_set;
  int uid, gid;
  long wall_time, cpu_time; // us
  long rss, vss; // KiB
  int proc_num;
  int file_num;
  long fsize; // KiB
  std::vector<std::string> dirs;

  SandboxOptions() :
      preserve_env(false),
      uid(65534), gid(65534),
      wall_time(0), cpu_time(0),
      rss(0), vss(0),
      proc_num(0),
      file_num(0),
      fsize(0) {}
  // throws nlohmann::json::exception on a malformed buffer
  explicit SandboxOptions(const std::vector<uint8_t>& serial);

  // drop bind mounts that do not exist (or are symlinks) on this host
  void FilterDirs();
  std::vector<uint8_t> Serialize() const;
};

// Resource usage is in real time; kTimeMultiplier is applied by the caller
struct SandboxResult {
  bool error; // sandbox could not be set up or its helper failed; error_no is errno
  int error_no;
  bool timekill; // wall or CPU time limit reached
  bool oomkill; // killed by the memory cgroup
  int si_code, status; // si_code, si_status as siginfo_t of the jailed process
  long wall_us, user_us, sys_us;
  long max_rss_kib, max_vss_kib;

  SandboxResult() :
      error(false), error_no(0), timekill(false), oomkill(false),
      si_code(0), status(0),
      wall_us(0), user_us(0), sys_us(0),
      max_rss_kib(0), max_vss_kib(0) {}

  static SandboxResult Error(int err) {
    SandboxResult ret;
    ret.error = true;
    ret.error_no = err;
    return ret;
  }
};

#endif  // INCLUDE_JRUNNER_SANDBOX_H_
