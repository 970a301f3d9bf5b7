#include <jrunner/limits.h>

#include <algorithm>

#include <jrunner/submission.h>

Limits kDefaultLimits(1'000'000, 0, 256 * 1024, 64 * 1024, 1);
Limits kDefaultCheckerLimits(5'000'000, 10'000'000, 1024 * 1024, 1024, 1);
Limits kCompileLimits(20'000'000, 30'000'000, 0, 0, 64); // memory & output: ceilings

namespace {

inline int64_t DeriveWallTime(int64_t cpu_time) {
  return std::max(cpu_time + cpu_time / 5, cpu_time + 1'000'000);
}

} // namespace

bool IsValidLimits(const Limits& lim) {
  return lim.cpu_time >= 0 && lim.wall_time >= 0 && lim.memory >= 0 &&
         lim.output >= 0 && lim.proc_num >= 0;
}

Limits ResolveLimits(const Limits& req, const Limits& defaults) {
  Limits ret;
  ret.cpu_time = req.cpu_time ? req.cpu_time : defaults.cpu_time;
  if (ret.cpu_time <= 0) ret.cpu_time = 1'000'000;
  if (ret.cpu_time > kMaxCpuTime) ret.cpu_time = kMaxCpuTime;
  if (req.wall_time) {
    ret.wall_time = req.wall_time;
  } else if (req.cpu_time || !defaults.wall_time) {
    ret.wall_time = DeriveWallTime(ret.cpu_time);
  } else {
    ret.wall_time = defaults.wall_time;
  }
  if (ret.wall_time > kMaxWallTime) ret.wall_time = kMaxWallTime;
  ret.memory = req.memory ? req.memory : defaults.memory;
  if (ret.memory <= 0 || ret.memory > kMaxRSS) ret.memory = kMaxRSS;
  ret.output = req.output ? req.output : defaults.output;
  if (ret.output <= 0 || ret.output > kMaxOutput) ret.output = kMaxOutput;
  ret.proc_num = req.proc_num ? req.proc_num : defaults.proc_num;
  if (ret.proc_num <= 0) ret.proc_num = 1;
  return ret;
}
