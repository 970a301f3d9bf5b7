#ifndef INCLUDE_JRUNNER_LIMITS_H_
#define INCLUDE_JRUNNER_LIMITS_H_

#include <cstdint>

struct Limits {
  int64_t cpu_time; // us
  int64_t wall_time; // us
  int64_t memory; // KiB
  int64_t output; // KiB
  int proc_num;

  Limits() : cpu_time(0), wall_time(0), memory(0), output(0), proc_num(0) {}
  Limits(int64_t cpu_time, int64_t wall_time, int64_t memory, int64_t output, int proc_num) :
      cpu_time(cpu_time), wall_time(wall_time), memory(memory), output(output), proc_num(proc_num) {}
};

// Service defaults; configured before the workers start, read-only afterwards
extern Limits kDefaultLimits;
extern Limits kDefaultCheckerLimits;
extern Limits kCompileLimits;

// false if any field is negative
bool IsValidLimits(const Limits&);

// Zero fields of requested are taken from defaults; never "unlimited".
// If only the CPU time is requested, the wall time is derived from it.
// CPU and wall time are clamped to kMaxCpuTime and kMaxWallTime,
// memory and output to kMaxRSS and kMaxOutput.
Limits ResolveLimits(const Limits& requested, const Limits& defaults);

#endif  // INCLUDE_JRUNNER_LIMITS_H_
