#ifndef CPUSET_H_
#define CPUSET_H_

#include <sched.h>
#include <cstddef>

// Parses a list of CPU ranges, util-linux style: "0,2-5,8-15:2".
// Use "all" for all CPUs, "none" for none of the CPUs.
// CPUs >= ncpu are ignored; return false on syntax errors
bool CpusetParse(const char *str, cpu_set_t *set, size_t ncpu);

#endif  // CPUSET_H_
