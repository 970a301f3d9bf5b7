#ifndef JRUNNER_TASKS_H_
#define JRUNNER_TASKS_H_

#include <jrunner/tasks.h>
#include <jrunner/isolation.h>
#include "submission.h"

// Resources owned by one worker thread
struct WorkerSlot {
  int index;
  int uid; // also used as gid
  int cpuid; // -1 if not pinned
};

// Fill the time, memory, process and file size limits of opt from resolved limits
// (kTimeMultiplier and margins applied)
void ApplyLimits(const Limits& lim, SandboxOptions& opt);

// Each blocks until the sandbox is gone; the box must be prepared by the caller
SandboxResult RunCompile(const Submission&, CompileSubtask, const WorkerSlot&, RunHandle&);
SandboxResult RunExecute(const Submission&, int td, const Limits& lim, const WorkerSlot&, RunHandle&);
SandboxResult RunChecker(const Submission&, int td, const Limits& lim, const WorkerSlot&, RunHandle&);

#endif // JRUNNER_TASKS_H_
