#ifndef INCLUDE_JRUNNER_ISOLATION_H_
#define INCLUDE_JRUNNER_ISOLATION_H_

#include <memory>
#include <mutex>
#include <sys/types.h>

#include <jrunner/sandbox.h>

// Links a running sandbox to whoever may cancel it.
// The process group registered here is killed on Cancel(); it is detached
// only after it has been reaped, so its pid cannot be reused in between.
class RunHandle {
  mutable std::mutex mtx_;
  pid_t pgid_;
  bool cancelled_;
 public:
  RunHandle() : pgid_(0), cancelled_(false) {}
  RunHandle(const RunHandle&) = delete;
  RunHandle& operator=(const RunHandle&) = delete;

  // return false (and kill the group) if already cancelled
  bool Attach(pid_t pgid);
  void Detach();
  void Cancel();
  bool IsCancelled() const;
};

// Everything the executor needs from the host OS to run one untrusted process tree.
class IsolationContext {
 public:
  virtual ~IsolationContext() = default;
  // Blocks until the process tree is gone; returns within wall_time + grace
  virtual SandboxResult Run(const SandboxOptions&, RunHandle&) = 0;
  // Kill anything still running as uid
  virtual void Sweep(int uid) = 0;
  virtual const char* Name() const = 0;
};

// Linux: cjail (namespaces, cgroups, rlimits) in a separate helper process
class CJailIsolation : public IsolationContext {
 public:
  SandboxResult Run(const SandboxOptions&, RunHandle&) override;
  void Sweep(int uid) override;
  const char* Name() const override { return "cjail"; }
};

// Extra time the runner waits for a sandbox after its wall time limit, us
extern long kCleanupGrace;

// Install before WorkLoop(); default is CJailIsolation
void SetIsolation(std::unique_ptr<IsolationContext>);
IsolationContext& Isolation();

#endif  // INCLUDE_JRUNNER_ISOLATION_H_
