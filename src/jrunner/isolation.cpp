#include <jrunner/isolation.h>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <unistd.h>
#include <sys/wait.h>
#include <chrono>
#include <cstring>

#include <fmt/ranges.h>
#include <spdlog/spdlog.h>
#include "paths.h"
#include "utils.h"

long kCleanupGrace = 3'000'000;

namespace {

std::unique_ptr<IsolationContext> isolation = std::make_unique<CJailIsolation>();

bool WriteAll(int fd, const void* buf, size_t sz) {
  for (size_t cur = 0; cur < sz;) {
    ssize_t ret = write(fd, (const char*)buf + cur, sz - cur);
    if (ret < 0) {
      if (errno == EINTR) continue;
      return false;
    }
    cur += ret;
  }
  return true;
}

// false on timeout or error; errno is 0 on timeout
bool WaitReadable(int fd, std::chrono::steady_clock::time_point deadline) {
  while (true) {
    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now()).count();
    if (remaining <= 0) {
      errno = 0;
      return false;
    }
    struct pollfd pfd = {.fd = fd, .events = POLLIN, .revents = 0};
    int ret = poll(&pfd, 1, remaining);
    if (ret > 0) return true;
    if (ret < 0 && errno != EINTR) return false;
  }
}

void KillGroup(pid_t pgid) {
  if (kill(-pgid, SIGKILL) < 0 && errno != ESRCH) {
    spdlog::warn("Failed killing process group {}: {}", pgid, strerror(errno));
  }
}

} // namespace

bool RunHandle::Attach(pid_t pgid) {
  std::lock_guard lck(mtx_);
  if (cancelled_) {
    KillGroup(pgid);
    return false;
  }
  pgid_ = pgid;
  return true;
}

void RunHandle::Detach() {
  std::lock_guard lck(mtx_);
  pgid_ = 0;
}

void RunHandle::Cancel() {
  std::lock_guard lck(mtx_);
  cancelled_ = true;
  if (pgid_ > 0) KillGroup(pgid_);
}

bool RunHandle::IsCancelled() const {
  std::lock_guard lck(mtx_);
  return cancelled_;
}

SandboxResult CJailIsolation::Run(const SandboxOptions& opt, RunHandle& handle) {
  const fs::path cmd = SandboxExecPath();
  const auto vec = opt.Serialize();
  const long size = vec.size();
  SandboxResult ret;
  int inpipe[2], outpipe[2];
  pid_t pid;
  if (pipe2(inpipe, O_CLOEXEC) < 0) return SandboxResult::Error(errno);
  if (pipe2(outpipe, O_CLOEXEC) < 0) {
    int err = errno;
    close(inpipe[0]);
    close(inpipe[1]);
    return SandboxResult::Error(err);
  }
  pid = fork();
  if (pid < 0) {
    int err = errno;
    for (int fd : {inpipe[0], inpipe[1], outpipe[0], outpipe[1]}) close(fd);
    return SandboxResult::Error(err);
  }
  if (pid == 0) {
    // only async-signal-safe calls here
    setpgid(0, 0);
    signal(SIGPIPE, SIG_DFL);
    dup2(outpipe[0], 0);
    dup2(inpipe[1], 1);
    CloseFrom(3);
    execl(cmd.c_str(), cmd.c_str(), nullptr);
    _exit(1);
  }
  setpgid(pid, pid); // the child does the same; either may win
  close(inpipe[1]);
  close(outpipe[0]);
  spdlog::debug("sandbox-exec pid={} uid={} boxdir={} command={}",
                pid, opt.uid, opt.boxdir, fmt::format("{}", opt.command));
  auto start = std::chrono::steady_clock::now();
  auto deadline = start + std::chrono::microseconds(opt.wall_time + kCleanupGrace);
  if (!handle.Attach(pid)) {
    ret = SandboxResult::Error(ECANCELED);
  } else if (!WriteAll(outpipe[1], &size, sizeof(size)) || !WriteAll(outpipe[1], vec.data(), vec.size())) {
    ret = SandboxResult::Error(errno);
    KillGroup(pid);
  } else if (!WaitReadable(inpipe[0], deadline)) {
    if (errno) {
      ret = SandboxResult::Error(errno);
    } else {
      // the sandbox did not come back in time; take down everything it started
      spdlog::warn("sandbox-exec pid={} exceeded wall time + grace, killing", pid);
      ret.timekill = true;
      ret.wall_us = std::chrono::duration_cast<std::chrono::microseconds>(
          std::chrono::steady_clock::now() - start).count();
    }
    KillGroup(pid);
  } else {
    ssize_t sz = read(inpipe[0], &ret, sizeof(ret));
    if (sz != sizeof(ret)) {
      // helper died before writing its result
      ret = SandboxResult::Error(sz < 0 ? errno : EPIPE);
    }
  }
  close(inpipe[0]);
  close(outpipe[1]);
  int status = 0;
  while (waitpid(pid, &status, 0) < 0 && errno == EINTR);
  handle.Detach();
  if (ret.error) {
    spdlog::warn("sandbox-exec error: errno={} {}", ret.error_no, strerror(ret.error_no));
  }
  return ret;
}

void CJailIsolation::Sweep(int uid) {
  pid_t pid = fork();
  if (pid < 0) {
    spdlog::warn("Failed sweeping uid {}: {}", uid, strerror(errno));
    return;
  }
  if (pid == 0) {
    // kill(-1) as uid reaches every process of uid but ourselves
    if (setresgid(uid, uid, uid) < 0 || setresuid(uid, uid, uid) < 0) _exit(1);
    kill(-1, SIGKILL);
    _exit(0);
  }
  int status = 0;
  while (waitpid(pid, &status, 0) < 0 && errno == EINTR);
  if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
    spdlog::warn("Failed sweeping uid {}", uid);
  } else {
    spdlog::debug("Swept uid {}", uid);
  }
}

void SetIsolation(std::unique_ptr<IsolationContext> ctx) {
  isolation = std::move(ctx);
}

IsolationContext& Isolation() {
  return *isolation;
}
