#include <jrunner/verdict.h>

#include <signal.h>
#include <sys/wait.h>
#include <cstring>

#include <jrunner/utils.h>

namespace {

inline int64_t Scaled(long us) {
  return us * (long double)kTimeMultiplier;
}

} // namespace

Verdict ClassifyExecution(const SandboxResult& res, const Limits& lim, long output_bytes,
                          SubmissionResult::CaseResult& td_result) {
  td_result.time = Scaled(res.user_us + res.sys_us);
  td_result.wall = Scaled(res.wall_us);
  td_result.rss = res.max_rss_kib;
  bool signaled = res.si_code == CLD_KILLED || res.si_code == CLD_DUMPED;
  td_result.exit_code = signaled ? 0 : res.status;
  td_result.signal = signaled ? res.status : 0;
  if (res.error) {
    td_result.message = std::string("Sandbox error: ") + strerror(res.error_no);
    return Verdict::IE;
  }
  if (res.oomkill) return Verdict::MLE;
  if (res.timekill) return Verdict::TLE;
  if (signaled) {
    if (res.status == SIGXFSZ) return Verdict::OLE;
    // MLE will likely cause SIGSEGV or std::bad_alloc (SIGABRT), so we check it before RE
    if (td_result.rss > lim.memory) return Verdict::MLE;
    return Verdict::RE;
  }
  if (td_result.rss > lim.memory) return Verdict::MLE;
  if (res.status != 0) return Verdict::RE;
  if (td_result.time > lim.cpu_time) return Verdict::TLE;
  if (output_bytes > lim.output * 1024) return Verdict::OLE;
  return Verdict::NUL;
}

Verdict ClassifyChecker(const SandboxResult& res) {
  if (res.error || res.timekill || res.oomkill) return Verdict::IE;
  if (res.si_code != CLD_EXITED) return Verdict::IE;
  switch (res.status) {
    case 0: return Verdict::AC;
    case 1: return Verdict::WA;
    default: return Verdict::IE;
  }
}

Verdict AggregateVerdict(const std::vector<SubmissionResult::CaseResult>& results, size_t* position) {
  Verdict ret = Verdict::AC;
  size_t pos = results.size();
  for (size_t i = 0; i < results.size(); i++) {
    Verdict verdict = results[i].verdict;
    if (verdict == Verdict::NUL) continue;
    if (pos == results.size() || VerdictSeverity(verdict) > VerdictSeverity(ret)) {
      ret = verdict;
      pos = i;
    }
  }
  if (position) *position = pos;
  return ret;
}
