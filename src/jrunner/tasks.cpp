#include "tasks.h"

#include <spdlog/spdlog.h>
#include "paths.h"
#include "utils.h"
#include "toolchain.h"

namespace {

inline Language GetLang(const Submission& sub, CompileSubtask subtask) {
  switch (subtask) {
    case CompileSubtask::USERPROG: return sub.lang;
    case CompileSubtask::CHECKER: return sub.checker_lang;
  }
  __builtin_unreachable();
}

inline void SetSlot(const WorkerSlot& slot, SandboxOptions& opt) {
  if (slot.cpuid != -1) opt.cpu_set.push_back(slot.cpuid);
  opt.uid = opt.gid = slot.uid;
}

} // namespace

void ApplyLimits(const Limits& lim, SandboxOptions& opt) {
  opt.wall_time = lim.wall_time / kTimeMultiplier;
  opt.cpu_time = (lim.cpu_time + 50'000) / kTimeMultiplier; // a little bit of margin just in case
  if (opt.wall_time <= 0) opt.wall_time = 1; // avoid being regarded as no limit
  if (opt.cpu_time <= 0) opt.cpu_time = 1;
  // add some margin so we can determine whether it is MLE
  opt.rss = lim.memory + 1024;
  opt.proc_num = lim.proc_num;
  // one block past the ceiling, so output of exactly the ceiling is not truncated
  opt.fsize = lim.output + 1;
}

SandboxResult RunCompile(const Submission& sub, CompileSubtask subtask, const WorkerSlot& slot, RunHandle& handle) {
  long id = sub.submission_internal_id;
  spdlog::debug("Generating compile settings: id={} subid={}, subtask={}",
                id, sub.submission_id, CompileSubtaskName(subtask));
  Language lang = GetLang(sub, subtask);

  SandboxOptions opt;
  opt.boxdir = CompileBoxPath(id, subtask);
  opt.command = CompileCommand(lang, CompileBoxInput(-1, subtask, lang, true),
                               CompileBoxOutput(-1, subtask, lang, true));
  if (char* path = getenv("PATH")) opt.envs.push_back(std::string("PATH=") + path);
  opt.workdir = Workdir("/");
  opt.output = CompileBoxMessage(-1, subtask, true);
  opt.error = CompileBoxError(-1, subtask, true);
  SetSlot(slot, opt);
  ApplyLimits(ResolveLimits(kCompileLimits, kCompileLimits), opt);
  opt.dirs = CompileDirs();
  opt.FilterDirs();
  return Isolation().Run(opt, handle);
}

SandboxResult RunExecute(const Submission& sub, int td, const Limits& lim, const WorkerSlot& slot, RunHandle& handle) {
  long id = sub.submission_internal_id;
  spdlog::debug("Generating execute settings: id={} subid={}, td={}", id, sub.submission_id, td);

  SandboxOptions opt;
  opt.boxdir = ExecuteBoxPath(id, td);
  opt.command = ExecuteCommand(sub.lang, ExecuteBoxProgram(-1, -1, sub.lang, true));
  opt.workdir = Workdir("/");
  opt.input = ExecuteBoxInput(-1, -1, true);
  opt.output = ExecuteBoxOutput(-1, -1, true);
  opt.error = ExecuteBoxError(-1, -1, true);
  SetSlot(slot, opt);
  ApplyLimits(lim, opt);
  // Output file is accounted in cgroups, so we need to extend RSS limit
  // MLE check will still be done by the original limit
  opt.rss += opt.fsize;
  opt.dirs = ExecuteDirs();
  opt.FilterDirs();
  return Isolation().Run(opt, handle);
}

SandboxResult RunChecker(const Submission& sub, int td, const Limits& lim, const WorkerSlot& slot, RunHandle& handle) {
  long id = sub.submission_internal_id;
  spdlog::debug("Generating checker settings: id={} subid={}, td={}", id, sub.submission_id, td);

  SandboxOptions opt;
  opt.boxdir = CheckerBoxPath(id, td);
  opt.command = ExecuteCommand(sub.checker_lang, CheckerBoxProgram(-1, -1, sub.checker_lang, true));
  opt.command.insert(opt.command.end(), {
    CheckerBoxInput(-1, -1, true),
    CheckerBoxAnswer(-1, -1, true),
    CheckerBoxUserOutput(-1, -1, true),
  });
  opt.workdir = Workdir("/");
  opt.output = CheckerBoxOutput(-1, -1, true);
  opt.error = "/dev/null";
  SetSlot(slot, opt);
  ApplyLimits(lim, opt);
  opt.dirs = ExecuteDirs();
  opt.FilterDirs();
  return Isolation().Run(opt, handle);
}
