#include "submission.h"

#include <unistd.h>
#include <signal.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <sys/sysinfo.h>
#include <cmath>
#include <mutex>
#include <deque>
#include <cstring>
#include <regex>
#include <atomic>
#include <thread>
#include <algorithm>
#include <unordered_map>
#include <condition_variable>

#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <jrunner/compare.h>
#include <jrunner/verdict.h>
#include "tasks.h"
#include "utils.h"
#include "paths.h"
#include "toolchain.h"

int kMaxParallel = 1;
cpu_set_t kPinnedCpus = {};
long kMaxRSS = 2 * 1024 * 1024; // 2G
long kMaxOutput = 1 * 1024 * 1024; // 1G
long kMaxCpuTime = 60'000'000;
long kMaxWallTime = 120'000'000;
long kMaxSourceSize = 256 * 1024;
long kMaxBinarySize = 64 * 1024 * 1024;
double kTimeMultiplier = 1.0;
size_t kMaxQueue = 0;
int kUidBase = 50000;
int kFatalSandboxFailures = 5;

Job::Job(Submission&& sub_) :
    sub(std::move(sub_)), result(), state(JobQueued{}),
    limits(ResolveLimits(sub.limits, kDefaultLimits)),
    checker_limits(ResolveLimits(sub.checker_limits, kDefaultCheckerLimits)) {
  result.case_results.resize(sub.testcases.size());
}

void Job::Transit(JobEvent event) {
  auto nxt = NextState(state, event);
  if (!nxt) {
    spdlog::error("Illegal job transition: id={} state={} event={}",
                  sub.submission_internal_id, JobStateName(state), JobEventName(event));
    return;
  }
  spdlog::info("Job transition: id={} {} -> {}", sub.submission_internal_id,
               JobStateName(state), JobStateName(*nxt));
  state = std::move(*nxt);
}

namespace {

constexpr size_t kMaxMsgLen = 4000;
constexpr size_t kMaxReportOutput = 4096;
constexpr size_t kMaxReportError = 1024;
constexpr size_t kMaxCheckerOutput = 32768;
const char kCompileLimitMessage[] = "Compilation exceeded resource limits";

std::mutex job_mtx;
std::condition_variable job_cv;
std::deque<long> job_queue; // FIFO of internal ids
std::unordered_map<long, std::shared_ptr<Job>> job_list; // queued & running
std::unordered_map<std::string, long> submission_id_map; // submission id -> internal id
int busy_workers = 0;
std::atomic_bool draining = false;
std::atomic_int sandbox_failures = 0;

inline int64_t NormalizeScore(long double score) {
  if (!(score >= 0)) score = 0; // also NaN
  if (score > 1) score = 1;
  return std::llround(score * 1'000'000);
}

inline Language GetLang(const Submission& sub, CompileSubtask subtask) {
  switch (subtask) {
    case CompileSubtask::USERPROG: return sub.lang;
    case CompileSubtask::CHECKER: return sub.checker_lang;
  }
  __builtin_unreachable();
}

// Every sandbox run ends here: nothing of the slot uid may survive it
void AfterSandbox(const SandboxResult& res, const WorkerSlot& slot) {
  Isolation().Sweep(slot.uid);
  if (!res.error || res.error_no == ECANCELED) {
    sandbox_failures = 0;
    return;
  }
  int failures = ++sandbox_failures;
  spdlog::warn("Sandbox failure {} in a row on slot {}", failures, slot.index);
  if (failures >= kFatalSandboxFailures && !draining.exchange(true)) {
    spdlog::critical("{} consecutive sandbox failures; stop accepting submissions", failures);
  }
}

/// Compile
enum class CompileStatus { OK, FAILED, INTERNAL, CANCELLED };

std::string CompileMessage(long id, CompileSubtask subtask) {
  static const std::regex kFilterRegex(
      "(^|\\n)In file included from[\\S\\s]*?(\\n/workdir/(prog|checker)|$)");
  static const std::string kFilterReplace = "$1[Error messages from headers removed]$2";

  bool truncated_out = false, truncated_err = false;
  std::string message = ReadHead(CompileBoxMessage(id, subtask), kMaxMsgLen, &truncated_out);
  message += ReadHead(CompileBoxError(id, subtask), kMaxMsgLen, &truncated_err);
  bool truncated = truncated_out || truncated_err || message.size() > kMaxMsgLen;
  if (message.size() > kMaxMsgLen) message.resize(kMaxMsgLen);
  message = std::regex_replace(message, kFilterRegex, kFilterReplace);
  if (truncated) {
    message += "\n[Error message truncated after " + std::to_string(kMaxMsgLen) + " bytes]";
  }
  return message;
}

CompileStatus Compile(Job& job, CompileSubtask subtask, const WorkerSlot& slot) {
  const Submission& sub = job.sub;
  SubmissionResult& sub_res = job.result;
  long id = sub.submission_internal_id;
  Language lang = GetLang(sub, subtask);
  auto Fail = [&](std::string&& message) {
    spdlog::info("Compilation failed: id={} subtask={}", id, CompileSubtaskName(subtask));
    if (subtask == CompileSubtask::USERPROG) {
      sub_res.ce_message = std::move(message);
      return CompileStatus::FAILED;
    }
    sub_res.ie_message = "Checker compilation failed:\n" + message;
    return CompileStatus::INTERNAL;
  };

  if (!IsLanguageAvailable(lang)) {
    sub_res.ie_message = std::string("Language ") + LanguageName(lang) + " is not available";
    return CompileStatus::INTERNAL;
  }
  fs::path code = subtask == CompileSubtask::USERPROG ? SubmissionUserCode(id) : SubmissionCheckerCode(id);
  long code_size = FileSize(code);
  if (code_size < 0) {
    sub_res.ie_message = "Source code not found";
    return CompileStatus::INTERNAL;
  }
  if (lang == Language::BINARY) {
    if (code_size > kMaxBinarySize) {
      return Fail("Binary exceeds " + std::to_string(kMaxBinarySize) + " bytes");
    }
  } else if (code_size > kMaxSourceSize) {
    return Fail("Source code exceeds " + std::to_string(kMaxSourceSize) + " bytes");
  }
  if (!CreateDirs(Workdir(CompileBoxPath(id, subtask)), fs::perms::all)) {
    sub_res.ie_message = "Failed to prepare compilation";
    return CompileStatus::INTERNAL;
  }
  if (lang == Language::BINARY) {
    // precompiled artifact
    if (!Copy(code, CompileBoxOutput(id, subtask, lang), fs::perms::owner_all)) {
      sub_res.ie_message = "Failed to prepare compilation";
      return CompileStatus::INTERNAL;
    }
    return CompileStatus::OK;
  }
  if (!Copy(code, CompileBoxInput(id, subtask, lang), kPerm666)) {
    sub_res.ie_message = "Failed to prepare compilation";
    return CompileStatus::INTERNAL;
  }

  SandboxResult res = RunCompile(sub, subtask, slot, job.handle);
  AfterSandbox(res, slot);
  if (job.handle.IsCancelled()) return CompileStatus::CANCELLED;
  if (res.error) {
    sub_res.ie_message = std::string("Sandbox error during compilation: ") + strerror(res.error_no);
    return CompileStatus::INTERNAL;
  }
  if (res.timekill || res.oomkill) return Fail(kCompileLimitMessage);
  if (res.si_code != CLD_EXITED || res.status != 0 ||
      !fs::is_regular_file(CompileBoxOutput(id, subtask, lang))) {
    std::string message = CompileMessage(id, subtask);
    spdlog::debug("Message: {}", message);
    return Fail(std::move(message));
  }
  spdlog::info("Compilation successful: id={} subtask={}", id, CompileSubtaskName(subtask));
  return CompileStatus::OK;
}

/// Checker
void ReadCheckerOutput(const fs::path& output_path, SubmissionResult::CaseResult& td_result) {
  td_result.score = td_result.verdict == Verdict::AC ? 1'000'000 : 0;
  std::string output = ReadHead(output_path, kMaxCheckerOutput);
  if (output.empty()) return;
  try {
    auto json = nlohmann::json::parse(output);
    if (!json.is_object()) {
      td_result.message = std::move(output);
      return;
    }
    if (auto it = json.find("score"); it != json.end() && it->is_number()) {
      td_result.score = NormalizeScore(it->get<long double>());
    }
    if (auto it = json.find("message"); it != json.end() && it->is_string()) {
      td_result.message = it->get<std::string>();
    }
  } catch (nlohmann::json::exception&) {
    // plain text
    td_result.message = std::move(output);
  }
}

Verdict Check(Job& job, int td, const fs::path& user_output, const WorkerSlot& slot) {
  const Submission& sub = job.sub;
  auto& td_result = job.result.case_results[td];
  long id = sub.submission_internal_id;
  auto& testcase = sub.testcases[td];

  fs::path box = CheckerBoxPath(id, td);
  if (!CreateDirs(Workdir(fs::path(box)), fs::perms::all) ||
      !Copy(CompileBoxOutput(id, CompileSubtask::CHECKER, sub.checker_lang),
            CheckerBoxProgram(id, td, sub.checker_lang), ExecuteBoxProgramPerm(sub.checker_lang)) ||
      !Copy(testcase.input_file, CheckerBoxInput(id, td), kPerm666) ||
      !Copy(testcase.answer_file, CheckerBoxAnswer(id, td), kPerm666) ||
      !Move(user_output, CheckerBoxUserOutput(id, td), kPerm666)) {
    RemoveAll(box);
    td_result.message = "Failed to prepare checker";
    return Verdict::IE;
  }
  SandboxResult res = RunChecker(sub, td, job.checker_limits, slot, job.handle);
  AfterSandbox(res, slot);
  Verdict verdict = ClassifyChecker(res);
  td_result.verdict = verdict;
  if (verdict == Verdict::IE) {
    if (res.error) {
      td_result.message = std::string("Checker sandbox error: ") + strerror(res.error_no);
    } else if (res.timekill || res.oomkill) {
      td_result.message = "Checker exceeded resource limits";
    } else if (res.si_code != CLD_EXITED) {
      td_result.message = "Checker killed by signal " + std::to_string(res.status);
    } else {
      td_result.message = "Checker exited with code " + std::to_string(res.status);
    }
  } else {
    ReadCheckerOutput(CheckerBoxOutput(id, td), td_result);
  }
  spdlog::info("Checker finished: id={} td={} code={} status={} verdict={}",
               id, td, res.si_code, res.status, VerdictToAbr(verdict));
  RemoveAll(box);
  return verdict;
}

/// Execute
void RunCase(Job& job, int td, const WorkerSlot& slot) {
  const Submission& sub = job.sub;
  auto& td_result = job.result.case_results[td];
  auto& lim = job.limits;
  long id = sub.submission_internal_id;
  auto& testcase = sub.testcases[td];

  fs::path program = CompileBoxOutput(id, CompileSubtask::USERPROG, sub.lang);
  fs::path box = ExecuteBoxPath(id, td);
  fs::path workdir = Workdir(fs::path(box));
  long program_size = FileSize(program), input_size = FileSize(testcase.input_file);
  if (program_size < 0 || input_size < 0) {
    td_result.verdict = Verdict::IE;
    td_result.message = input_size < 0 ? "Input file not found" : "Program not found";
    return;
  }
  // stdout and stderr are both capped by the output limit
  long tmpfs_size_kib = (program_size / 4096 + 1) * 4 + (input_size / 4096 + 1) * 4 + lim.output * 2 + 64;
  if (!CreateDirs(workdir) || !MountTmpfs(workdir, tmpfs_size_kib)) {
    RemoveAll(box);
    td_result.verdict = Verdict::IE;
    td_result.message = "Failed to prepare sandbox";
    AfterSandbox(SandboxResult::Error(errno ? errno : EIO), slot);
    return;
  }
  std::error_code ec;
  fs::permissions(workdir, fs::perms::all, ec);
  if (ec || !Copy(program, ExecuteBoxProgram(id, td, sub.lang), ExecuteBoxProgramPerm(sub.lang)) ||
      !Copy(testcase.input_file, ExecuteBoxInput(id, td), kPerm666)) {
    Umount(workdir);
    RemoveAll(box);
    td_result.verdict = Verdict::IE;
    td_result.message = "Failed to prepare sandbox";
    return;
  }

  SandboxResult res = RunExecute(sub, td, lim, slot, job.handle);
  AfterSandbox(res, slot);
  fs::path output = ExecuteBoxOutput(id, td);
  long output_bytes = std::max(FileSize(output), 0L);
  Verdict verdict = ClassifyExecution(res, lim, output_bytes, td_result);
  td_result.output = ReadHead(output, kMaxReportOutput, &td_result.output_truncated);
  if (verdict == Verdict::OLE) td_result.output_truncated = true;
  td_result.error = ReadHead(ExecuteBoxError(id, td), kMaxReportError);
  spdlog::info("Execute finished: id={} td={} code={} status={} verdict={} time={} wall={} rss={}",
               id, td, res.si_code, res.status, VerdictToAbr(verdict),
               td_result.time, td_result.wall, td_result.rss);

  fs::path final_output = ExecuteBoxFinalOutput(id, td);
  bool has_output = false;
  if (verdict == Verdict::NUL && !job.handle.IsCancelled()) {
    // a missing output file is compared as empty
    has_output = output_bytes == 0 ? Touch(final_output) : Move(output, final_output);
    if (!has_output) {
      verdict = Verdict::IE;
      td_result.message = "Failed to collect output";
    }
  }
  Umount(workdir);
  RemoveAll(box);
  if (job.handle.IsCancelled()) {
    RemoveAll(final_output);
    return;
  }

  if (verdict == Verdict::NUL) {
    if (sub.checker_type == CheckerType::CUSTOM) {
      verdict = Check(job, td, final_output, slot);
    } else {
      CompareResult cmp = CompareOutput(testcase.answer_file, final_output,
                                        sub.compare_mode, sub.float_mode, sub.float_tolerance);
      verdict = cmp.accepted ? Verdict::AC : Verdict::WA;
      td_result.score = cmp.accepted ? 1'000'000 : 0;
      td_result.message = std::move(cmp.message);
    }
  }
  if (has_output) RemoveAll(final_output);
  td_result.verdict = verdict;
}

/// Job
void Cleanup(const Job& job) {
  long id = job.sub.submission_internal_id;
  if (job.sub.remove_submission) RemoveAll(SubmissionCodePath(id));
  RemoveAll(SubmissionRunPath(id));
}

void RunCases(Job& job, const WorkerSlot& slot) {
  const Submission& sub = job.sub;
  long id = sub.submission_internal_id;
  bool skip = false;
  for (size_t td = 0; td < sub.testcases.size(); td++) {
    if (job.handle.IsCancelled()) return;
    if (!skip) {
      RunCase(job, td, slot);
      if (job.handle.IsCancelled()) return;
      auto& td_result = job.result.case_results[td];
      if (sub.reporter.ReportCaseResult) sub.reporter.ReportCaseResult(sub, job.result, td);
      if (td_result.verdict == Verdict::IE) {
        // no more untrusted code on this slot
        spdlog::warn("Internal error: id={} td={} message={}", id, td, td_result.message);
        job.result.ie_message = td_result.message;
        job.Transit(JobEvent::INTERNAL_ERROR);
        return;
      }
      if (sub.early_exit && td_result.verdict != Verdict::AC) {
        spdlog::info("Early exit: id={} td={} verdict={}", id, td, VerdictToAbr(td_result.verdict));
        skip = true;
      }
    }
    // skipped cases stay Verdict::NUL
    job.Transit(JobEvent::CASE_FINISHED);
  }
  job.Transit(JobEvent::CASES_FINISHED);
}

void RunJob(Job& job, const WorkerSlot& slot) {
  const Submission& sub = job.sub;
  SubmissionResult& res = job.result;
  long id = sub.submission_internal_id;
  spdlog::info("Judging: id={} sub_id={} lang={} checker={} cases={} slot={} uid={} cpu={}",
               id, sub.submission_id, LanguageName(sub.lang), CheckerTypeName(sub.checker_type), sub.testcases.size(),
               slot.index, slot.uid, slot.cpuid);

  job.Transit(JobEvent::START_COMPILE);
  if (sub.reporter.ReportStartCompiling) sub.reporter.ReportStartCompiling(sub, res);
  CompileStatus status = Compile(job, CompileSubtask::USERPROG, slot);
  if (status == CompileStatus::OK && sub.checker_type == CheckerType::CUSTOM) {
    status = Compile(job, CompileSubtask::CHECKER, slot);
  }
  if (job.handle.IsCancelled()) status = CompileStatus::CANCELLED;
  switch (status) {
    case CompileStatus::OK: {
      job.Transit(JobEvent::COMPILE_SUCCEEDED);
      RunCases(job, slot);
      break;
    }
    case CompileStatus::FAILED: job.Transit(JobEvent::COMPILE_FAILED); break;
    case CompileStatus::INTERNAL: job.Transit(JobEvent::INTERNAL_ERROR); break;
    case CompileStatus::CANCELLED: break;
  }
  if (job.handle.IsCancelled() && !IsTerminal(job.state)) job.Transit(JobEvent::CANCEL);

  if (std::holds_alternative<JobAggregating>(job.state)) {
    size_t position;
    res.verdict = AggregateVerdict(res.case_results, &position);
    if (res.verdict == Verdict::IE && position < res.case_results.size()) {
      res.ie_message = res.case_results[position].message;
    }
  } else if (std::holds_alternative<JobCompileFailed>(job.state)) {
    res.verdict = Verdict::CE;
  } else if (auto ptr = std::get_if<JobAborted>(&job.state)) {
    res.verdict = ptr->verdict;
  }
  Cleanup(job);
  spdlog::info("Submission judged: id={} sub_id={} verdict={}", id, sub.submission_id, VerdictToAbr(res.verdict));
  if (sub.reporter.ReportOverallResult) sub.reporter.ReportOverallResult(sub, res);
  if (std::holds_alternative<JobAggregating>(job.state)) job.Transit(JobEvent::REPORTED);
}

// Remove a finished job from the lists; job_mtx must be held
void EraseJobLocked(const std::shared_ptr<Job>& job) {
  const Submission& sub = job->sub;
  long id = sub.submission_internal_id;
  if (auto it = submission_id_map.find(sub.submission_id); it != submission_id_map.end() && it->second == id) {
    submission_id_map.erase(it);
  }
  job_list.erase(id);
  spdlog::info("Submission finished: id={} sub_id={} list_size={}", id, sub.submission_id, job_list.size());
  if (sub.reporter.ReportFinalized) sub.reporter.ReportFinalized(sub, job->result, job_list.size());
}

// job_mtx must be held
void CancelLocked(long id) {
  auto it = job_list.find(id);
  if (it == job_list.end()) return;
  std::shared_ptr<Job> job = it->second;
  if (auto pos = std::find(job_queue.begin(), job_queue.end(), id); pos != job_queue.end()) {
    // never started; finish it right here
    job_queue.erase(pos);
    job->Transit(JobEvent::CANCEL);
    job->result.verdict = Verdict::AB;
    Cleanup(*job);
    spdlog::info("Queued submission cancelled: id={} sub_id={}", id, job->sub.submission_id);
    if (job->sub.reporter.ReportOverallResult) job->sub.reporter.ReportOverallResult(job->sub, job->result);
    EraseJobLocked(job);
  } else {
    spdlog::info("Running submission cancelled: id={} sub_id={}", id, job->sub.submission_id);
    job->handle.Cancel();
  }
}

void WorkerThread(WorkerSlot slot, bool loop) {
  std::unique_lock lck(job_mtx);
  while (true) {
    if (job_queue.empty()) {
      if (!loop) break;
      job_cv.wait(lck, []{ return !job_queue.empty(); });
    }
    long id = job_queue.front();
    job_queue.pop_front();
    std::shared_ptr<Job> job = job_list.at(id);
    busy_workers++;
    lck.unlock();
    RunJob(*job, slot);
    lck.lock();
    busy_workers--;
    EraseJobLocked(job);
  }
}

} // namespace

void WorkLoop(bool loop) {
  umask(0022);
  std::vector<int> cpus;
  for (int i = 0, N = get_nprocs(); i < N; i++) {
    if (CPU_ISSET(i, &kPinnedCpus)) cpus.push_back(i);
  }
  if (!cpus.empty() && (int)cpus.size() < kMaxParallel) {
    spdlog::warn("Only {} pinned cpus for {} workers; some workers won\'t be pinned", cpus.size(), kMaxParallel);
  }
  std::vector<std::thread> workers;
  for (int i = 0; i < kMaxParallel; i++) {
    WorkerSlot slot{.index = i, .uid = kUidBase + i, .cpuid = i < (int)cpus.size() ? cpus[i] : -1};
    workers.emplace_back(WorkerThread, slot, loop);
  }
  for (auto& i : workers) i.join();
}

size_t CurrentSubmissionQueueSize() {
  std::lock_guard lck(job_mtx);
  return job_list.size();
}

std::vector<std::string> GetQueuedSubmissionID() {
  std::vector<std::string> st;
  std::lock_guard lck(job_mtx);
  for (auto& i : job_list) {
    if (i.second->handle.IsCancelled()) continue;
    st.push_back(i.second->sub.submission_id);
  }
  return st;
}

PoolStatus GetPoolStatus() {
  std::lock_guard lck(job_mtx);
  return {
    .workers = kMaxParallel,
    .busy = busy_workers,
    .queued = job_queue.size(),
    .draining = draining,
  };
}

bool PushSubmission(Submission&& sub, size_t max_queue) {
  std::unique_lock lck(job_mtx);
  if (draining) return false;
  if (max_queue > 0 && job_queue.size() >= max_queue) return false;

  long id = sub.submission_internal_id;
  auto job = std::make_shared<Job>(std::move(sub));
  const std::string& sub_id = job->sub.submission_id;
  if (auto it = submission_id_map.find(sub_id); it != submission_id_map.end()) {
    // if the same submission is already judging, cancel the old one
    long old_id = it->second;
    it->second = id;
    CancelLocked(old_id);
  }
  submission_id_map[sub_id] = id;
  job_list.insert({id, job});
  job_queue.push_back(id);
  spdlog::info("Submission enqueued: id={} sub_id={} list_size={}", id, sub_id, job_list.size());
  lck.unlock();
  job_cv.notify_one();
  return true;
}

bool CancelSubmission(const std::string& submission_id) {
  std::lock_guard lck(job_mtx);
  auto it = submission_id_map.find(submission_id);
  if (it == submission_id_map.end()) return false;
  CancelLocked(it->second);
  return true;
}

void SetDraining(bool value) {
  if (draining.exchange(value) != value) {
    spdlog::info("Runner {}", value ? "draining" : "accepting");
  }
}

bool IsDraining() {
  return draining;
}
