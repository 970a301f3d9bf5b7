#include <signal.h>
#include <sys/wait.h>
#include <cerrno>
#include <gtest/gtest.h>
#include <jrunner/utils.h>
#include <jrunner/verdict.h>

namespace {

const Limits kLim(1'000'000, 2'000'000, 65536, 1024, 1);

SandboxResult Exited(int status, long cpu_us = 1000, long rss_kib = 1000) {
  SandboxResult res;
  res.si_code = CLD_EXITED;
  res.status = status;
  res.user_us = cpu_us;
  res.wall_us = cpu_us + 100;
  res.max_rss_kib = rss_kib;
  return res;
}

SandboxResult Killed(int sig, long rss_kib = 1000) {
  SandboxResult res = Exited(0, 1000, rss_kib);
  res.si_code = CLD_KILLED;
  res.status = sig;
  return res;
}

Verdict Classify(const SandboxResult& res, long output_bytes = 0) {
  SubmissionResult::CaseResult td_result;
  return ClassifyExecution(res, kLim, output_bytes, td_result);
}

SubmissionResult::CaseResult Case(Verdict verdict) {
  SubmissionResult::CaseResult ret;
  ret.verdict = verdict;
  return ret;
}

} // namespace

TEST(ClassifyExecution, Clean) {
  SubmissionResult::CaseResult td_result;
  EXPECT_EQ(ClassifyExecution(Exited(0, 5000, 2000), kLim, 10, td_result), Verdict::NUL);
  EXPECT_EQ(td_result.time, 5000);
  EXPECT_EQ(td_result.wall, 5100);
  EXPECT_EQ(td_result.rss, 2000);
  EXPECT_EQ(td_result.exit_code, 0);
  EXPECT_EQ(td_result.signal, 0);
}

TEST(ClassifyExecution, Order) {
  SandboxResult err = SandboxResult::Error(ENOMEM);
  err.oomkill = true;
  EXPECT_EQ(Classify(err), Verdict::IE);

  SandboxResult oom = Killed(SIGKILL);
  oom.oomkill = oom.timekill = true;
  EXPECT_EQ(Classify(oom), Verdict::MLE);

  SandboxResult tle = Killed(SIGKILL);
  tle.timekill = true;
  EXPECT_EQ(Classify(tle), Verdict::TLE);

  EXPECT_EQ(Classify(Killed(SIGXFSZ)), Verdict::OLE);
  EXPECT_EQ(Classify(Killed(SIGSEGV, 70000)), Verdict::MLE);
  EXPECT_EQ(Classify(Killed(SIGSEGV)), Verdict::RE);
  EXPECT_EQ(Classify(Exited(1, 1000, 70000)), Verdict::MLE);
  EXPECT_EQ(Classify(Exited(1, 2'000'000)), Verdict::RE);
  EXPECT_EQ(Classify(Exited(0, 1'000'001)), Verdict::TLE);
  EXPECT_EQ(Classify(Exited(0), 1024 * 1024 + 1), Verdict::OLE);
  // exactly at the ceiling is fine
  EXPECT_EQ(Classify(Exited(0), 1024 * 1024), Verdict::NUL);
}

TEST(ClassifyExecution, SignalRecorded) {
  SubmissionResult::CaseResult td_result;
  EXPECT_EQ(ClassifyExecution(Killed(SIGABRT), kLim, 0, td_result), Verdict::RE);
  EXPECT_EQ(td_result.signal, SIGABRT);
  EXPECT_EQ(td_result.exit_code, 0);
}

TEST(ClassifyExecution, TimeMultiplier) {
  double orig = kTimeMultiplier;
  kTimeMultiplier = 2.0;
  SubmissionResult::CaseResult td_result;
  EXPECT_EQ(ClassifyExecution(Exited(0, 600'000), kLim, 0, td_result), Verdict::TLE);
  EXPECT_EQ(td_result.time, 1'200'000);
  kTimeMultiplier = orig;
}

TEST(ClassifyChecker, ExitCodes) {
  EXPECT_EQ(ClassifyChecker(Exited(0)), Verdict::AC);
  EXPECT_EQ(ClassifyChecker(Exited(1)), Verdict::WA);
  EXPECT_EQ(ClassifyChecker(Exited(2)), Verdict::IE);
  EXPECT_EQ(ClassifyChecker(Killed(SIGSEGV)), Verdict::IE);
  EXPECT_EQ(ClassifyChecker(SandboxResult::Error(EPERM)), Verdict::IE);
  SandboxResult tle = Exited(0);
  tle.timekill = true;
  EXPECT_EQ(ClassifyChecker(tle), Verdict::IE);
}

TEST(AggregateVerdict, Severity) {
  EXPECT_EQ(AggregateVerdict({}), Verdict::AC);
  EXPECT_EQ(AggregateVerdict({Case(Verdict::AC), Case(Verdict::AC)}), Verdict::AC);
  EXPECT_EQ(AggregateVerdict({Case(Verdict::AC), Case(Verdict::WA)}), Verdict::WA);
  EXPECT_EQ(AggregateVerdict({Case(Verdict::TLE), Case(Verdict::WA)}), Verdict::TLE);
  EXPECT_EQ(AggregateVerdict({Case(Verdict::RE), Case(Verdict::MLE)}), Verdict::RE);
  EXPECT_EQ(AggregateVerdict({Case(Verdict::RE), Case(Verdict::IE)}), Verdict::IE);
}

TEST(AggregateVerdict, EarliestOnTie) {
  size_t position;
  EXPECT_EQ(AggregateVerdict({Case(Verdict::AC), Case(Verdict::MLE), Case(Verdict::TLE), Case(Verdict::OLE)},
                             &position), Verdict::MLE);
  EXPECT_EQ(position, 1u);
  EXPECT_EQ(AggregateVerdict({Case(Verdict::OLE), Case(Verdict::TLE)}, &position), Verdict::OLE);
  EXPECT_EQ(position, 0u);
}

TEST(AggregateVerdict, SkippedIgnored) {
  size_t position;
  EXPECT_EQ(AggregateVerdict({Case(Verdict::NUL), Case(Verdict::WA), Case(Verdict::NUL)}, &position), Verdict::WA);
  EXPECT_EQ(position, 1u);
  EXPECT_EQ(AggregateVerdict({Case(Verdict::NUL)}, &position), Verdict::AC);
  EXPECT_EQ(position, 1u);
}

TEST(VerdictUtils, Names) {
  EXPECT_STREQ(VerdictToAbr(Verdict::OLE), "OLE");
  EXPECT_STREQ(VerdictToDesc(Verdict::AB), "Aborted");
  EXPECT_EQ(AbrToVerdict("MLE"), Verdict::MLE);
  EXPECT_EQ(GetLanguage("c++17"), Language::GCC_CPP_17);
  EXPECT_FALSE(GetLanguage("cobol").has_value());
  EXPECT_EQ(GetCompareMode("white-diff"), CompareMode::WHITE_DIFF);
  EXPECT_EQ(GetFloatMode("relative"), FloatMode::RELATIVE);
  EXPECT_EQ(ScoreToString(1'000'000), "1.000000");
  EXPECT_EQ(ScoreToString(123'456'789), "123.456789");
}
