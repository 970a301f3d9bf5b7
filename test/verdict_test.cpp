#include <algorithm>
#include <jrunner/utils.h>

#include "example_job.h"
#include "utils.h"

namespace {

struct SubParam {
  std::string name;
  Verdict verdict;
  std::string code;
};

std::string ParamName(const ::testing::TestParamInfo<SubParam>& info) {
  return std::string("verdict_") + VerdictToAbr(info.param.verdict) + "_" + info.param.name;
}

} // namespace

class ExampleJobVerdict : public ExampleJob, public testing::WithParamInterface<SubParam> {};
TEST_P(ExampleJobVerdict, Ver) {
  auto& param = GetParam();
  SetUp(2, 2);
  AssertVerdictReporter reporter(param.verdict, param.verdict != Verdict::CE);
  sub.reporter = reporter.GetReporter();
  Submission sub1 = sub, sub2 = sub;
  long id1 = SetupSubmission(sub1, "verdict-" + param.name + "-1", Language::GCC_CPP_17, param.code);
  long id2 = SetupSubmission(sub2, "verdict-" + param.name + "-2", Language::GCC_CPP_17, param.code);
  PushSubmission(std::move(sub1));
  PushSubmission(std::move(sub2));
  WorkLoop(false);
  TeardownSubmission(id1);
  TeardownSubmission(id2);
}
INSTANTIATE_TEST_SUITE_P(OneSubmission, ExampleJobVerdict,
    testing::Values(
      (SubParam){"echo", Verdict::AC, R"(#include <cstdio>
int main(){ int a; scanf("%d",&a);printf("%d",a); })"},
      (SubParam){"plus_one", Verdict::WA, R"(#include <cstdio>
int main(){ int a; scanf("%d",&a);printf("%d",a+1); })"},
      (SubParam){"loop", Verdict::TLE, R"(int main(){ while (true); })"},
      (SubParam){"sleep", Verdict::TLE, R"(#include <unistd.h>
int main(){ sleep(100); })"},
      (SubParam){"malloc", Verdict::MLE, R"(#include <cstdlib>
#include <cstring>
int main(){ while (true) memset(malloc(65536), 0x1, 65536); })"},
      (SubParam){"puts", Verdict::OLE, R"(#include <cstdio>
int main(){ while (true) puts("aaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaa"); })"},
      (SubParam){"exit", Verdict::RE, R"(int main(){ return 1; })"},
      (SubParam){"segv", Verdict::RE, R"(char* p; int main(){ *p = 123; })"},
      (SubParam){"fpe", Verdict::RE, R"(int c; int main(){ c /= 0; })"},
      (SubParam){"empty", Verdict::CE, ""}
    ),
    ParamName);

TEST_F(ExampleJob, OutputLimitExitZero) {
  SetUp(1);
  sub.limits.output = 4;
  AssertVerdictReporter reporter(Verdict::OLE);
  sub.reporter = reporter.GetReporter();
  // ignores the failed writes and exits normally
  long id = SetupSubmission(sub, "ole-exit", Language::GCC_CPP_17, R"(#include <csignal>
#include <unistd.h>
char buf[1024];
int main(){ signal(SIGXFSZ, SIG_IGN); for (int i = 0; i < 64; i++) (void)!write(1, buf, 1024); })");
  RunAndTeardownSubmission(id);
  EXPECT_TRUE(reporter.last_result.case_results[0].output_truncated);
}

TEST_F(ExampleJob, OutputAtLimit) {
  SetUp({{"", std::string(4096, 'a')}});
  sub.limits.output = 4;
  AssertVerdictReporter reporter(Verdict::AC);
  sub.reporter = reporter.GetReporter();
  long id = SetupSubmission(sub, "ole-exact", Language::GCC_CPP_17, R"(#include <unistd.h>
#include <cstring>
char buf[4096];
int main(){ memset(buf, 'a', sizeof(buf)); return write(1, buf, sizeof(buf)) != sizeof(buf); })");
  RunAndTeardownSubmission(id);
  EXPECT_FALSE(reporter.last_result.case_results[0].output_truncated);
}

TEST_F(ExampleJob, StderrCaptured) {
  SetUp(1);
  AssertVerdictReporter reporter(Verdict::RE);
  sub.reporter = reporter.GetReporter();
  long id = SetupSubmission(sub, "stderr-1", Language::GCC_CPP_17, R"(#include <cstdio>
int main(){ fputs("bad input", stderr); return 3; })");
  RunAndTeardownSubmission(id);
  auto& res = reporter.last_result.case_results[0];
  EXPECT_EQ(res.exit_code, 3);
  EXPECT_EQ(res.error, "bad input");
}

TEST_F(ExampleJob, RuntimeErrorDetails) {
  SetUp({{"1\n", "1\n"}, {"2\n", "2\n"}, {"3\n", "3\n"}});
  AssertVerdictReporter reporter(Verdict::RE);
  sub.reporter = reporter.GetReporter();
  // case 2 fails by exit code, case 3 by signal
  long id = SetupSubmission(sub, "tie-1", Language::GCC_CPP_17, R"(#include <cstdio>
#include <cstdlib>
int main(){ int a; scanf("%d",&a); if (a == 2) return 2; if (a == 3) abort(); printf("%d",a); })");
  RunAndTeardownSubmission(id);
  auto& res = reporter.last_result.case_results;
  EXPECT_EQ(res[0].verdict, Verdict::AC);
  EXPECT_EQ(res[1].verdict, Verdict::RE);
  EXPECT_EQ(res[1].exit_code, 2);
  EXPECT_EQ(res[2].verdict, Verdict::RE);
  EXPECT_NE(res[2].signal, 0);
}
