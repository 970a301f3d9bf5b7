#include <thread>
#include <algorithm>
#include <jrunner/utils.h>
#include <jrunner/toolchain.h>

#include "example_job.h"
#include "utils.h"

namespace {

struct SubParam {
  std::string sub_id;
  int parallel;
  Language lang;
  std::string code;
};

std::string ParamName(const ::testing::TestParamInfo<SubParam>& info) {
  std::string ret = LanguageName(info.param.lang);
  std::replace(ret.begin(), ret.end(), '+', 'p');
  if (info.param.parallel > 1) ret += "_parallel";
  return ret;
}

} // namespace

class ExampleJobOneSubmission : public ExampleJob, public testing::WithParamInterface<SubParam> {};
TEST_P(ExampleJobOneSubmission, Sub) {
  auto& param = GetParam();
  if (!IsLanguageAvailable(param.lang)) GTEST_SKIP() << LanguageName(param.lang) << " not installed";
  SetUp(5, param.parallel);
  AssertVerdictReporter reporter(Verdict::AC);
  sub.reporter = reporter.GetReporter();
  long id = SetupSubmission(sub, param.sub_id, param.lang, param.code);
  RunAndTeardownSubmission(id);
  for (auto& i : reporter.last_result.case_results) EXPECT_EQ(i.verdict, Verdict::AC);
}
INSTANTIATE_TEST_SUITE_P(OneSubmission, ExampleJobOneSubmission,
    testing::Values(
      (SubParam){"lang-1", 1, Language::GCC_CPP_17, R"(#include <cstdio>
int main(){ int a; scanf("%d",&a);printf("%d",a); })"},
      (SubParam){"lang-2", 4, Language::GCC_CPP_20, R"(#include <iostream>
int main(){ int a; std::cin >> a; std::cout << a << '\n'; })"},
      (SubParam){"lang-3", 1, Language::GCC_C_11, R"(#include <stdio.h>
int main(){ int a; scanf("%d",&a);printf("%d\n",a); return 0; })"},
      (SubParam){"lang-4", 1, Language::PYTHON3, "print(input())"},
      (SubParam){"lang-5", 4, Language::PYTHON3, "import sys; print(sys.stdin.read())"}
    ),
    ParamName);

TEST_F(ExampleJob, CompileError) {
  SetUp(2);
  AssertVerdictReporter reporter(Verdict::CE, false);
  sub.reporter = reporter.GetReporter();
  long id = SetupSubmission(sub, "ce-1", Language::GCC_CPP_17, "int main() { return undefined_name; }");
  RunAndTeardownSubmission(id);
  EXPECT_NE(reporter.last_result.ce_message.find("undefined_name"), std::string::npos);
  for (auto& i : reporter.last_result.case_results) EXPECT_EQ(i.verdict, Verdict::NUL);
}

TEST_F(ExampleJob, CompileErrorFromHeaders) {
  SetUp(1);
  AssertVerdictReporter reporter(Verdict::CE, false);
  sub.reporter = reporter.GetReporter();
  long id = SetupSubmission(sub, "ce-2", Language::GCC_CPP_17, R"(#include <vector>
int main() { std::vector<int> v; v.push_back("str"); })");
  RunAndTeardownSubmission(id);
  EXPECT_EQ(reporter.last_result.ce_message.find("/usr/include"), std::string::npos);
}

TEST_F(ExampleJob, SourceTooLarge) {
  SetUp(1);
  AssertVerdictReporter reporter(Verdict::CE, false);
  sub.reporter = reporter.GetReporter();
  std::string code = "int main() {}\n" + std::string(kMaxSourceSize, '/');
  long id = SetupSubmission(sub, "ce-3", Language::GCC_CPP_17, code);
  RunAndTeardownSubmission(id);
  EXPECT_NE(reporter.last_result.ce_message.find("exceeds"), std::string::npos);
}

TEST_F(ExampleJob, EarlyExit) {
  SetUp({{"1\n", "1\n"}, {"2\n", "3\n"}, {"3\n", "3\n"}});
  sub.early_exit = true;
  AssertVerdictReporter reporter(Verdict::WA);
  sub.reporter = reporter.GetReporter();
  long id = SetupSubmission(sub, "early-1", Language::GCC_CPP_17, R"(#include <cstdio>
int main(){ int a; scanf("%d",&a);printf("%d",a); })");
  RunAndTeardownSubmission(id);
  auto& res = reporter.last_result.case_results;
  ASSERT_EQ(res.size(), 3u);
  EXPECT_EQ(res[0].verdict, Verdict::AC);
  EXPECT_EQ(res[1].verdict, Verdict::WA);
  EXPECT_EQ(res[2].verdict, Verdict::NUL);
}

TEST_F(ExampleJob, CancelRunning) {
  SetUp(3);
  AssertVerdictReporter reporter(Verdict::AB, false);
  sub.reporter = reporter.GetReporter();
  sub.limits.cpu_time = 10'000'000;
  long id = SetupSubmission(sub, "cancel-1", Language::GCC_CPP_17, "int main(){ while (true); }");
  PushSubmission(std::move(sub));
  std::thread worker([]{ WorkLoop(false); });
  // wait until the first case is running
  while (GetPoolStatus().busy == 0) std::this_thread::sleep_for(std::chrono::milliseconds(10));
  std::this_thread::sleep_for(std::chrono::seconds(3));
  auto start = std::chrono::steady_clock::now();
  EXPECT_TRUE(CancelSubmission("cancel-1"));
  worker.join();
  EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(5));
  EXPECT_EQ(CountProcessesOfUid(kUidBase), 0);
  TeardownSubmission(id);
}
