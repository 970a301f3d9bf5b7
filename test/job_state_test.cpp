#include <iterator>
#include <gtest/gtest.h>
#include <jrunner/job_state.h>

namespace {

constexpr int kNumEvents = 0
#define X(name) + 1
  ENUM_JOB_EVENT_
#undef X
;

constexpr int N = -1; // illegal
constexpr int kQueued = 0, kCompiling = 1, kCompileFailed = 2, kRunningCases = 3,
    kAggregating = 4, kReported = 5, kAborted = 6;

const JobState kStates[] = {
  JobQueued{}, JobCompiling{}, JobCompileFailed{}, JobRunningCases{2},
  JobAggregating{}, JobReported{}, JobAborted{Verdict::AB},
};

// row: state; column: START_COMPILE, COMPILE_SUCCEEDED, COMPILE_FAILED, CASE_FINISHED,
//   CASES_FINISHED, REPORTED, CANCEL, INTERNAL_ERROR
const int kTransitions[][kNumEvents] = {
  {kCompiling, N, N, N, N, N, kAborted, kAborted},
  {N, kRunningCases, kCompileFailed, N, N, N, kAborted, kAborted},
  {N, N, N, N, N, N, N, N},
  {N, N, N, kRunningCases, kAggregating, N, kAborted, kAborted},
  {N, N, N, N, N, kReported, kAborted, kAborted},
  {N, N, N, N, N, N, N, N},
  {N, N, N, N, N, N, N, N},
};

} // namespace

TEST(JobState, TransitionTable) {
  static_assert(std::size(kStates) == std::variant_size_v<JobState>);
  for (size_t i = 0; i < std::size(kStates); i++) {
    EXPECT_EQ(kStates[i].index(), i);
    for (int j = 0; j < kNumEvents; j++) {
      auto nxt = NextState(kStates[i], (JobEvent)j);
      std::string desc = std::string(JobStateName(kStates[i])) + " + " + JobEventName((JobEvent)j);
      if (kTransitions[i][j] == N) {
        EXPECT_FALSE(nxt.has_value()) << desc;
      } else {
        ASSERT_TRUE(nxt.has_value()) << desc;
        EXPECT_EQ((int)nxt->index(), kTransitions[i][j]) << desc;
      }
    }
  }
}

TEST(JobState, Terminal) {
  for (size_t i = 0; i < std::size(kStates); i++) {
    bool terminal = i == kCompileFailed || i == kReported || i == kAborted;
    EXPECT_EQ(IsTerminal(kStates[i]), terminal) << JobStateName(kStates[i]);
  }
}

TEST(JobState, CaseCounter) {
  JobState state = JobQueued{};
  for (JobEvent event : {JobEvent::START_COMPILE, JobEvent::COMPILE_SUCCEEDED,
                         JobEvent::CASE_FINISHED, JobEvent::CASE_FINISHED}) {
    state = NextState(state, event).value();
  }
  ASSERT_TRUE(std::holds_alternative<JobRunningCases>(state));
  EXPECT_EQ(std::get<JobRunningCases>(state).next_case, 2u);
}

TEST(JobState, AbortVerdict) {
  auto cancelled = NextState(JobRunningCases{0}, JobEvent::CANCEL);
  ASSERT_TRUE(cancelled && std::holds_alternative<JobAborted>(*cancelled));
  EXPECT_EQ(std::get<JobAborted>(*cancelled).verdict, Verdict::AB);
  auto failed = NextState(JobQueued{}, JobEvent::INTERNAL_ERROR);
  ASSERT_TRUE(failed && std::holds_alternative<JobAborted>(*failed));
  EXPECT_EQ(std::get<JobAborted>(*failed).verdict, Verdict::IE);
}

TEST(JobState, Names) {
  EXPECT_STREQ(JobStateName(JobCompileFailed{}), "CompileFailed");
  EXPECT_STREQ(JobEventName(JobEvent::CASES_FINISHED), "CASES_FINISHED");
}
