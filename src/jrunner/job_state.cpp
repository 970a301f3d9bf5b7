#include <jrunner/job_state.h>

namespace {

const char* kJobStateNameTable[] = {
  "Queued", "Compiling", "CompileFailed", "RunningCases",
  "Aggregating", "Reported", "Aborted",
};
static_assert(sizeof(kJobStateNameTable) / sizeof(kJobStateNameTable[0]) == std::variant_size_v<JobState>);

const char* kJobEventNameTable[] = {
#define X(name) #name,
  ENUM_JOB_EVENT_
#undef X
};

} // namespace

bool IsTerminal(const JobState& state) {
  return std::holds_alternative<JobCompileFailed>(state) ||
         std::holds_alternative<JobReported>(state) ||
         std::holds_alternative<JobAborted>(state);
}

std::optional<JobState> NextState(const JobState& state, JobEvent event) {
  if (IsTerminal(state)) return std::nullopt;
  switch (event) {
    case JobEvent::START_COMPILE: {
      if (std::holds_alternative<JobQueued>(state)) return JobCompiling{};
      break;
    }
    case JobEvent::COMPILE_SUCCEEDED: {
      if (std::holds_alternative<JobCompiling>(state)) return JobRunningCases{0};
      break;
    }
    case JobEvent::COMPILE_FAILED: {
      if (std::holds_alternative<JobCompiling>(state)) return JobCompileFailed{};
      break;
    }
    case JobEvent::CASE_FINISHED: {
      if (auto ptr = std::get_if<JobRunningCases>(&state)) return JobRunningCases{ptr->next_case + 1};
      break;
    }
    case JobEvent::CASES_FINISHED: {
      if (std::holds_alternative<JobRunningCases>(state)) return JobAggregating{};
      break;
    }
    case JobEvent::REPORTED: {
      if (std::holds_alternative<JobAggregating>(state)) return JobReported{};
      break;
    }
    case JobEvent::CANCEL: return JobAborted{Verdict::AB};
    case JobEvent::INTERNAL_ERROR: return JobAborted{Verdict::IE};
  }
  return std::nullopt;
}

const char* JobStateName(const JobState& state) {
  return kJobStateNameTable[state.index()];
}

const char* JobEventName(JobEvent event) {
  return kJobEventNameTable[(int)event];
}
