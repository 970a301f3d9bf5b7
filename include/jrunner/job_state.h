#ifndef INCLUDE_JRUNNER_JOB_STATE_H_
#define INCLUDE_JRUNNER_JOB_STATE_H_

#include <cstddef>
#include <variant>
#include <optional>

#include "submission.h"

//  Queued -> Compiling -> CompileFailed
//                      -> RunningCases -> Aggregating -> Reported
//  (any non-terminal) -> Aborted
struct JobQueued {};
struct JobCompiling {};
struct JobCompileFailed {};
struct JobRunningCases {
  size_t next_case;
};
struct JobAggregating {};
struct JobReported {};
struct JobAborted {
  Verdict verdict; // AB if cancelled, IE on internal errors
};

using JobState = std::variant<
    JobQueued, JobCompiling, JobCompileFailed, JobRunningCases,
    JobAggregating, JobReported, JobAborted>;

#define ENUM_JOB_EVENT_ \
  X(START_COMPILE) \
  X(COMPILE_SUCCEEDED) \
  X(COMPILE_FAILED) \
  X(CASE_FINISHED) \
  X(CASES_FINISHED) \
  X(REPORTED) \
  X(CANCEL) \
  X(INTERNAL_ERROR)
enum class JobEvent {
#define X(name) name,
  ENUM_JOB_EVENT_
#undef X
};

// std::nullopt if the event is not allowed in this state
std::optional<JobState> NextState(const JobState&, JobEvent);
bool IsTerminal(const JobState&);

const char* JobStateName(const JobState&);
const char* JobEventName(JobEvent);

#endif  // INCLUDE_JRUNNER_JOB_STATE_H_
