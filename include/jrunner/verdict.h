#ifndef INCLUDE_JRUNNER_VERDICT_H_
#define INCLUDE_JRUNNER_VERDICT_H_

#include <vector>

#include "limits.h"
#include "sandbox.h"
#include "submission.h"

// Fill the measured usage of an execution into td_result and return its verdict.
// lim must be resolved; output_bytes is the size of the captured stdout.
// Verdict::NUL means the execution is clean and the output still has to be compared.
Verdict ClassifyExecution(const SandboxResult&, const Limits& lim, long output_bytes,
                          SubmissionResult::CaseResult& td_result);

// Verdict of a checker run from its sandbox result alone:
// AC for exit code 0, WA for exit code 1, IE for anything else
Verdict ClassifyChecker(const SandboxResult&);

// Most severe verdict among the cases; on a tie the earliest case wins.
// Cases with Verdict::NUL (skipped) are ignored; AC if there is none.
Verdict AggregateVerdict(const std::vector<SubmissionResult::CaseResult>&, size_t* position = nullptr);

#endif  // INCLUDE_JRUNNER_VERDICT_H_
