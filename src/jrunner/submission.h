#ifndef JRUNNER_SUBMISSION_H_
#define JRUNNER_SUBMISSION_H_

#include <jrunner/submission.h>
#include <jrunner/isolation.h>
#include <jrunner/job_state.h>

struct Job {
  const Submission sub;
  SubmissionResult result;
  JobState state;
  // resolved at admission
  const Limits limits, checker_limits;
  RunHandle handle;

  Job(Submission&& sub);
  Job(const Job&) = delete;
  Job& operator=(const Job&) = delete;

  // log an illegal transition and keep the state
  void Transit(JobEvent);
};

#endif  // JRUNNER_SUBMISSION_H_
