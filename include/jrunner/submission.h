#ifndef INCLUDE_JRUNNER_SUBMISSION_H_
#define INCLUDE_JRUNNER_SUBMISSION_H_

#include <string>
#include <vector>
#include <filesystem>
#include <functional>

#include <sched.h>
#include <jrunner/limits.h>

extern int kMaxParallel;
extern cpu_set_t kPinnedCpus;
// KiB
extern long kMaxRSS;
extern long kMaxOutput;
// us
extern long kMaxCpuTime;
extern long kMaxWallTime;
// bytes
extern long kMaxSourceSize;
extern long kMaxBinarySize;
// Real time * kTimeMultiplier = Indicated time
extern double kTimeMultiplier;
// 0 = no limit
extern size_t kMaxQueue;
// uid of worker slot i is kUidBase + i
extern int kUidBase;
// consecutive sandbox setup failures before the runner stops accepting jobs
extern int kFatalSandboxFailures;

#define ENUM_LANGUAGE_ \
  X(GCC_CPP_11, "c++11") \
  X(GCC_CPP_14, "c++14") \
  X(GCC_CPP_17, "c++17") \
  X(GCC_CPP_20, "c++20") \
  X(GCC_C_11, "c11") \
  X(GCC_C_17, "c17") \
  X(HASKELL, "haskell") \
  X(PYTHON3, "python3") \
  X(BINARY, "binary") /* precompiled artifact */
enum class Language {
#define X(name, langname) name,
  ENUM_LANGUAGE_
#undef X
};

#define ENUM_CHECKER_TYPE_ \
  X(NONE) \
  X(CUSTOM)
enum class CheckerType {
#define X(name) name,
  ENUM_CHECKER_TYPE_
#undef X
};

#define ENUM_COMPARE_MODE_ \
  X(STRICT, "strict") \
  X(LINE, "line") \
  X(WHITE_DIFF, "white-diff") \
  X(FLOAT_DIFF, "float-diff")
enum class CompareMode {
#define X(name, modename) name,
  ENUM_COMPARE_MODE_
#undef X
};

#define ENUM_FLOAT_MODE_ \
  X(ABSOLUTE, "absolute") \
  X(RELATIVE, "relative") \
  X(ABSOLUTE_RELATIVE, "absolute-relative")
enum class FloatMode {
#define X(name, modename) name,
  ENUM_FLOAT_MODE_
#undef X
};

// the most severe verdict of all cases would be the final result (see VerdictSeverity)
#define ENUM_VERDICT_ \
  X(NUL, "", "nil") \
  /* verdicts after execution */ \
  X(AC, "AC", "Accepted") \
  X(WA, "WA", "Wrong Answer") \
  X(TLE, "TLE", "Time Limit Exceeded") \
  X(MLE, "MLE", "Memory Limit Exceeded") \
  X(OLE, "OLE", "Output Limit Exceeded") \
  X(RE, "RE", "Runtime Error") \
  /* verdicts of the whole job */ \
  X(CE, "CE", "Compile Error") \
  X(IE, "IE", "Internal Error") \
  X(AB, "AB", "Aborted")
enum class Verdict {
#define X(name, abr, desc) name,
  ENUM_VERDICT_
#undef X
};

class SubmissionResult;

class Submission {
 public:
  // use for file management; must be unique in a run even if the same submission is sent again
  long submission_internal_id;
  // identifier given by the orchestrator
  std::string submission_id;
  Language lang;

  // requested limits; zero fields fall back to kDefaultLimits
  Limits limits;

  // evaluation
  CheckerType checker_type;
  Language checker_lang;
  Limits checker_limits; // zero fields fall back to kDefaultCheckerLimits
  CompareMode compare_mode;
  FloatMode float_mode;
  double float_tolerance;
  bool early_exit; // stop at the first case that is not AC

  struct TestCase {
    std::string name;
    std::filesystem::path input_file, answer_file;
  };
  std::vector<TestCase> testcases;

  // judge behavior
  struct Reporter {
    // these functions should not block
    std::function<void(const Submission&, const SubmissionResult&)> ReportStartCompiling;
    std::function<void(const Submission&, const SubmissionResult&, int position)> ReportCaseResult;
    // called exactly once per submission, including aborted ones
    std::function<void(const Submission&, const SubmissionResult&)> ReportOverallResult;
    std::function<void(const Submission&, const SubmissionResult&, size_t queue_size_before_pop)> ReportFinalized;
  };
  Reporter reporter; // callbacks for result reporting
  bool remove_submission; // remove submission files after judge

  Submission() :
      submission_internal_id(0),
      lang(Language::GCC_CPP_17),
      checker_type(CheckerType::NONE),
      checker_lang(Language::GCC_CPP_17),
      compare_mode(CompareMode::LINE),
      float_mode(FloatMode::ABSOLUTE_RELATIVE),
      float_tolerance(1e-6),
      early_exit(false),
      remove_submission(true) {}
};

class SubmissionResult {
 public:
  struct CaseResult {
    Verdict verdict;
    int64_t time; // us, CPU
    int64_t wall; // us
    int64_t rss; // KiB
    int exit_code;
    int signal; // 0 if not killed
    int64_t score; // 10^(-6)
    std::string output; // head of stdout, for reporting
    bool output_truncated;
    std::string error; // head of stderr
    std::string message; // from comparison or checker
    CaseResult() :
        verdict(Verdict::NUL), time{}, wall{}, rss{}, exit_code{}, signal{}, score{},
        output_truncated(false) {}
  };
  std::vector<CaseResult> case_results;
  // overall result
  Verdict verdict;
  std::string ce_message, ie_message;

  SubmissionResult() : verdict(Verdict::NUL) {}
};

// Call from main thread; runs kMaxParallel workers.
// If loop is false, returns once the queue is empty and all workers are idle.
void WorkLoop(bool loop = true);

// Judge queue information; DO NOT call these in reporter because of deadlocks!
size_t CurrentSubmissionQueueSize();
// External ID, for server communication
std::vector<std::string> GetQueuedSubmissionID();

struct PoolStatus {
  int workers;
  int busy;
  size_t queued;
  bool draining;
};
PoolStatus GetPoolStatus();

// Called from any thread
// 0 = no limit; return false if queue size exceeded or draining
bool PushSubmission(Submission&&, size_t max_queue = 0);
// return false if no submission with this ID is queued or running
bool CancelSubmission(const std::string& submission_id);

// draining: no new submissions are accepted, queued and running ones finish
void SetDraining(bool);
bool IsDraining();

#endif  // INCLUDE_JRUNNER_SUBMISSION_H_
