#ifndef TEST_UTILS_H_
#define TEST_UTILS_H_

#include <gtest/gtest.h>
#include <jrunner/utils.h>
#include <jrunner/submission.h>

class AssertVerdictReporter {
  bool has_case_result_;
  bool has_overall_result_;
  bool require_case_;
  int overall_results_;

  void AssertResult_() {
    ASSERT_TRUE(has_overall_result_ && (!require_case_ || has_case_result_));
    ASSERT_EQ(overall_results_, 1);
  }
 public:
  Verdict expect_verdict;
  SubmissionResult last_result;

  AssertVerdictReporter(Verdict ver, bool require_case = true) :
      has_case_result_(false),
      has_overall_result_(false),
      require_case_(require_case),
      overall_results_(0),
      expect_verdict(ver) {}
  ~AssertVerdictReporter() { AssertResult_(); }

  void ReportOverallResult(const SubmissionResult& res) {
    overall_results_++;
    last_result = res;
    ASSERT_EQ(res.verdict, expect_verdict) << "CE: " << res.ce_message << "\nIE: " << res.ie_message;
    has_overall_result_ = true;
  }
  void ReportCaseResult(const SubmissionResult& res, int position) {
    ASSERT_NE(res.case_results[position].verdict, Verdict::NUL);
    has_case_result_ = true;
  }

  Submission::Reporter GetReporter() {
    Submission::Reporter reporter;
    reporter.ReportOverallResult = [&](const Submission&, const SubmissionResult& res) {
      ReportOverallResult(res);
    };
    reporter.ReportCaseResult = [&](const Submission&, const SubmissionResult& res, int position) {
      ReportCaseResult(res, position);
    };
    return reporter;
  }
};

long SetupSubmission(
    Submission& sub, const std::string& id, Language lang, const std::string& code,
    const std::string& checker_code = "", Language checker_lang = Language::GCC_CPP_17);

void TeardownSubmission(long id);

// number of processes running as uid
int CountProcessesOfUid(int uid);

bool IsRoot();

#endif // TEST_UTILS_H_
