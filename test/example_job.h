#ifndef EXAMPLE_JOB_H_
#define EXAMPLE_JOB_H_

#include <filesystem>

#include <gtest/gtest.h>
#include <jrunner/submission.h>

// Jobs judged in the real sandbox; skipped unless running as root
class ExampleJob : public ::testing::Test {
 protected:
  void SetUp() override;
  void SetUp(int case_num, int max_parallel = 1);
  void SetUp(const std::vector<std::pair<std::string, std::string>>& cases, int max_parallel = 1);
  void TearDown() override;

  void RunAndTeardownSubmission(long id);

  Submission sub;
  std::filesystem::path case_path;
};

#endif  // EXAMPLE_JOB_H_
