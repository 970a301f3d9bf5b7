#ifndef INCLUDE_JRUNNER_COMPARE_H_
#define INCLUDE_JRUNNER_COMPARE_H_

#include <string>
#include <filesystem>

#include "submission.h"

struct CompareResult {
  bool accepted;
  std::string message; // where the outputs differ; empty if accepted
};

// Direct comparison of the user output against the expected answer.
// A missing user output file is never accepted.
CompareResult CompareOutput(const std::filesystem::path& answer, const std::filesystem::path& user_output,
                            CompareMode mode, FloatMode float_mode = FloatMode::ABSOLUTE_RELATIVE,
                            double tolerance = 1e-6);

#endif  // INCLUDE_JRUNNER_COMPARE_H_
