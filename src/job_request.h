#ifndef JOB_REQUEST_H_
#define JOB_REQUEST_H_

#include <string>
#include <stdexcept>
#include <nlohmann/json.hpp>
#include <jrunner/submission.h>

// malformed grading request; answered with 400
class RequestError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// well-formed request naming a language the runner does not know;
// the job ends with IE without being queued
class UnsupportedLanguage : public RequestError {
  std::string language_;
 public:
  explicit UnsupportedLanguage(const std::string& language) :
      RequestError("Unsupported language: " + language), language_(language) {}
  const std::string& Language() const { return language_; }
};

// Fill sub from a grading request and write its source, checker and cases
// under SubmissionCodePath(sub.submission_internal_id), which must be set.
// Throws RequestError or nlohmann::json::exception; files written before the
// error are left for the caller to remove.
void ParseJobRequest(const nlohmann::json& data, Submission& sub);

// decoders for case payloads; both throw RequestError on bad input
void OutputBase64(std::ostream& fout, const std::string& str);
void OutputZstdBase64(std::ostream& fout, const std::string& str);

#endif  // JOB_REQUEST_H_
