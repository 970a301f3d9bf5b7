#ifndef INCLUDE_JRUNNER_PATHS_H_
#define INCLUDE_JRUNNER_PATHS_H_

#include <filesystem>

namespace fs = std::filesystem;

extern fs::path kBoxRoot;
extern fs::path kSubmissionRoot;

namespace internal {

// does not meant to be publicly used; only for testing
extern fs::path kDataDir;

} // internal

// for submission fetch; id is the internal id
fs::path SubmissionCodePath(long id);
fs::path SubmissionUserCode(long id);
fs::path SubmissionCheckerCode(long id);
fs::path SubmissionCaseInput(long id, int position);
fs::path SubmissionCaseAnswer(long id, int position);

#endif  // INCLUDE_JRUNNER_PATHS_H_
