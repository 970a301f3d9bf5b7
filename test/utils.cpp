#include "utils.h"

#include <unistd.h>
#include <fstream>
#include <sstream>
#include <filesystem>
#include <jrunner/paths.h>

long SetupSubmission(
    Submission& sub, const std::string& id, Language lang, const std::string& code,
    const std::string& checker_code, Language checker_lang) {
  sub.submission_id = id;
  long iid = sub.submission_internal_id = GetUniqueSubmissionInternalId();
  sub.lang = lang;
  fs::create_directories(SubmissionCodePath(iid));
  {
    std::ofstream fout(SubmissionUserCode(iid));
    fout << code;
  }
  if (checker_code.size()) {
    sub.checker_type = CheckerType::CUSTOM;
    sub.checker_lang = checker_lang;
    std::ofstream fout(SubmissionCheckerCode(iid));
    fout << checker_code;
  }
  return iid;
}

void TeardownSubmission(long id) {
  fs::remove_all(SubmissionCodePath(id));
}

int CountProcessesOfUid(int uid) {
  int count = 0;
  std::error_code ec;
  for (auto& entry : fs::directory_iterator("/proc", ec)) {
    std::string name = entry.path().filename();
    if (name.find_first_not_of("0123456789") != std::string::npos) continue;
    std::ifstream fin(entry.path() / "status");
    std::string line;
    while (std::getline(fin, line)) {
      if (line.compare(0, 4, "Uid:") != 0) continue;
      // real, effective, saved, fs
      std::istringstream sin(line.substr(4));
      int real, effective;
      if (sin >> real >> effective && (real == uid || effective == uid)) count++;
      break;
    }
  }
  return count;
}

bool IsRoot() {
  return geteuid() == 0;
}
