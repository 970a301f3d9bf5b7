#ifndef INCLUDE_JRUNNER_UTILS_H_
#define INCLUDE_JRUNNER_UTILS_H_

#include <string>
#include <optional>

#include "tasks.h"
#include "submission.h"

long GetUniqueSubmissionInternalId();

const char* VerdictToDesc(Verdict);
const char* VerdictToAbr(Verdict);
Verdict AbrToVerdict(const std::string&);
// AC < WA < TLE = MLE = OLE < RE < CE < IE < AB
int VerdictSeverity(Verdict);

const char* LanguageName(Language);
std::optional<Language> GetLanguage(const std::string&);
const char* CompareModeName(CompareMode);
std::optional<CompareMode> GetCompareMode(const std::string&);
const char* FloatModeName(FloatMode);
std::optional<FloatMode> GetFloatMode(const std::string&);

// "123.456789" for 123456789
std::string ScoreToString(int64_t score);

// logging
const char* CompileSubtaskName(CompileSubtask);
const char* CheckerTypeName(CheckerType);

#endif  // INCLUDE_JRUNNER_UTILS_H_
