#ifndef INCLUDE_JRUNNER_TOOLCHAIN_H_
#define INCLUDE_JRUNNER_TOOLCHAIN_H_

#include <vector>

#include "submission.h"

// Check the compilers and interpreters once; call before WorkLoop().
// Languages in disabled are never available.
void InitToolchains(const std::vector<Language>& disabled = {});
bool IsLanguageAvailable(Language);

#endif  // INCLUDE_JRUNNER_TOOLCHAIN_H_
