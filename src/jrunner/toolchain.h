#ifndef JRUNNER_TOOLCHAIN_H_
#define JRUNNER_TOOLCHAIN_H_

#include <string>
#include <vector>

#include <jrunner/toolchain.h>

// paths are inside the box; empty if lang needs no compilation
std::vector<std::string> CompileCommand(Language lang, const std::string& input, const std::string& output);
std::vector<std::string> ExecuteCommand(Language lang, const std::string& program);
// directories bind-mounted into an execute box
std::vector<std::string> ExecuteDirs();
std::vector<std::string> CompileDirs();

#endif  // JRUNNER_TOOLCHAIN_H_
