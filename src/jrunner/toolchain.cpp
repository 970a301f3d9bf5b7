#include "toolchain.h"

#include <mutex>
#include <algorithm>

#include <spdlog/spdlog.h>
#include "utils.h"

namespace {

constexpr size_t kNumLanguages = 0
#define X(name, langname) + 1
  ENUM_LANGUAGE_
#undef X
;

// written once by InitToolchains, read-only afterwards
bool available[kNumLanguages];
std::once_flag init_flag;

const char* ToolName(Language lang) {
  switch (lang) {
    case Language::GCC_CPP_11: [[fallthrough]];
    case Language::GCC_CPP_14: [[fallthrough]];
    case Language::GCC_CPP_17: [[fallthrough]];
    case Language::GCC_CPP_20: return "g++";
    case Language::GCC_C_11: [[fallthrough]];
    case Language::GCC_C_17: return "gcc";
    case Language::HASKELL: return "ghc";
    case Language::PYTHON3: return "python3";
    case Language::BINARY: return nullptr;
  }
  __builtin_unreachable();
}

std::vector<std::string> GccCompileCommand(Language lang, const std::string& input, const std::string& output) {
  std::string prog, std;
  switch (lang) {
    case Language::GCC_CPP_11: prog = "g++", std = "-std=c++11"; break;
    case Language::GCC_CPP_14: prog = "g++", std = "-std=c++14"; break;
    case Language::GCC_CPP_17: prog = "g++", std = "-std=c++17"; break;
    case Language::GCC_CPP_20: prog = "g++", std = "-std=c++20"; break;
    case Language::GCC_C_11: prog = "gcc", std = "-std=c11"; break;
    case Language::GCC_C_17: prog = "gcc", std = "-std=c17"; break;
    default: __builtin_unreachable();
  }
  std::vector<std::string> ret = {"/usr/bin/env", prog, std, "-O2", "-w", "-o", output, input};
  if (prog == "gcc") ret.push_back("-lm");
  return ret;
}

} // namespace

void InitToolchains(const std::vector<Language>& disabled) {
  std::call_once(init_flag, [&disabled]() {
    for (size_t i = 0; i < kNumLanguages; i++) {
      Language lang = (Language)i;
      if (std::find(disabled.begin(), disabled.end(), lang) != disabled.end()) {
        spdlog::info("Language {} disabled", LanguageName(lang));
        continue;
      }
      const char* tool = ToolName(lang);
      if (!tool) {
        available[i] = true;
        continue;
      }
      fs::path path = FindInPath(tool);
      if (path.empty()) {
        spdlog::warn("{} not found; language {} unavailable", tool, LanguageName(lang));
        continue;
      }
      spdlog::debug("Language {} uses {}", LanguageName(lang), path.c_str());
      available[i] = true;
    }
  });
}

bool IsLanguageAvailable(Language lang) {
  return available[(int)lang];
}

std::vector<std::string> CompileCommand(Language lang, const std::string& input, const std::string& output) {
  switch (lang) {
    case Language::GCC_CPP_11: [[fallthrough]];
    case Language::GCC_CPP_14: [[fallthrough]];
    case Language::GCC_CPP_17: [[fallthrough]];
    case Language::GCC_CPP_20: [[fallthrough]];
    case Language::GCC_C_11: [[fallthrough]];
    case Language::GCC_C_17:
      return GccCompileCommand(lang, input, output);
    case Language::HASKELL:
      return {"/usr/bin/env", "ghc", "-w", "-O", "-tmpdir", ".", "-o", output, input};
    case Language::PYTHON3: {
      // note: we assume input & output name has no quotes here
      std::string script = ("import py_compile;py_compile.compile(\'\'\'" +
                            input + "\'\'\',\'\'\'" + output + "\'\'\',doraise=True)");
      return {"/usr/bin/env", "python3", "-c", script};
    }
    case Language::BINARY: return {};
  }
  __builtin_unreachable();
}

std::vector<std::string> ExecuteCommand(Language lang, const std::string& program) {
  switch (lang) {
    case Language::PYTHON3: return {"/usr/bin/env", "python3", program};
    default: return {program};
  }
}

std::vector<std::string> ExecuteDirs() {
  return {"/usr", "/lib", "/lib64", "/etc/alternatives", "/bin"};
}

std::vector<std::string> CompileDirs() {
  return {"/usr", "/var/lib", "/lib", "/lib64", "/etc/alternatives", "/bin"};
}
