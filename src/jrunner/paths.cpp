#include "paths.h"

fs::path kBoxRoot = "/tmp/jrunner_box";
fs::path kSubmissionRoot = "/tmp/jrunner_submissions";

namespace internal {
fs::path kDataDir = fs::path(JRUNNER_DATA_DIR);
} // internal

const char kWorkdirRelative[] = "workdir";
fs::path Workdir(fs::path&& path) {
  path /= kWorkdirRelative;
  return path;
}

namespace {

inline std::string PadInt(long x, size_t width) {
  std::string ret = std::to_string(x);
  if (ret.size() < width) ret = std::string(width - ret.size(), '0') + ret;
  return ret;
}

inline std::string CodeExtension(Language lang) {
  switch (lang) {
    case Language::GCC_CPP_11: [[fallthrough]];
    case Language::GCC_CPP_14: [[fallthrough]];
    case Language::GCC_CPP_17: [[fallthrough]];
    case Language::GCC_CPP_20: return ".cpp";
    case Language::GCC_C_11: [[fallthrough]];
    case Language::GCC_C_17: return ".c";
    case Language::HASKELL: return ".hs";
    case Language::PYTHON3: return ".py";
    case Language::BINARY: return "";
  }
  __builtin_unreachable();
}

inline std::string ProgramExtension(Language lang) {
  switch (lang) {
    case Language::PYTHON3: return ".pyc";
    default: return "";
  }
}

inline std::string CompileBaseName(CompileSubtask subtask) {
  switch (subtask) {
    case CompileSubtask::USERPROG: return "prog";
    case CompileSubtask::CHECKER: return "checker";
  }
  __builtin_unreachable();
}

inline fs::path BoxRoot(fs::path root, bool inside_box) {
  return inside_box ? fs::path("/") : root;
}

} // namespace

fs::path SubmissionRunPath(long id) {
  return kBoxRoot / PadInt(id, 6);
}

fs::path CompileBoxPath(long id, CompileSubtask subtask) {
  return SubmissionRunPath(id) / ("compile" + std::to_string((int)subtask));
}
fs::path CompileBoxInput(long id, CompileSubtask subtask, Language lang, bool inside_box) {
  // the binary "source" is the artifact itself; keep it apart from the output name
  std::string ext = lang == Language::BINARY ? ".bin" : CodeExtension(lang);
  return Workdir(BoxRoot(CompileBoxPath(id, subtask), inside_box)) / (CompileBaseName(subtask) + ext);
}
fs::path CompileBoxOutput(long id, CompileSubtask subtask, Language lang, bool inside_box) {
  return Workdir(BoxRoot(CompileBoxPath(id, subtask), inside_box))
      / (CompileBaseName(subtask) + ProgramExtension(lang));
}
fs::path CompileBoxMessage(long id, CompileSubtask subtask, bool inside_box) {
  return Workdir(BoxRoot(CompileBoxPath(id, subtask), inside_box)) / "compile.out";
}
fs::path CompileBoxError(long id, CompileSubtask subtask, bool inside_box) {
  return Workdir(BoxRoot(CompileBoxPath(id, subtask), inside_box)) / "compile.err";
}

fs::path ExecuteBoxPath(long id, int td) {
  return SubmissionRunPath(id) / ("execute" + PadInt(td, 3));
}
fs::path ExecuteBoxProgram(long id, int td, Language lang, bool inside_box) {
  return Workdir(BoxRoot(ExecuteBoxPath(id, td), inside_box)) / ("prog" + ProgramExtension(lang));
}
fs::perms ExecuteBoxProgramPerm(Language lang) {
  switch (lang) {
    case Language::PYTHON3:
      return fs::perms::owner_all |
             fs::perms::group_read | fs::perms::group_exec |
             fs::perms::others_read | fs::perms::others_exec; // 755
    default:
      return fs::perms::owner_all | fs::perms::group_exec | fs::perms::others_exec; // 711
  }
}
fs::path ExecuteBoxInput(long id, int td, bool inside_box) {
  return Workdir(BoxRoot(ExecuteBoxPath(id, td), inside_box)) / "input";
}
fs::path ExecuteBoxOutput(long id, int td, bool inside_box) {
  return Workdir(BoxRoot(ExecuteBoxPath(id, td), inside_box)) / "output";
}
fs::path ExecuteBoxError(long id, int td, bool inside_box) {
  return Workdir(BoxRoot(ExecuteBoxPath(id, td), inside_box)) / "error";
}
fs::path ExecuteBoxFinalOutput(long id, int td) {
  return SubmissionRunPath(id) / ("output" + PadInt(td, 3));
}

fs::path CheckerBoxPath(long id, int td) {
  return SubmissionRunPath(id) / ("checker" + PadInt(td, 3));
}
fs::path CheckerBoxProgram(long id, int td, Language lang, bool inside_box) {
  return Workdir(BoxRoot(CheckerBoxPath(id, td), inside_box)) / ("checker" + ProgramExtension(lang));
}
fs::path CheckerBoxInput(long id, int td, bool inside_box) {
  return Workdir(BoxRoot(CheckerBoxPath(id, td), inside_box)) / "input";
}
fs::path CheckerBoxAnswer(long id, int td, bool inside_box) {
  return Workdir(BoxRoot(CheckerBoxPath(id, td), inside_box)) / "answer";
}
fs::path CheckerBoxUserOutput(long id, int td, bool inside_box) {
  return Workdir(BoxRoot(CheckerBoxPath(id, td), inside_box)) / "user_output";
}
fs::path CheckerBoxOutput(long id, int td, bool inside_box) {
  return Workdir(BoxRoot(CheckerBoxPath(id, td), inside_box)) / "output";
}

fs::path SandboxExecPath() {
  return internal::kDataDir / "sandbox-exec";
}

fs::path SubmissionCodePath(long id) {
  return kSubmissionRoot / PadInt(id, 6);
}
fs::path SubmissionUserCode(long id) {
  return SubmissionCodePath(id) / "prog";
}
fs::path SubmissionCheckerCode(long id) {
  return SubmissionCodePath(id) / "checker";
}
fs::path SubmissionCaseInput(long id, int position) {
  return SubmissionCodePath(id) / ("input" + PadInt(position, 3));
}
fs::path SubmissionCaseAnswer(long id, int position) {
  return SubmissionCodePath(id) / ("answer" + PadInt(position, 3));
}
