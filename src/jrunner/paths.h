#ifndef JRUNNER_PATHS_H_
#define JRUNNER_PATHS_H_

#include <jrunner/paths.h>

#include "tasks.h"
#include "submission.h"

extern const char kWorkdirRelative[];
fs::path Workdir(fs::path&&);

// for sandbox
// if inside_box = true, id (and td) is not used
// those calls will have id (and td) marked as -1
fs::path SubmissionRunPath(long id);
fs::path CompileBoxPath(long id, CompileSubtask subtask);
fs::path CompileBoxInput(long id, CompileSubtask subtask, Language lang, bool inside_box = false);
fs::path CompileBoxOutput(long id, CompileSubtask subtask, Language lang, bool inside_box = false);
fs::path CompileBoxMessage(long id, CompileSubtask subtask, bool inside_box = false);
fs::path CompileBoxError(long id, CompileSubtask subtask, bool inside_box = false);
fs::path ExecuteBoxPath(long id, int td);
fs::path ExecuteBoxProgram(long id, int td, Language lang, bool inside_box = false);
fs::perms ExecuteBoxProgramPerm(Language lang);
fs::path ExecuteBoxInput(long id, int td, bool inside_box = false);
fs::path ExecuteBoxOutput(long id, int td, bool inside_box = false);
fs::path ExecuteBoxError(long id, int td, bool inside_box = false);
// user output kept after the execute box is removed
fs::path ExecuteBoxFinalOutput(long id, int td);
fs::path CheckerBoxPath(long id, int td);
fs::path CheckerBoxProgram(long id, int td, Language lang, bool inside_box = false);
fs::path CheckerBoxInput(long id, int td, bool inside_box = false);
fs::path CheckerBoxAnswer(long id, int td, bool inside_box = false);
fs::path CheckerBoxUserOutput(long id, int td, bool inside_box = false);
fs::path CheckerBoxOutput(long id, int td, bool inside_box = false);

fs::path SandboxExecPath();

#endif  // JRUNNER_PATHS_H_
