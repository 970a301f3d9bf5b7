#ifndef INCLUDE_JRUNNER_TASKS_H_
#define INCLUDE_JRUNNER_TASKS_H_

#define ENUM_COMPILE_SUBTASK_ \
  X(USERPROG) \
  X(CHECKER)
enum class CompileSubtask : int {
#define X(name) name,
  ENUM_COMPILE_SUBTASK_
#undef X
};

#endif  // INCLUDE_JRUNNER_TASKS_H_
