#ifndef INCLUDE_JRUNNER_LOGGER_H_
#define INCLUDE_JRUNNER_LOGGER_H_

// Keep console sinks usable in children created by fork()
void InitLogger();

#endif  // INCLUDE_JRUNNER_LOGGER_H_
