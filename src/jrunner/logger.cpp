#include <jrunner/logger.h>

#include <pthread.h>
#include <spdlog/spdlog.h>
#include <spdlog/details/console_globals.h>

namespace {

// the mutex shared by all console sinks
using console_mutex = spdlog::details::console_mutex;

void Prepare() {
  console_mutex::mutex().lock();
}

void Child() {
  console_mutex::mutex().unlock();
}

void Parent() {
  console_mutex::mutex().unlock();
}

} // namespace

void InitLogger() {
  spdlog::set_pattern("[%t] %+");
  spdlog::debug("Setup logger pthread_atfork");
  pthread_atfork(Prepare, Parent, Child);
}
