#include <signal.h>
#include <gtest/gtest.h>
#include <spdlog/spdlog.h>
#include <jrunner/paths.h>
#include <jrunner/toolchain.h>

spdlog::level::level_enum log_level;

class MyEnvironment : public ::testing::Environment {
 public:
  void SetUp() override {
    spdlog::set_pattern("[%t] %+");
    spdlog::set_level(log_level);
    // ghc takes too long to be tested routinely
    InitToolchains({Language::HASKELL});
  }
  void TearDown() override {
    fs::remove_all(kSubmissionRoot);
  }
};

testing::Environment* const my_env = testing::AddGlobalTestEnvironment(new MyEnvironment);

int main(int argc, char** argv) {
  ::testing::InitGoogleTest(&argc, argv);
  if (argc) internal::kDataDir = fs::path(argv[0]).parent_path();
  signal(SIGPIPE, SIG_IGN);
  log_level = spdlog::level::warn;
  if (argc > 1) {
    if (std::string("-v") == argv[1]) log_level = spdlog::level::info;
    if (std::string("-vv") == argv[1]) log_level = spdlog::level::debug;
  }
  return RUN_ALL_TESTS();
}
