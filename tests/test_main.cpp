#include "../utils/plx_env.h"
#include <catch2/catch_session.hpp>
#include <filesystem>

static void load_test_environment() {
  std::filesystem::path test_dir = std::filesystem::path(__FILE__).parent_path();
  std::filesystem::path project_root = test_dir.parent_path();
  std::filesystem::path env_file = project_root / ".env";

  if (std::filesystem::exists(env_file)) {
    load_env_file(env_file.string());
  }
}

// Main test runner, picks up every tests/test_*.cpp linked into plx_tests
int main(int argc, char* argv[]) {
  load_test_environment();
  return Catch::Session().run(argc, argv);
}
