#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <string>

#include <unistd.h>

#include "kubehost/runtime/pid_file.h"
#include "kubehost/runtime/temp_dir.h"
#include "support/test_helpers.h"

using kubehost::testing::WriteFile;

TEST_CASE("pid file round trips through an atomic write", "[runtime][pid]") {
  kubehost::runtime::ScopedTempDir dir;
  std::string error;
  REQUIRE(dir.Create("kubehost-pid-test", error));
  const auto path = dir.path() / "nested" / "forward.pid";

  REQUIRE(kubehost::runtime::WritePidFile(path, 31337, error));
  CHECK(error.empty());
  CHECK(kubehost::runtime::ReadPidFile(path) == 31337);
  CHECK_FALSE(std::filesystem::exists(path.string() + ".tmp." + std::to_string(::getpid())));

  REQUIRE(kubehost::runtime::WritePidFile(path, 42, error));
  CHECK(kubehost::runtime::ReadPidFile(path) == 42);
}

TEST_CASE("pid file rejects invalid content", "[runtime][pid]") {
  kubehost::runtime::ScopedTempDir dir;
  std::string error;
  REQUIRE(dir.Create("kubehost-pid-test", error));
  const auto path = dir.path() / "forward.pid";

  CHECK_FALSE(kubehost::runtime::ReadPidFile(path).has_value());

  WriteFile(path, "");
  CHECK_FALSE(kubehost::runtime::ReadPidFile(path).has_value());
  WriteFile(path, "abc\n");
  CHECK_FALSE(kubehost::runtime::ReadPidFile(path).has_value());
  WriteFile(path, "-5\n");
  CHECK_FALSE(kubehost::runtime::ReadPidFile(path).has_value());
  WriteFile(path, "0\n");
  CHECK_FALSE(kubehost::runtime::ReadPidFile(path).has_value());
  WriteFile(path, "  77  \n");
  CHECK(kubehost::runtime::ReadPidFile(path) == 77);

  REQUIRE_FALSE(kubehost::runtime::WritePidFile(path, 0, error));
  CHECK_FALSE(error.empty());
}

TEST_CASE("removing a pid file also drops its lock and tolerates absence", "[runtime][pid]") {
  kubehost::runtime::ScopedTempDir dir;
  std::string error;
  REQUIRE(dir.Create("kubehost-pid-test", error));
  const auto path = dir.path() / "forward.pid";

  REQUIRE(kubehost::runtime::WritePidFile(path, 1234, error));
  REQUIRE(std::filesystem::exists(path.string() + ".lock"));

  REQUIRE(kubehost::runtime::RemovePidFile(path, error));
  CHECK_FALSE(std::filesystem::exists(path));
  CHECK_FALSE(std::filesystem::exists(path.string() + ".lock"));

  REQUIRE(kubehost::runtime::RemovePidFile(path, error));
  CHECK(error.empty());
}
