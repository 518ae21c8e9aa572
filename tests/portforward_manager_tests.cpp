#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

#include "kubehost/portforward/manager.h"
#include "kubehost/runtime/pid_file.h"
#include "kubehost/runtime/temp_dir.h"
#include "support/fake_process_runner.h"
#include "support/test_helpers.h"

using kubehost::portforward::PortForwardManager;
using kubehost::portforward::PortForwardSettings;
using kubehost::portforward::StartStatus;
using kubehost::portforward::State;
using kubehost::testing::FakeProcessRunner;

namespace {

PortForwardSettings MakeSettings() {
  PortForwardSettings settings;
  settings.target = "svc/openclaw";
  return settings;
}

struct PortForwardFixture {
  PortForwardFixture() {
    std::string error;
    created = dir.Create("kubehost-pf-test", error);
  }

  PortForwardManager MakeManager(bool port_in_use = false) {
    PortForwardManager manager(MakeSettings(), runner, dir.path() / "run");
    manager.set_port_probe([port_in_use](int) { return port_in_use; });
    manager.set_settle_delay(std::chrono::milliseconds(0));
    return manager;
  }

  kubehost::runtime::ScopedTempDir dir;
  bool created = false;
  FakeProcessRunner runner;
};

}  // namespace

TEST_CASE("port-forward start launches kubectl and records its pid", "[portforward]") {
  PortForwardFixture fixture;
  REQUIRE(fixture.created);
  auto manager = fixture.MakeManager();

  const auto result = manager.Start();
  REQUIRE(result.status == StartStatus::kStarted);
  CHECK(result.pid == 4000);

  REQUIRE(fixture.runner.starts.size() == 1);
  const auto& request = fixture.runner.starts[0];
  CHECK(request.argv ==
        std::vector<std::string>{"kubectl", "-n", "openclaw", "port-forward", "svc/openclaw", "18789:18789"});
  CHECK(request.log_path == manager.Files().log_file);
  CHECK(kubehost::runtime::ReadPidFile(manager.Files().pid_file) == 4000);
}

TEST_CASE("port-forward start reuses a live process", "[portforward]") {
  PortForwardFixture fixture;
  REQUIRE(fixture.created);
  auto manager = fixture.MakeManager();
  std::string error;
  REQUIRE(kubehost::runtime::WritePidFile(manager.Files().pid_file, 777, error));
  fixture.runner.alive.insert(777);

  const auto result = manager.Start();
  CHECK(result.status == StartStatus::kAlreadyRunning);
  CHECK(result.pid == 777);
  CHECK(result.ok());
  CHECK(fixture.runner.starts.empty());
}

TEST_CASE("port-forward start replaces stale state", "[portforward]") {
  PortForwardFixture fixture;
  REQUIRE(fixture.created);
  auto manager = fixture.MakeManager();
  std::string error;
  REQUIRE(kubehost::runtime::WritePidFile(manager.Files().pid_file, 777, error));

  const auto result = manager.Start();
  CHECK(result.status == StartStatus::kStarted);
  CHECK(kubehost::runtime::ReadPidFile(manager.Files().pid_file) == result.pid);
}

TEST_CASE("port-forward start refuses an occupied local port", "[portforward]") {
  PortForwardFixture fixture;
  REQUIRE(fixture.created);
  auto manager = fixture.MakeManager(true);

  const auto result = manager.Start();
  CHECK(result.status == StartStatus::kPortInUse);
  CHECK(result.error.find("local port 18789 is already in use") != std::string::npos);
  CHECK(fixture.runner.starts.empty());
  CHECK_FALSE(std::filesystem::exists(manager.Files().pid_file));
}

TEST_CASE("port-forward start detects a child that dies immediately", "[portforward]") {
  kubehost::testing::ScopedStreamCapture capture;
  PortForwardFixture fixture;
  REQUIRE(fixture.created);
  fixture.runner.start_exits_immediately = true;
  fixture.runner.start_log_output = "error: services \"openclaw\" not found\n";
  auto manager = fixture.MakeManager();

  const auto result = manager.Start();
  CHECK(result.status == StartStatus::kFailed);
  CHECK(result.error.find("exited immediately") != std::string::npos);
  CHECK(result.error.find("services \"openclaw\" not found") != std::string::npos);
  CHECK_FALSE(std::filesystem::exists(manager.Files().pid_file));
}

TEST_CASE("port-forward start reports launch failures", "[portforward]") {
  PortForwardFixture fixture;
  REQUIRE(fixture.created);
  fixture.runner.start_error = "failed to exec 'kubectl': No such file or directory";
  auto manager = fixture.MakeManager();

  const auto result = manager.Start();
  CHECK(result.status == StartStatus::kFailed);
  CHECK(result.error == "failed to start port-forward: failed to exec 'kubectl': No such file or directory");
}

TEST_CASE("port-forward status heals stale and corrupt pid files", "[portforward]") {
  kubehost::testing::ScopedStreamCapture capture;
  PortForwardFixture fixture;
  REQUIRE(fixture.created);
  auto manager = fixture.MakeManager();
  const auto pid_file = manager.Files().pid_file;

  const auto empty = manager.Status();
  CHECK(empty.state == State::kStopped);
  CHECK(empty.local_port == 18789);

  kubehost::testing::WriteFile(pid_file, "not-a-pid\n");
  CHECK_FALSE(manager.Status().running());
  CHECK_FALSE(std::filesystem::exists(pid_file));

  std::string error;
  REQUIRE(kubehost::runtime::WritePidFile(pid_file, 555, error));
  CHECK_FALSE(manager.Status().running());
  CHECK_FALSE(std::filesystem::exists(pid_file));

  REQUIRE(kubehost::runtime::WritePidFile(pid_file, 556, error));
  fixture.runner.alive.insert(556);
  const auto running = manager.Status();
  CHECK(running.running());
  CHECK(running.pid == 556);
  CHECK(running.log_file == manager.Files().log_file);
}

TEST_CASE("port-forward stop terminates the process group and clears state", "[portforward]") {
  PortForwardFixture fixture;
  REQUIRE(fixture.created);
  auto manager = fixture.MakeManager();
  std::string error;

  REQUIRE(manager.Stop(error));
  CHECK(fixture.runner.stops.empty());

  const auto started = manager.Start();
  REQUIRE(started.ok());
  REQUIRE(manager.Stop(error));
  CHECK(fixture.runner.stops == std::vector<int>{started.pid});
  CHECK_FALSE(std::filesystem::exists(manager.Files().pid_file));
  CHECK_FALSE(manager.Status().running());
}

TEST_CASE("port-forward stop of a dead process only removes the pid file", "[portforward]") {
  PortForwardFixture fixture;
  REQUIRE(fixture.created);
  auto manager = fixture.MakeManager();
  std::string error;
  REQUIRE(kubehost::runtime::WritePidFile(manager.Files().pid_file, 888, error));

  REQUIRE(manager.Stop(error));
  CHECK(fixture.runner.stops.empty());
  CHECK_FALSE(std::filesystem::exists(manager.Files().pid_file));
}

TEST_CASE("log tail returns the trimmed end of the file", "[portforward]") {
  kubehost::runtime::ScopedTempDir dir;
  std::string error;
  REQUIRE(dir.Create("kubehost-pf-test", error));
  const auto log = dir.path() / "pf.log";

  CHECK(kubehost::portforward::ReadLogTail(log).empty());
  kubehost::testing::WriteFile(log, "Forwarding from 127.0.0.1:18789 -> 18789\nerror: lost connection\n");
  CHECK(kubehost::portforward::ReadLogTail(log, 23) == "error: lost connection");
  CHECK(kubehost::portforward::ReadLogTail(log) ==
        "Forwarding from 127.0.0.1:18789 -> 18789\nerror: lost connection");
}
