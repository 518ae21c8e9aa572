#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <string>
#include <vector>

#include "kubehost/tunnel/manager.h"
#include "support/fake_process_runner.h"

using kubehost::testing::FakeProcessRunner;
using kubehost::tunnel::StartStatus;
using kubehost::tunnel::TunnelManager;
using kubehost::tunnel::TunnelSettings;

namespace {

TunnelSettings MakeSettings() {
  TunnelSettings settings;
  settings.user = "cubeadmin";
  settings.host = "10.0.0.5";
  return settings;
}

TunnelManager MakeManager(FakeProcessRunner& runner, bool port_in_use = false) {
  TunnelManager manager(MakeSettings(), runner, "/run/kubehost-test");
  manager.set_port_probe([port_in_use](int) { return port_in_use; });
  return manager;
}

bool Contains(const std::vector<std::string>& argv, const std::string& value) {
  return std::find(argv.begin(), argv.end(), value) != argv.end();
}

}  // namespace

TEST_CASE("tunnel control socket is derived from its identity", "[tunnel]") {
  FakeProcessRunner runner;
  auto manager = MakeManager(runner);
  CHECK(manager.ControlSocket().string() == "/run/kubehost-test/kubehost-tunnel-cubeadmin_10.0.0.5-6443.ctl");
}

TEST_CASE("tunnel running state comes from the control master check", "[tunnel]") {
  FakeProcessRunner runner;
  auto manager = MakeManager(runner);

  runner.OnRun({"-O", "check"}, 0, "Master running (pid=4242)\n");
  CHECK(manager.IsRunning());
  CHECK(runner.runs.back().argv == std::vector<std::string>{"ssh", "-S", manager.ControlSocket().string(), "-O",
                                                            "check", "cubeadmin@10.0.0.5"});

  runner.OnRun({"-O", "check"}, 255, "Control socket connect: No such file or directory\n");
  CHECK_FALSE(manager.IsRunning());
}

TEST_CASE("tunnel start opens a persistent control master", "[tunnel]") {
  FakeProcessRunner runner;
  runner.OnRun({"-O", "check"}, 255);
  auto manager = MakeManager(runner);

  const auto result = manager.Start();
  REQUIRE(result.status == StartStatus::kStarted);
  REQUIRE(result.ok());

  const auto starts = runner.RunsMatching({"-M"});
  REQUIRE(starts.size() == 1);
  const auto& argv = starts[0].argv;
  CHECK(argv.front() == "ssh");
  CHECK(Contains(argv, "-fN"));
  CHECK(Contains(argv, "6443:127.0.0.1:6443"));
  CHECK(Contains(argv, "ControlPersist=yes"));
  CHECK(Contains(argv, "ExitOnForwardFailure=yes"));
  CHECK(Contains(argv, "ServerAliveInterval=30"));
  CHECK(Contains(argv, "ServerAliveCountMax=3"));
  CHECK(Contains(argv, manager.ControlSocket().string()));
}

TEST_CASE("tunnel start is idempotent while the master runs", "[tunnel]") {
  FakeProcessRunner runner;
  auto manager = MakeManager(runner, true);

  const auto result = manager.Start();
  CHECK(result.status == StartStatus::kAlreadyRunning);
  CHECK(result.ok());
  CHECK(runner.RunsMatching({"-M"}).empty());
}

TEST_CASE("tunnel start refuses a local port held by something else", "[tunnel]") {
  FakeProcessRunner runner;
  runner.OnRun({"-O", "check"}, 255);
  auto manager = MakeManager(runner, true);

  const auto result = manager.Start();
  CHECK(result.status == StartStatus::kPortInUse);
  CHECK(result.error == "localhost:6443 is already in use");
  CHECK(runner.RunsMatching({"-M"}).empty());
}

TEST_CASE("tunnel start distinguishes authentication failures", "[tunnel]") {
  FakeProcessRunner runner;
  runner.OnRun({"-O", "check"}, 255);
  runner.OnRun({"-M"}, 255, "cubeadmin@10.0.0.5: Permission denied (publickey).\n");
  auto manager = MakeManager(runner);

  const auto result = manager.Start();
  CHECK(result.status == StartStatus::kAuthFailed);
  CHECK(result.error.find("SSH authentication failed for cubeadmin@10.0.0.5") != std::string::npos);
}

TEST_CASE("tunnel start reports other ssh failures with their output", "[tunnel]") {
  FakeProcessRunner runner;
  runner.OnRun({"-O", "check"}, 255);
  runner.OnRun({"-M"}, 255, "ssh: connect to host 10.0.0.5 port 22: Connection refused\n");
  auto manager = MakeManager(runner);

  const auto result = manager.Start();
  CHECK(result.status == StartStatus::kFailed);
  CHECK(result.error ==
        "failed to start tunnel: ssh exited with status 255: ssh: connect to host 10.0.0.5 port 22: Connection refused");
}

TEST_CASE("tunnel stop is a no-op when nothing runs", "[tunnel]") {
  FakeProcessRunner runner;
  runner.OnRun({"-O", "check"}, 255);
  auto manager = MakeManager(runner);
  std::string error;

  REQUIRE(manager.Stop(error));
  CHECK(error.empty());
  CHECK(runner.RunsMatching({"-O", "exit"}).empty());
}

TEST_CASE("tunnel stop asks the control master to exit", "[tunnel]") {
  FakeProcessRunner runner;
  auto manager = MakeManager(runner);
  std::string error;

  REQUIRE(manager.Stop(error));
  CHECK(runner.RunsMatching({"-O", "exit"}).size() == 1);

  runner.OnRun({"-O", "exit"}, 255, "Exit request failed\n");
  REQUIRE_FALSE(manager.Stop(error));
  CHECK(error == "failed to stop tunnel: Exit request failed");
}

TEST_CASE("tunnel status reports socket, control output and port binding", "[tunnel]") {
  FakeProcessRunner runner;
  runner.OnRun({"-O", "check"}, 0, "Master running (pid=4242)\n");
  auto manager = MakeManager(runner, true);

  const auto status = manager.Status();
  CHECK(status.running);
  CHECK(status.control_output == "Master running (pid=4242)");
  CHECK(status.control_socket == manager.ControlSocket());
  CHECK(status.local_port_bound);

  runner.OnRun({"-O", "check"}, 255, "");
  CHECK_FALSE(manager.Status().running);
}
