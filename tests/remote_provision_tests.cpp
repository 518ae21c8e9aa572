#include <catch2/catch_test_macros.hpp>

#include <cstdlib>
#include <memory>
#include <string>
#include <vector>

#include "kubehost/remote/engine.h"
#include "kubehost/runtime/temp_dir.h"
#include "support/fake_client.h"
#include "support/fake_process_runner.h"
#include "support/test_helpers.h"

using kubehost::testing::BorrowedClient;
using kubehost::testing::FakeClient;
using kubehost::testing::FakeProcessRunner;
using kubehost::testing::ScopedEnvVar;
using kubehost::testing::ScopedStreamCapture;
using kubehost::testing::WriteFile;

namespace {

constexpr const char* kPublicKey = "ssh-ed25519 AAAAC3NzaC1lZDI1NTE5AAAAIKh ops@laptop";

//! Temporary home directory holding `~/.ssh/id_ed25519.pub`.
class FakeHome {
 public:
  FakeHome() {
    std::string error;
    created_ = dir_.Create("kubehost-provision-test", error);
    WriteFile(dir_.path() / ".ssh" / "id_ed25519.pub", std::string(kPublicKey) + "\n");
  }

  bool created() const { return created_; }
  const std::filesystem::path& path() const { return dir_.path(); }
  std::filesystem::path key() const { return dir_.path() / ".ssh" / "id_ed25519.pub"; }

 private:
  kubehost::runtime::ScopedTempDir dir_;
  bool created_ = false;
};

struct ProvisionFixture {
  FakeHome home;
  FakeProcessRunner runner;
  FakeClient root;
  std::vector<std::string> connected;

  kubehost::remote::Engine MakeEngine() {
    return kubehost::remote::Engine(
        runner,
        [this](const std::string& host, const std::string& user) -> std::unique_ptr<kubehost::remote::Client> {
          connected.push_back(user + "@" + host);
          return std::make_unique<BorrowedClient>(root);
        },
        home.path());
  }
};

kubehost::remote::Target MakeTarget() {
  kubehost::remote::Target target;
  target.host = "10.0.0.5";
  target.user = "ops";
  target.repo_url = "https://git.example.net/infra/kubehost.git";
  return target;
}

}  // namespace

TEST_CASE("user names follow POSIX account rules", "[remote][provision]") {
  CHECK(kubehost::remote::IsValidUserName("cubeadmin"));
  CHECK(kubehost::remote::IsValidUserName("_svc-1"));
  CHECK_FALSE(kubehost::remote::IsValidUserName(""));
  CHECK_FALSE(kubehost::remote::IsValidUserName("Ops"));
  CHECK_FALSE(kubehost::remote::IsValidUserName("1ops"));
  CHECK_FALSE(kubehost::remote::IsValidUserName("ops;reboot"));
  CHECK_FALSE(kubehost::remote::IsValidUserName(std::string(33, 'a')));
}

TEST_CASE("provision script embeds only the validated user name", "[remote][provision]") {
  std::string error;
  const auto script = kubehost::remote::RenderProvisionScript("ops", error);
  REQUIRE(script.has_value());
  CHECK(script->find("__NEW_USER__") == std::string::npos);
  CHECK(script->find("adduser --disabled-password --gecos \"\" ops") != std::string::npos);
  CHECK(script->find("/etc/sudoers.d/90-ops") != std::string::npos);
  CHECK(script->find("ops ALL=(ALL) NOPASSWD:ALL") != std::string::npos);
  CHECK(script->find("grep -qxF -- \"${pubkey}\"") != std::string::npos);
  CHECK(script->find("git clone \"${repo_url}\" /home/ops/kubehost") != std::string::npos);

  REQUIRE_FALSE(kubehost::remote::RenderProvisionScript("ops$(id)", error).has_value());
  CHECK(error == "invalid user name 'ops$(id)'");
}

TEST_CASE("public keys must be a single non-empty line", "[remote][provision]") {
  FakeHome home;
  REQUIRE(home.created());
  std::string error;

  const auto key = kubehost::remote::ReadSinglePublicKey(home.key(), error);
  REQUIRE(key.has_value());
  CHECK(*key == kPublicKey);

  WriteFile(home.path() / "empty.pub", "  \n");
  CHECK_FALSE(kubehost::remote::ReadSinglePublicKey(home.path() / "empty.pub", error).has_value());
  CHECK(error.find("is empty") != std::string::npos);

  WriteFile(home.path() / "two.pub", "ssh-ed25519 AAAA a\nssh-rsa BBBB b\n");
  CHECK_FALSE(kubehost::remote::ReadSinglePublicKey(home.path() / "two.pub", error).has_value());
  CHECK(error.find("contains multiple lines") != std::string::npos);
}

TEST_CASE("public key resolution prefers the explicit path", "[remote][provision]") {
  FakeHome home;
  REQUIRE(home.created());
  std::string error;

  auto target = MakeTarget();
  CHECK(kubehost::remote::ResolvePublicKey(target, home.path(), error) == home.key());

  target.pub_key_path = (home.path() / "missing.pub").string();
  CHECK_FALSE(kubehost::remote::ResolvePublicKey(target, home.path(), error).has_value());
  CHECK(error.find("public key not found") != std::string::npos);

  target.pub_key_path.clear();
  CHECK_FALSE(kubehost::remote::ResolvePublicKey(target, "/nonexistent-home", error).has_value());
  CHECK(error.find("ssh-keygen -t ed25519") != std::string::npos);
}

TEST_CASE("provision runs the script as root when the key already works", "[remote][provision]") {
  ScopedStreamCapture capture;
  ProvisionFixture fixture;
  REQUIRE(fixture.home.created());
  auto engine = fixture.MakeEngine();
  std::string error;

  REQUIRE(engine.Provision(MakeTarget(), error));
  CHECK(fixture.connected == std::vector<std::string>{"root@10.0.0.5"});
  CHECK(fixture.runner.runs.empty());

  const auto scripts = fixture.root.CallsOf("script");
  REQUIRE(scripts.size() == 1);
  CHECK(scripts[0].args ==
        std::vector<std::string>{kPublicKey, "https://git.example.net/infra/kubehost.git", "10.0.0.5"});
  CHECK(scripts[0].command.find("usermod -aG sudo ops") != std::string::npos);
  CHECK(capture.out().find("SSH key already works for root@10.0.0.5") != std::string::npos);
}

TEST_CASE("provision explains manual key installation without sshpass", "[remote][provision]") {
  ScopedStreamCapture capture;
  ProvisionFixture fixture;
  fixture.root.connection_ok = false;
  fixture.runner.missing_binaries.insert("sshpass");
  auto engine = fixture.MakeEngine();
  std::string error;

  REQUIRE_FALSE(engine.Provision(MakeTarget(), error));
  CHECK(error.find("ssh-copy-id -o StrictHostKeyChecking=no -i " + fixture.home.key().string() + " root@10.0.0.5") !=
        std::string::npos);
  CHECK(fixture.root.CallsOf("script").empty());
}

TEST_CASE("provision requires ROOT_PASS for password authentication", "[remote][provision]") {
  ScopedStreamCapture capture;
  ScopedEnvVar root_pass("ROOT_PASS", nullptr);
  ProvisionFixture fixture;
  fixture.root.connection_ok = false;
  auto engine = fixture.MakeEngine();
  std::string error;

  REQUIRE_FALSE(engine.Provision(MakeTarget(), error));
  CHECK(error.find("ROOT_PASS environment variable not set") != std::string::npos);
  CHECK(error.find("ssh-copy-id") != std::string::npos);
  CHECK(fixture.runner.runs.empty());
}

TEST_CASE("provision pushes the key with sshpass and clears the password", "[remote][provision]") {
  ScopedStreamCapture capture;
  ScopedEnvVar root_pass("ROOT_PASS", "hunter2");
  ProvisionFixture fixture;
  fixture.root.connection_ok = false;
  auto engine = fixture.MakeEngine();
  std::string error;

  REQUIRE(engine.Provision(MakeTarget(), error));
  REQUIRE(fixture.runner.runs.size() == 1);
  const auto& request = fixture.runner.runs.front();
  CHECK(request.argv == std::vector<std::string>{"sshpass", "-e", "ssh-copy-id", "-o", "StrictHostKeyChecking=no",
                                                 "-f", "-i", fixture.home.key().string(), "root@10.0.0.5"});
  CHECK(request.env.at("SSHPASS") == "hunter2");
  CHECK(std::getenv("ROOT_PASS") == nullptr);
  CHECK(fixture.root.CallsOf("script").size() == 1);
}

TEST_CASE("provision stops when ssh-copy-id fails", "[remote][provision]") {
  ScopedStreamCapture capture;
  ScopedEnvVar root_pass("ROOT_PASS", "wrong");
  ProvisionFixture fixture;
  fixture.root.connection_ok = false;
  fixture.runner.OnRun({"ssh-copy-id"}, 6);
  auto engine = fixture.MakeEngine();
  std::string error;

  REQUIRE_FALSE(engine.Provision(MakeTarget(), error));
  CHECK(error == "failed to copy SSH key: ssh-copy-id exited with status 6");
  CHECK(fixture.root.CallsOf("script").empty());
}

TEST_CASE("provision validates the user before touching the network", "[remote][provision]") {
  ProvisionFixture fixture;
  auto engine = fixture.MakeEngine();
  auto target = MakeTarget();
  target.user = "Bad User";
  std::string error;

  REQUIRE_FALSE(engine.Provision(target, error));
  CHECK(error == "invalid user name 'Bad User'");
  CHECK(fixture.connected.empty());
}

TEST_CASE("provision rejects an empty key file before connecting", "[remote][provision]") {
  ProvisionFixture fixture;
  REQUIRE(fixture.home.created());
  WriteFile(fixture.home.key(), " \n\t\n");
  auto engine = fixture.MakeEngine();
  std::string error;

  REQUIRE_FALSE(engine.Provision(MakeTarget(), error));
  CHECK(error.find("is empty") != std::string::npos);
  CHECK(fixture.connected.empty());
  CHECK(fixture.root.calls.empty());
  CHECK(fixture.runner.runs.empty());
}

TEST_CASE("provision rejects a key file with several keys before connecting", "[remote][provision]") {
  ProvisionFixture fixture;
  REQUIRE(fixture.home.created());
  const auto explicit_key = fixture.home.path() / "team.pub";
  WriteFile(explicit_key, std::string(kPublicKey) + "\nssh-rsa AAAAB3NzaC1yc2E second@laptop\n");
  auto engine = fixture.MakeEngine();
  auto target = MakeTarget();
  target.pub_key_path = explicit_key.string();
  std::string error;

  REQUIRE_FALSE(engine.Provision(target, error));
  CHECK(error.find("contains multiple lines") != std::string::npos);
  CHECK(fixture.connected.empty());
  CHECK(fixture.root.calls.empty());
  CHECK(fixture.runner.runs.empty());
}

TEST_CASE("provision wraps script failures", "[remote][provision]") {
  ScopedStreamCapture capture;
  ProvisionFixture fixture;
  fixture.root.script_ok = false;
  auto engine = fixture.MakeEngine();
  std::string error;

  REQUIRE_FALSE(engine.Provision(MakeTarget(), error));
  CHECK(error.rfind("provisioning failed: ", 0) == 0);
}
