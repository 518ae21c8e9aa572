#include <catch2/catch_test_macros.hpp>

#include <string>

#include "kubehost/runtime/identity.h"
#include "support/test_helpers.h"

using kubehost::runtime::ControlSocketPath;
using kubehost::runtime::PortForwardFiles;
using kubehost::runtime::SanitizePathToken;
using kubehost::testing::ScopedEnvVar;

TEST_CASE("path tokens keep safe characters and percent-encode the rest", "[runtime][identity]") {
  CHECK(SanitizePathToken("mgmt-1.example.net") == "mgmt-1.example.net");
  CHECK(SanitizePathToken("ops@host") == "ops%40host");
  CHECK(SanitizePathToken("../etc") == "..%2Fetc");
  CHECK(SanitizePathToken("a_b") == "a%5Fb");
}

TEST_CASE("control socket path embeds user, host and local port", "[runtime][identity]") {
  const auto path = ControlSocketPath({.user = "cubeadmin", .host = "10.0.0.5", .local_port = 6443}, "/run/user/1000");
  CHECK(path.string() == "/run/user/1000/kubehost-tunnel-cubeadmin_10.0.0.5-6443.ctl");
}

TEST_CASE("distinct tunnel identities never share a control socket", "[runtime][identity]") {
  const auto a = ControlSocketPath({.user = "a_b", .host = "c", .local_port = 6443}, "/tmp");
  const auto b = ControlSocketPath({.user = "a", .host = "b_c", .local_port = 6443}, "/tmp");
  const auto c = ControlSocketPath({.user = "a", .host = "b_c", .local_port = 6444}, "/tmp");
  CHECK(a != b);
  CHECK(b != c);
}

TEST_CASE("port-forward files are keyed by namespace and local port", "[runtime][identity]") {
  const auto files = PortForwardFiles({.namespace_name = "openclaw", .local_port = 18789}, "/tmp");
  CHECK(files.pid_file.string() == "/tmp/kubehost-pf-openclaw-18789.pid");
  CHECK(files.log_file.string() == "/tmp/kubehost-pf-openclaw-18789.log");

  const auto other = PortForwardFiles({.namespace_name = "openclaw", .local_port = 18790}, "/tmp");
  CHECK(other.pid_file != files.pid_file);
}

TEST_CASE("runtime directory prefers XDG_RUNTIME_DIR", "[runtime][identity]") {
  {
    ScopedEnvVar xdg("XDG_RUNTIME_DIR", "/run/user/4242");
    CHECK(kubehost::runtime::DefaultRuntimeDirectory().string() == "/run/user/4242");
  }
  {
    ScopedEnvVar xdg("XDG_RUNTIME_DIR", nullptr);
    CHECK(kubehost::runtime::DefaultRuntimeDirectory().string() == "/tmp");
  }
}
