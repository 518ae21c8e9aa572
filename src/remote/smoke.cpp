#include "kubehost/remote/engine.h"

#include <iostream>

#include "kubehost/runtime/temp_dir.h"

namespace kubehost::remote {

namespace {

constexpr const char* kSmokeEnv =
    "DRY_RUN=true\n"
    "DRY_RUN_WRITE_FILES=false\n"
    "ENABLE_UFW=false\n"
    "EDGE_PROXY=none\n"
    "DASH_ENABLE=false\n"
    "CONFIRM=true\n";

constexpr const char* kSmokeJoinExtra =
    "SERVER_URL=https://1.2.3.4:6443\n"
    "TOKEN=dummytoken\n";

}  // namespace

const std::vector<SmokeStep>& SmokeSteps() {
  static const std::vector<SmokeStep> steps = {
      {.name = "help", .join_env = false, .args = {"--help"}},
      {.name = "dns help", .join_env = false, .args = {"dns", "--help"}},
      {.name = "pair help", .join_env = false, .args = {"pair", "--help"}},
      {.name = "bootstrap", .join_env = false, .args = {"bootstrap"}},
      {.name = "join", .join_env = true, .args = {"join"}},
  };
  return steps;
}

bool SmokeWithClient(Client& client, runtime::ProcessRunner& runner, const Target& target, const GitOptions& opts,
                     const std::filesystem::path& project_root, std::string& error) {
  std::string probe_error;
  if (!client.TestConnection(probe_error)) {
    error = "SSH connection failed. Run 'kubehost remote provision' first";
    return false;
  }

  if (!RemoteBuildAndUpload(client, runner, target, project_root, opts, error)) {
    return false;
  }

  runtime::ScopedTempDir scratch;
  if (!scratch.Create("kubehost-smoke", error)) {
    error = "failed to create smoke env file: " + error;
    return false;
  }
  const auto env_path = scratch.path() / "smoke.env";
  const auto join_env_path = scratch.path() / "smoke-join.env";
  if (!runtime::WriteTextFile(env_path, kSmokeEnv, error) ||
      !runtime::WriteTextFile(join_env_path, std::string(kSmokeEnv) + kSmokeJoinExtra, error)) {
    error = "failed to create smoke env file: " + error;
    return false;
  }

  std::cout << "[local] Running DRY_RUN smoke test on " << target.user << "@" << target.host
            << " (non-interactive)\n";

  for (const auto& step : SmokeSteps()) {
    std::cout << "[smoke] Running: " << step.name << "\n";
    RunOptions run_opts;
    run_opts.force_tty = false;
    run_opts.env_file = (step.join_env ? join_env_path : env_path).string();
    run_opts.args = step.args;
    if (!RunWithClient(client, target, run_opts, error)) {
      error = "smoke test '" + step.name + "' failed: " + error;
      return false;
    }
  }

  std::cout << "[local] Smoke test complete (DRY_RUN).\n";
  return true;
}

}  // namespace kubehost::remote
