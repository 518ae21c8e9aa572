#include "kubehost/remote/engine.h"

#include <algorithm>
#include <iostream>
#include <sstream>
#include <utility>

#include <unistd.h>

#include "kubehost/runtime/shell.h"

namespace kubehost::remote {

namespace {

// $1 env file or "__NONE__", $2 binary, remaining arguments are passed through untouched.
constexpr const char* kRunnerScript = R"SH(set -euo pipefail
env_file="${1:-}"
bin="${2:-}"
shift 2 || true

if [[ "${env_file}" != "__NONE__" && -n "${env_file}" ]]; then
  set -a
  # shellcheck disable=SC1090
  source "${env_file}"
  set +a
fi

exec "${bin}" "$@"
)SH";

//! Removes an uploaded env file when the run finishes, whatever the outcome.
class RemoteEnvCleanup {
 public:
  RemoteEnvCleanup(Client& client, std::string remote_path, bool force_tty)
      : client_(client), remote_path_(std::move(remote_path)), force_tty_(force_tty) {}

  ~RemoteEnvCleanup() {
    std::string error;
    if (!client_.Execute("sudo", {"rm", "-f", remote_path_}, force_tty_, error)) {
      std::cerr << "failed to clean up remote env file " << remote_path_ << ": " << error << "\n";
    }
  }

  RemoteEnvCleanup(const RemoteEnvCleanup&) = delete;
  RemoteEnvCleanup& operator=(const RemoteEnvCleanup&) = delete;

 private:
  Client& client_;
  std::string remote_path_;
  bool force_tty_;
};

std::string JoinSupported() {
  std::ostringstream oss;
  const auto& commands = SupportedRunCommands();
  for (std::size_t i = 0; i < commands.size(); ++i) {
    if (i > 0) {
      oss << ", ";
    }
    oss << commands[i];
  }
  return oss.str();
}

std::string DisplayArgs(const std::vector<std::string>& args) {
  std::ostringstream oss;
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (i > 0) {
      oss << ' ';
    }
    const bool has_space = args[i].find_first_of(" \t\n") != std::string::npos;
    oss << (has_space ? "\"" + args[i] + "\"" : args[i]);
  }
  return oss.str();
}

bool Preflight(Client& client, const Target& target, std::string& error) {
  std::string probe_error;
  if (!client.TestConnection(probe_error)) {
    error = "SSH key does not work for " + target.user + "@" + target.host +
            ".\nRun provisioning first (uses root once):\n  kubehost remote provision";
    return false;
  }
  const std::string repo_dir = RemoteRepoDir(target);
  if (!client.Execute("test", {"-d", repo_dir}, false, probe_error)) {
    error = "remote repo not found at " + target.user + "@" + target.host + ":" + repo_dir +
            "\nRun provisioning first:\n  kubehost remote provision";
    return false;
  }
  return true;
}

}  // namespace

const std::vector<std::string>& SupportedRunCommands() {
  static const std::vector<std::string> commands = {"bootstrap", "join", "pair", "dns", "install",
                                                    "ssh",       "help", "-h",   "--help"};
  return commands;
}

bool ValidateRunArgs(const std::vector<std::string>& args, std::string& error) {
  if (args.empty()) {
    error = "missing kubehost command arguments";
    return false;
  }
  const auto& commands = SupportedRunCommands();
  if (std::find(commands.begin(), commands.end(), args.front()) == commands.end()) {
    error = "unsupported kubehost command for remote run: " + args.front() + " (supported: " + JoinSupported() + ")";
    return false;
  }
  return true;
}

std::string BuildRunnerCommandLine(const std::string& remote_env_file, const std::string& remote_bin,
                                   const std::vector<std::string>& args) {
  std::vector<std::string> sudo_args = {"-E", "bash", "-lc", kRunnerScript, "bash", remote_env_file, remote_bin};
  sudo_args.insert(sudo_args.end(), args.begin(), args.end());
  return runtime::JoinShellCommand("sudo", sudo_args);
}

bool RunWithClient(Client& client, const Target& target, const RunOptions& opts, std::string& error) {
  if (!ValidateRunArgs(opts.args, error)) {
    return false;
  }
  if (!Preflight(client, target, error)) {
    return false;
  }

  if (opts.git.Requested()) {
    if (!RemoteGitSync(client, RemoteRepoDir(target), opts.git, error)) {
      error = "git sync failed: " + error;
      return false;
    }
  }

  const std::string remote_bin = RemoteBinPath(target);
  std::string probe_error;
  if (!client.Execute("test", {"-x", remote_bin}, false, probe_error)) {
    error = "remote kubehost binary not found or not executable: " + target.user + "@" + target.host + ":" +
            remote_bin + "\nBuild/upload it first:\n  kubehost remote build";
    return false;
  }

  std::string remote_env = kUnsetSentinel;
  std::optional<RemoteEnvCleanup> cleanup;
  if (!opts.env_file.empty()) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(opts.env_file, ec)) {
      error = "--env-file not found: " + opts.env_file;
      return false;
    }
    remote_env = "/tmp/kubehost-remote.env." + std::to_string(::getpid());
    std::cout << "[local] Uploading env file to " << target.user << "@" << target.host << ":" << remote_env << "\n";
    // Registered before the upload so a partially written file is removed too.
    cleanup.emplace(client, remote_env, opts.force_tty);
    if (!client.Upload(opts.env_file, remote_env, error)) {
      error = "failed to upload env file: " + error;
      return false;
    }
  }

  std::cout << "[local] Running on " << target.user << "@" << target.host << ": kubehost " << DisplayArgs(opts.args)
            << "\n";
  return client.RunCommandString(BuildRunnerCommandLine(remote_env, remote_bin, opts.args), opts.force_tty, error);
}

}  // namespace kubehost::remote
