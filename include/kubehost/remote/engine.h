#pragma once

#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "kubehost/remote/client.h"
#include "kubehost/remote/types.h"
#include "kubehost/runtime/process_runner.h"

namespace kubehost::remote {

/// Creates the client used to talk to `user@host`.
using ClientFactory = std::function<std::unique_ptr<Client>(const std::string& host, const std::string& user)>;

/// Factory producing `SshClient`s bound to `runner`.
ClientFactory MakeSshClientFactory(runtime::ProcessRunner& runner);

// -- git sync ---------------------------------------------------------------

/// Positional parameters of the git sync script: `(repo_dir, branch|__NONE__, ref|__NONE__, true|false)`.
std::vector<std::string> GitSyncArguments(const std::string& repo_dir, const GitOptions& opts);

/// Fetches all remotes, then checks out `ref` (detached) or `branch` (tracking) and
/// fast-forward pulls when a branch is active and a pull was requested.
bool RemoteGitSync(Client& client, const std::string& repo_dir, const GitOptions& opts, std::string& error);

// -- build and upload -------------------------------------------------------

/// Maps `uname -m` output to `amd64` or `arm64`. Anything else is an error.
std::optional<std::string> MapRemoteArchitecture(const std::string& uname_output, std::string& error);

/// Cross compiler used for `arch`; `KUBEHOST_CROSS_CXX` overrides the default.
std::string CrossCompilerFor(const std::string& arch);

/// Optional git sync, remote architecture detection, static local build in a scratch
/// directory, then upload of the binary to `RemoteBinPath(target)`.
bool RemoteBuildAndUpload(Client& client, runtime::ProcessRunner& runner, const Target& target,
                          const std::filesystem::path& project_root, const GitOptions& opts, std::string& error);

// -- provisioning -----------------------------------------------------------

/// POSIX account name check (`[a-z_][a-z0-9_-]*`, at most 32 characters).
bool IsValidUserName(const std::string& user);

/// Reads a public key file and requires exactly one non-empty line after trimming.
std::optional<std::string> ReadSinglePublicKey(const std::filesystem::path& path, std::string& error);

/// Provisioning script for `user`. Key, repository URL and host are positional parameters.
std::optional<std::string> RenderProvisionScript(const std::string& user, std::string& error);

/// Makes sure `root@host` accepts our key, installing it with `sshpass -e ssh-copy-id`
/// and `ROOT_PASS` when the key does not work yet.
bool EnsureRootAccess(Client& root_client, runtime::ProcessRunner& runner, const std::string& host,
                      const std::filesystem::path& pub_key_path, std::string& error);

// -- remote run -------------------------------------------------------------

/// Top-level commands that may be run remotely.
const std::vector<std::string>& SupportedRunCommands();

/// Rejects an empty argument list or a first argument outside the allow-list.
bool ValidateRunArgs(const std::vector<std::string>& args, std::string& error);

/// `sudo -E bash -lc <runner> bash <env_file|__NONE__> <bin> <args...>`, fully escaped.
std::string BuildRunnerCommandLine(const std::string& remote_env_file, const std::string& remote_bin,
                                   const std::vector<std::string>& args);

/// Validates, preflights, optionally syncs git and uploads an env file, then runs the
/// remote binary. An uploaded env file is removed afterwards on every path.
bool RunWithClient(Client& client, const Target& target, const RunOptions& opts, std::string& error);

// -- smoke ------------------------------------------------------------------

/// One step of the dry-run smoke sequence.
struct SmokeStep {
  std::string name;
  bool join_env = false;
  std::vector<std::string> args;
};

const std::vector<SmokeStep>& SmokeSteps();

bool SmokeWithClient(Client& client, runtime::ProcessRunner& runner, const Target& target, const GitOptions& opts,
                     const std::filesystem::path& project_root, std::string& error);

// -- engine -----------------------------------------------------------------

/// Entry points used by the CLI. Each call builds the clients it needs for one target.
class Engine {
 public:
  Engine(runtime::ProcessRunner& runner, ClientFactory make_client, std::filesystem::path home = HomeDirectory());

  bool Provision(const Target& target, std::string& error);
  bool GitSync(const Target& target, const GitOptions& opts, std::string& error);
  bool BuildAndUpload(const Target& target, const std::filesystem::path& project_root, const GitOptions& opts,
                      std::string& error);
  bool Run(const Target& target, const RunOptions& opts, std::string& error);
  bool Smoke(const Target& target, const GitOptions& opts, const std::filesystem::path& project_root,
             std::string& error);

 private:
  std::unique_ptr<Client> ConnectedClient(const Target& target, std::string& error);

  runtime::ProcessRunner& runner_;
  ClientFactory make_client_;
  std::filesystem::path home_;
};

}  // namespace kubehost::remote
