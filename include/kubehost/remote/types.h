#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace kubehost::remote {

inline constexpr const char* kDefaultUser = "cubeadmin";
inline constexpr const char* kDefaultRepoUrl = "https://github.com/mfittko/netcup-kube.git";
//! Sentinel passed to remote scripts for "not requested"; distinct from an empty value.
inline constexpr const char* kUnsetSentinel = "__NONE__";

/// One remote host as seen by a single invocation. Never persisted.
struct Target {
  std::string host;
  std::string user = kDefaultUser;
  /// Set when the user came from an explicit flag; config files never override it.
  bool user_explicit = false;
  std::string pub_key_path;
  std::string repo_url = kDefaultRepoUrl;
  std::string config_path;
};

/// Git checkout request for the remote repository. `ref` wins over `branch`.
struct GitOptions {
  std::string branch;
  std::string ref;
  bool pull = false;
  bool pull_is_set = false;

  /// True when any git operation was requested at all.
  bool Requested() const { return !branch.empty() || !ref.empty() || pull; }
};

/// Options for running the deployed CLI on the remote host.
struct RunOptions {
  bool force_tty = true;
  std::string env_file;
  GitOptions git;
  std::vector<std::string> args;
};

/// `/home/<user>/kubehost`
std::string RemoteRepoDir(const Target& target);

/// `/home/<user>/kubehost/bin/kubehost`
std::string RemoteBinPath(const Target& target);

/// Fills host and user from `MGMT_HOST`/`MGMT_IP` and `MGMT_USER`/`DEFAULT_USER`.
/// Host is only taken when empty; user only when it was not given explicitly.
void ApplyEnvDefaults(Target& target, const std::map<std::string, std::string>& env);

/// Resolves the public key to install: the explicit path (which must exist), else
/// `~/.ssh/id_ed25519.pub`, else `~/.ssh/id_rsa.pub`.
std::optional<std::filesystem::path> ResolvePublicKey(const Target& target, const std::filesystem::path& home,
                                                      std::string& error);

/// `$HOME`, or an empty path when unset.
std::filesystem::path HomeDirectory();

}  // namespace kubehost::remote
