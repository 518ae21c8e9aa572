#include "kubehost/remote/types.h"

#include <cstdlib>

#include <unistd.h>

namespace kubehost::remote {
namespace {

std::string LocalHostname() {
  char buffer[256] = {};
  if (::gethostname(buffer, sizeof(buffer) - 1) != 0) {
    return "localhost";
  }
  return buffer;
}

std::string LookupNonEmpty(const std::map<std::string, std::string>& env, const char* key) {
  const auto it = env.find(key);
  return it == env.end() ? std::string() : it->second;
}

}  // namespace

std::string RemoteRepoDir(const Target& target) { return "/home/" + target.user + "/kubehost"; }

std::string RemoteBinPath(const Target& target) { return RemoteRepoDir(target) + "/bin/kubehost"; }

void ApplyEnvDefaults(Target& target, const std::map<std::string, std::string>& env) {
  if (target.host.empty()) {
    target.host = LookupNonEmpty(env, "MGMT_HOST");
    if (target.host.empty()) {
      target.host = LookupNonEmpty(env, "MGMT_IP");
    }
  }
  if (!target.user_explicit) {
    auto user = LookupNonEmpty(env, "MGMT_USER");
    if (user.empty()) {
      user = LookupNonEmpty(env, "DEFAULT_USER");
    }
    if (!user.empty()) {
      target.user = user;
    }
  }
}

std::optional<std::filesystem::path> ResolvePublicKey(const Target& target, const std::filesystem::path& home,
                                                      std::string& error) {
  std::error_code ec;
  if (!target.pub_key_path.empty()) {
    if (std::filesystem::exists(target.pub_key_path, ec)) {
      error.clear();
      return std::filesystem::path(target.pub_key_path);
    }
    error = "public key not found: " + target.pub_key_path;
    return std::nullopt;
  }

  for (const char* name : {"id_ed25519.pub", "id_rsa.pub"}) {
    const auto candidate = home / ".ssh" / name;
    if (std::filesystem::exists(candidate, ec)) {
      error.clear();
      return candidate;
    }
  }

  const char* local_user = std::getenv("USER");
  error = "no public key found. Generate one with: ssh-keygen -t ed25519 -C '" +
          std::string(local_user != nullptr ? local_user : "user") + "@" + LocalHostname() + "'";
  return std::nullopt;
}

std::filesystem::path HomeDirectory() {
  const char* home = std::getenv("HOME");
  return home != nullptr ? std::filesystem::path(home) : std::filesystem::path();
}

}  // namespace kubehost::remote
