#include "kubehost/remote/engine.h"

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>

#include <stdlib.h>

#include "kubehost/runtime/shell.h"

namespace kubehost::remote {

namespace {

// __NEW_USER__ is substituted after validation. $1 public key, $2 repository URL, $3 host.
constexpr const char* kProvisionScript = R"SH(set -euo pipefail
pubkey="${1:?public key required}"
repo_url="${2:?repository url required}"
host="${3:-}"
export DEBIAN_FRONTEND=noninteractive
apt-get update -y
apt-get install -y --no-install-recommends sudo git curl ca-certificates

if ! id -u __NEW_USER__ >/dev/null 2>&1; then
  adduser --disabled-password --gecos "" __NEW_USER__
fi
usermod -aG sudo __NEW_USER__
install -d -m 0700 -o __NEW_USER__ -g __NEW_USER__ /home/__NEW_USER__/.ssh

keys=/home/__NEW_USER__/.ssh/authorized_keys
touch "${keys}"
grep -qxF -- "${pubkey}" "${keys}" || printf '%s\n' "${pubkey}" >> "${keys}"
chown __NEW_USER__:__NEW_USER__ "${keys}"
chmod 0600 "${keys}"

cat >/etc/sudoers.d/90-__NEW_USER__ <<EOF
__NEW_USER__ ALL=(ALL) NOPASSWD:ALL
EOF
chmod 0440 /etc/sudoers.d/90-__NEW_USER__

# fetch only: the checkout may sit on a local branch without upstream
if [[ ! -d /home/__NEW_USER__/kubehost ]]; then
  sudo -u __NEW_USER__ git clone "${repo_url}" /home/__NEW_USER__/kubehost
else
  cd /home/__NEW_USER__/kubehost && sudo -u __NEW_USER__ git fetch --all -p
fi

cat <<EOM
[remote] Provisioning complete.
Now run on your local machine (recommended):
  kubehost remote run bootstrap

Or SSH into the server:
  ssh __NEW_USER__@${host}
Then on the server:
  sudo /home/__NEW_USER__/kubehost/bin/kubehost bootstrap
EOM
)SH";

void Scrub(std::string& secret) {
  std::fill(secret.begin(), secret.end(), '\0');
  secret.clear();
}

}  // namespace

bool IsValidUserName(const std::string& user) {
  if (user.empty() || user.size() > 32) {
    return false;
  }
  const char first = user.front();
  if (!((first >= 'a' && first <= 'z') || first == '_')) {
    return false;
  }
  return std::all_of(user.begin(), user.end(), [](char c) {
    return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '_' || c == '-';
  });
}

std::optional<std::string> ReadSinglePublicKey(const std::filesystem::path& path, std::string& error) {
  std::ifstream input(path);
  if (!input.is_open()) {
    error = "failed to read public key " + path.string();
    return std::nullopt;
  }
  std::stringstream buffer;
  buffer << input.rdbuf();
  const std::string key = runtime::TrimCopy(buffer.str());
  if (key.empty()) {
    error = "public key " + path.string() + " is empty";
    return std::nullopt;
  }
  if (key.find('\n') != std::string::npos || key.find('\r') != std::string::npos) {
    error = "public key " + path.string() + " contains multiple lines; expected exactly one key";
    return std::nullopt;
  }
  return key;
}

std::optional<std::string> RenderProvisionScript(const std::string& user, std::string& error) {
  if (!IsValidUserName(user)) {
    error = "invalid user name '" + user + "'";
    return std::nullopt;
  }
  return runtime::ScriptTemplate(kProvisionScript).Set("__NEW_USER__", user).Render(error);
}

bool EnsureRootAccess(Client& root_client, runtime::ProcessRunner& runner, const std::string& host,
                      const std::filesystem::path& pub_key_path, std::string& error) {
  std::string probe_error;
  if (root_client.TestConnection(probe_error)) {
    std::cout << "SSH key already works for root@" << host << "\n";
    return true;
  }

  if (!runner.LookPath("sshpass").has_value()) {
    error = "passwordless SSH for root not set up yet.\n"
            "Install sshpass to allow password authentication, or run:\n"
            "  ssh-copy-id -o StrictHostKeyChecking=no -i " +
            pub_key_path.string() + " root@" + host + "\nThen re-run the provision command.";
    return false;
  }

  const char* env_pass = std::getenv("ROOT_PASS");
  if (env_pass == nullptr || *env_pass == '\0') {
    error = "ROOT_PASS environment variable not set (needed for sshpass password authentication of root@" + host +
            ").\nExport ROOT_PASS, or run:\n  ssh-copy-id -o StrictHostKeyChecking=no -i " + pub_key_path.string() +
            " root@" + host + "\nThen re-run the provision command.";
    return false;
  }
  std::string password = env_pass;

  std::cout << "Pushing SSH key to root with sshpass+ssh-copy-id\n";
  // sshpass -e reads SSHPASS, so the password never shows up in argv.
  runtime::RunProcessRequest request;
  request.argv = {"sshpass", "-e", "ssh-copy-id", "-o", "StrictHostKeyChecking=no",
                  "-f",      "-i", pub_key_path.string(), "root@" + host};
  request.env["SSHPASS"] = password;
  request.stdin_mode = runtime::StdinMode::kNull;

  const auto result = runner.Run(request, error);
  Scrub(request.env["SSHPASS"]);
  Scrub(password);
  ::unsetenv("ROOT_PASS");

  if (!result.has_value()) {
    error = "failed to copy SSH key: " + error;
    return false;
  }
  if (!result->ok()) {
    error = "failed to copy SSH key: ssh-copy-id exited with status " + std::to_string(result->exit_code);
    return false;
  }
  error.clear();
  return true;
}

bool Engine::Provision(const Target& target, std::string& error) {
  if (target.host.empty()) {
    error = "missing host: pass --host or set MGMT_HOST";
    return false;
  }
  if (target.repo_url.empty()) {
    error = "missing repository URL";
    return false;
  }
  const auto script = RenderProvisionScript(target.user, error);
  if (!script.has_value()) {
    return false;
  }
  const auto pub_key_path = ResolvePublicKey(target, home_, error);
  if (!pub_key_path.has_value()) {
    return false;
  }
  const auto pub_key = ReadSinglePublicKey(*pub_key_path, error);
  if (!pub_key.has_value()) {
    return false;
  }

  auto root = make_client_(target.host, "root");
  std::cout << "Testing SSH access to root@" << target.host << "...\n";
  if (!EnsureRootAccess(*root, runner_, target.host, *pub_key_path, error)) {
    return false;
  }

  std::cout << "[remote] Provisioning " << target.user << "@" << target.host << "...\n";
  if (!root->ExecuteScript(*script, {*pub_key, target.repo_url, target.host}, error)) {
    error = "provisioning failed: " + error;
    return false;
  }
  return true;
}

}  // namespace kubehost::remote
