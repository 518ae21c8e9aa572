#include "kubehost/remote/engine.h"

#include <utility>

namespace kubehost::remote {

ClientFactory MakeSshClientFactory(runtime::ProcessRunner& runner) {
  return [&runner](const std::string& host, const std::string& user) -> std::unique_ptr<Client> {
    return std::make_unique<SshClient>(host, user, runner);
  };
}

Engine::Engine(runtime::ProcessRunner& runner, ClientFactory make_client, std::filesystem::path home)
    : runner_(runner), make_client_(std::move(make_client)), home_(std::move(home)) {}

std::unique_ptr<Client> Engine::ConnectedClient(const Target& target, std::string& error) {
  if (target.host.empty()) {
    error = "missing host: pass --host or set MGMT_HOST";
    return nullptr;
  }
  return make_client_(target.host, target.user);
}

bool Engine::GitSync(const Target& target, const GitOptions& opts, std::string& error) {
  auto client = ConnectedClient(target, error);
  if (!client) {
    return false;
  }
  if (!RemoteGitSync(*client, RemoteRepoDir(target), opts, error)) {
    error = "git sync failed: " + error;
    return false;
  }
  return true;
}

bool Engine::BuildAndUpload(const Target& target, const std::filesystem::path& project_root, const GitOptions& opts,
                            std::string& error) {
  auto client = ConnectedClient(target, error);
  if (!client) {
    return false;
  }
  return RemoteBuildAndUpload(*client, runner_, target, project_root, opts, error);
}

bool Engine::Run(const Target& target, const RunOptions& opts, std::string& error) {
  // Cheap local checks come before any connection is set up.
  if (!ValidateRunArgs(opts.args, error)) {
    return false;
  }
  auto client = ConnectedClient(target, error);
  if (!client) {
    return false;
  }
  return RunWithClient(*client, target, opts, error);
}

bool Engine::Smoke(const Target& target, const GitOptions& opts, const std::filesystem::path& project_root,
                   std::string& error) {
  auto client = ConnectedClient(target, error);
  if (!client) {
    return false;
  }
  return SmokeWithClient(*client, runner_, target, opts, project_root, error);
}

}  // namespace kubehost::remote
