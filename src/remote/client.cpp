#include "kubehost/remote/client.h"

#include <sstream>
#include <utility>

#include "kubehost/remote/types.h"
#include "kubehost/runtime/shell.h"

namespace kubehost::remote {

std::filesystem::path SelectIdentityFile(const std::filesystem::path& home) {
  if (home.empty()) {
    return {};
  }
  std::error_code ec;
  for (const char* name : {"id_ed25519", "id_rsa"}) {
    const auto candidate = home / ".ssh" / name;
    if (std::filesystem::exists(candidate, ec)) {
      return candidate;
    }
  }
  return {};
}

SshClient::SshClient(std::string host, std::string user, runtime::ProcessRunner& runner)
    : SshClient(std::move(host), std::move(user), std::filesystem::path(), runner) {
  identity_file_ = SelectIdentityFile(HomeDirectory());
}

SshClient::SshClient(std::string host, std::string user, std::filesystem::path identity_file,
                     runtime::ProcessRunner& runner)
    : host_(std::move(host)), user_(std::move(user)), identity_file_(std::move(identity_file)), runner_(runner) {}

std::vector<std::string> SshClient::BaseArgs(const std::string& program) const {
  std::vector<std::string> argv = {program, "-o", "StrictHostKeyChecking=no"};
  if (!identity_file_.empty()) {
    argv.push_back("-i");
    argv.push_back(identity_file_.string());
  }
  return argv;
}

std::string SshClient::Destination() const { return user_ + "@" + host_; }

bool SshClient::RunChecked(const runtime::RunProcessRequest& request, std::string& error) {
  const auto result = runner_.Run(request, error);
  if (!result.has_value()) {
    return false;
  }
  if (!result->ok()) {
    std::ostringstream oss;
    oss << request.argv.front() << " to " << Destination() << " exited with status " << result->exit_code;
    error = oss.str();
    return false;
  }
  error.clear();
  return true;
}

bool SshClient::TestConnection(std::string& error) {
  runtime::RunProcessRequest request;
  request.argv = BaseArgs("ssh");
  request.argv.push_back("-o");
  request.argv.push_back("BatchMode=yes");
  request.argv.push_back(Destination());
  request.argv.push_back("true");
  request.stdin_mode = runtime::StdinMode::kNull;
  request.output_mode = runtime::OutputMode::kDiscard;
  if (!RunChecked(request, error)) {
    error = "cannot reach " + Destination() + ": " + error;
    return false;
  }
  return true;
}

bool SshClient::Execute(const std::string& command, const std::vector<std::string>& args, bool force_tty,
                        std::string& error) {
  return ExecuteWithEnv(command, args, {}, force_tty, error);
}

bool SshClient::ExecuteWithEnv(const std::string& command, const std::vector<std::string>& args,
                               const std::map<std::string, std::string>& env, bool force_tty, std::string& error) {
  for (const auto& [key, value] : env) {
    if (!runtime::IsShellVariableName(key)) {
      error = "invalid environment variable name '" + key + "'";
      return false;
    }
  }
  return RunCommandString(runtime::JoinShellCommand(command, args, env), force_tty, error);
}

bool SshClient::ExecuteScript(const std::string& script, const std::vector<std::string>& args, std::string& error) {
  std::vector<std::string> bash_args = {"-s", "--"};
  bash_args.insert(bash_args.end(), args.begin(), args.end());

  runtime::RunProcessRequest request;
  request.argv = BaseArgs("ssh");
  request.argv.push_back(Destination());
  request.argv.push_back(runtime::JoinShellCommand("bash", bash_args));
  request.stdin_mode = runtime::StdinMode::kString;
  request.stdin_data = script;
  return RunChecked(request, error);
}

bool SshClient::Upload(const std::filesystem::path& local_path, const std::string& remote_path, std::string& error) {
  runtime::RunProcessRequest request;
  request.argv = BaseArgs("scp");
  request.argv.push_back(local_path.string());
  request.argv.push_back(Destination() + ":" + remote_path);
  request.stdin_mode = runtime::StdinMode::kNull;
  return RunChecked(request, error);
}

bool SshClient::RunCommandString(const std::string& command_line, bool force_tty, std::string& error) {
  runtime::RunProcessRequest request;
  request.argv = BaseArgs("ssh");
  if (force_tty) {
    request.argv.push_back("-tt");
  }
  request.argv.push_back(Destination());
  request.argv.push_back(command_line);
  return RunChecked(request, error);
}

std::optional<std::string> SshClient::OutputCommand(const std::string& command, const std::vector<std::string>& args,
                                                    std::string& error) {
  runtime::RunProcessRequest request;
  request.argv = BaseArgs("ssh");
  request.argv.push_back(Destination());
  request.argv.push_back(runtime::JoinShellCommand(command, args));
  request.stdin_mode = runtime::StdinMode::kNull;
  request.output_mode = runtime::OutputMode::kCaptureStdout;

  const auto result = runner_.Run(request, error);
  if (!result.has_value()) {
    return std::nullopt;
  }
  if (!result->ok()) {
    std::ostringstream oss;
    oss << "ssh to " << Destination() << " exited with status " << result->exit_code;
    error = oss.str();
    return std::nullopt;
  }
  error.clear();
  return result->output;
}

}  // namespace kubehost::remote
