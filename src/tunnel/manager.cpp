#include "kubehost/tunnel/manager.h"

#include <utility>

#include "kubehost/runtime/net_probe.h"
#include "kubehost/runtime/shell.h"

namespace kubehost::tunnel {

TunnelManager::TunnelManager(TunnelSettings settings, runtime::ProcessRunner& runner,
                             std::filesystem::path runtime_dir)
    : settings_(std::move(settings)),
      runner_(runner),
      runtime_dir_(std::move(runtime_dir)),
      port_probe_(runtime::IsLocalPortInUse) {}

std::filesystem::path TunnelManager::ControlSocket() const {
  return runtime::ControlSocketPath(
      runtime::TunnelIdentity{.user = settings_.user, .host = settings_.host, .local_port = settings_.local_port},
      runtime_dir_);
}

std::string TunnelManager::Destination() const { return settings_.user + "@" + settings_.host; }

std::optional<runtime::ProcessResult> TunnelManager::ControlCommand(const std::string& operation,
                                                                    std::string& error) {
  runtime::RunProcessRequest request;
  request.argv = {"ssh", "-S", ControlSocket().string(), "-O", operation, Destination()};
  request.stdin_mode = runtime::StdinMode::kNull;
  request.output_mode = runtime::OutputMode::kCaptureCombined;
  return runner_.Run(request, error);
}

bool TunnelManager::IsRunning() {
  std::string error;
  const auto result = ControlCommand("check", error);
  return result.has_value() && result->ok();
}

TunnelStatus TunnelManager::Status() {
  TunnelStatus status;
  status.control_socket = ControlSocket();
  std::string error;
  const auto result = ControlCommand("check", error);
  if (result.has_value()) {
    status.running = result->ok();
    status.control_output = runtime::TrimCopy(result->output);
  } else {
    status.control_output = error;
  }
  status.local_port_bound = port_probe_(settings_.local_port);
  return status;
}

StartResult TunnelManager::Start() {
  if (IsRunning()) {
    return {.status = StartStatus::kAlreadyRunning, .error = ""};
  }

  if (port_probe_(settings_.local_port)) {
    return {.status = StartStatus::kPortInUse,
            .error = "localhost:" + std::to_string(settings_.local_port) + " is already in use"};
  }

  const std::string forward = std::to_string(settings_.local_port) + ":" + settings_.remote_host + ":" +
                              std::to_string(settings_.remote_port);
  runtime::RunProcessRequest request;
  request.argv = {"ssh",
                  "-M",
                  "-S",
                  ControlSocket().string(),
                  "-fN",
                  "-L",
                  forward,
                  Destination(),
                  "-o",
                  "ControlPersist=yes",
                  "-o",
                  "ExitOnForwardFailure=yes",
                  "-o",
                  "ServerAliveInterval=30",
                  "-o",
                  "ServerAliveCountMax=3"};
  request.stdin_mode = runtime::StdinMode::kNull;
  // ssh -f points the backgrounded master's stdio at /dev/null, so capturing here
  // only sees the foreground authentication phase.
  request.output_mode = runtime::OutputMode::kCaptureCombined;

  std::string error;
  const auto result = runner_.Run(request, error);
  if (!result.has_value()) {
    return {.status = StartStatus::kFailed, .error = "failed to start tunnel: " + error};
  }
  if (!result->ok()) {
    const std::string output = runtime::TrimCopy(result->output);
    if (output.find("Permission denied") != std::string::npos) {
      return {.status = StartStatus::kAuthFailed,
              .error = "SSH authentication failed for " + Destination() + ": " + output};
    }
    std::string message = "failed to start tunnel: ssh exited with status " + std::to_string(result->exit_code);
    if (!output.empty()) {
      message += ": " + output;
    }
    return {.status = StartStatus::kFailed, .error = message};
  }
  return {.status = StartStatus::kStarted, .error = ""};
}

bool TunnelManager::Stop(std::string& error) {
  if (!IsRunning()) {
    error.clear();
    return true;
  }
  const auto result = ControlCommand("exit", error);
  if (!result.has_value()) {
    error = "failed to stop tunnel: " + error;
    return false;
  }
  if (!result->ok()) {
    error = "failed to stop tunnel: " + runtime::TrimCopy(result->output);
    return false;
  }
  error.clear();
  return true;
}

}  // namespace kubehost::tunnel
