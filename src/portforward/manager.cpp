#include "kubehost/portforward/manager.h"

#include <fstream>
#include <iostream>
#include <iterator>
#include <thread>

#include "kubehost/runtime/net_probe.h"
#include "kubehost/runtime/pid_file.h"
#include "kubehost/runtime/shell.h"

namespace kubehost::portforward {
namespace {

bool LocalPortAcceptsConnections(int port) {
  return runtime::TcpProbe("127.0.0.1", port, std::chrono::milliseconds(200));
}

}  // namespace

PortForwardManager::PortForwardManager(PortForwardSettings settings, runtime::ProcessRunner& runner,
                                       std::filesystem::path runtime_dir)
    : settings_(std::move(settings)),
      runner_(runner),
      runtime_dir_(std::move(runtime_dir)),
      port_probe_(LocalPortAcceptsConnections) {}

runtime::PortForwardPaths PortForwardManager::Files() const {
  return runtime::PortForwardFiles(
      runtime::PortForwardIdentity{.namespace_name = settings_.namespace_name, .local_port = settings_.local_port},
      runtime_dir_);
}

void PortForwardManager::ClearBookkeeping() {
  std::string error;
  if (!runtime::RemovePidFile(Files().pid_file, error)) {
    std::cerr << "warning: " << error << "\n";
  }
}

StartResult PortForwardManager::Start() {
  const auto files = Files();
  if (const auto pid = runtime::ReadPidFile(files.pid_file); pid.has_value()) {
    if (runner_.IsAlive(*pid)) {
      return {.status = StartStatus::kAlreadyRunning, .pid = *pid, .error = ""};
    }
    ClearBookkeeping();
  }

  if (port_probe_(settings_.local_port)) {
    return {.status = StartStatus::kPortInUse,
            .pid = 0,
            .error = "local port " + std::to_string(settings_.local_port) +
                     " is already in use; stop the existing forward or use a different local port"};
  }

  std::error_code ec;
  std::filesystem::create_directories(runtime_dir_, ec);
  if (ec) {
    return {.status = StartStatus::kFailed,
            .pid = 0,
            .error = "failed to create runtime directory " + runtime_dir_.string() + ": " + ec.message()};
  }

  runtime::StartProcessRequest request;
  request.argv = {settings_.kubectl,
                  "-n",
                  settings_.namespace_name,
                  "port-forward",
                  settings_.target,
                  std::to_string(settings_.local_port) + ":" + std::to_string(settings_.remote_port)};
  request.log_path = files.log_file;

  std::string error;
  const auto started = runner_.Start(request, error);
  if (!started.has_value()) {
    return {.status = StartStatus::kFailed, .pid = 0, .error = "failed to start port-forward: " + error};
  }
  const int pid = started->pid;

  if (!runtime::WritePidFile(files.pid_file, pid, error)) {
    std::string stop_error;
    if (!runner_.Stop(pid, stop_error)) {
      std::cerr << "warning: " << stop_error << "\n";
    }
    return {.status = StartStatus::kFailed, .pid = pid, .error = error};
  }

  std::this_thread::sleep_for(settle_delay_);
  if (!runner_.IsAlive(pid)) {
    ClearBookkeeping();
    std::string message = "port-forward process exited immediately (pid " + std::to_string(pid) + ")";
    const std::string tail = ReadLogTail(files.log_file);
    if (!tail.empty()) {
      message += ": " + tail;
    }
    return {.status = StartStatus::kFailed, .pid = pid, .error = message};
  }

  return {.status = StartStatus::kStarted, .pid = pid, .error = ""};
}

PortForwardStatus PortForwardManager::Status() {
  const auto files = Files();
  PortForwardStatus status;
  status.local_port = settings_.local_port;
  status.log_file = files.log_file;

  const auto pid = runtime::ReadPidFile(files.pid_file);
  if (!pid.has_value()) {
    std::error_code ec;
    if (std::filesystem::exists(files.pid_file, ec)) {
      ClearBookkeeping();
    }
    return status;
  }
  if (!runner_.IsAlive(*pid)) {
    ClearBookkeeping();
    return status;
  }
  status.state = State::kRunning;
  status.pid = *pid;
  return status;
}

bool PortForwardManager::Stop(std::string& error) {
  const auto files = Files();
  const auto pid = runtime::ReadPidFile(files.pid_file);
  if (!pid.has_value()) {
    std::error_code ec;
    if (std::filesystem::exists(files.pid_file, ec)) {
      ClearBookkeeping();
    }
    error.clear();
    return true;
  }
  if (runner_.IsAlive(*pid) && !runner_.Stop(*pid, error)) {
    error = "failed to stop port-forward (pid " + std::to_string(*pid) + "): " + error;
    return false;
  }
  return runtime::RemovePidFile(files.pid_file, error);
}

std::string ReadLogTail(const std::filesystem::path& path, std::size_t max_bytes) {
  if (max_bytes == 0) {
    return "";
  }
  std::ifstream input(path, std::ios::binary);
  if (!input.is_open()) {
    return "";
  }
  const std::string data((std::istreambuf_iterator<char>(input)), std::istreambuf_iterator<char>());
  if (data.size() <= max_bytes) {
    return runtime::TrimCopy(data);
  }
  return runtime::TrimCopy(data.substr(data.size() - max_bytes));
}

const char* ToString(State state) {
  switch (state) {
    case State::kStopped:
      return "stopped";
    case State::kRunning:
      return "running";
  }
  return "unknown";
}

}  // namespace kubehost::portforward
