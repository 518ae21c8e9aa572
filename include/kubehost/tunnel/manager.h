#pragma once

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <utility>

#include "kubehost/runtime/identity.h"
#include "kubehost/runtime/process_runner.h"

namespace kubehost::tunnel {

inline constexpr int kDefaultLocalPort = 6443;
inline constexpr const char* kDefaultRemoteHost = "127.0.0.1";
inline constexpr int kDefaultRemotePort = 6443;

/// One SSH local port forward: `localhost:local_port -> remote_host:remote_port` via `user@host`.
struct TunnelSettings {
  std::string user;
  std::string host;
  int local_port = kDefaultLocalPort;
  std::string remote_host = kDefaultRemoteHost;
  int remote_port = kDefaultRemotePort;
};

enum class StartStatus {
  kStarted,
  kAlreadyRunning,
  kPortInUse,
  kAuthFailed,
  kFailed,
};

struct StartResult {
  StartStatus status = StartStatus::kFailed;
  std::string error;

  bool ok() const { return status == StartStatus::kStarted || status == StartStatus::kAlreadyRunning; }
};

struct TunnelStatus {
  bool running = false;
  std::filesystem::path control_socket;
  /// Whatever `ssh -O check` printed, trimmed.
  std::string control_output;
  bool local_port_bound = false;
};

/// Manages the control-master SSH process for one tunnel identity. No state is kept
/// between calls; the control socket is the only source of truth.
class TunnelManager {
 public:
  using PortProbe = std::function<bool(int)>;

  TunnelManager(TunnelSettings settings, runtime::ProcessRunner& runner,
                std::filesystem::path runtime_dir = runtime::DefaultRuntimeDirectory());

  /// Replaces the local port check (defaults to `runtime::IsLocalPortInUse`).
  void set_port_probe(PortProbe probe) { port_probe_ = std::move(probe); }

  const TunnelSettings& settings() const { return settings_; }
  std::filesystem::path ControlSocket() const;

  bool IsRunning();
  TunnelStatus Status();
  StartResult Start();
  /// Closes the master connection. Succeeds without doing anything when not running.
  bool Stop(std::string& error);

 private:
  std::optional<runtime::ProcessResult> ControlCommand(const std::string& operation, std::string& error);
  std::string Destination() const;

  TunnelSettings settings_;
  runtime::ProcessRunner& runner_;
  std::filesystem::path runtime_dir_;
  PortProbe port_probe_;
};

}  // namespace kubehost::tunnel
