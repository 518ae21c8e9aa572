#pragma once

#include <chrono>
#include <filesystem>
#include <functional>
#include <string>
#include <utility>

#include "kubehost/runtime/identity.h"
#include "kubehost/runtime/process_runner.h"

namespace kubehost::portforward {

inline constexpr const char* kDefaultNamespace = "openclaw";
inline constexpr int kDefaultPort = 18789;
inline constexpr std::chrono::milliseconds kDefaultReadinessTimeout{3000};

/// One `kubectl -n <namespace> port-forward <target> <local>:<remote>` process.
struct PortForwardSettings {
  std::string namespace_name = kDefaultNamespace;
  std::string target;
  int local_port = kDefaultPort;
  int remote_port = kDefaultPort;
  std::string kubectl = "kubectl";
};

enum class StartStatus {
  kStarted,
  kAlreadyRunning,
  kPortInUse,
  kFailed,
};

struct StartResult {
  StartStatus status = StartStatus::kFailed;
  int pid = 0;
  std::string error;

  bool ok() const { return status == StartStatus::kStarted || status == StartStatus::kAlreadyRunning; }
};

enum class State {
  kStopped,
  kRunning,
};

struct PortForwardStatus {
  State state = State::kStopped;
  int pid = 0;
  int local_port = 0;
  std::filesystem::path log_file;

  bool running() const { return state == State::kRunning; }
};

/// Lifecycle of one background port-forward, keyed by (namespace, local port).
/// The PID file is the only record; a dead or unreadable one counts as stopped.
class PortForwardManager {
 public:
  using PortProbe = std::function<bool(int)>;

  PortForwardManager(PortForwardSettings settings, runtime::ProcessRunner& runner,
                     std::filesystem::path runtime_dir = runtime::DefaultRuntimeDirectory());

  /// Replaces the "is something already listening" check (defaults to a TCP connect).
  void set_port_probe(PortProbe probe) { port_probe_ = std::move(probe); }
  /// Delay before checking that a freshly started child survived.
  void set_settle_delay(std::chrono::milliseconds delay) { settle_delay_ = delay; }

  const PortForwardSettings& settings() const { return settings_; }
  runtime::PortForwardPaths Files() const;

  StartResult Start();
  PortForwardStatus Status();
  /// Stops the tracked process group. Without a PID file this is a no-op.
  bool Stop(std::string& error);

 private:
  void ClearBookkeeping();

  PortForwardSettings settings_;
  runtime::ProcessRunner& runner_;
  std::filesystem::path runtime_dir_;
  PortProbe port_probe_;
  std::chrono::milliseconds settle_delay_{200};
};

/// Last `max_bytes` of `path`, trimmed. Empty when unreadable.
std::string ReadLogTail(const std::filesystem::path& path, std::size_t max_bytes = 2048);

const char* ToString(State state);

}  // namespace kubehost::portforward
