#pragma once

#include <filesystem>
#include <string>

namespace kubehost::runtime {

//! Identity tuple of one SSH local-port-forward tunnel.
struct TunnelIdentity {
  std::string user;
  std::string host;
  int local_port = 0;
};

//! Identity tuple of one background kubectl port-forward.
struct PortForwardIdentity {
  std::string namespace_name;
  int local_port = 0;
};

//! PID/log file pair owned by one port-forward identity.
struct PortForwardPaths {
  std::filesystem::path pid_file;
  std::filesystem::path log_file;
};

//! `$XDG_RUNTIME_DIR` when set, otherwise `/tmp`.
std::filesystem::path DefaultRuntimeDirectory();

//! Encodes every byte outside `[A-Za-z0-9.-]` as `%XX`, so distinct inputs stay distinct.
std::string SanitizePathToken(const std::string& token);

//! `<runtime_dir>/kubehost-tunnel-<user>_<host>-<port>.ctl`
std::filesystem::path ControlSocketPath(const TunnelIdentity& identity, const std::filesystem::path& runtime_dir);

//! `<runtime_dir>/kubehost-pf-<namespace>-<port>.{pid,log}`
PortForwardPaths PortForwardFiles(const PortForwardIdentity& identity, const std::filesystem::path& runtime_dir);

}  // namespace kubehost::runtime
