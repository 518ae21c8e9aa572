#pragma once

#include <optional>
#include <string>

namespace kubehost::config {

/// `remote:` section. Every field is optional; absent values fall through to env and defaults.
struct RemoteSection {
  std::optional<std::string> host;
  std::optional<std::string> user;
  std::optional<std::string> pub_key;
  std::optional<std::string> repo_url;
  std::optional<std::string> env_file;
};

/// `tunnel:` section.
struct TunnelSection {
  std::optional<std::string> host;
  std::optional<std::string> user;
  std::optional<int> local_port;
  std::optional<std::string> remote_host;
  std::optional<int> remote_port;
};

/// `portForward:` section.
struct PortForwardSection {
  std::optional<std::string> namespace_name;
  std::optional<std::string> target;
  std::optional<std::string> selector;
  std::optional<std::string> fallback_service;
  std::optional<int> local_port;
  std::optional<int> remote_port;
  std::optional<int> readiness_timeout_ms;
};

/// Root of `kubehost.yaml`.
struct Config {
  int version = 1;
  RemoteSection remote;
  TunnelSection tunnel;
  PortForwardSection port_forward;
};

}  // namespace kubehost::config
