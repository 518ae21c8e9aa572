#include "kubehost/config/loader.h"

#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <fstream>
#include <set>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace kubehost::config {
namespace {

void AddError(std::vector<ConfigLoadError>& errors, std::string context, std::string message) {
  errors.push_back(ConfigLoadError{std::move(context), std::move(message)});
}

bool IsPortValid(int value) { return value >= 1 && value <= 65535; }

void EnsureAllowedKeys(const YAML::Node& node, const std::string& context, const std::set<std::string>& allowed,
                       std::vector<ConfigLoadError>& errors) {
  if (!node || !node.IsMap()) {
    return;
  }
  for (const auto& entry : node) {
    if (!entry.first.IsScalar()) {
      AddError(errors, context, "encountered non-string key");
      continue;
    }
    const auto key = entry.first.as<std::string>();
    if (allowed.count(key) == 0) {
      AddError(errors, context, "unknown key '" + key + "'");
    }
  }
}

std::optional<std::string> ReadOptionalString(const YAML::Node& node, const std::string& context,
                                              std::vector<ConfigLoadError>& errors) {
  if (!node || node.IsNull()) {
    return std::nullopt;
  }
  if (!node.IsScalar()) {
    AddError(errors, context, "expected string");
    return std::nullopt;
  }
  return node.as<std::string>();
}

std::optional<int> ReadOptionalInt(const YAML::Node& node, const std::string& context,
                                   std::vector<ConfigLoadError>& errors) {
  if (!node || node.IsNull()) {
    return std::nullopt;
  }
  if (!node.IsScalar()) {
    AddError(errors, context, "expected integer");
    return std::nullopt;
  }
  try {
    return node.as<int>();
  } catch (const YAML::BadConversion&) {
    AddError(errors, context, "expected integer");
    return std::nullopt;
  }
}

std::optional<int> ReadOptionalPort(const YAML::Node& node, const std::string& context,
                                    std::vector<ConfigLoadError>& errors) {
  const auto port = ReadOptionalInt(node, context, errors);
  if (port.has_value() && !IsPortValid(*port)) {
    AddError(errors, context, "port must be between 1 and 65535");
    return std::nullopt;
  }
  return port;
}

std::optional<std::string> ReadOptionalNonEmpty(const YAML::Node& node, const std::string& context,
                                                std::vector<ConfigLoadError>& errors) {
  auto value = ReadOptionalString(node, context, errors);
  if (value.has_value() && value->empty()) {
    AddError(errors, context, "cannot be empty");
    return std::nullopt;
  }
  return value;
}

bool ExpectSection(const YAML::Node& node, const std::string& context, std::vector<ConfigLoadError>& errors) {
  if (!node || node.IsNull()) {
    return false;
  }
  if (!node.IsMap()) {
    AddError(errors, context, "expected mapping");
    return false;
  }
  return true;
}

RemoteSection ParseRemote(const YAML::Node& node, std::vector<ConfigLoadError>& errors) {
  RemoteSection remote;
  if (!ExpectSection(node, "remote", errors)) {
    return remote;
  }
  EnsureAllowedKeys(node, "remote", {"host", "user", "pubkey", "repo", "envFile"}, errors);
  remote.host = ReadOptionalNonEmpty(node["host"], "remote.host", errors);
  remote.user = ReadOptionalNonEmpty(node["user"], "remote.user", errors);
  remote.pub_key = ReadOptionalNonEmpty(node["pubkey"], "remote.pubkey", errors);
  remote.repo_url = ReadOptionalNonEmpty(node["repo"], "remote.repo", errors);
  remote.env_file = ReadOptionalNonEmpty(node["envFile"], "remote.envFile", errors);
  return remote;
}

TunnelSection ParseTunnel(const YAML::Node& node, std::vector<ConfigLoadError>& errors) {
  TunnelSection tunnel;
  if (!ExpectSection(node, "tunnel", errors)) {
    return tunnel;
  }
  EnsureAllowedKeys(node, "tunnel", {"host", "user", "localPort", "remoteHost", "remotePort"}, errors);
  tunnel.host = ReadOptionalNonEmpty(node["host"], "tunnel.host", errors);
  tunnel.user = ReadOptionalNonEmpty(node["user"], "tunnel.user", errors);
  tunnel.local_port = ReadOptionalPort(node["localPort"], "tunnel.localPort", errors);
  tunnel.remote_host = ReadOptionalNonEmpty(node["remoteHost"], "tunnel.remoteHost", errors);
  tunnel.remote_port = ReadOptionalPort(node["remotePort"], "tunnel.remotePort", errors);
  return tunnel;
}

PortForwardSection ParsePortForward(const YAML::Node& node, std::vector<ConfigLoadError>& errors) {
  PortForwardSection pf;
  if (!ExpectSection(node, "portForward", errors)) {
    return pf;
  }
  EnsureAllowedKeys(node, "portForward",
                    {"namespace", "target", "selector", "fallbackService", "localPort", "remotePort",
                     "readinessTimeoutMs"},
                    errors);
  pf.namespace_name = ReadOptionalNonEmpty(node["namespace"], "portForward.namespace", errors);
  pf.target = ReadOptionalNonEmpty(node["target"], "portForward.target", errors);
  pf.selector = ReadOptionalNonEmpty(node["selector"], "portForward.selector", errors);
  pf.fallback_service = ReadOptionalNonEmpty(node["fallbackService"], "portForward.fallbackService", errors);
  pf.local_port = ReadOptionalPort(node["localPort"], "portForward.localPort", errors);
  pf.remote_port = ReadOptionalPort(node["remotePort"], "portForward.remotePort", errors);
  if (const auto timeout = ReadOptionalInt(node["readinessTimeoutMs"], "portForward.readinessTimeoutMs", errors)) {
    if (*timeout <= 0) {
      AddError(errors, "portForward.readinessTimeoutMs", "must be positive");
    } else {
      pf.readiness_timeout_ms = timeout;
    }
  }
  return pf;
}

}  // namespace

ConfigLoadResult LoadConfigFromString(const std::string& contents, const std::string& source) {
  ConfigLoadResult result;
  YAML::Node root;
  try {
    root = YAML::Load(contents);
  } catch (const YAML::ParserException& ex) {
    AddError(result.errors, source, std::string("YAML parse error: ") + ex.what());
    return result;
  }

  if (!root || !root.IsMap()) {
    AddError(result.errors, source, "expected top-level mapping");
    return result;
  }

  EnsureAllowedKeys(root, "root", {"version", "remote", "tunnel", "portForward"}, result.errors);

  Config config;
  if (const auto version = ReadOptionalInt(root["version"], "version", result.errors)) {
    config.version = *version;
    if (config.version != 1) {
      AddError(result.errors, "version", "only schema version 1 is supported");
    }
  } else {
    AddError(result.errors, "version", "schema version is required");
  }

  config.remote = ParseRemote(root["remote"], result.errors);
  config.tunnel = ParseTunnel(root["tunnel"], result.errors);
  config.port_forward = ParsePortForward(root["portForward"], result.errors);

  result.config = std::move(config);
  return result;
}

ConfigLoadResult LoadConfigFromFile(const std::string& path) {
  std::ifstream input(path);
  if (!input.is_open()) {
    ConfigLoadResult result;
    AddError(result.errors, path, "unable to open config file");
    return result;
  }
  std::stringstream buffer;
  buffer << input.rdbuf();
  return LoadConfigFromString(buffer.str(), path);
}

ConfigLocation ResolveConfigLocation(const std::string& flag_value) {
  if (!flag_value.empty()) {
    return {.path = flag_value, .required = true};
  }
  if (const char* env_path = std::getenv("KUBEHOST_CONFIG")) {
    if (env_path[0] != '\0') {
      return {.path = env_path, .required = true};
    }
  }
  return {.path = kDefaultConfigFile, .required = false};
}

ConfigLoadResult LoadConfig(const ConfigLocation& location) {
  std::error_code ec;
  if (!location.required && !std::filesystem::exists(location.path, ec)) {
    ConfigLoadResult result;
    result.config = Config{};
    return result;
  }
  return LoadConfigFromFile(location.path.string());
}

}  // namespace kubehost::config
