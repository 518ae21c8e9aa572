#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "kubehost/config/types.h"

namespace kubehost::config {

inline constexpr const char* kDefaultConfigFile = "kubehost.yaml";

/// A single validation or loading error found while parsing config input.
struct ConfigLoadError {
  /// Dot-separated path that identifies where the error occurred.
  std::string context;
  /// Human-readable description of the failure.
  std::string message;
};

/// Result for config loading with partial diagnostics.
///
/// `config` is set only when parsing produced a usable model; `errors` lists every
/// problem found, not just the first.
struct ConfigLoadResult {
  std::optional<Config> config;
  std::vector<ConfigLoadError> errors;

  /// True when a usable config exists and no errors were recorded.
  bool ok() const { return config.has_value() && errors.empty(); }
};

/// Parses YAML text. `source` names the input in errors about the document as a whole.
ConfigLoadResult LoadConfigFromString(const std::string& contents, const std::string& source);

/// Loads and validates a kubehost config file from disk.
ConfigLoadResult LoadConfigFromFile(const std::string& path);

/// Which config file an invocation should read.
struct ConfigLocation {
  std::filesystem::path path;
  /// True for `--config-file` and `KUBEHOST_CONFIG`; a missing file is then an error.
  bool required = false;
};

/// `flag_value`, else `$KUBEHOST_CONFIG`, else `./kubehost.yaml` (optional).
ConfigLocation ResolveConfigLocation(const std::string& flag_value);

/// Loads the located file. A missing optional file yields an empty, valid config.
ConfigLoadResult LoadConfig(const ConfigLocation& location);

}  // namespace kubehost::config
