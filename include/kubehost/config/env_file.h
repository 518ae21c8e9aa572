#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <string>

namespace kubehost::config {

using EnvMap = std::map<std::string, std::string>;

/// Parses `KEY=value` lines. Blank lines and `#` comments are skipped, keys and values
/// are trimmed and one pair of matching surrounding quotes is removed. With `expand`,
/// `${VAR}` is replaced in a single pass by an earlier key of the same file, then by the
/// process environment, then by the empty string.
EnvMap ParseEnvText(const std::string& text, bool expand);

/// Reads and parses `path` with expansion. Fails when the file cannot be read.
std::optional<EnvMap> LoadEnvFile(const std::filesystem::path& path, std::string& error);

/// `${VAR}` expansion against `known`, then the process environment. An unterminated
/// `${` is kept verbatim.
std::string ExpandVariables(const std::string& value, const EnvMap& known);

/// First existing file among `config/kubehost.env` and `.env` below `base`.
std::optional<std::filesystem::path> FindDefaultEnvFile(const std::filesystem::path& base);

/// Process environment value, else the env-file `overlay` value, else nullopt. Empty
/// values count as unset.
std::optional<std::string> LookupEnv(const EnvMap& overlay, const std::string& key);

}  // namespace kubehost::config
