#include "kubehost/config/env_file.h"

#include <cstdlib>
#include <fstream>
#include <sstream>
#include <utility>

#include "kubehost/runtime/shell.h"

namespace kubehost::config {
namespace {

std::string StripMatchingQuotes(const std::string& value) {
  if (value.size() >= 2) {
    const char first = value.front();
    const char last = value.back();
    if ((first == '"' && last == '"') || (first == '\'' && last == '\'')) {
      return value.substr(1, value.size() - 2);
    }
  }
  return value;
}

std::optional<std::string> ReadWholeFile(const std::filesystem::path& path, std::string& error) {
  std::ifstream input(path);
  if (!input.is_open()) {
    error = "failed to open env file " + path.string();
    return std::nullopt;
  }
  std::stringstream buffer;
  buffer << input.rdbuf();
  error.clear();
  return buffer.str();
}

}  // namespace

std::string ExpandVariables(const std::string& value, const EnvMap& known) {
  std::string result;
  result.reserve(value.size());
  std::size_t pos = 0;
  while (pos < value.size()) {
    const auto start = value.find("${", pos);
    if (start == std::string::npos) {
      result.append(value, pos, std::string::npos);
      break;
    }
    result.append(value, pos, start - pos);
    const auto end = value.find('}', start + 2);
    if (end == std::string::npos) {
      result.append(value, start, std::string::npos);
      break;
    }
    const std::string name = value.substr(start + 2, end - start - 2);
    if (const auto it = known.find(name); it != known.end()) {
      result += it->second;
    } else if (const char* env_value = std::getenv(name.c_str())) {
      result += env_value;
    }
    pos = end + 1;
  }
  return result;
}

EnvMap ParseEnvText(const std::string& text, bool expand) {
  EnvMap values;
  std::istringstream lines(text);
  std::string line;
  while (std::getline(lines, line)) {
    const std::string trimmed = runtime::TrimCopy(line);
    if (trimmed.empty() || trimmed.front() == '#') {
      continue;
    }
    const auto eq = trimmed.find('=');
    if (eq == std::string::npos) {
      continue;
    }
    const std::string key = runtime::TrimCopy(trimmed.substr(0, eq));
    if (key.empty()) {
      continue;
    }
    std::string value = StripMatchingQuotes(runtime::TrimCopy(trimmed.substr(eq + 1)));
    if (expand) {
      value = ExpandVariables(value, values);
    }
    values[key] = std::move(value);
  }
  return values;
}

std::optional<EnvMap> LoadEnvFile(const std::filesystem::path& path, std::string& error) {
  const auto text = ReadWholeFile(path, error);
  if (!text.has_value()) {
    return std::nullopt;
  }
  return ParseEnvText(*text, /*expand=*/true);
}

std::optional<std::filesystem::path> FindDefaultEnvFile(const std::filesystem::path& base) {
  std::error_code ec;
  for (const auto& candidate : {base / "config" / "kubehost.env", base / ".env"}) {
    if (std::filesystem::is_regular_file(candidate, ec)) {
      return candidate;
    }
  }
  return std::nullopt;
}

std::optional<std::string> LookupEnv(const EnvMap& overlay, const std::string& key) {
  if (const char* value = std::getenv(key.c_str()); value != nullptr && value[0] != '\0') {
    return std::string(value);
  }
  if (const auto it = overlay.find(key); it != overlay.end() && !it->second.empty()) {
    return it->second;
  }
  return std::nullopt;
}

}  // namespace kubehost::config
