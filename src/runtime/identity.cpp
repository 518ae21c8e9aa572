#include "kubehost/runtime/identity.h"

#include <cstdlib>

namespace kubehost::runtime {

std::filesystem::path DefaultRuntimeDirectory() {
  if (const char* runtime_dir = std::getenv("XDG_RUNTIME_DIR")) {
    if (runtime_dir[0] != '\0') {
      return std::filesystem::path(runtime_dir);
    }
  }
  return std::filesystem::path("/tmp");
}

std::string SanitizePathToken(const std::string& token) {
  static const char kHex[] = "0123456789ABCDEF";
  std::string result;
  result.reserve(token.size());
  for (char ch : token) {
    const bool safe = (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') || (ch >= '0' && ch <= '9') || ch == '-' ||
                      ch == '.';
    if (safe) {
      result.push_back(ch);
      continue;
    }
    const auto byte = static_cast<unsigned char>(ch);
    result.push_back('%');
    result.push_back(kHex[byte >> 4]);
    result.push_back(kHex[byte & 0x0F]);
  }
  return result;
}

std::filesystem::path ControlSocketPath(const TunnelIdentity& identity, const std::filesystem::path& runtime_dir) {
  // '_' never survives sanitization, so it unambiguously separates user from host; the
  // port is numeric and always follows the last '-'.
  const std::string key = SanitizePathToken(identity.user) + "_" + SanitizePathToken(identity.host) + "-" +
                          std::to_string(identity.local_port);
  return runtime_dir / ("kubehost-tunnel-" + key + ".ctl");
}

PortForwardPaths PortForwardFiles(const PortForwardIdentity& identity, const std::filesystem::path& runtime_dir) {
  const std::string stem =
      "kubehost-pf-" + SanitizePathToken(identity.namespace_name) + "-" + std::to_string(identity.local_port);
  return PortForwardPaths{
      .pid_file = runtime_dir / (stem + ".pid"),
      .log_file = runtime_dir / (stem + ".log"),
  };
}

}  // namespace kubehost::runtime
