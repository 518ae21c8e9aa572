#include "kubehost/runtime/temp_dir.h"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <iostream>
#include <vector>

#include <stdlib.h>

namespace kubehost::runtime {

ScopedTempDir::~ScopedTempDir() {
  if (path_.empty()) {
    return;
  }
  std::error_code ec;
  std::filesystem::remove_all(path_, ec);
  if (ec) {
    std::cerr << "warning: failed to remove " << path_.string() << ": " << ec.message() << "\n";
  }
}

bool ScopedTempDir::Create(const std::string& prefix, std::string& error) {
  std::error_code ec;
  const auto base = std::filesystem::temp_directory_path(ec);
  if (ec) {
    error = "failed to locate temp directory: " + ec.message();
    return false;
  }
  std::string pattern = (base / (prefix + "-XXXXXX")).string();
  std::vector<char> buffer(pattern.begin(), pattern.end());
  buffer.push_back('\0');
  if (::mkdtemp(buffer.data()) == nullptr) {
    error = "failed to create temp dir: " + std::string(std::strerror(errno));
    return false;
  }
  path_ = buffer.data();
  error.clear();
  return true;
}

bool WriteTextFile(const std::filesystem::path& path, const std::string& contents, std::string& error) {
  std::ofstream out(path, std::ios::trunc);
  if (!out.is_open()) {
    error = "failed to open " + path.string() + " for writing";
    return false;
  }
  out << contents;
  out.flush();
  if (!out.good()) {
    error = "failed to write " + path.string();
    return false;
  }
  error.clear();
  return true;
}

}  // namespace kubehost::runtime
