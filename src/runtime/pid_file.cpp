#include "kubehost/runtime/pid_file.h"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

#include "kubehost/runtime/shell.h"

namespace kubehost::runtime {
namespace {

std::filesystem::path LockPath(const std::filesystem::path& path) { return path.string() + ".lock"; }

int OpenAndLock(const std::filesystem::path& path, std::string& error) {
  const auto lock_path = LockPath(path);
  const int lock_fd = ::open(lock_path.c_str(), O_CREAT | O_RDWR | O_CLOEXEC, 0600);
  if (lock_fd < 0) {
    error = "failed to open pid lock file: " + std::string(std::strerror(errno));
    return -1;
  }
  if (::flock(lock_fd, LOCK_EX) != 0) {
    error = "failed to lock pid file: " + std::string(std::strerror(errno));
    ::close(lock_fd);
    return -1;
  }
  error.clear();
  return lock_fd;
}

std::filesystem::path TemporaryPath(const std::filesystem::path& path) {
  std::ostringstream suffix;
  suffix << ".tmp." << ::getpid();
  return path.string() + suffix.str();
}

}  // namespace

std::optional<int> ReadPidFile(const std::filesystem::path& path) {
  std::ifstream input(path);
  if (!input.is_open()) {
    return std::nullopt;
  }
  std::stringstream buffer;
  buffer << input.rdbuf();
  const std::string text = TrimCopy(buffer.str());
  if (text.empty() || text.size() > 10) {
    return std::nullopt;
  }
  long long pid = 0;
  for (char c : text) {
    if (c < '0' || c > '9') {
      return std::nullopt;
    }
    pid = pid * 10 + (c - '0');
  }
  if (pid <= 0 || pid > 0x7fffffff) {
    return std::nullopt;
  }
  return static_cast<int>(pid);
}

bool WritePidFile(const std::filesystem::path& path, int pid, std::string& error) {
  if (pid <= 0) {
    error = "refusing to record invalid pid " + std::to_string(pid);
    return false;
  }
  std::error_code ec;
  if (!path.parent_path().empty()) {
    std::filesystem::create_directories(path.parent_path(), ec);
    if (ec) {
      error = "failed to create pid directory: " + ec.message();
      return false;
    }
  }

  const int lock_fd = OpenAndLock(path, error);
  if (lock_fd < 0) {
    return false;
  }

  const auto tmp_path = TemporaryPath(path);
  std::ofstream out(tmp_path, std::ios::trunc);
  if (!out.is_open()) {
    error = "failed to open temporary pid file for writing";
    ::close(lock_fd);
    return false;
  }
  out << pid << "\n";
  out.flush();
  if (!out.good()) {
    error = "failed to flush temporary pid file";
    out.close();
    std::error_code remove_ec;
    std::filesystem::remove(tmp_path, remove_ec);
    ::close(lock_fd);
    return false;
  }
  out.close();

  std::error_code rename_ec;
  std::filesystem::rename(tmp_path, path, rename_ec);
  if (rename_ec) {
    error = "failed to replace pid file atomically: " + rename_ec.message();
    std::error_code remove_ec;
    std::filesystem::remove(tmp_path, remove_ec);
    ::close(lock_fd);
    return false;
  }

  ::close(lock_fd);
  error.clear();
  return true;
}

bool RemovePidFile(const std::filesystem::path& path, std::string& error) {
  std::error_code ec;
  std::filesystem::remove(path, ec);
  if (ec) {
    error = "failed to remove pid file " + path.string() + ": " + ec.message();
    return false;
  }
  std::filesystem::remove(LockPath(path), ec);
  if (ec) {
    error = "failed to remove pid lock file: " + ec.message();
    return false;
  }
  error.clear();
  return true;
}

}  // namespace kubehost::runtime
