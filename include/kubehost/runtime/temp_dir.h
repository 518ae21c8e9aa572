#pragma once

#include <filesystem>
#include <string>

namespace kubehost::runtime {

//! Scratch directory under the system temp dir, removed recursively on destruction.
class ScopedTempDir {
 public:
  ScopedTempDir() = default;
  ~ScopedTempDir();

  ScopedTempDir(const ScopedTempDir&) = delete;
  ScopedTempDir& operator=(const ScopedTempDir&) = delete;

  //! Creates `<tmp>/<prefix>-XXXXXX`. Must be called at most once.
  bool Create(const std::string& prefix, std::string& error);

  const std::filesystem::path& path() const { return path_; }

 private:
  std::filesystem::path path_;
};

//! Writes `contents` to `path`, replacing any existing file.
bool WriteTextFile(const std::filesystem::path& path, const std::string& contents, std::string& error);

}  // namespace kubehost::runtime
