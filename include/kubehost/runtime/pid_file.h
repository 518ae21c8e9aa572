#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace kubehost::runtime {

//! Reads a positive PID from `path`. Missing, empty or unparsable files yield nullopt.
std::optional<int> ReadPidFile(const std::filesystem::path& path);

//! Writes `pid` atomically (temp file + rename) under an exclusive lock on `<path>.lock`.
bool WritePidFile(const std::filesystem::path& path, int pid, std::string& error);

//! Removes the PID file and its lock file. Missing files are not an error.
bool RemovePidFile(const std::filesystem::path& path, std::string& error);

}  // namespace kubehost::runtime
