#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace kubehost::runtime {

//! Where a blocking child reads its standard input from.
enum class StdinMode {
  kInherit,
  kNull,
  kString,
};

//! What happens to a blocking child's stdout/stderr.
enum class OutputMode {
  kInherit,
  kDiscard,
  //! stdout is captured, stderr stays attached to the invoking terminal.
  kCaptureStdout,
  kCaptureCombined,
};

//! Blocking process request. `env` entries are overlaid on the parent environment.
struct RunProcessRequest {
  std::vector<std::string> argv;
  std::filesystem::path cwd;
  std::map<std::string, std::string> env;
  StdinMode stdin_mode = StdinMode::kInherit;
  std::string stdin_data;
  OutputMode output_mode = OutputMode::kInherit;
};

//! Outcome of a process that was launched and ran to completion.
struct ProcessResult {
  int exit_code = 0;
  std::string output;

  bool ok() const { return exit_code == 0; }
};

//! Detached process start request. Output is appended to `log_path` (or discarded).
struct StartProcessRequest {
  std::vector<std::string> argv;
  std::filesystem::path cwd;
  std::filesystem::path log_path;
};

//! Process handle metadata returned after successful process start.
struct StartedProcess {
  int pid = 0;
};

//! Process control capability injected into every client and manager.
class ProcessRunner {
 public:
  virtual ~ProcessRunner() = default;

  //! Runs a child to completion. Returns nullopt only when the child could not be launched.
  virtual std::optional<ProcessResult> Run(const RunProcessRequest& request, std::string& error) = 0;
  //! Launches a child in its own session so it outlives the invoking process.
  virtual std::optional<StartedProcess> Start(const StartProcessRequest& request, std::string& error) = 0;
  virtual bool Stop(int pid, std::string& error) = 0;
  virtual bool IsAlive(int pid) = 0;
  virtual std::optional<std::filesystem::path> LookPath(const std::string& name) = 0;
};

//! POSIX-backed runner that launches and terminates real child process groups.
class PosixProcessRunner final : public ProcessRunner {
 public:
  std::optional<ProcessResult> Run(const RunProcessRequest& request, std::string& error) override;
  std::optional<StartedProcess> Start(const StartProcessRequest& request, std::string& error) override;
  bool Stop(int pid, std::string& error) override;
  bool IsAlive(int pid) override;
  std::optional<std::filesystem::path> LookPath(const std::string& name) override;
};

//! Prints every command instead of running it and reports success.
class DryRunProcessRunner final : public ProcessRunner {
 public:
  std::optional<ProcessResult> Run(const RunProcessRequest& request, std::string& error) override;
  std::optional<StartedProcess> Start(const StartProcessRequest& request, std::string& error) override;
  bool Stop(int pid, std::string& error) override;
  bool IsAlive(int pid) override;
  std::optional<std::filesystem::path> LookPath(const std::string& name) override;

 private:
  int next_pid_ = 12000;
};

//! Renders argv for display, quoting arguments that contain whitespace.
std::string FormatArgv(const std::vector<std::string>& argv);

}  // namespace kubehost::runtime
