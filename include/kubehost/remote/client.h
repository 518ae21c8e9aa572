#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "kubehost/runtime/process_runner.h"

namespace kubehost::remote {

//! Everything the orchestration code needs from a remote host. Tests substitute fakes.
class Client {
 public:
  virtual ~Client() = default;

  //! Silent, non-interactive reachability probe.
  virtual bool TestConnection(std::string& error) = 0;
  //! Runs `command` with every argument escaped individually.
  virtual bool Execute(const std::string& command, const std::vector<std::string>& args, bool force_tty,
                       std::string& error) = 0;
  //! Same as Execute, prefixed with escaped `KEY=value` assignments.
  virtual bool ExecuteWithEnv(const std::string& command, const std::vector<std::string>& args,
                              const std::map<std::string, std::string>& env, bool force_tty, std::string& error) = 0;
  //! Pipes `script` into `bash -s --` with `args` as positional parameters.
  virtual bool ExecuteScript(const std::string& script, const std::vector<std::string>& args, std::string& error) = 0;
  virtual bool Upload(const std::filesystem::path& local_path, const std::string& remote_path, std::string& error) = 0;
  //! Runs an already escaped command line. Only for internally assembled wrappers.
  virtual bool RunCommandString(const std::string& command_line, bool force_tty, std::string& error) = 0;
  //! Like Execute but returns the captured stdout.
  virtual std::optional<std::string> OutputCommand(const std::string& command, const std::vector<std::string>& args,
                                                   std::string& error) = 0;
};

//! Picks `~/.ssh/id_ed25519`, then `~/.ssh/id_rsa`. Empty when neither exists.
std::filesystem::path SelectIdentityFile(const std::filesystem::path& home);

//! Client backed by the local `ssh`/`scp` binaries.
class SshClient final : public Client {
 public:
  //! Selects the identity file from `$HOME` once, at construction.
  SshClient(std::string host, std::string user, runtime::ProcessRunner& runner);
  SshClient(std::string host, std::string user, std::filesystem::path identity_file, runtime::ProcessRunner& runner);

  bool TestConnection(std::string& error) override;
  bool Execute(const std::string& command, const std::vector<std::string>& args, bool force_tty,
               std::string& error) override;
  bool ExecuteWithEnv(const std::string& command, const std::vector<std::string>& args,
                      const std::map<std::string, std::string>& env, bool force_tty, std::string& error) override;
  bool ExecuteScript(const std::string& script, const std::vector<std::string>& args, std::string& error) override;
  bool Upload(const std::filesystem::path& local_path, const std::string& remote_path, std::string& error) override;
  bool RunCommandString(const std::string& command_line, bool force_tty, std::string& error) override;
  std::optional<std::string> OutputCommand(const std::string& command, const std::vector<std::string>& args,
                                           std::string& error) override;

  const std::string& host() const { return host_; }
  const std::string& user() const { return user_; }
  const std::filesystem::path& identity_file() const { return identity_file_; }

 private:
  std::vector<std::string> BaseArgs(const std::string& program) const;
  std::string Destination() const;
  bool RunChecked(const runtime::RunProcessRequest& request, std::string& error);

  std::string host_;
  std::string user_;
  std::filesystem::path identity_file_;
  runtime::ProcessRunner& runner_;
};

}  // namespace kubehost::remote
