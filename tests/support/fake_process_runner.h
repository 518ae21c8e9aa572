#pragma once

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "kubehost/runtime/process_runner.h"

namespace kubehost::testing {

//! Records every request and answers from scripted rules instead of spawning processes.
class FakeProcessRunner final : public runtime::ProcessRunner {
 public:
  //! Any Run whose argv contains `tokens` in order gets `exit_code` and `output`.
  //! Later rules win over earlier ones.
  void OnRun(std::vector<std::string> tokens, int exit_code, std::string output = "") {
    rules_.push_back(Rule{std::move(tokens), runtime::ProcessResult{exit_code, std::move(output)}, ""});
  }

  //! Matching Run calls fail to launch with `error`.
  void FailLaunch(std::vector<std::string> tokens, std::string error) {
    rules_.push_back(Rule{std::move(tokens), std::nullopt, std::move(error)});
  }

  std::optional<runtime::ProcessResult> Run(const runtime::RunProcessRequest& request, std::string& error) override {
    runs.push_back(request);
    for (auto it = rules_.rbegin(); it != rules_.rend(); ++it) {
      if (Matches(request.argv, it->tokens)) {
        if (!it->result.has_value()) {
          error = it->error;
          return std::nullopt;
        }
        error.clear();
        return it->result;
      }
    }
    error.clear();
    return runtime::ProcessResult{};
  }

  std::optional<runtime::StartedProcess> Start(const runtime::StartProcessRequest& request,
                                               std::string& error) override {
    starts.push_back(request);
    if (!start_error.empty()) {
      error = start_error;
      return std::nullopt;
    }
    if (!start_log_output.empty() && !request.log_path.empty()) {
      std::ofstream log(request.log_path, std::ios::app);
      log << start_log_output;
    }
    const int pid = next_pid++;
    if (!start_exits_immediately) {
      alive.insert(pid);
    }
    error.clear();
    return runtime::StartedProcess{pid};
  }

  bool Stop(int pid, std::string& error) override {
    stops.push_back(pid);
    alive.erase(pid);
    error.clear();
    return true;
  }

  bool IsAlive(int pid) override { return alive.count(pid) != 0; }

  std::optional<std::filesystem::path> LookPath(const std::string& name) override {
    if (missing_binaries.count(name) != 0) {
      return std::nullopt;
    }
    return std::filesystem::path("/usr/bin") / name;
  }

  //! Runs whose argv contains `tokens` in order.
  std::vector<runtime::RunProcessRequest> RunsMatching(const std::vector<std::string>& tokens) const {
    std::vector<runtime::RunProcessRequest> matched;
    std::copy_if(runs.begin(), runs.end(), std::back_inserter(matched),
                 [&](const runtime::RunProcessRequest& request) { return Matches(request.argv, tokens); });
    return matched;
  }

  std::vector<runtime::RunProcessRequest> runs;
  std::vector<runtime::StartProcessRequest> starts;
  std::vector<int> stops;
  std::set<int> alive;
  std::set<std::string> missing_binaries;
  int next_pid = 4000;
  bool start_exits_immediately = false;
  std::string start_error;
  std::string start_log_output;

 private:
  struct Rule {
    std::vector<std::string> tokens;
    std::optional<runtime::ProcessResult> result;
    std::string error;
  };

  static bool Matches(const std::vector<std::string>& argv, const std::vector<std::string>& tokens) {
    auto pos = argv.begin();
    for (const auto& token : tokens) {
      pos = std::find(pos, argv.end(), token);
      if (pos == argv.end()) {
        return false;
      }
      ++pos;
    }
    return true;
  }

  std::vector<Rule> rules_;
};

}  // namespace kubehost::testing
