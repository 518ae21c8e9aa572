#pragma once

#include <string>
#include <vector>

#include "kubehost/runtime/process_runner.h"

namespace kubehost {

/// Process exit codes returned by `run_cli`.
inline constexpr int kExitOk = 0;
inline constexpr int kExitUsage = 1;
inline constexpr int kExitFailure = 2;
/// Status queries whose resource is confirmed not running.
inline constexpr int kExitNotRunning = 3;

/// Runs the kubehost CLI dispatcher.
///
/// `args` must follow argv conventions where `args[0]` is the executable name.
/// Uses a dry-run runner when `KUBEHOST_DRY_RUN=1`, a POSIX runner otherwise.
int run_cli(const std::vector<std::string>& args);

/// Same dispatcher with every external process routed through `runner`.
int run_cli(const std::vector<std::string>& args, runtime::ProcessRunner& runner);

}  // namespace kubehost
