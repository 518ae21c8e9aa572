#pragma once

#include <optional>
#include <string>
#include <vector>

#include "kubehost/runtime/process_runner.h"

namespace kubehost::kube {

inline constexpr const char* kDefaultSelector = "app.kubernetes.io/instance=openclaw";
inline constexpr const char* kDefaultFallbackService = "svc/openclaw";

struct ResolverSettings {
  std::string namespace_name = "openclaw";
  std::string selector = kDefaultSelector;
  std::string fallback_service = kDefaultFallbackService;
};

//! `$KUBEHOST_KUBECTL_BIN` when set, otherwise `kubectl`.
std::string KubectlBinary();

//! Label-based lookup of the workload a port-forward or exec should target.
class Resolver {
 public:
  Resolver(ResolverSettings settings, runtime::ProcessRunner& runner, std::string kubectl = KubectlBinary());

  //! `svc/<first service matching the selector>`, else the fallback service. Never fails.
  std::string ResolveService();

  //! Name of the first pod matching the selector.
  std::optional<std::string> ResolvePod(std::string& error);

  const ResolverSettings& settings() const { return settings_; }

 private:
  std::optional<std::string> FirstMatchingName(const std::string& kind, std::string& error);

  ResolverSettings settings_;
  runtime::ProcessRunner& runner_;
  std::string kubectl_;
};

//! `kubectl -n <ns> exec [-c <container>] [-it] <pod> -- sh -lc <command joined by spaces>`
std::vector<std::string> BuildPodExecArgv(const std::string& kubectl, const std::string& namespace_name,
                                          const std::string& pod, const std::string& container, bool tty,
                                          const std::vector<std::string>& command);

}  // namespace kubehost::kube
