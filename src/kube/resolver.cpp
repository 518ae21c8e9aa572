#include "kubehost/kube/resolver.h"

#include <cstdlib>
#include <utility>

#include "kubehost/runtime/shell.h"

namespace kubehost::kube {

std::string KubectlBinary() {
  if (const char* override_bin = std::getenv("KUBEHOST_KUBECTL_BIN")) {
    if (override_bin[0] != '\0') {
      return override_bin;
    }
  }
  return "kubectl";
}

Resolver::Resolver(ResolverSettings settings, runtime::ProcessRunner& runner, std::string kubectl)
    : settings_(std::move(settings)), runner_(runner), kubectl_(std::move(kubectl)) {}

std::optional<std::string> Resolver::FirstMatchingName(const std::string& kind, std::string& error) {
  runtime::RunProcessRequest request;
  request.argv = {kubectl_, "-n", settings_.namespace_name, "get", kind, "-l", settings_.selector,
                  "-o",     "jsonpath={.items[0].metadata.name}"};
  request.stdin_mode = runtime::StdinMode::kNull;
  request.output_mode = runtime::OutputMode::kCaptureStdout;

  const auto result = runner_.Run(request, error);
  if (!result.has_value()) {
    return std::nullopt;
  }
  if (!result->ok()) {
    error = "kubectl get " + kind + " exited with status " + std::to_string(result->exit_code);
    return std::nullopt;
  }
  error.clear();
  return runtime::TrimCopy(result->output);
}

std::string Resolver::ResolveService() {
  std::string error;
  const auto name = FirstMatchingName("svc", error);
  if (name.has_value() && !name->empty()) {
    return "svc/" + *name;
  }
  return settings_.fallback_service;
}

std::optional<std::string> Resolver::ResolvePod(std::string& error) {
  const auto name = FirstMatchingName("pod", error);
  if (!name.has_value()) {
    error = "failed to list pods in namespace " + settings_.namespace_name + ": " + error;
    return std::nullopt;
  }
  if (name->empty()) {
    error = "no pod found with label " + settings_.selector + " in namespace " + settings_.namespace_name;
    return std::nullopt;
  }
  return name;
}

std::vector<std::string> BuildPodExecArgv(const std::string& kubectl, const std::string& namespace_name,
                                          const std::string& pod, const std::string& container, bool tty,
                                          const std::vector<std::string>& command) {
  std::vector<std::string> argv = {kubectl, "-n", namespace_name, "exec"};
  if (!container.empty()) {
    argv.push_back("-c");
    argv.push_back(container);
  }
  if (tty) {
    argv.push_back("-it");
  }
  argv.push_back(pod);
  argv.push_back("--");
  argv.push_back("sh");
  argv.push_back("-lc");

  std::string joined;
  for (const auto& part : command) {
    if (!joined.empty()) {
      joined += ' ';
    }
    joined += part;
  }
  argv.push_back(joined);
  return argv;
}

}  // namespace kubehost::kube
