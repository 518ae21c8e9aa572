#include "kubehost/remote/engine.h"

#include <cstdlib>
#include <iostream>
#include <utility>

#include "kubehost/runtime/shell.h"
#include "kubehost/runtime/temp_dir.h"

namespace kubehost::remote {

namespace {

std::optional<std::string> DetectRemoteArchitecture(Client& client, std::string& error) {
  const auto output = client.OutputCommand("uname", {"-m"}, error);
  if (!output.has_value()) {
    error = "failed to detect remote architecture: " + error;
    return std::nullopt;
  }
  return MapRemoteArchitecture(*output, error);
}

bool RunLocal(runtime::ProcessRunner& runner, std::vector<std::string> argv, std::string& error) {
  runtime::RunProcessRequest request;
  request.argv = std::move(argv);
  request.stdin_mode = runtime::StdinMode::kNull;
  const auto result = runner.Run(request, error);
  if (!result.has_value()) {
    return false;
  }
  if (!result->ok()) {
    error = runtime::FormatArgv(request.argv) + " exited with status " + std::to_string(result->exit_code);
    return false;
  }
  return true;
}

// Configures and builds only the CLI target, statically linked, with the cross compiler.
bool LocalStaticBuild(runtime::ProcessRunner& runner, const std::filesystem::path& project_root,
                      const std::filesystem::path& build_dir, const std::string& compiler, std::string& error) {
  if (!RunLocal(runner,
                {"cmake", "-S", project_root.string(), "-B", build_dir.string(), "-DCMAKE_BUILD_TYPE=Release",
                 "-DCMAKE_CXX_COMPILER=" + compiler, "-DKUBEHOST_STATIC=ON", "-DKUBEHOST_BUILD_TESTS=OFF"},
                error)) {
    return false;
  }
  return RunLocal(runner, {"cmake", "--build", build_dir.string(), "--target", "kubehost"}, error);
}

}  // namespace

std::optional<std::string> MapRemoteArchitecture(const std::string& uname_output, std::string& error) {
  const std::string arch = runtime::TrimCopy(uname_output);
  if (arch == "x86_64" || arch == "amd64") {
    return std::string("amd64");
  }
  if (arch == "aarch64" || arch == "arm64") {
    return std::string("arm64");
  }
  error = "unsupported remote architecture: " + arch;
  return std::nullopt;
}

std::string CrossCompilerFor(const std::string& arch) {
  if (const char* override_cxx = std::getenv("KUBEHOST_CROSS_CXX"); override_cxx && *override_cxx) {
    return override_cxx;
  }
  return arch == "arm64" ? "aarch64-linux-gnu-g++" : "x86_64-linux-gnu-g++";
}

bool RemoteBuildAndUpload(Client& client, runtime::ProcessRunner& runner, const Target& target,
                          const std::filesystem::path& project_root, const GitOptions& opts, std::string& error) {
  if (opts.Requested()) {
    if (!RemoteGitSync(client, RemoteRepoDir(target), opts, error)) {
      error = "git sync failed: " + error;
      return false;
    }
  }

  if (!runner.LookPath("cmake").has_value()) {
    error = "missing local build toolchain: 'cmake' not found in PATH. Install cmake and a cross g++ and retry";
    return false;
  }

  const auto arch = DetectRemoteArchitecture(client, error);
  if (!arch.has_value()) {
    return false;
  }
  const std::string compiler = CrossCompilerFor(*arch);
  if (!runner.LookPath(compiler).has_value()) {
    error = "missing cross compiler '" + compiler + "' for linux/" + *arch +
            ". Install it or point KUBEHOST_CROSS_CXX at one";
    return false;
  }

  runtime::ScopedTempDir scratch;
  if (!scratch.Create("kubehost-build", error)) {
    return false;
  }
  const auto build_dir = scratch.path() / "build";

  std::cout << "[local] Building kubehost for linux/" << *arch << "\n";
  if (!LocalStaticBuild(runner, project_root, build_dir, compiler, error)) {
    error = "build failed: " + error;
    return false;
  }

  const auto local_bin = build_dir / "kubehost";
  const std::string remote_bin = RemoteBinPath(target);
  const std::string remote_bin_dir = std::filesystem::path(remote_bin).parent_path().string();

  std::cout << "[local] Uploading " << local_bin.string() << " to " << target.user << "@" << target.host << ":"
            << remote_bin << "\n";

  if (!client.Execute("install", {"-d", "-m", "0755", remote_bin_dir}, false, error)) {
    error = "failed to create remote bin directory: " + error;
    return false;
  }
  if (!client.Upload(local_bin, remote_bin, error)) {
    error = "upload failed: " + error;
    return false;
  }
  if (!client.Execute("chmod", {"+x", remote_bin}, false, error)) {
    error = "chmod failed: " + error;
    return false;
  }

  std::cout << "[local] Done. Remote CLI: " << remote_bin << "\n";
  return true;
}

}  // namespace kubehost::remote
