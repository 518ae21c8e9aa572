#include "kubehost/cli.h"

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include <cxxopts.hpp>

#include "kubehost/config/env_file.h"
#include "kubehost/config/loader.h"
#include "kubehost/kube/resolver.h"
#include "kubehost/portforward/manager.h"
#include "kubehost/remote/client.h"
#include "kubehost/remote/engine.h"
#include "kubehost/remote/types.h"
#include "kubehost/runtime/net_probe.h"
#include "kubehost/runtime/process_runner.h"
#include "kubehost/tunnel/manager.h"

namespace {

using kubehost::kExitFailure;
using kubehost::kExitNotRunning;
using kubehost::kExitOk;
using kubehost::kExitUsage;
using kubehost::config::EnvMap;

//! Converts vector<string> argv representation into the char* form expected by cxxopts.
std::vector<const char*> ToCArgs(const std::vector<std::string>& args) {
  std::vector<const char*> result;
  result.reserve(args.size());
  for (const auto& arg : args) {
    result.push_back(arg.c_str());
  }
  return result;
}

std::vector<std::string> BuildSubcommandArgs(const std::vector<std::string>& args, size_t start_index,
                                             const std::string& command_name) {
  std::vector<std::string> sub_args;
  sub_args.reserve(args.size() - start_index + 1);
  sub_args.emplace_back(args.front() + " " + command_name);
  for (size_t i = start_index; i < args.size(); ++i) {
    sub_args.push_back(args[i]);
  }
  return sub_args;
}

const char* AppVersion() { return KH_APP_VERSION; }

void PrintGeneralHelp() {
  std::cout << "kubehost CLI\n"
            << "\n"
            << "Usage:\n"
            << "  kubehost <command> [options]\n"
            << "  kubehost --version\n"
            << "\n"
            << "Commands:\n"
            << "  remote        Provision, sync, build and run kubehost on the management node.\n"
            << "  tunnel        Start, stop or inspect the SSH tunnel to the cluster API.\n"
            << "  port-forward  Manage the background kubectl port-forward.\n"
            << "  pod           Execute a command in the application pod.\n"
            << "  ssh           Open an interactive shell on the management node.\n"
            << "  bootstrap     Install and configure the k3s server on this node (scripts/main.sh).\n"
            << "  join          Join this node to an existing cluster as a worker.\n"
            << "  pair          Print the join command for a worker node.\n"
            << "  dns           Configure edge TLS via Caddy.\n"
            << "  install       Install a recipe from scripts/recipes onto the cluster.\n"
            << "  help          Show this message.\n"
            << "\n"
            << "Global options:\n"
            << "  --version    Show kubehost CLI version.\n"
            << "\n"
            << "Node script options (bootstrap, join, pair, dns):\n"
            << "  --env-file F           Env file passed to the script (default: config/kubehost.env, .env).\n"
            << "  --dry-run              Sets DRY_RUN=true.\n"
            << "  --dry-run-write-files  Sets DRY_RUN_WRITE_FILES=true.\n"
            << "\n"
            << "Environment:\n"
            << "  KUBEHOST_CONFIG        Operator config file (default: ./kubehost.yaml).\n"
            << "  KUBEHOST_KUBECTL_BIN   kubectl binary to use.\n"
            << "  KUBEHOST_DRY_RUN=1     Print external commands instead of running them.\n";
}

void PrintRemoteHelp(const std::string& program) {
  std::cout << "Usage:\n"
            << "  " << program << " [--host H] [--user U] [--pubkey P] [--repo URL] [--config ENV] <subcommand>\n"
            << "\n"
            << "Subcommands:\n"
            << "  provision   Prepare the host: sudo user, authorized key, repository clone.\n"
            << "  git         Fetch and check out --branch/--ref on the host (pulls by default).\n"
            << "  build       Cross-build kubehost locally and upload it to the host.\n"
            << "  smoke       Build, upload and run a DRY_RUN smoke sequence.\n"
            << "  run         Run an allow-listed kubehost command on the host with sudo.\n"
            << "\n"
            << "Options after the subcommand name are specific to it; see '<subcommand> --help'.\n"
            << "Arguments for 'run' start at the first non-option token or after '--'.\n";
}

//! Options, positionals and pass-through tokens of one command line.
struct SplitArgs {
  std::vector<std::string> options;
  std::vector<std::string> positionals;
  //! Tokens after `--`, or everything from the first positional when requested.
  std::vector<std::string> passthrough;
};

bool TakesValue(const std::string& token) {
  static const std::set<std::string> value_flags = {
      "--host",       "--user",       "--pubkey",      "--repo",     "--config",    "--config-file",
      "--branch",     "--ref",        "--env-file",    "-n",         "--namespace", "--target",
      "--local-port", "--remote-port", "--remote-host", "--selector", "-c",          "--container"};
  return value_flags.count(token) != 0;
}

//! Separates option tokens from positionals so cxxopts never sees free-form arguments.
SplitArgs SplitCommandLine(const std::vector<std::string>& args, size_t start, bool stop_at_first_positional) {
  SplitArgs split;
  for (size_t i = start; i < args.size(); ++i) {
    const std::string& token = args[i];
    if (token == "--") {
      split.passthrough.insert(split.passthrough.end(), args.begin() + static_cast<long>(i) + 1, args.end());
      break;
    }
    if (token.size() > 1 && token[0] == '-') {
      split.options.push_back(token);
      if (token.find('=') == std::string::npos && TakesValue(token) && i + 1 < args.size()) {
        split.options.push_back(args[++i]);
      }
      continue;
    }
    if (stop_at_first_positional) {
      split.passthrough.insert(split.passthrough.end(), args.begin() + static_cast<long>(i), args.end());
      break;
    }
    split.positionals.push_back(token);
  }
  return split;
}

bool ParseOptions(cxxopts::Options& options, const std::string& program, const std::vector<std::string>& tokens,
                  const std::string& command_name) {
  std::vector<std::string> full = {program};
  full.insert(full.end(), tokens.begin(), tokens.end());
  const auto c_args = ToCArgs(full);
  const int argc = static_cast<int>(c_args.size());
  char** argv = const_cast<char**>(c_args.data());
  try {
    options.parse_positional({});
    options.parse(argc, argv);
  } catch (const cxxopts::exceptions::exception& e) {
    std::cerr << command_name << ": " << e.what() << "\n";
    return false;
  }
  return true;
}

bool UseDryRunRunner() {
  if (const char* value = std::getenv("KUBEHOST_DRY_RUN")) {
    return std::string(value) == "1";
  }
  return false;
}

std::unique_ptr<kubehost::runtime::ProcessRunner> MakeProcessRunner() {
  if (UseDryRunRunner()) {
    return std::make_unique<kubehost::runtime::DryRunProcessRunner>();
  }
  return std::make_unique<kubehost::runtime::PosixProcessRunner>();
}

bool IsPortValid(int value) { return value >= 1 && value <= 65535; }

std::optional<kubehost::config::Config> LoadConfigForCommand(const std::string& command_name,
                                                             const std::string& config_file_flag) {
  const auto location = kubehost::config::ResolveConfigLocation(config_file_flag);
  const auto result = kubehost::config::LoadConfig(location);
  if (!result.ok()) {
    std::cerr << command_name << ": failed to load config '" << location.path.string() << "'.\n";
    for (const auto& error : result.errors) {
      std::cerr << "  - " << error.context << ": " << error.message << "\n";
    }
    return std::nullopt;
  }
  return result.config;
}

//! Loads the env file named on the command line, or the default one. An explicitly
//! named file must exist; a missing default is fine.
bool LoadCommandEnv(const std::string& command_name, const std::string& explicit_path, bool no_env, EnvMap& env) {
  env.clear();
  if (no_env) {
    return true;
  }
  std::filesystem::path path;
  if (!explicit_path.empty()) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(explicit_path, ec)) {
      std::cerr << command_name << ": env file not found: " << explicit_path << "\n";
      return false;
    }
    path = explicit_path;
  } else {
    std::error_code ec;
    const auto cwd = std::filesystem::current_path(ec);
    if (ec) {
      return true;
    }
    const auto found = kubehost::config::FindDefaultEnvFile(cwd);
    if (!found.has_value()) {
      return true;
    }
    path = *found;
  }

  std::string error;
  auto loaded = kubehost::config::LoadEnvFile(path, error);
  if (!loaded.has_value()) {
    std::cerr << command_name << ": failed to load env file: " << error << "\n";
    return false;
  }
  env = std::move(*loaded);
  return true;
}

std::optional<int> EnvPort(const EnvMap& env, const std::string& key, std::string& error) {
  const auto value = kubehost::config::LookupEnv(env, key);
  if (!value.has_value()) {
    return std::nullopt;
  }
  try {
    size_t consumed = 0;
    const int port = std::stoi(*value, &consumed);
    if (consumed == value->size() && IsPortValid(port)) {
      return port;
    }
  } catch (const std::exception&) {
  }
  error = key + " must be a port between 1 and 65535, got '" + *value + "'";
  return std::nullopt;
}

std::optional<std::filesystem::path> FindProjectRoot(std::string& error) {
  const auto is_root = [](const std::filesystem::path& dir) {
    std::error_code ec;
    return std::filesystem::exists(dir / "CMakeLists.txt", ec) &&
           std::filesystem::exists(dir / "cmd" / "kubehost" / "main.cpp", ec);
  };

  std::error_code ec;
  const auto cwd = std::filesystem::current_path(ec);
  if (!ec) {
    if (is_root(cwd)) {
      return cwd;
    }
    if (is_root(cwd.parent_path())) {
      return cwd.parent_path();
    }
  }
  const auto exe = std::filesystem::read_symlink("/proc/self/exe", ec);
  if (!ec) {
    for (const auto& candidate : {exe.parent_path(), exe.parent_path().parent_path()}) {
      if (is_root(candidate)) {
        return candidate;
      }
    }
  }
  error = "could not locate project root: cmd/kubehost/main.cpp not found in the current directory or next to the "
          "executable";
  return std::nullopt;
}

// -- tunnel -----------------------------------------------------------------

struct TunnelFlags {
  bool show_help = false;
  bool verbose = false;
  bool no_env = false;
  std::string host;
  std::string user;
  std::string remote_host;
  std::string env_file;
  std::string config_file;
  int local_port = 0;
  int remote_port = 0;
};

void AddTunnelOptions(cxxopts::Options& options, TunnelFlags& flags) {
  options.add_options()
      ("h,help", "Show help", cxxopts::value<bool>(flags.show_help)->default_value("false"))
      ("v,verbose", "Show resolved settings", cxxopts::value<bool>(flags.verbose)->default_value("false"))
      ("host", "SSH host (default: TUNNEL_HOST, MGMT_HOST, MGMT_IP)", cxxopts::value<std::string>(flags.host))
      ("user", "SSH user (default: TUNNEL_USER, MGMT_USER, cubeadmin)", cxxopts::value<std::string>(flags.user))
      ("local-port", "Local port (default 6443)", cxxopts::value<int>(flags.local_port))
      ("remote-host", "Host to forward to, seen from the SSH host (default 127.0.0.1)",
          cxxopts::value<std::string>(flags.remote_host))
      ("remote-port", "Remote port (default 6443)", cxxopts::value<int>(flags.remote_port))
      ("env-file", "Env file to read (default: config/kubehost.env or .env)",
          cxxopts::value<std::string>(flags.env_file))
      ("no-env", "Do not read any env file", cxxopts::value<bool>(flags.no_env)->default_value("false"))
      ("config-file", "Path to kubehost.yaml", cxxopts::value<std::string>(flags.config_file));
}

//! Precedence: flag, then TUNNEL_* / MGMT_* from the process env or env file, then yaml, then defaults.
bool ResolveTunnelSettings(const TunnelFlags& flags, const kubehost::config::Config& config, const EnvMap& env,
                           kubehost::tunnel::TunnelSettings& settings, std::string& error) {
  using kubehost::config::LookupEnv;
  const auto first_of = [&](std::initializer_list<const char*> keys) -> std::optional<std::string> {
    for (const char* key : keys) {
      if (auto value = LookupEnv(env, key)) {
        return value;
      }
    }
    return std::nullopt;
  };

  settings = kubehost::tunnel::TunnelSettings{};
  settings.host = flags.host;
  if (settings.host.empty()) {
    settings.host = first_of({"TUNNEL_HOST", "MGMT_HOST", "MGMT_IP"})
                        .value_or(config.tunnel.host.value_or(config.remote.host.value_or("")));
  }
  settings.user = flags.user;
  if (settings.user.empty()) {
    settings.user = first_of({"TUNNEL_USER", "MGMT_USER"})
                        .value_or(config.tunnel.user.value_or(config.remote.user.value_or(kubehost::remote::kDefaultUser)));
  }
  settings.remote_host = flags.remote_host;
  if (settings.remote_host.empty()) {
    settings.remote_host = first_of({"TUNNEL_REMOTE_HOST"})
                               .value_or(config.tunnel.remote_host.value_or(kubehost::tunnel::kDefaultRemoteHost));
  }

  if (flags.local_port != 0) {
    settings.local_port = flags.local_port;
  } else if (const auto port = EnvPort(env, "TUNNEL_LOCAL_PORT", error)) {
    settings.local_port = *port;
  } else if (!error.empty()) {
    return false;
  } else {
    settings.local_port = config.tunnel.local_port.value_or(kubehost::tunnel::kDefaultLocalPort);
  }
  if (flags.remote_port != 0) {
    settings.remote_port = flags.remote_port;
  } else if (const auto port = EnvPort(env, "TUNNEL_REMOTE_PORT", error)) {
    settings.remote_port = *port;
  } else if (!error.empty()) {
    return false;
  } else {
    settings.remote_port = config.tunnel.remote_port.value_or(kubehost::tunnel::kDefaultRemotePort);
  }

  if (!IsPortValid(settings.local_port) || !IsPortValid(settings.remote_port)) {
    error = "ports must be between 1 and 65535";
    return false;
  }
  if (settings.host.empty()) {
    error = "no host provided and no TUNNEL_HOST/MGMT_HOST found in config";
    return false;
  }
  return true;
}

std::string DescribeTunnel(const kubehost::tunnel::TunnelSettings& settings) {
  return "localhost:" + std::to_string(settings.local_port) + " -> " + settings.remote_host + ":" +
         std::to_string(settings.remote_port) + " via " + settings.user + "@" + settings.host;
}

int RunTunnelCommand(const std::vector<std::string>& args, kubehost::runtime::ProcessRunner& runner) {
  TunnelFlags flags;
  cxxopts::Options options(args.front(), "Manage the SSH tunnel to the cluster API (start, stop, status).");
  AddTunnelOptions(options, flags);

  const auto split = SplitCommandLine(args, 1, false);
  if (!ParseOptions(options, args.front(), split.options, "tunnel")) {
    return kExitUsage;
  }
  if (flags.show_help) {
    std::cout << options.help() << "\n";
    return kExitOk;
  }
  if (split.positionals.size() > 1 || !split.passthrough.empty()) {
    std::cerr << "tunnel: expected at most one action (start, stop, status)\n";
    return kExitUsage;
  }
  const std::string action = split.positionals.empty() ? "start" : split.positionals.front();
  if (action != "start" && action != "stop" && action != "status") {
    std::cerr << "tunnel: unknown action '" << action << "' (valid: start, stop, status)\n";
    return kExitUsage;
  }

  const auto config = LoadConfigForCommand("tunnel", flags.config_file);
  if (!config.has_value()) {
    return kExitFailure;
  }
  EnvMap env;
  if (!LoadCommandEnv("tunnel", flags.env_file, flags.no_env, env)) {
    return kExitFailure;
  }
  kubehost::tunnel::TunnelSettings settings;
  std::string error;
  if (!ResolveTunnelSettings(flags, *config, env, settings, error)) {
    std::cerr << "tunnel: " << error << "\n";
    return kExitUsage;
  }

  kubehost::tunnel::TunnelManager manager(settings, runner);
  if (flags.verbose) {
    std::cout << "socket: " << manager.ControlSocket().string() << "\n";
  }

  if (action == "start") {
    const auto result = manager.Start();
    if (result.status == kubehost::tunnel::StartStatus::kAlreadyRunning) {
      std::cout << "Tunnel already running on " << DescribeTunnel(settings) << "\n";
      return kExitOk;
    }
    if (!result.ok()) {
      std::cerr << "tunnel: " << result.error << "\n";
      if (result.status == kubehost::tunnel::StartStatus::kPortInUse) {
        std::cerr << "Stop the existing process or choose a different --local-port.\n";
      }
      return kExitFailure;
    }
    std::cout << "Started tunnel on " << DescribeTunnel(settings) << "\n";
    return kExitOk;
  }

  if (action == "stop") {
    if (!manager.Stop(error)) {
      std::cerr << "tunnel: " << error << "\n";
      return kExitFailure;
    }
    std::cout << "Tunnel stopped (" << settings.user << "@" << settings.host << ", localhost:" << settings.local_port
              << ")\n";
    return kExitOk;
  }

  const auto status = manager.Status();
  if (!status.running) {
    std::cout << "not running: " << DescribeTunnel(settings) << "\n";
    std::cout << "socket:   " << status.control_socket.string() << "\n";
    return kExitNotRunning;
  }
  std::cout << "running:  " << DescribeTunnel(settings) << "\n";
  std::cout << "socket:   " << status.control_socket.string() << "\n";
  std::cout << "control:  " << status.control_output << "\n";
  std::cout << "port:     " << (status.local_port_bound ? "bound" : "not bound") << "\n";
  return kExitOk;
}

// -- ssh --------------------------------------------------------------------

int RunSshCommand(const std::vector<std::string>& args, kubehost::runtime::ProcessRunner& runner) {
  TunnelFlags flags;
  cxxopts::Options options(args.front(), "Open an interactive SSH shell on the management node.");
  AddTunnelOptions(options, flags);

  const auto split = SplitCommandLine(args, 1, false);
  if (!ParseOptions(options, args.front(), split.options, "ssh")) {
    return kExitUsage;
  }
  if (flags.show_help) {
    std::cout << options.help() << "\n";
    return kExitOk;
  }
  if (!split.positionals.empty() || !split.passthrough.empty()) {
    std::cerr << "ssh: unexpected argument '"
              << (split.positionals.empty() ? split.passthrough.front() : split.positionals.front()) << "'\n";
    return kExitUsage;
  }

  const auto config = LoadConfigForCommand("ssh", flags.config_file);
  if (!config.has_value()) {
    return kExitFailure;
  }
  EnvMap env;
  if (!LoadCommandEnv("ssh", flags.env_file, flags.no_env, env)) {
    return kExitFailure;
  }
  kubehost::tunnel::TunnelSettings settings;
  std::string error;
  if (!ResolveTunnelSettings(flags, *config, env, settings, error)) {
    std::cerr << "ssh: " << error << "\n";
    return kExitUsage;
  }

  kubehost::runtime::RunProcessRequest request;
  request.argv = {"ssh", "-o", "StrictHostKeyChecking=no"};
  const auto identity = kubehost::remote::SelectIdentityFile(kubehost::remote::HomeDirectory());
  if (!identity.empty()) {
    request.argv.push_back("-i");
    request.argv.push_back(identity.string());
  }
  request.argv.push_back(settings.user + "@" + settings.host);

  const auto result = runner.Run(request, error);
  if (!result.has_value()) {
    std::cerr << "ssh: " << error << "\n";
    return kExitFailure;
  }
  return result->ok() ? kExitOk : kExitFailure;
}

// -- port-forward -----------------------------------------------------------

struct PortForwardFlags {
  bool show_help = false;
  bool verbose = false;
  bool ensure_tunnel = false;
  std::string namespace_name;
  std::string target;
  std::string config_file;
  int local_port = 0;
  int remote_port = 0;
};

kubehost::portforward::PortForwardSettings ResolvePortForwardSettings(const PortForwardFlags& flags,
                                                                      const kubehost::config::Config& config) {
  kubehost::portforward::PortForwardSettings settings;
  settings.namespace_name = !flags.namespace_name.empty()
                                ? flags.namespace_name
                                : config.port_forward.namespace_name.value_or(kubehost::portforward::kDefaultNamespace);
  settings.local_port =
      flags.local_port != 0 ? flags.local_port : config.port_forward.local_port.value_or(kubehost::portforward::kDefaultPort);
  settings.remote_port = flags.remote_port != 0
                             ? flags.remote_port
                             : config.port_forward.remote_port.value_or(kubehost::portforward::kDefaultPort);
  settings.target = !flags.target.empty() ? flags.target : config.port_forward.target.value_or("");
  settings.kubectl = kubehost::kube::KubectlBinary();
  return settings;
}

kubehost::kube::ResolverSettings ResolverSettingsFor(const std::string& namespace_name,
                                                     const kubehost::config::Config& config) {
  kubehost::kube::ResolverSettings settings;
  settings.namespace_name = namespace_name;
  settings.selector = config.port_forward.selector.value_or(kubehost::kube::kDefaultSelector);
  settings.fallback_service = config.port_forward.fallback_service.value_or(kubehost::kube::kDefaultFallbackService);
  return settings;
}

//! Starts the SSH tunnel when nothing answers on its local port.
bool EnsureTunnel(const kubehost::config::Config& config, kubehost::runtime::ProcessRunner& runner) {
  EnvMap env;
  if (!LoadCommandEnv("port-forward", "", false, env)) {
    return false;
  }
  TunnelFlags tunnel_flags;
  kubehost::tunnel::TunnelSettings settings;
  std::string error;
  if (!ResolveTunnelSettings(tunnel_flags, config, env, settings, error)) {
    std::cerr << "port-forward: cannot ensure tunnel: " << error << "\n";
    return false;
  }
  if (kubehost::runtime::TcpProbe("127.0.0.1", settings.local_port, std::chrono::milliseconds(500))) {
    return true;
  }
  kubehost::tunnel::TunnelManager manager(settings, runner);
  if (manager.IsRunning()) {
    return true;
  }
  std::cerr << "kube API unreachable; starting SSH tunnel via " << settings.user << "@" << settings.host << "...\n";
  const auto result = manager.Start();
  if (!result.ok()) {
    std::cerr << "port-forward: failed to start SSH tunnel: " << result.error << "\n";
    return false;
  }
  return true;
}

int RunPortForwardCommand(const std::vector<std::string>& args, kubehost::runtime::ProcessRunner& runner) {
  PortForwardFlags flags;
  cxxopts::Options options(args.front(), "Manage the background kubectl port-forward (start, stop, status).");
  options.add_options()
      ("h,help", "Show help", cxxopts::value<bool>(flags.show_help)->default_value("false"))
      ("v,verbose", "Show resolved settings", cxxopts::value<bool>(flags.verbose)->default_value("false"))
      ("n,namespace", "Kubernetes namespace (default openclaw)", cxxopts::value<std::string>(flags.namespace_name))
      ("target", "Forward target such as svc/name (default: resolved by label)",
          cxxopts::value<std::string>(flags.target))
      ("local-port", "Local port (default 18789)", cxxopts::value<int>(flags.local_port))
      ("remote-port", "Remote port (default 18789)", cxxopts::value<int>(flags.remote_port))
      ("ensure-tunnel", "Start the SSH tunnel first when the cluster API is unreachable",
          cxxopts::value<bool>(flags.ensure_tunnel)->default_value("false"))
      ("config-file", "Path to kubehost.yaml", cxxopts::value<std::string>(flags.config_file));

  const auto split = SplitCommandLine(args, 1, false);
  if (!ParseOptions(options, args.front(), split.options, "port-forward")) {
    return kExitUsage;
  }
  if (flags.show_help) {
    std::cout << options.help() << "\n";
    return kExitOk;
  }
  if (split.positionals.size() != 1 || !split.passthrough.empty()) {
    std::cerr << "port-forward: expected exactly one action (start, stop, status)\n";
    return kExitUsage;
  }
  const std::string action = split.positionals.front();
  if (action != "start" && action != "stop" && action != "status") {
    std::cerr << "port-forward: unknown action '" << action << "' (valid: start, stop, status)\n";
    return kExitUsage;
  }
  if ((flags.local_port != 0 && !IsPortValid(flags.local_port)) ||
      (flags.remote_port != 0 && !IsPortValid(flags.remote_port))) {
    std::cerr << "port-forward: ports must be between 1 and 65535\n";
    return kExitUsage;
  }

  const auto config = LoadConfigForCommand("port-forward", flags.config_file);
  if (!config.has_value()) {
    return kExitFailure;
  }
  auto settings = ResolvePortForwardSettings(flags, *config);

  if (action == "start") {
    if (flags.ensure_tunnel && !EnsureTunnel(*config, runner)) {
      return kExitFailure;
    }
    if (settings.target.empty()) {
      kubehost::kube::Resolver resolver(ResolverSettingsFor(settings.namespace_name, *config), runner,
                                        settings.kubectl);
      settings.target = resolver.ResolveService();
    }
    kubehost::portforward::PortForwardManager manager(settings, runner);
    const auto result = manager.Start();
    if (!result.ok()) {
      std::cerr << "port-forward: " << result.error << "\n";
      return kExitFailure;
    }
    const auto files = manager.Files();
    std::cout << "port-forward " << (result.status == kubehost::portforward::StartStatus::kAlreadyRunning
                                         ? "already running"
                                         : "running")
              << ": localhost:" << settings.local_port << " -> " << settings.target << " in namespace "
              << settings.namespace_name << " (pid " << result.pid << ")\n";
    std::cout << "log: " << files.log_file.string() << "\n";

    const auto timeout = std::chrono::milliseconds(
        config->port_forward.readiness_timeout_ms.value_or(
            static_cast<int>(kubehost::portforward::kDefaultReadinessTimeout.count())));
    std::string readiness_error;
    if (!kubehost::runtime::ReadinessCheck(settings.local_port, timeout, readiness_error)) {
      std::cerr << "warning: port-forward started but local port not yet ready: " << readiness_error << "\n";
    }
    return kExitOk;
  }

  kubehost::portforward::PortForwardManager manager(settings, runner);
  if (action == "stop") {
    std::string error;
    if (!manager.Stop(error)) {
      std::cerr << "port-forward: " << error << "\n";
      return kExitFailure;
    }
    std::cout << "port-forward stopped (namespace: " << settings.namespace_name << ", port: " << settings.local_port
              << ")\n";
    return kExitOk;
  }

  const auto status = manager.Status();
  std::cout << "state:      " << kubehost::portforward::ToString(status.state) << "\n";
  std::cout << "namespace:  " << settings.namespace_name << "\n";
  std::cout << "port:       " << settings.local_port << "\n";
  if (status.pid > 0) {
    std::cout << "pid:        " << status.pid << "\n";
  }
  if (flags.verbose || status.running()) {
    std::cout << "log:        " << status.log_file.string() << "\n";
  }
  return status.running() ? kExitOk : kExitNotRunning;
}

// -- pod exec ---------------------------------------------------------------

int RunPodCommand(const std::vector<std::string>& args, kubehost::runtime::ProcessRunner& runner) {
  bool show_help = false;
  bool tty = false;
  std::string namespace_name;
  std::string selector;
  std::string container;
  std::string config_file;

  cxxopts::Options options(args.front() + " exec", "Execute a shell command in the application pod.");
  options.add_options()
      ("h,help", "Show help", cxxopts::value<bool>(show_help)->default_value("false"))
      ("n,namespace", "Kubernetes namespace (default openclaw)", cxxopts::value<std::string>(namespace_name))
      ("selector", "Pod label selector", cxxopts::value<std::string>(selector))
      ("c,container", "Container name", cxxopts::value<std::string>(container))
      ("tty", "Allocate a TTY and keep stdin open", cxxopts::value<bool>(tty)->default_value("false"))
      ("config-file", "Path to kubehost.yaml", cxxopts::value<std::string>(config_file));

  if (args.size() < 2 || args[1] != "exec") {
    if (args.size() >= 2 && (args[1] == "-h" || args[1] == "--help")) {
      std::cout << options.help() << "\n";
      return kExitOk;
    }
    std::cerr << "pod: expected 'exec' subcommand\n";
    return kExitUsage;
  }

  const auto split = SplitCommandLine(args, 2, true);
  if (!ParseOptions(options, args.front() + " exec", split.options, "pod exec")) {
    return kExitUsage;
  }
  if (show_help) {
    std::cout << options.help() << "\n";
    return kExitOk;
  }
  if (split.passthrough.empty()) {
    std::cerr << "pod exec: missing command (usage: pod exec [options] -- <command...>)\n";
    return kExitUsage;
  }

  const auto config = LoadConfigForCommand("pod exec", config_file);
  if (!config.has_value()) {
    return kExitFailure;
  }
  if (namespace_name.empty()) {
    namespace_name = config->port_forward.namespace_name.value_or(kubehost::portforward::kDefaultNamespace);
  }
  auto resolver_settings = ResolverSettingsFor(namespace_name, *config);
  if (!selector.empty()) {
    resolver_settings.selector = selector;
  }

  const std::string kubectl = kubehost::kube::KubectlBinary();
  kubehost::kube::Resolver resolver(resolver_settings, runner, kubectl);
  std::string error;
  const auto pod = resolver.ResolvePod(error);
  if (!pod.has_value()) {
    std::cerr << "pod exec: " << error << "\n";
    return kExitFailure;
  }

  kubehost::runtime::RunProcessRequest request;
  request.argv = kubehost::kube::BuildPodExecArgv(kubectl, namespace_name, *pod, container, tty, split.passthrough);
  const auto result = runner.Run(request, error);
  if (!result.has_value()) {
    std::cerr << "pod exec: " << error << "\n";
    return kExitFailure;
  }
  if (!result->ok()) {
    std::cerr << "pod exec: kubectl exited with status " << result->exit_code << "\n";
    return kExitFailure;
  }
  return kExitOk;
}

// -- node scripts -----------------------------------------------------------

constexpr const char* kServerKubeconfig = "/etc/rancher/k3s/k3s.yaml";

//! Directory holding `scripts/main.sh`: cwd, the parent of a `bin` cwd, then the parent
//! of the executable's directory.
std::optional<std::filesystem::path> FindScriptRoot(std::string& error) {
  const auto has_main = [](const std::filesystem::path& dir) {
    std::error_code ec;
    return std::filesystem::is_regular_file(dir / "scripts" / "main.sh", ec);
  };

  std::error_code ec;
  const auto cwd = std::filesystem::current_path(ec);
  if (!ec) {
    if (has_main(cwd)) {
      return cwd;
    }
    if (cwd.filename() == "bin" && has_main(cwd.parent_path())) {
      return cwd.parent_path();
    }
  }
  const auto exe = std::filesystem::read_symlink("/proc/self/exe", ec);
  if (!ec && has_main(exe.parent_path().parent_path())) {
    return exe.parent_path().parent_path();
  }
  error = "could not locate project root: scripts/main.sh not found in the current directory or next to the "
          "executable";
  return std::nullopt;
}

//! Flags every node script command understands. They are stripped before the script
//! sees its arguments.
struct NodeFlags {
  std::string env_file;
  bool dry_run = false;
  bool dry_run_write_files = false;
  std::vector<std::string> remaining;
};

NodeFlags ParseNodeFlags(const std::vector<std::string>& args) {
  NodeFlags flags;
  for (size_t i = 0; i < args.size(); ++i) {
    const auto& arg = args[i];
    if (arg == "--dry-run") {
      flags.dry_run = true;
    } else if (arg == "--dry-run-write-files") {
      flags.dry_run_write_files = true;
    } else if (arg == "--env-file" && i + 1 < args.size()) {
      flags.env_file = args[++i];
    } else if (arg.rfind("--env-file=", 0) == 0) {
      flags.env_file = arg.substr(std::string("--env-file=").size());
    } else {
      flags.remaining.push_back(arg);
    }
  }
  return flags;
}

bool IsHelpRequest(const std::vector<std::string>& args) {
  return std::any_of(args.begin(), args.end(),
                     [](const std::string& arg) { return arg == "-h" || arg == "--help" || arg == "help"; });
}

//! Env file values with the dry-run flags layered on top.
bool BuildNodeEnv(const std::string& command_name, const NodeFlags& flags, EnvMap& env) {
  if (!LoadCommandEnv(command_name, flags.env_file, false, env)) {
    return false;
  }
  if (flags.dry_run) {
    env["DRY_RUN"] = "true";
  }
  if (flags.dry_run_write_files) {
    env["DRY_RUN_WRITE_FILES"] = "true";
  }
  return true;
}

//! Runs `request` with inherited stdio and hands back the child's own exit code.
int RunScript(const std::string& command_name, kubehost::runtime::RunProcessRequest request,
              kubehost::runtime::ProcessRunner& runner) {
  request.stdin_mode = kubehost::runtime::StdinMode::kInherit;
  request.output_mode = kubehost::runtime::OutputMode::kInherit;
  std::string error;
  const auto result = runner.Run(request, error);
  if (!result.has_value()) {
    std::cerr << command_name << ": failed to execute " << request.argv.front() << ": " << error << "\n";
    return kExitFailure;
  }
  return result->exit_code;
}

//! `bootstrap`, `join`, `pair` and `dns`: `bash scripts/main.sh <command> <args...>`.
int RunNodeScriptCommand(const std::string& command, const std::vector<std::string>& args,
                         kubehost::runtime::ProcessRunner& runner) {
  const auto flags = ParseNodeFlags(args);
  EnvMap env;
  if (!BuildNodeEnv(command, flags, env)) {
    return kExitUsage;
  }
  if (command == "bootstrap" || command == "join") {
    env["MODE"] = command;
  }

  std::string error;
  const auto root = FindScriptRoot(error);
  if (!root.has_value()) {
    std::cerr << command << ": " << error << "\n";
    return kExitFailure;
  }

  kubehost::runtime::RunProcessRequest request;
  request.argv = {"bash", (*root / "scripts" / "main.sh").string(), command};
  // Help goes to the script untouched so it can describe its own flags.
  const auto& script_args = IsHelpRequest(args) ? args : flags.remaining;
  request.argv.insert(request.argv.end(), script_args.begin(), script_args.end());
  request.env = std::move(env);
  return RunScript(command, std::move(request), runner);
}

std::vector<std::string> ListRecipes(const std::filesystem::path& root) {
  std::vector<std::string> recipes;
  std::error_code ec;
  for (std::filesystem::directory_iterator it(root / "scripts" / "recipes", ec), end; !ec && it != end;
       it.increment(ec)) {
    if (std::filesystem::is_regular_file(it->path() / "install.sh", ec)) {
      recipes.push_back(it->path().filename().string());
    }
  }
  std::sort(recipes.begin(), recipes.end());
  return recipes;
}

void PrintInstallHelp(const std::optional<std::filesystem::path>& root) {
  std::cout << "Usage:\n"
            << "  kubehost install <recipe> [recipe-options]\n"
            << "\n"
            << "Runs scripts/recipes/<recipe>/install.sh against the cluster. KUBECONFIG defaults to\n"
            << kServerKubeconfig << " on the node and config/k3s.yaml elsewhere; off the node the SSH\n"
            << "tunnel is started first.\n";
  if (!root.has_value()) {
    return;
  }
  std::cout << "\nAvailable recipes:\n";
  for (const auto& recipe : ListRecipes(*root)) {
    std::cout << "  " << recipe << "\n";
  }
}

bool IsRecipeName(const std::string& name) {
  return !name.empty() && name != "." && name != ".." && name.find('/') == std::string::npos;
}

int RunInstallCommand(const std::vector<std::string>& args, kubehost::runtime::ProcessRunner& runner) {
  std::string error;
  const auto root = FindScriptRoot(error);
  if (args.empty() || args.front() == "-h" || args.front() == "--help" || args.front() == "help") {
    PrintInstallHelp(root);
    return kExitOk;
  }
  if (!root.has_value()) {
    std::cerr << "install: " << error << "\n";
    return kExitFailure;
  }

  const std::string& recipe = args.front();
  const std::vector<std::string> recipe_args(args.begin() + 1, args.end());
  const auto script = *root / "scripts" / "recipes" / recipe / "install.sh";
  std::error_code ec;
  if (!IsRecipeName(recipe) || !std::filesystem::is_regular_file(script, ec)) {
    std::cerr << "install: unknown recipe: " << recipe << "\n"
              << "Run 'kubehost install --help' to see available recipes.\n";
    return kExitUsage;
  }

  kubehost::runtime::RunProcessRequest request;
  request.argv = {"bash", script.string()};
  request.argv.insert(request.argv.end(), recipe_args.begin(), recipe_args.end());

  if (!IsHelpRequest(recipe_args)) {
    std::string kubeconfig;
    const char* value = std::getenv("KUBECONFIG");
    if (value != nullptr && *value != '\0') {
      kubeconfig = value;
    } else if (std::filesystem::exists(kServerKubeconfig, ec)) {
      kubeconfig = kServerKubeconfig;
    } else {
      kubeconfig = (*root / "config" / "k3s.yaml").string();
    }

    if (kubeconfig != kServerKubeconfig) {
      if (!std::filesystem::is_regular_file(kubeconfig, ec)) {
        std::cerr << "install: kubeconfig " << kubeconfig << " not found; copy " << kServerKubeconfig
                  << " from the management node first.\n";
        return kExitFailure;
      }
      const auto config = LoadConfigForCommand("install", "");
      if (!config.has_value() || !EnsureTunnel(*config, runner)) {
        return kExitFailure;
      }
    }
    request.env["KUBECONFIG"] = kubeconfig;
  }
  return RunScript("install", std::move(request), runner);
}

// -- remote -----------------------------------------------------------------

struct RemoteFlags {
  bool show_help = false;
  bool verbose = false;
  std::string host;
  std::string user;
  std::string pubkey;
  std::string repo;
  std::string env_config;
  std::string config_file;
  std::string branch;
  std::string ref;
  bool pull = false;
  bool no_pull = false;
  bool no_tty = false;
  std::string env_file;
};

void AddRemoteOptions(cxxopts::Options& options, RemoteFlags& flags) {
  options.add_options()
      ("h,help", "Show help", cxxopts::value<bool>(flags.show_help)->default_value("false"))
      ("v,verbose", "Show the resolved target", cxxopts::value<bool>(flags.verbose)->default_value("false"))
      ("host", "Remote host or IP address (default: MGMT_HOST, MGMT_IP)", cxxopts::value<std::string>(flags.host))
      ("user", "Remote sudo user (default cubeadmin)", cxxopts::value<std::string>(flags.user))
      ("pubkey", "Path to SSH public key", cxxopts::value<std::string>(flags.pubkey))
      ("repo", "Repository URL", cxxopts::value<std::string>(flags.repo))
      ("config", "Env file with MGMT_HOST/MGMT_USER (default: config/kubehost.env)",
          cxxopts::value<std::string>(flags.env_config))
      ("config-file", "Path to kubehost.yaml", cxxopts::value<std::string>(flags.config_file));
}

void AddGitOptions(cxxopts::Options& options, RemoteFlags& flags) {
  options.add_options("git")
      ("branch", "Git branch name", cxxopts::value<std::string>(flags.branch))
      ("ref", "Git ref (commit/tag); wins over --branch", cxxopts::value<std::string>(flags.ref))
      ("pull", "Pull latest changes (ff-only)", cxxopts::value<bool>(flags.pull)->default_value("false"))
      ("no-pull", "Do not pull changes", cxxopts::value<bool>(flags.no_pull)->default_value("false"));
}

void AddRunOptions(cxxopts::Options& options, RemoteFlags& flags) {
  options.add_options("run")
      ("no-tty", "Do not force a TTY (default: forced for prompts)",
          cxxopts::value<bool>(flags.no_tty)->default_value("false"))
      ("env-file", "Upload and source this env file before running", cxxopts::value<std::string>(flags.env_file));
}

//! Flags, then MGMT_* from the process env or env file, then yaml, then defaults.
bool ResolveRemoteTarget(const RemoteFlags& flags, const kubehost::config::Config& config,
                         kubehost::remote::Target& target) {
  target = kubehost::remote::Target{};
  target.host = flags.host;
  target.user = config.remote.user.value_or(kubehost::remote::kDefaultUser);
  if (!flags.user.empty()) {
    target.user = flags.user;
    target.user_explicit = true;
  }
  target.pub_key_path = !flags.pubkey.empty() ? flags.pubkey : config.remote.pub_key.value_or("");
  target.repo_url = !flags.repo.empty() ? flags.repo : config.remote.repo_url.value_or(kubehost::remote::kDefaultRepoUrl);

  std::string env_path = !flags.env_config.empty() ? flags.env_config : config.remote.env_file.value_or("");
  EnvMap file_env;
  if (!LoadCommandEnv("remote", env_path, false, file_env)) {
    return false;
  }
  target.config_path = env_path;

  EnvMap env;
  for (const char* key : {"MGMT_HOST", "MGMT_IP", "MGMT_USER", "DEFAULT_USER"}) {
    if (auto value = kubehost::config::LookupEnv(file_env, key)) {
      env[key] = *value;
    }
  }
  kubehost::remote::ApplyEnvDefaults(target, env);
  if (target.host.empty()) {
    target.host = config.remote.host.value_or("");
  }
  return true;
}

kubehost::remote::GitOptions MakeGitOptions(const RemoteFlags& flags) {
  kubehost::remote::GitOptions git;
  git.branch = flags.branch;
  git.ref = flags.ref;
  git.pull = flags.pull && !flags.no_pull;
  git.pull_is_set = flags.pull || flags.no_pull;
  return git;
}

int RunRemoteCommand(const std::vector<std::string>& args, kubehost::runtime::ProcessRunner& runner) {
  static const std::set<std::string> subcommands = {"provision", "git", "build", "smoke", "run"};

  const auto outer = SplitCommandLine(args, 1, true);
  if (outer.passthrough.empty()) {
    PrintRemoteHelp(args.front());
    for (const auto& token : outer.options) {
      if (token == "-h" || token == "--help") {
        return kExitOk;
      }
    }
    return kExitUsage;
  }
  const std::string sub = outer.passthrough.front();
  if (subcommands.count(sub) == 0) {
    std::cerr << "remote: unknown subcommand '" << sub << "'\n\n";
    PrintRemoteHelp(args.front());
    return kExitUsage;
  }

  std::vector<std::string> rest(outer.passthrough.begin() + 1, outer.passthrough.end());
  const auto inner = SplitCommandLine(rest, 0, sub == "run");
  std::vector<std::string> tokens = outer.options;
  tokens.insert(tokens.end(), inner.options.begin(), inner.options.end());

  const std::string command_name = "remote " + sub;
  RemoteFlags flags;
  cxxopts::Options options(args.front() + " " + sub, "Remote operation '" + sub + "' on the management node.");
  AddRemoteOptions(options, flags);
  if (sub != "provision") {
    AddGitOptions(options, flags);
  }
  if (sub == "run") {
    AddRunOptions(options, flags);
  }
  if (!ParseOptions(options, args.front() + " " + sub, tokens, command_name)) {
    return kExitUsage;
  }
  if (flags.show_help) {
    std::cout << options.help() << "\n";
    return kExitOk;
  }
  if (sub != "run" && (!inner.positionals.empty() || !inner.passthrough.empty())) {
    std::cerr << command_name << ": unexpected argument '"
              << (inner.positionals.empty() ? inner.passthrough.front() : inner.positionals.front()) << "'\n";
    return kExitUsage;
  }
  if (flags.pull && flags.no_pull) {
    std::cerr << command_name << ": --pull and --no-pull are mutually exclusive\n";
    return kExitUsage;
  }
  if (sub == "run" && inner.passthrough.empty()) {
    std::cerr << command_name << ": missing kubehost command arguments\n";
    std::cout << options.help() << "\n";
    return kExitUsage;
  }

  const auto config = LoadConfigForCommand(command_name, flags.config_file);
  if (!config.has_value()) {
    return kExitFailure;
  }
  kubehost::remote::Target target;
  if (!ResolveRemoteTarget(flags, *config, target)) {
    return kExitFailure;
  }
  if (target.host.empty()) {
    std::cerr << command_name << ": no host provided and no MGMT_HOST/MGMT_IP found in config\n";
    return kExitUsage;
  }
  if (flags.verbose) {
    std::cout << "target: " << target.user << "@" << target.host << "\n";
    std::cout << "  repo: " << target.repo_url << "\n";
    std::cout << "  remote dir: " << kubehost::remote::RemoteRepoDir(target) << "\n";
  }

  kubehost::remote::Engine engine(runner, kubehost::remote::MakeSshClientFactory(runner));
  auto git = MakeGitOptions(flags);
  std::string error;
  bool ok = false;

  if (sub == "provision") {
    ok = engine.Provision(target, error);
  } else if (sub == "git") {
    if (!git.pull_is_set) {
      git.pull = true;
      git.pull_is_set = true;
    }
    ok = engine.GitSync(target, git, error);
  } else if (sub == "build" || sub == "smoke") {
    const auto root = FindProjectRoot(error);
    if (root.has_value()) {
      ok = sub == "build" ? engine.BuildAndUpload(target, *root, git, error) : engine.Smoke(target, git, *root, error);
    }
  } else {
    if (!git.branch.empty() && !git.pull_is_set) {
      git.pull = true;
    }
    kubehost::remote::RunOptions run;
    run.force_tty = !flags.no_tty;
    run.env_file = flags.env_file;
    run.git = git;
    run.args = inner.passthrough;
    ok = engine.Run(target, run, error);
  }

  if (!ok) {
    std::cerr << command_name << ": " << error << "\n";
    return kExitFailure;
  }
  return kExitOk;
}

}  // namespace

namespace kubehost {

int run_cli(const std::vector<std::string>& args) {
  auto runner = MakeProcessRunner();
  return run_cli(args, *runner);
}

int run_cli(const std::vector<std::string>& args, runtime::ProcessRunner& runner) {
  //! Top-level dispatcher: commands are mutually exclusive and parsed by first token.
  if (args.size() < 2) {
    PrintGeneralHelp();
    return kExitUsage;
  }

  const std::string command = args[1];
  if (command == "help" || command == "--help" || command == "-h") {
    PrintGeneralHelp();
    return kExitOk;
  }

  if (command == "--version") {
    std::cout << AppVersion() << "\n";
    return kExitOk;
  }

  if (command == "remote") {
    return RunRemoteCommand(BuildSubcommandArgs(args, 2, "remote"), runner);
  }

  if (command == "tunnel") {
    return RunTunnelCommand(BuildSubcommandArgs(args, 2, "tunnel"), runner);
  }

  if (command == "port-forward") {
    return RunPortForwardCommand(BuildSubcommandArgs(args, 2, "port-forward"), runner);
  }

  if (command == "pod") {
    return RunPodCommand(BuildSubcommandArgs(args, 2, "pod"), runner);
  }

  if (command == "ssh") {
    return RunSshCommand(BuildSubcommandArgs(args, 2, "ssh"), runner);
  }

  if (command == "bootstrap" || command == "join" || command == "pair" || command == "dns") {
    return RunNodeScriptCommand(command, std::vector<std::string>(args.begin() + 2, args.end()), runner);
  }

  if (command == "install") {
    return RunInstallCommand(std::vector<std::string>(args.begin() + 2, args.end()), runner);
  }

  std::cerr << "Unknown command '" << command << "'.\n\n";
  PrintGeneralHelp();
  return kExitUsage;
}

}  // namespace kubehost
