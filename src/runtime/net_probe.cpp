#include "kubehost/runtime/net_probe.h"

#include <cerrno>
#include <sstream>
#include <thread>

#include <arpa/inet.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace kubehost::runtime {
namespace {

constexpr std::chrono::milliseconds kDialTimeout{500};
constexpr std::chrono::milliseconds kRetryInterval{200};

bool IsPortValid(int port) { return port >= 1 && port <= 65535; }

}  // namespace

bool IsLocalPortInUse(int port) {
  if (!IsPortValid(port)) {
    return false;
  }
  const int fd = ::socket(AF_INET, SOCK_STREAM, 0);
  if (fd < 0) {
    // Restricted runtimes (tests/sandboxes) may forbid socket probes.
    return false;
  }
  const int reuse = 1;
  (void)::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));

  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(static_cast<uint16_t>(port));
  addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);

  const bool in_use = ::bind(fd, reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)) != 0 && errno == EADDRINUSE;
  ::close(fd);
  return in_use;
}

bool TcpProbe(const std::string& host, int port, std::chrono::milliseconds timeout) {
  if (!IsPortValid(port)) {
    return false;
  }
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(static_cast<uint16_t>(port));
  const std::string address = host == "localhost" ? "127.0.0.1" : host;
  if (::inet_pton(AF_INET, address.c_str(), &addr.sin_addr) != 1) {
    return false;
  }

  const int fd = ::socket(AF_INET, SOCK_STREAM, 0);
  if (fd < 0) {
    return false;
  }
  (void)::fcntl(fd, F_SETFL, ::fcntl(fd, F_GETFL) | O_NONBLOCK);

  bool connected = ::connect(fd, reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)) == 0;
  if (!connected && errno == EINPROGRESS) {
    pollfd pfd{fd, POLLOUT, 0};
    if (::poll(&pfd, 1, static_cast<int>(timeout.count())) == 1) {
      int so_error = 0;
      socklen_t len = sizeof(so_error);
      connected = ::getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len) == 0 && so_error == 0;
    }
  }
  ::close(fd);
  return connected;
}

bool ReadinessCheck(int port, std::chrono::milliseconds timeout, std::string& error) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (TcpProbe("127.0.0.1", port, kDialTimeout)) {
      error.clear();
      return true;
    }
    std::this_thread::sleep_for(kRetryInterval);
  }
  std::ostringstream oss;
  oss << "localhost:" << port << " not accepting connections after " << timeout.count() << "ms";
  error = oss.str();
  return false;
}

}  // namespace kubehost::runtime
