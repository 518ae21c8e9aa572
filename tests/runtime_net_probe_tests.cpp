#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <string>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include "kubehost/runtime/net_probe.h"

namespace {

//! Listening socket on an ephemeral loopback port.
class LoopbackListener {
 public:
  LoopbackListener() {
    fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = 0;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    if (fd_ >= 0 && ::bind(fd_, reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)) == 0 &&
        ::listen(fd_, 4) == 0) {
      socklen_t len = sizeof(addr);
      if (::getsockname(fd_, reinterpret_cast<sockaddr*>(&addr), &len) == 0) {
        port_ = ntohs(addr.sin_port);
      }
    }
  }

  ~LoopbackListener() { Close(); }

  void Close() {
    if (fd_ >= 0) {
      ::close(fd_);
      fd_ = -1;
    }
  }

  int port() const { return port_; }

 private:
  int fd_ = -1;
  int port_ = 0;
};

}  // namespace

TEST_CASE("local port check detects a bound listener", "[runtime][net]") {
  LoopbackListener listener;
  REQUIRE(listener.port() > 0);
  CHECK(kubehost::runtime::IsLocalPortInUse(listener.port()));
}

TEST_CASE("local port check rejects out of range ports", "[runtime][net]") {
  CHECK_FALSE(kubehost::runtime::IsLocalPortInUse(0));
  CHECK_FALSE(kubehost::runtime::IsLocalPortInUse(70000));
}

TEST_CASE("tcp probe connects to a listener and fails once it closes", "[runtime][net]") {
  LoopbackListener listener;
  const int port = listener.port();
  REQUIRE(port > 0);
  CHECK(kubehost::runtime::TcpProbe("127.0.0.1", port, std::chrono::milliseconds(500)));
  CHECK(kubehost::runtime::TcpProbe("localhost", port, std::chrono::milliseconds(500)));

  listener.Close();
  CHECK_FALSE(kubehost::runtime::TcpProbe("127.0.0.1", port, std::chrono::milliseconds(200)));
}

TEST_CASE("tcp probe rejects unparsable hosts", "[runtime][net]") {
  CHECK_FALSE(kubehost::runtime::TcpProbe("not an address", 80, std::chrono::milliseconds(100)));
}

TEST_CASE("readiness check succeeds against a listener", "[runtime][net]") {
  LoopbackListener listener;
  REQUIRE(listener.port() > 0);
  std::string error;
  REQUIRE(kubehost::runtime::ReadinessCheck(listener.port(), std::chrono::milliseconds(1000), error));
  CHECK(error.empty());
}

TEST_CASE("readiness check reports a timeout", "[runtime][net]") {
  int port = 0;
  {
    LoopbackListener listener;
    port = listener.port();
  }
  REQUIRE(port > 0);
  std::string error;
  REQUIRE_FALSE(kubehost::runtime::ReadinessCheck(port, std::chrono::milliseconds(300), error));
  CHECK(error.find("not accepting connections") != std::string::npos);
}
