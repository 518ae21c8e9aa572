#pragma once

#include <chrono>
#include <string>

namespace kubehost::runtime {

//! True when binding 127.0.0.1:`port` fails with EADDRINUSE.
bool IsLocalPortInUse(int port);

//! Single TCP connect attempt to `host`:`port` bounded by `timeout`.
bool TcpProbe(const std::string& host, int port, std::chrono::milliseconds timeout);

//! Retries a TCP connect to localhost:`port` every 200ms until it succeeds or `timeout`
//! elapses. Independent of whichever process is supposed to be listening.
bool ReadinessCheck(int port, std::chrono::milliseconds timeout, std::string& error);

}  // namespace kubehost::runtime
