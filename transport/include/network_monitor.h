#ifndef WHISPER_TRANSPORT_NETWORK_MONITOR_H
#define WHISPER_TRANSPORT_NETWORK_MONITOR_H

#include <functional>
#include <string>

#include "config.h"
#include "transport.h"

namespace whisper::transport {

// Decides whether the network path can be used at all.
class NetworkMonitor final {
 public:
  using Probe = std::function<bool()>;

  // Defaults to platform::net::HasRoutableInterface.
  explicit NetworkMonitor(const core::NetworkSection& config);
  NetworkMonitor(const core::NetworkSection& config, Probe probe);

  // kDisabled when turned off in configuration. A relay on a loopback
  // address counts as reachable without a routable interface.
  TransportStatus status() const;

 private:
  core::NetworkSection config_;
  Probe probe_;
};

bool IsLoopbackHost(const std::string& host);

}  // namespace whisper::transport

#endif  // WHISPER_TRANSPORT_NETWORK_MONITOR_H
