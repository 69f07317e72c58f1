#include "network_monitor.h"

#include <utility>

#include "platform_net.h"

namespace whisper::transport {

NetworkMonitor::NetworkMonitor(const core::NetworkSection& config)
    : NetworkMonitor(config, &platform::net::HasRoutableInterface) {}

NetworkMonitor::NetworkMonitor(const core::NetworkSection& config, Probe probe)
    : config_(config), probe_(std::move(probe)) {}

TransportStatus NetworkMonitor::status() const {
  if (!config_.enable) {
    return TransportStatus::kDisabled;
  }
  if (config_.relay_host.empty() || config_.relay_port == 0) {
    return TransportStatus::kOff;
  }
  if (IsLoopbackHost(config_.relay_host)) {
    return TransportStatus::kOn;
  }
  return probe_ && probe_() ? TransportStatus::kOn : TransportStatus::kOff;
}

bool IsLoopbackHost(const std::string& host) {
  return host == "localhost" || host == "::1" ||
         host.compare(0, 4, "127.") == 0;
}

}  // namespace whisper::transport
