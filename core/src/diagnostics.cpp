#include "diagnostics.h"

#include <utility>

#include "platform_log.h"

namespace whisper::core {

namespace pfl = whisper::platform::log;

const char* AnomalyName(Anomaly kind) {
  switch (kind) {
    case Anomaly::kMalformedPacket:
      return "malformed_packet";
    case Anomaly::kUnknownRemote:
      return "unknown_remote";
    case Anomaly::kTransportUnavailable:
      return "transport_unavailable";
    case Anomaly::kHandshakeTimeout:
      return "handshake_timeout";
    case Anomaly::kAuthorizationDenied:
      return "authorization_denied";
    case Anomaly::kNoTransportAvailable:
      return "no_transport_available";
    case Anomaly::kDuplicateRemote:
      return "duplicate_remote";
    case Anomaly::kRadioFailure:
      return "radio_failure";
    case Anomaly::kNetworkFailure:
      return "network_failure";
    case Anomaly::kTeardownFailure:
      return "teardown_failure";
    case Anomaly::kCount:
      break;
  }
  return "unknown";
}

void Diagnostics::Report(Anomaly kind, std::string_view tag,
                         std::string_view detail) {
  const auto index = static_cast<std::size_t>(kind);
  if (index >= kKinds) {
    return;
  }
  counts_[index].fetch_add(1, std::memory_order_relaxed);
  pfl::Log(pfl::Level::kWarn, tag, detail, {{"anomaly", AnomalyName(kind)}});

  Observer observer;
  {
    std::lock_guard<std::mutex> lock(observer_mutex_);
    observer = observer_;
  }
  if (observer) {
    observer(kind, tag, detail);
  }
}

std::uint64_t Diagnostics::count(Anomaly kind) const {
  const auto index = static_cast<std::size_t>(kind);
  if (index >= kKinds) {
    return 0;
  }
  return counts_[index].load(std::memory_order_relaxed);
}

std::uint64_t Diagnostics::total() const {
  std::uint64_t sum = 0;
  for (const auto& c : counts_) {
    sum += c.load(std::memory_order_relaxed);
  }
  return sum;
}

void Diagnostics::Reset() {
  for (auto& c : counts_) {
    c.store(0, std::memory_order_relaxed);
  }
}

void Diagnostics::SetObserver(Observer observer) {
  std::lock_guard<std::mutex> lock(observer_mutex_);
  observer_ = std::move(observer);
}

}  // namespace whisper::core
