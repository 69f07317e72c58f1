#ifndef WHISPER_CORE_DIAGNOSTICS_H
#define WHISPER_CORE_DIAGNOSTICS_H

#include <array>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>

namespace whisper::core {

enum class Anomaly : std::uint8_t {
  kMalformedPacket = 0,
  kUnknownRemote,
  kTransportUnavailable,
  kHandshakeTimeout,
  kAuthorizationDenied,
  kNoTransportAvailable,
  kDuplicateRemote,
  kRadioFailure,
  kNetworkFailure,
  kTeardownFailure,
  kCount
};

const char* AnomalyName(Anomaly kind);

// Anomaly sink shared by every transport of a session. Report never blocks
// on the observer and never fails.
class Diagnostics {
 public:
  using Observer = std::function<void(Anomaly kind, std::string_view tag,
                                      std::string_view detail)>;

  void Report(Anomaly kind, std::string_view tag, std::string_view detail);

  std::uint64_t count(Anomaly kind) const;
  std::uint64_t total() const;
  void Reset();

  void SetObserver(Observer observer);

 private:
  static constexpr std::size_t kKinds = static_cast<std::size_t>(Anomaly::kCount);

  std::array<std::atomic<std::uint64_t>, kKinds> counts_{};
  std::mutex observer_mutex_;
  Observer observer_;
};

}  // namespace whisper::core

#endif  // WHISPER_CORE_DIAGNOSTICS_H
