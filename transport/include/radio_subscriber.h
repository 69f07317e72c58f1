#ifndef WHISPER_TRANSPORT_RADIO_SUBSCRIBER_H
#define WHISPER_TRANSPORT_RADIO_SUBSCRIBER_H

#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>

#include "config.h"
#include "conversation.h"
#include "diagnostics.h"
#include "event_queue.h"
#include "radio_gatt.h"
#include "transport.h"

namespace whisper::transport {

// Listener over the radio: central role, connects to advertising
// whisperers and pairs over the control characteristics.
class RadioSubscriber final : public SubscribeTransport, public RadioObserver {
 public:
  enum class Phase : std::uint8_t {
    kConnecting = 0,
    kResolvingServices,
    kPairing,
    kAwaitingAuthorization,
    kSubscribed
  };

  // Without a target conversation any whisperer is a candidate.
  RadioSubscriber(core::EventQueue& queue, RadioAdapter& radio,
                  core::Diagnostics& diagnostics,
                  const core::RadioSection& config,
                  core::LocalIdentity identity,
                  std::optional<core::Conversation> target);
  ~RadioSubscriber() override;

  RadioSubscriber(const RadioSubscriber&) = delete;
  RadioSubscriber& operator=(const RadioSubscriber&) = delete;

  TransportKind kind() const override { return TransportKind::kLocal; }
  TransportStatus status() const override;
  void SetCallbacks(TransportCallbacks callbacks) override;

  void Start(FailureCallback on_failure) override;
  void Stop() override;
  void GoToBackground() override;
  void GoToForeground() override;

  bool Subscribe(const std::string& remote_id,
                 const core::Conversation& conversation) override;
  bool SendControl(const std::string& remote_id,
                   const core::ProtocolChunk& chunk) override;
  bool Drop(const std::string& remote_id) override;

  std::optional<TransportRemote> FindRemote(
      const std::string& remote_id) const override;

  std::optional<Phase> PhaseOf(const std::string& remote_id) const;
  bool running() const override { return running_; }
  bool discovering() const { return discovering_; }
  bool advertising() const { return advertising_; }
  const std::string& publisher_id() const { return publisher_; }

  // RadioObserver
  void OnRadioStatus(TransportStatus status) override;
  void OnAdvertisement(const Advertisement& ad) override;
  void OnConnected(const std::string& peripheral_id) override;
  void OnConnectFailed(const std::string& peripheral_id,
                       const std::string& error) override;
  void OnDisconnected(const std::string& peripheral_id,
                      const std::string& error) override;
  void OnServicesDiscovered(const std::string& peripheral_id, bool found,
                            const std::string& error) override;
  void OnCharacteristicsDiscovered(const std::string& peripheral_id,
                                   const std::string& error) override;
  void OnNotifyStateChanged(const std::string& peripheral_id,
                            Characteristic characteristic, bool enabled,
                            const std::string& error) override;
  void OnValueUpdated(const std::string& peripheral_id,
                      Characteristic characteristic,
                      const std::vector<std::uint8_t>& value) override;
  void OnWriteCompleted(const std::string& peripheral_id,
                        Characteristic characteristic,
                        const std::string& error) override;

 private:
  struct Remote {
    std::string id;
    Phase phase{Phase::kConnecting};
    RemoteState state;
    bool offer_delivered{false};
    core::ScopedTimer handshake_timer;
  };

  void StartDiscovery();
  void StopDiscovery();
  void StartAdvertising();
  void StopAdvertising();

  Remote* Find(const std::string& peripheral_id);
  void MaybeAwaitAuthorization(Remote& remote);
  void HandleControl(const std::string& peripheral_id,
                     const std::vector<std::uint8_t>& value);
  void HandleContent(const std::string& peripheral_id,
                     const std::vector<std::uint8_t>& value);
  // Tears down our side of the link; the remote must still be tracked.
  void RemoveRemote(const std::string& peripheral_id);
  void Fail(const std::string& peripheral_id, const std::string& reason);
  void ReportUnknown(const char* op, const std::string& remote_id);

  static TransportRemote Snapshot(const Remote& remote);

  core::EventQueue& queue_;
  RadioAdapter& radio_;
  core::Diagnostics& diagnostics_;
  core::RadioSection config_;
  core::LocalIdentity identity_;
  std::optional<core::Conversation> target_;
  TransportCallbacks callbacks_;
  FailureCallback on_failure_;

  bool running_{false};
  bool in_background_{false};
  bool discovering_{false};
  bool advertising_{false};
  core::ScopedTimer ad_timer_;

  std::map<std::string, Remote> remotes_;
  std::set<std::string> drops_in_progress_;
  std::set<std::string> advertisers_;
  std::string publisher_;
};

const char* SubscriberPhaseName(RadioSubscriber::Phase phase);

}  // namespace whisper::transport

#endif  // WHISPER_TRANSPORT_RADIO_SUBSCRIBER_H
