#ifndef WHISPER_TRANSPORT_RADIO_PUBLISHER_H
#define WHISPER_TRANSPORT_RADIO_PUBLISHER_H

#include <cstdint>
#include <deque>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "config.h"
#include "conversation.h"
#include "diagnostics.h"
#include "event_queue.h"
#include "radio_gatt.h"
#include "transport.h"

namespace whisper::transport {

// Whisperer over the radio: peripheral role, publishes the whisper service
// and advertises while listeners are looking for it.
class RadioPublisher final : public PublishTransport, public RadioObserver {
 public:
  RadioPublisher(core::EventQueue& queue, RadioAdapter& radio,
                 core::Diagnostics& diagnostics,
                 const core::RadioSection& config,
                 core::LocalIdentity identity,
                 core::Conversation conversation);
  ~RadioPublisher() override;

  RadioPublisher(const RadioPublisher&) = delete;
  RadioPublisher& operator=(const RadioPublisher&) = delete;

  TransportKind kind() const override { return TransportKind::kLocal; }
  TransportStatus status() const override;
  void SetCallbacks(TransportCallbacks callbacks) override;

  void Start(FailureCallback on_failure) override;
  void Stop() override;
  void GoToBackground() override;
  void GoToForeground() override;

  void Publish(const std::vector<core::ProtocolChunk>& chunks) override;
  bool SendContent(const std::string& remote_id,
                   const std::vector<core::ProtocolChunk>& chunks) override;
  bool SendControl(const std::string& remote_id,
                   const core::ProtocolChunk& chunk) override;
  bool Authorize(const std::string& remote_id) override;
  bool Deauthorize(const std::string& remote_id) override;
  bool Drop(const std::string& remote_id) override;

  std::optional<TransportRemote> FindRemote(
      const std::string& remote_id) const override;
  std::vector<std::string> BroadcastRecipients() const override;

  bool running() const override { return running_; }
  bool advertising() const { return advertising_; }
  // True until every removed remote has unsubscribed or timed out.
  bool draining() const { return attached_ && !running_; }
  std::size_t removed_count() const { return removed_.size(); }
  std::vector<std::string> Eavesdroppers() const;

  // RadioObserver
  void OnRadioStatus(TransportStatus status) override;
  void OnAdvertisement(const Advertisement& ad) override;
  void OnCentralSubscribed(const std::string& central_id,
                           Characteristic characteristic) override;
  void OnCentralUnsubscribed(const std::string& central_id,
                             Characteristic characteristic) override;
  void OnWriteRequests(const std::vector<WriteRequest>& requests) override;
  void OnReadyToUpdate() override;

 private:
  struct Remote {
    std::string id;
    RemoteState state;
    bool has_dropped{false};
    core::ScopedTimer removal_timer;
  };

  void StartDiscovery();
  void StopDiscovery();
  void StartAdvertising();
  void StopAdvertising();

  // Each returns true while chunks are still waiting for OnReadyToUpdate.
  bool UpdateControl();
  bool UpdateContent();
  void UpdateControlAndContent();

  Remote& EnsureRemote(const std::string& central_id);
  void RemoveRemote(const std::string& central_id, bool notify_peer);
  void ForgetRemoved(const std::string& central_id);
  void LeaveConversation();
  void Release();
  void MaybeFinishDrain();
  void ReportUnknown(const char* op, const std::string& remote_id);

  static TransportRemote Snapshot(const Remote& remote);
  static void EraseId(std::vector<std::string>& list, const std::string& id);

  core::EventQueue& queue_;
  RadioAdapter& radio_;
  core::Diagnostics& diagnostics_;
  core::RadioSection config_;
  core::LocalIdentity identity_;
  core::Conversation conversation_;
  TransportCallbacks callbacks_;
  FailureCallback on_failure_;

  bool running_{false};
  bool attached_{false};
  bool in_background_{false};
  bool advertising_{false};
  std::uint64_t ad_burst_started_ms_{0};
  core::ScopedTimer ad_timer_;
  core::ScopedTimer release_timer_;

  std::map<std::string, Remote> remotes_;
  std::map<std::string, Remote> removed_;
  std::vector<std::string> listeners_;
  std::vector<std::string> eavesdroppers_;
  std::set<std::string> advertisers_;

  std::deque<core::ProtocolChunk> pending_content_;
  std::map<std::string, std::deque<core::ProtocolChunk>> directed_content_;
  std::deque<core::ProtocolChunk> pending_control_;
  std::map<std::string, std::deque<core::ProtocolChunk>> directed_control_;
};

}  // namespace whisper::transport

#endif  // WHISPER_TRANSPORT_RADIO_PUBLISHER_H
