#ifndef WHISPER_TRANSPORT_NET_PUBLISHER_H
#define WHISPER_TRANSPORT_NET_PUBLISHER_H

#include <deque>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "config.h"
#include "conversation.h"
#include "diagnostics.h"
#include "event_queue.h"
#include "network_monitor.h"
#include "relay_link.h"
#include "transport.h"

namespace whisper::transport {

// Whisperer over the relay. Listeners are keyed by their relay client id.
class NetPublisher final : public PublishTransport {
 public:
  NetPublisher(core::EventQueue& queue, const NetworkMonitor& monitor,
               core::Diagnostics& diagnostics,
               const core::NetworkSection& config,
               core::LocalIdentity identity, core::Conversation conversation,
               std::string content_id);
  ~NetPublisher() override;

  NetPublisher(const NetPublisher&) = delete;
  NetPublisher& operator=(const NetPublisher&) = delete;

  TransportKind kind() const override { return TransportKind::kGlobal; }
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
  bool connected() const { return connected_; }
  const std::string& content_id() const { return content_id_; }

 private:
  struct Remote {
    std::string id;
    RemoteState state;
    bool has_dropped{false};
    // Held until the remote joins the content channel.
    std::deque<core::ProtocolChunk> held_content;
  };

  void OnConnected();
  void OnFrame(const RelayFrame& frame);
  void OnClosed(const std::string& reason);
  void HandleControl(const MessagePayload& message);
  void HandlePresence(const PresencePayload& presence);

  Remote& EnsureRemote(const std::string& client_id);
  void RemoveRemote(const std::string& client_id, bool notify_peer);
  void LoseAll();
  bool SendTo(const std::string& channel, std::string_view target,
              const core::ProtocolChunk& chunk);
  void ReportUnknown(const char* op, const std::string& remote_id);

  static TransportRemote Snapshot(const Remote& remote);

  const NetworkMonitor& monitor_;
  core::Diagnostics& diagnostics_;
  core::LocalIdentity identity_;
  core::Conversation conversation_;
  std::string content_id_;
  std::string control_channel_;
  std::string content_channel_;
  TransportCallbacks callbacks_;
  FailureCallback on_failure_;
  RelayLink link_;

  bool running_{false};
  bool connected_{false};
  bool link_failed_{false};
  std::map<std::string, Remote> remotes_;
};

}  // namespace whisper::transport

#endif  // WHISPER_TRANSPORT_NET_PUBLISHER_H
