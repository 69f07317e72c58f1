#ifndef WHISPER_TRANSPORT_NET_SUBSCRIBER_H
#define WHISPER_TRANSPORT_NET_SUBSCRIBER_H

#include <map>
#include <optional>
#include <string>
#include <string_view>

#include "config.h"
#include "conversation.h"
#include "diagnostics.h"
#include "event_queue.h"
#include "network_monitor.h"
#include "relay_link.h"
#include "transport.h"

namespace whisper::transport {

// Listener over the relay. Only usable with a target conversation: the
// relay channels are named after it.
class NetSubscriber final : public SubscribeTransport {
 public:
  NetSubscriber(core::EventQueue& queue, const NetworkMonitor& monitor,
                core::Diagnostics& diagnostics,
                const core::NetworkSection& config,
                core::LocalIdentity identity,
                std::optional<core::Conversation> target);
  ~NetSubscriber() override;

  NetSubscriber(const NetSubscriber&) = delete;
  NetSubscriber& operator=(const NetSubscriber&) = delete;

  TransportKind kind() const override { return TransportKind::kGlobal; }
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

  bool running() const override { return running_; }
  bool connected() const { return connected_; }
  const std::string& publisher_id() const { return publisher_; }

 private:
  struct Remote {
    std::string id;
    RemoteState state;
    // Learned from the remote's listen authorization.
    std::string content_id;
  };

  void OnConnected();
  void OnFrame(const RelayFrame& frame);
  void OnClosed(const std::string& reason);
  void HandleControl(const MessagePayload& message);
  void HandleContent(const MessagePayload& message);
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
  std::optional<core::Conversation> target_;
  std::string control_channel_;
  std::string content_channel_;
  TransportCallbacks callbacks_;
  FailureCallback on_failure_;
  RelayLink link_;

  bool running_{false};
  bool connected_{false};
  bool link_failed_{false};
  std::string publisher_;
  std::map<std::string, Remote> remotes_;
};

}  // namespace whisper::transport

#endif  // WHISPER_TRANSPORT_NET_SUBSCRIBER_H
