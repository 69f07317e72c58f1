#ifndef WHISPER_TRANSPORT_COMPOSITE_SUBSCRIBER_H
#define WHISPER_TRANSPORT_COMPOSITE_SUBSCRIBER_H

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "composite_remotes.h"
#include "config.h"
#include "diagnostics.h"
#include "event_queue.h"
#include "transport.h"

namespace whisper::transport {

// Listener over a radio and a network subscriber at once. Whisperers are
// unified by client id.
class CompositeSubscriber final : public SubscribeTransport {
 public:
  // Either transport may be null.
  CompositeSubscriber(core::EventQueue& queue, core::Diagnostics& diagnostics,
                      const core::CompositeSection& config,
                      std::unique_ptr<SubscribeTransport> local,
                      std::unique_ptr<SubscribeTransport> global);
  ~CompositeSubscriber() override;

  CompositeSubscriber(const CompositeSubscriber&) = delete;
  CompositeSubscriber& operator=(const CompositeSubscriber&) = delete;

  TransportKind kind() const override;
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
  bool started(TransportKind kind) const;
  bool radio_start_pending() const { return radio_timer_.pending(); }
  const std::string& publisher_id() const { return publisher_; }
  std::vector<std::string> RemoteIds() const { return remotes_.ClientIds(); }
  SubscribeTransport* transport(TransportKind kind);

 private:
  struct Slot {
    std::unique_ptr<SubscribeTransport> transport;
    bool started{false};
  };

  Slot& SlotFor(TransportKind kind);
  const Slot& SlotFor(TransportKind kind) const;
  bool IsOn(const Slot& slot) const;
  bool OtherActive(TransportKind kind) const;
  void Wire(TransportKind kind);
  void StartSlot(TransportKind kind);

  void OnControl(TransportKind kind, const TransportRemote& remote,
                 const core::ProtocolChunk& chunk);
  void OnContent(TransportKind kind, const TransportRemote& remote,
                 const core::ProtocolChunk& chunk);
  void OnLost(TransportKind kind, const TransportRemote& remote);
  void OnStatus(TransportKind kind, TransportStatus status);
  void OnFailure(TransportKind kind, const std::string& reason);

  SubscribeTransport* Route(const char* op, const std::string& remote_id,
                            std::string& inner_id);

  core::EventQueue& queue_;
  core::Diagnostics& diagnostics_;
  core::CompositeSection config_;
  Slot local_;
  Slot global_;
  TransportCallbacks callbacks_;
  FailureCallback on_failure_;
  CompositeRemotes remotes_;
  core::ScopedTimer radio_timer_;
  bool running_{false};
  std::string publisher_;
};

}  // namespace whisper::transport

#endif  // WHISPER_TRANSPORT_COMPOSITE_SUBSCRIBER_H
