#ifndef WHISPER_TRANSPORT_COMPOSITE_PUBLISHER_H
#define WHISPER_TRANSPORT_COMPOSITE_PUBLISHER_H

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

// Whisperer over a radio and a network publisher at once. Listeners are
// unified by client id; each one is reached through exactly one transport.
class CompositePublisher final : public PublishTransport {
 public:
  // Either transport may be null.
  CompositePublisher(core::EventQueue& queue, core::Diagnostics& diagnostics,
                     const core::CompositeSection& config,
                     std::unique_ptr<PublishTransport> local,
                     std::unique_ptr<PublishTransport> global);
  ~CompositePublisher() override;

  CompositePublisher(const CompositePublisher&) = delete;
  CompositePublisher& operator=(const CompositePublisher&) = delete;

  // The network transport when it is on, the radio otherwise.
  TransportKind kind() const override;
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
  bool started(TransportKind kind) const;
  bool radio_start_pending() const { return radio_timer_.pending(); }
  PublishTransport* transport(TransportKind kind);

 private:
  struct Slot {
    std::unique_ptr<PublishTransport> transport;
    bool started{false};
  };

  Slot& SlotFor(TransportKind kind);
  const Slot& SlotFor(TransportKind kind) const;
  bool IsOn(const Slot& slot) const;
  // True when the transport other than `kind` is on and started or about
  // to start.
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

  // Resolves a unified id; reports and returns null for unknown ids.
  PublishTransport* Route(const char* op, const std::string& remote_id,
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
};

}  // namespace whisper::transport

#endif  // WHISPER_TRANSPORT_COMPOSITE_PUBLISHER_H
