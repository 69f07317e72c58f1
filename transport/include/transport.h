#ifndef WHISPER_TRANSPORT_TRANSPORT_H
#define WHISPER_TRANSPORT_TRANSPORT_H

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "conversation.h"
#include "protocol.h"

namespace whisper::transport {

enum class TransportKind : std::uint8_t { kLocal = 0, kGlobal = 1 };

enum class TransportStatus : std::uint8_t { kOn = 0, kOff = 1, kDisabled = 2 };

const char* TransportKindName(TransportKind kind);
const char* TransportStatusName(TransportStatus status);

struct RemoteState {
  bool content_subscribed{false};
  bool control_subscribed{false};
  bool authorized{false};
  bool drop_in_progress{false};
};

// Peer reached over the short-range radio.
struct LocalRemote {
  std::string id;
  RemoteState state;
};

// Peer reached through the relay.
struct GlobalRemote {
  std::string id;
  RemoteState state;
};

using TransportRemote = std::variant<LocalRemote, GlobalRemote>;

const std::string& RemoteId(const TransportRemote& remote);
TransportKind RemoteKind(const TransportRemote& remote);
const RemoteState& StateOf(const TransportRemote& remote);
RemoteState& StateOf(TransportRemote& remote);

using FailureCallback = std::function<void(const std::string& reason)>;

struct TransportCallbacks {
  std::function<void(const TransportRemote&, const core::ProtocolChunk&)>
      on_control;
  std::function<void(const TransportRemote&, const core::ProtocolChunk&)>
      on_content;
  std::function<void(const TransportRemote&)> on_lost;
  std::function<void(TransportStatus)> on_status;
};

// Whisperer side. Operations addressed to an unknown remote return false.
class PublishTransport {
 public:
  virtual ~PublishTransport() = default;

  virtual TransportKind kind() const = 0;
  virtual TransportStatus status() const = 0;
  virtual void SetCallbacks(TransportCallbacks callbacks) = 0;
  virtual bool running() const = 0;

  virtual void Start(FailureCallback on_failure) = 0;
  virtual void Stop() = 0;
  virtual void GoToBackground() = 0;
  virtual void GoToForeground() = 0;

  // Broadcast to every authorized, content-subscribed remote.
  virtual void Publish(const std::vector<core::ProtocolChunk>& chunks) = 0;
  virtual bool SendContent(const std::string& remote_id,
                           const std::vector<core::ProtocolChunk>& chunks) = 0;
  virtual bool SendControl(const std::string& remote_id,
                           const core::ProtocolChunk& chunk) = 0;
  virtual bool Authorize(const std::string& remote_id) = 0;
  virtual bool Deauthorize(const std::string& remote_id) = 0;
  virtual bool Drop(const std::string& remote_id) = 0;

  virtual std::optional<TransportRemote> FindRemote(
      const std::string& remote_id) const = 0;
  virtual std::vector<std::string> BroadcastRecipients() const = 0;
};

// Listener side.
class SubscribeTransport {
 public:
  virtual ~SubscribeTransport() = default;

  virtual TransportKind kind() const = 0;
  virtual TransportStatus status() const = 0;
  virtual void SetCallbacks(TransportCallbacks callbacks) = 0;
  virtual bool running() const = 0;

  virtual void Start(FailureCallback on_failure) = 0;
  virtual void Stop() = 0;
  virtual void GoToBackground() = 0;
  virtual void GoToForeground() = 0;

  // Commits to one publisher and drops every other candidate.
  virtual bool Subscribe(const std::string& remote_id,
                         const core::Conversation& conversation) = 0;
  virtual bool SendControl(const std::string& remote_id,
                           const core::ProtocolChunk& chunk) = 0;
  virtual bool Drop(const std::string& remote_id) = 0;

  virtual std::optional<TransportRemote> FindRemote(
      const std::string& remote_id) const = 0;
};

}  // namespace whisper::transport

#endif  // WHISPER_TRANSPORT_TRANSPORT_H
