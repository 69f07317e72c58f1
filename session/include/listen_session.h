#ifndef WHISPER_SESSION_LISTEN_SESSION_H
#define WHISPER_SESSION_LISTEN_SESSION_H

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "composite_subscriber.h"
#include "conversation.h"
#include "line_diff.h"
#include "protocol.h"
#include "transport_factory.h"

namespace whisper::session {

// Listener side: finds a whisperer, asks to listen and rebuilds the
// transcript from the content stream.
class ListenSession {
 public:
  // Receives each line as it is committed to history.
  using LineSink = std::function<void(const std::string& line)>;
  // Receives sound, speech and shared transcript chunks.
  using EffectSink = std::function<void(const core::ProtocolChunk& chunk)>;

  // Without a target the session listens to whoever authorizes it first.
  ListenSession(const transport::TransportFactory& factory,
                std::optional<core::Conversation> target);
  ~ListenSession();

  ListenSession(const ListenSession&) = delete;
  ListenSession& operator=(const ListenSession&) = delete;

  void SetLineSink(LineSink sink) { line_sink_ = std::move(sink); }
  void SetEffectSink(EffectSink sink) { effect_sink_ = std::move(sink); }

  void Start(transport::FailureCallback on_failure);
  void Stop();
  void GoToBackground();
  void GoToForeground();

  // Asks the whisperer to resend part of the transcript.
  bool RequestReplay(core::ReadType type);

  bool running() const { return running_; }
  bool subscribed() const { return !whisperer_.empty(); }
  bool rereading() const { return rereading_; }
  const std::string& whisperer_id() const { return whisperer_; }
  const std::optional<core::ClientInfo>& whisperer() const {
    return whisperer_info_;
  }
  const std::string& live_text() const { return transcript_.live_text(); }
  const std::vector<std::string>& past_lines() const {
    return transcript_.past_lines();
  }
  transport::CompositeSubscriber& transport() { return *transport_; }

 private:
  void OnControl(const transport::TransportRemote& remote,
                 const core::ProtocolChunk& chunk);
  void OnContent(const transport::TransportRemote& remote,
                 const core::ProtocolChunk& chunk);
  void OnLost(const transport::TransportRemote& remote);
  void OnAuthorized(const std::string& remote_id,
                    const core::ProtocolChunk& chunk);
  void OnDenied(const std::string& remote_id);
  void Fail(const std::string& reason);
  void ApplyLine(const core::ProtocolChunk& chunk);

  core::Diagnostics& diagnostics_;
  core::LocalIdentity identity_;
  std::optional<core::Conversation> target_;
  std::unique_ptr<transport::CompositeSubscriber> transport_;
  transport::FailureCallback on_failure_;
  LineSink line_sink_;
  EffectSink effect_sink_;
  bool running_{false};

  std::string whisperer_;
  std::optional<core::ClientInfo> whisperer_info_;
  core::LineAssembler transcript_;
  bool rereading_{false};
};

}  // namespace whisper::session

#endif  // WHISPER_SESSION_LISTEN_SESSION_H
