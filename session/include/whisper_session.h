#ifndef WHISPER_SESSION_WHISPER_SESSION_H
#define WHISPER_SESSION_WHISPER_SESSION_H

#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "composite_publisher.h"
#include "conversation.h"
#include "protocol.h"
#include "transport_factory.h"

namespace whisper::session {

// Whisperer side of a conversation: keeps the transcript the editor
// produces, decides who may listen and feeds them.
class WhisperSession {
 public:
  struct Listener {
    core::ClientInfo info;
    bool joined{false};
  };

  // A fresh content id is generated when `content_id` is empty.
  WhisperSession(const transport::TransportFactory& factory,
                 core::Conversation conversation, std::string content_id = {});
  ~WhisperSession();

  WhisperSession(const WhisperSession&) = delete;
  WhisperSession& operator=(const WhisperSession&) = delete;

  void Start(transport::FailureCallback on_failure);
  void Stop();
  void GoToBackground();
  void GoToForeground();

  // `text` is the whole live line as edited; a '\n' commits what precedes
  // it.
  void UpdateLiveText(std::string_view text);
  void CommitLiveText();
  void PlaySound(std::string_view name);
  void PlaySpeech(std::string_view text);
  void ClearHistory();
  void ShareTranscript(std::string_view transcript_id);

  bool running() const { return running_; }
  const std::string& live_text() const { return live_; }
  const std::vector<std::string>& past_lines() const { return past_; }
  const std::string& content_id() const { return content_id_; }
  const core::Conversation& conversation() const { return conversation_; }
  const std::map<std::string, Listener>& listeners() const {
    return listeners_;
  }
  transport::CompositePublisher& transport() { return *transport_; }

 private:
  void OnControl(const transport::TransportRemote& remote,
                 const core::ProtocolChunk& chunk);
  void OnLost(const transport::TransportRemote& remote);
  void HandleOffer(const std::string& remote_id,
                   const core::ProtocolChunk& chunk);
  void HandleReplay(const std::string& remote_id,
                    const core::ProtocolChunk& chunk);
  bool MayListen(const core::ClientInfo& info) const;
  std::vector<core::ProtocolChunk> CatchUp() const;
  void Broadcast(std::vector<core::ProtocolChunk> chunks);

  core::Diagnostics& diagnostics_;
  core::LocalIdentity identity_;
  core::Conversation conversation_;
  std::string content_id_;
  std::unique_ptr<transport::CompositePublisher> transport_;
  transport::FailureCallback on_failure_;
  bool running_{false};

  std::string live_;
  std::vector<std::string> past_;
  std::map<std::string, Listener> listeners_;
};

}  // namespace whisper::session

#endif  // WHISPER_SESSION_WHISPER_SESSION_H
