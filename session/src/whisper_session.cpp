#include "whisper_session.h"

#include <utility>

#include "line_diff.h"
#include "platform_log.h"

namespace whisper::session {

namespace pfl = whisper::platform::log;

namespace {

constexpr const char* kTag = "whisper_session";

std::string NewContentId() {
  std::string id;
  if (!core::NewRandomId(id)) {
    pfl::Log(pfl::Level::kError, kTag, "content id generation failed");
    return "content";
  }
  return id;
}

}  // namespace

WhisperSession::WhisperSession(const transport::TransportFactory& factory,
                               core::Conversation conversation,
                               std::string content_id)
    : diagnostics_(factory.diagnostics()),
      identity_(factory.config().identity),
      conversation_(std::move(conversation)),
      content_id_(content_id.empty() ? NewContentId() : std::move(content_id)),
      transport_(factory.MakePublisher(conversation_, content_id_)) {
  transport::TransportCallbacks cb;
  cb.on_control = [this](const transport::TransportRemote& remote,
                         const core::ProtocolChunk& chunk) {
    OnControl(remote, chunk);
  };
  cb.on_content = [](const transport::TransportRemote& remote,
                     const core::ProtocolChunk&) {
    pfl::Log(pfl::Level::kDebug, kTag, "content from listener ignored",
             {{"remote", transport::RemoteId(remote)}});
  };
  cb.on_lost = [this](const transport::TransportRemote& remote) {
    OnLost(remote);
  };
  cb.on_status = [](transport::TransportStatus status) {
    pfl::Log(pfl::Level::kInfo, kTag, "transport status",
             {{"status", transport::TransportStatusName(status)}});
  };
  transport_->SetCallbacks(std::move(cb));
}

WhisperSession::~WhisperSession() {
  Stop();
  transport_->SetCallbacks(transport::TransportCallbacks{});
}

void WhisperSession::Start(transport::FailureCallback on_failure) {
  if (running_) {
    return;
  }
  on_failure_ = std::move(on_failure);
  pfl::Log(pfl::Level::kInfo, kTag, "whispering",
           {{"conversation", conversation_.id}, {"content", content_id_}});
  running_ = true;
  transport_->Start([this](const std::string& reason) {
    pfl::Log(pfl::Level::kError, kTag, "transport failure",
             {{"reason", reason}});
    if (!transport_->running()) {
      running_ = false;
    }
    if (on_failure_) {
      on_failure_(reason);
    }
  });
  if (!transport_->running()) {
    running_ = false;
  }
}

void WhisperSession::Stop() {
  if (!running_) {
    return;
  }
  pfl::Log(pfl::Level::kInfo, kTag, "stop whispering",
           {{"listeners", std::to_string(listeners_.size())}});
  running_ = false;
  transport_->Stop();
  listeners_.clear();
}

void WhisperSession::GoToBackground() { transport_->GoToBackground(); }

void WhisperSession::GoToForeground() { transport_->GoToForeground(); }

void WhisperSession::UpdateLiveText(std::string_view text) {
  std::vector<core::ProtocolChunk> chunks = core::DiffLines(live_, text);
  if (chunks.empty()) {
    return;
  }
  for (const auto& chunk : chunks) {
    if (core::IsCompleteLine(chunk)) {
      past_.push_back(std::move(live_));
      live_.clear();
    } else {
      live_ = core::ApplyDiff(live_, chunk);
    }
  }
  Broadcast(std::move(chunks));
}

void WhisperSession::CommitLiveText() { UpdateLiveText(live_ + "\n"); }

void WhisperSession::PlaySound(std::string_view name) {
  Broadcast({core::Sound(name)});
}

void WhisperSession::PlaySpeech(std::string_view text) {
  Broadcast({core::Speech(text)});
}

void WhisperSession::ClearHistory() {
  past_.clear();
  Broadcast({core::ClearHistory()});
}

void WhisperSession::ShareTranscript(std::string_view transcript_id) {
  Broadcast({core::ShareTranscript(transcript_id)});
}

void WhisperSession::Broadcast(std::vector<core::ProtocolChunk> chunks) {
  if (!running_) {
    return;
  }
  transport_->Publish(chunks);
}

void WhisperSession::OnControl(const transport::TransportRemote& remote,
                               const core::ProtocolChunk& chunk) {
  const std::string& id = transport::RemoteId(remote);
  using core::ControlOffset;
  if (core::IsListenOffer(chunk) ||
      core::HasOffset(chunk, ControlOffset::kListenRequest)) {
    HandleOffer(id, chunk);
    return;
  }
  if (core::HasOffset(chunk, ControlOffset::kJoining)) {
    auto it = listeners_.find(id);
    if (it == listeners_.end()) {
      pfl::Log(pfl::Level::kWarn, kTag, "joining without authorization",
               {{"remote", id}});
      return;
    }
    it->second.joined = true;
    pfl::Log(pfl::Level::kInfo, kTag, "listener joined",
             {{"remote", id}, {"user", it->second.info.username}});
    return;
  }
  if (core::IsReplayRequest(chunk)) {
    HandleReplay(id, chunk);
    return;
  }
  pfl::Log(pfl::Level::kDebug, kTag, "control ignored",
           {{"remote", id}, {"offset", core::ControlOffsetName(chunk.offset)}});
}

void WhisperSession::OnLost(const transport::TransportRemote& remote) {
  const std::string& id = transport::RemoteId(remote);
  if (listeners_.erase(id) != 0) {
    pfl::Log(pfl::Level::kInfo, kTag, "listener left", {{"remote", id}});
  }
}

void WhisperSession::HandleOffer(const std::string& remote_id,
                                 const core::ProtocolChunk& chunk) {
  core::ClientInfo info;
  if (!core::DecodeClientInfo(chunk.text, info)) {
    diagnostics_.Report(core::Anomaly::kMalformedPacket, kTag,
                        "unreadable listener identity from " + remote_id);
    return;
  }
  if (listeners_.count(remote_id) != 0) {
    pfl::Log(pfl::Level::kDebug, kTag, "listener already authorized",
             {{"remote", remote_id}});
    return;
  }
  if (!MayListen(info)) {
    pfl::Log(pfl::Level::kInfo, kTag, "listener denied",
             {{"remote", remote_id}, {"profile", info.profile_id}});
    diagnostics_.Report(core::Anomaly::kAuthorizationDenied, kTag,
                        "profile " + info.profile_id + " may not listen");
    const bool told = transport_->SendControl(
        remote_id,
        core::ListenAuthNo(core::MakeClientInfo(identity_, conversation_)));
    const bool dropped = transport_->Drop(remote_id);
    if (!told || !dropped) {
      pfl::Log(pfl::Level::kWarn, kTag, "denial incomplete",
               {{"remote", remote_id}});
    }
    listeners_.erase(remote_id);
    return;
  }
  pfl::Log(pfl::Level::kInfo, kTag, "listener authorized",
           {{"remote", remote_id}, {"user", info.username}});
  Listener& listener = listeners_[remote_id];
  listener.info = info;
  const bool ok =
      transport_->Authorize(remote_id) &&
      transport_->SendControl(
          remote_id, core::ListenAuthYes(core::MakeClientInfo(
                         identity_, conversation_, content_id_))) &&
      transport_->SendContent(remote_id, CatchUp());
  if (!ok) {
    pfl::Log(pfl::Level::kWarn, kTag, "authorization not delivered",
             {{"remote", remote_id}});
  }
}

void WhisperSession::HandleReplay(const std::string& remote_id,
                                  const core::ProtocolChunk& chunk) {
  if (listeners_.count(remote_id) == 0) {
    pfl::Log(pfl::Level::kWarn, kTag, "replay for unauthorized remote",
             {{"remote", remote_id}});
    return;
  }
  core::ReadType type = core::ReadType::kAll;
  if (!core::ParseReadType(chunk.text, type)) {
    diagnostics_.Report(core::Anomaly::kMalformedPacket, kTag,
                        "bad replay type from " + remote_id);
    return;
  }
  std::vector<core::ProtocolChunk> chunks;
  chunks.push_back(core::AcknowledgeRead(type));
  if (type != core::ReadType::kLive) {
    for (const auto& line : past_) {
      chunks.push_back(core::PastText(line));
    }
  }
  chunks.push_back(core::LiveText(live_));
  if (!transport_->SendContent(remote_id, chunks)) {
    pfl::Log(pfl::Level::kWarn, kTag, "replay not sent",
             {{"remote", remote_id}});
  }
}

bool WhisperSession::MayListen(const core::ClientInfo& info) const {
  if (!info.conversation_id.empty() &&
      info.conversation_id != conversation_.id) {
    return false;
  }
  return info.profile_id == conversation_.owner_profile_id ||
         conversation_.IsAuthorized(info.profile_id);
}

std::vector<core::ProtocolChunk> WhisperSession::CatchUp() const {
  std::vector<core::ProtocolChunk> chunks;
  chunks.reserve(past_.size() + 1);
  for (const auto& line : past_) {
    chunks.push_back(core::PastText(line));
  }
  chunks.push_back(core::LiveText(live_));
  return chunks;
}

}  // namespace whisper::session
