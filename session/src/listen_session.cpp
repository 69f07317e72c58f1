#include "listen_session.h"

#include <cstddef>
#include <utility>
#include <vector>

#include "platform_log.h"

namespace whisper::session {

namespace pfl = whisper::platform::log;

namespace {

constexpr const char* kTag = "listen_session";

core::Conversation ConversationOf(const core::ClientInfo& info) {
  core::Conversation conversation;
  conversation.id = info.conversation_id;
  conversation.name = info.conversation_name;
  conversation.owner_profile_id = info.profile_id;
  return conversation;
}

}  // namespace

ListenSession::ListenSession(const transport::TransportFactory& factory,
                             std::optional<core::Conversation> target)
    : diagnostics_(factory.diagnostics()),
      identity_(factory.config().identity),
      target_(std::move(target)),
      transport_(factory.MakeSubscriber(target_)) {
  transport::TransportCallbacks cb;
  cb.on_control = [this](const transport::TransportRemote& remote,
                         const core::ProtocolChunk& chunk) {
    OnControl(remote, chunk);
  };
  cb.on_content = [this](const transport::TransportRemote& remote,
                         const core::ProtocolChunk& chunk) {
    OnContent(remote, chunk);
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

ListenSession::~ListenSession() {
  Stop();
  transport_->SetCallbacks(transport::TransportCallbacks{});
}

void ListenSession::Start(transport::FailureCallback on_failure) {
  if (running_) {
    return;
  }
  on_failure_ = std::move(on_failure);
  pfl::Log(pfl::Level::kInfo, kTag, "listening",
           {{"conversation", target_ ? target_->id : std::string("any")}});
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

void ListenSession::Stop() {
  if (!running_) {
    return;
  }
  pfl::Log(pfl::Level::kInfo, kTag, "stop listening",
           {{"whisperer", whisperer_}});
  running_ = false;
  transport_->Stop();
  whisperer_.clear();
  whisperer_info_.reset();
  rereading_ = false;
}

void ListenSession::GoToBackground() { transport_->GoToBackground(); }

void ListenSession::GoToForeground() { transport_->GoToForeground(); }

bool ListenSession::RequestReplay(core::ReadType type) {
  if (whisperer_.empty()) {
    pfl::Log(pfl::Level::kWarn, kTag, "replay without a whisperer",
             {{"type", core::ReadTypeName(type)}});
    return false;
  }
  pfl::Log(pfl::Level::kInfo, kTag, "requesting replay",
           {{"type", core::ReadTypeName(type)}});
  return transport_->SendControl(whisperer_, core::ReplayRequest(type));
}

void ListenSession::OnControl(const transport::TransportRemote& remote,
                              const core::ProtocolChunk& chunk) {
  const std::string& id = transport::RemoteId(remote);
  using core::ControlOffset;
  if (core::HasOffset(chunk, ControlOffset::kWhisperOffer)) {
    if (!whisperer_.empty()) {
      return;
    }
    core::ClientInfo info;
    if (!core::DecodeClientInfo(chunk.text, info)) {
      diagnostics_.Report(core::Anomaly::kMalformedPacket, kTag,
                          "unreadable whisper offer from " + id);
      return;
    }
    if (target_ && info.conversation_id != target_->id) {
      pfl::Log(pfl::Level::kDebug, kTag, "offer for another conversation",
               {{"remote", id}, {"conversation", info.conversation_id}});
      return;
    }
    const core::Conversation conversation =
        target_ ? *target_ : ConversationOf(info);
    if (!transport_->SendControl(
            id, core::ListenRequest(
                    core::MakeClientInfo(identity_, conversation)))) {
      pfl::Log(pfl::Level::kWarn, kTag, "listen request not sent",
               {{"remote", id}});
    }
    return;
  }
  if (core::HasOffset(chunk, ControlOffset::kListenAuthYes)) {
    OnAuthorized(id, chunk);
    return;
  }
  if (core::HasOffset(chunk, ControlOffset::kListenAuthNo)) {
    OnDenied(id);
    return;
  }
  if (core::IsRestart(chunk)) {
    if (id != whisperer_) {
      return;
    }
    pfl::Log(pfl::Level::kInfo, kTag, "whisperer restarted", {{"remote", id}});
    transport::FailureCallback on_failure = on_failure_;
    Stop();
    transcript_.Reset();
    Start(std::move(on_failure));
    return;
  }
  pfl::Log(pfl::Level::kDebug, kTag, "control ignored",
           {{"remote", id}, {"offset", core::ControlOffsetName(chunk.offset)}});
}

void ListenSession::OnAuthorized(const std::string& remote_id,
                                 const core::ProtocolChunk& chunk) {
  if (remote_id == whisperer_) {
    return;
  }
  if (!whisperer_.empty()) {
    pfl::Log(pfl::Level::kInfo, kTag, "already listening elsewhere",
             {{"remote", remote_id}, {"whisperer", whisperer_}});
    if (!transport_->Drop(remote_id)) {
      pfl::Log(pfl::Level::kWarn, kTag, "drop failed",
               {{"remote", remote_id}});
    }
    return;
  }
  core::ClientInfo info;
  if (!core::DecodeClientInfo(chunk.text, info)) {
    diagnostics_.Report(core::Anomaly::kMalformedPacket, kTag,
                        "unreadable authorization from " + remote_id);
    return;
  }
  if (target_ && info.conversation_id != target_->id) {
    pfl::Log(pfl::Level::kWarn, kTag, "authorized for another conversation",
             {{"remote", remote_id}, {"conversation", info.conversation_id}});
    if (!transport_->Drop(remote_id)) {
      pfl::Log(pfl::Level::kWarn, kTag, "drop failed",
               {{"remote", remote_id}});
    }
    return;
  }
  const core::Conversation conversation =
      target_ ? *target_ : ConversationOf(info);
  if (!transport_->Subscribe(remote_id, conversation)) {
    pfl::Log(pfl::Level::kWarn, kTag, "subscribe failed",
             {{"remote", remote_id}});
    return;
  }
  whisperer_ = remote_id;
  whisperer_info_ = info;
  pfl::Log(pfl::Level::kInfo, kTag, "listening to whisperer",
           {{"remote", remote_id}, {"user", info.username}});
  if (!transport_->SendControl(
          remote_id,
          core::Joining(core::MakeClientInfo(identity_, conversation)))) {
    pfl::Log(pfl::Level::kWarn, kTag, "joining not sent",
             {{"remote", remote_id}});
  }
}

void ListenSession::OnDenied(const std::string& remote_id) {
  diagnostics_.Report(core::Anomaly::kAuthorizationDenied, kTag,
                      "whisperer " + remote_id + " refused");
  if (!transport_->Drop(remote_id)) {
    pfl::Log(pfl::Level::kDebug, kTag, "denying whisperer already gone",
             {{"remote", remote_id}});
  }
  Fail("The whisperer did not let you listen");
}

void ListenSession::Fail(const std::string& reason) {
  transport::FailureCallback on_failure = on_failure_;
  Stop();
  if (on_failure) {
    on_failure(reason);
  }
}

void ListenSession::OnContent(const transport::TransportRemote& remote,
                              const core::ProtocolChunk& chunk) {
  if (transport::RemoteId(remote) != whisperer_) {
    return;
  }
  if (core::IsFirstRead(chunk)) {
    core::ReadType type = core::ReadType::kAll;
    if (!core::ParseReadType(chunk.text, type)) {
      diagnostics_.Report(core::Anomaly::kMalformedPacket, kTag,
                          "bad reread type " + chunk.text);
      return;
    }
    rereading_ = true;
    if (type != core::ReadType::kLive) {
      transcript_.Reset();
    }
    return;
  }
  if (core::IsLastRead(chunk)) {
    transcript_.Apply(chunk);
    rereading_ = false;
    return;
  }
  if (core::IsDiff(chunk) && !core::IsCompleteLine(chunk)) {
    if (rereading_) {
      return;
    }
    if (static_cast<std::size_t>(chunk.offset) >
        core::CodePointCount(transcript_.live_text())) {
      pfl::Log(pfl::Level::kWarn, kTag, "diff past end of live text",
               {{"offset", std::to_string(chunk.offset)}});
      if (!RequestReplay(core::ReadType::kAll)) {
        pfl::Log(pfl::Level::kWarn, kTag, "out of sync, replay not requested");
      }
      return;
    }
    transcript_.Apply(chunk);
    return;
  }
  if (core::IsSound(chunk) ||
      core::HasOffset(chunk, core::ControlOffset::kPlaySpeech) ||
      core::IsTranscriptId(chunk)) {
    if (effect_sink_) {
      effect_sink_(chunk);
    }
    return;
  }
  ApplyLine(chunk);
}

void ListenSession::ApplyLine(const core::ProtocolChunk& chunk) {
  const std::size_t before = transcript_.past_lines().size();
  if (!transcript_.Apply(chunk)) {
    pfl::Log(pfl::Level::kDebug, kTag, "content ignored",
             {{"offset", core::ControlOffsetName(chunk.offset)}});
    return;
  }
  // Lines replayed by a reread were already delivered once.
  if (rereading_ || !line_sink_) {
    return;
  }
  const auto& past = transcript_.past_lines();
  for (std::size_t i = before; i < past.size(); ++i) {
    line_sink_(past[i]);
  }
}

void ListenSession::OnLost(const transport::TransportRemote& remote) {
  const std::string& id = transport::RemoteId(remote);
  if (id != whisperer_) {
    return;
  }
  pfl::Log(pfl::Level::kInfo, kTag, "whisperer gone", {{"remote", id}});
  whisperer_.clear();
  whisperer_info_.reset();
  rereading_ = false;
}

}  // namespace whisper::session
