#include "net_subscriber.h"

#include <utility>
#include <vector>

#include "platform_log.h"

namespace whisper::transport {

namespace pfl = whisper::platform::log;

namespace {

constexpr const char* kTag = "net_sub";

}  // namespace

NetSubscriber::NetSubscriber(core::EventQueue& queue,
                             const NetworkMonitor& monitor,
                             core::Diagnostics& diagnostics,
                             const core::NetworkSection& config,
                             core::LocalIdentity identity,
                             std::optional<core::Conversation> target)
    : monitor_(monitor),
      diagnostics_(diagnostics),
      identity_(std::move(identity)),
      target_(std::move(target)),
      link_(queue, config) {
  if (target_) {
    control_channel_ = ControlChannel(target_->id);
  }
}

NetSubscriber::~NetSubscriber() {
  Stop();
  link_.Close();
}

TransportStatus NetSubscriber::status() const {
  if (!target_) {
    return TransportStatus::kDisabled;
  }
  if (link_failed_) {
    return TransportStatus::kOff;
  }
  return monitor_.status();
}

void NetSubscriber::SetCallbacks(TransportCallbacks callbacks) {
  callbacks_ = std::move(callbacks);
}

void NetSubscriber::Start(FailureCallback on_failure) {
  if (running_) {
    return;
  }
  on_failure_ = std::move(on_failure);
  link_failed_ = false;
  if (!target_) {
    diagnostics_.Report(core::Anomaly::kTransportUnavailable, kTag,
                        "no target conversation");
    if (on_failure_) {
      on_failure_("Listening over the Internet needs a conversation");
    }
    return;
  }
  pfl::Log(pfl::Level::kInfo, kTag, "starting",
           {{"conversation", target_->id}});
  if (monitor_.status() != TransportStatus::kOn) {
    diagnostics_.Report(core::Anomaly::kTransportUnavailable, kTag,
                        "network is not on");
    if (on_failure_) {
      on_failure_("Internet is not available");
    }
    return;
  }

  RelayLink::Handlers handlers;
  handlers.on_connected = [this]() { OnConnected(); };
  handlers.on_frame = [this](const RelayFrame& frame) { OnFrame(frame); };
  handlers.on_closed = [this](const std::string& reason) { OnClosed(reason); };
  link_.SetHandlers(std::move(handlers));
  std::string error;
  if (!link_.Open(error)) {
    diagnostics_.Report(core::Anomaly::kNetworkFailure, kTag,
                        "relay link: " + error);
    if (on_failure_) {
      on_failure_("Could not connect to the whisper relay");
    }
    return;
  }
  running_ = true;

  const auto offer =
      core::ListenOffer(core::MakeClientInfo(identity_, *target_));
  const bool queued =
      link_.Send(JoinFrame({RelayRole::kListen, control_channel_,
                            identity_.client_id})) &&
      SendTo(control_channel_, kTargetWhisperers, offer);
  if (!queued) {
    pfl::Log(pfl::Level::kWarn, kTag, "relay link refused the join frames");
  }
}

void NetSubscriber::Stop() {
  if (!running_) {
    return;
  }
  pfl::Log(pfl::Level::kInfo, kTag, "stopping",
           {{"remotes", std::to_string(remotes_.size())}});
  running_ = false;
  std::vector<std::string> ids;
  for (const auto& entry : remotes_) {
    ids.push_back(entry.first);
  }
  for (const auto& id : ids) {
    RemoveRemote(id, true);
  }
  if (!link_.Send(LeaveFrame(control_channel_))) {
    pfl::Log(pfl::Level::kDebug, kTag, "leaving without a goodbye");
  }
  link_.Close();
  connected_ = false;
  publisher_.clear();
  content_channel_.clear();
}

void NetSubscriber::GoToBackground() {
  pfl::Log(pfl::Level::kDebug, kTag, "background");
}

void NetSubscriber::GoToForeground() {
  pfl::Log(pfl::Level::kDebug, kTag, "foreground");
}

bool NetSubscriber::Subscribe(const std::string& remote_id,
                              const core::Conversation& conversation) {
  auto it = remotes_.find(remote_id);
  if (it == remotes_.end()) {
    ReportUnknown("subscribe", remote_id);
    return false;
  }
  Remote& remote = it->second;
  if (remote.content_id.empty()) {
    pfl::Log(pfl::Level::kWarn, kTag, "subscribe before authorization",
             {{"remote", remote_id}});
    return false;
  }
  pfl::Log(pfl::Level::kInfo, kTag, "subscribing",
           {{"remote", remote_id}, {"conversation", conversation.id}});
  publisher_ = remote_id;
  target_ = conversation;
  remote.state.authorized = true;
  remote.state.content_subscribed = true;
  content_channel_ = ContentChannel(conversation.id, remote.content_id);
  if (!link_.Send(JoinFrame({RelayRole::kListen, content_channel_,
                             identity_.client_id}))) {
    diagnostics_.Report(core::Anomaly::kNetworkFailure, kTag,
                        "content join not sent");
  }

  std::vector<std::string> others;
  for (const auto& entry : remotes_) {
    if (entry.first != remote_id) {
      others.push_back(entry.first);
    }
  }
  for (const auto& id : others) {
    RemoveRemote(id, true);
  }
  return true;
}

bool NetSubscriber::SendControl(const std::string& remote_id,
                                const core::ProtocolChunk& chunk) {
  if (remotes_.find(remote_id) == remotes_.end()) {
    ReportUnknown("send control", remote_id);
    return false;
  }
  pfl::Log(pfl::Level::kDebug, kTag, "control out",
           {{"remote", remote_id},
            {"offset", core::ControlOffsetName(chunk.offset)}});
  return SendTo(control_channel_, remote_id, chunk);
}

bool NetSubscriber::Drop(const std::string& remote_id) {
  if (remotes_.find(remote_id) == remotes_.end()) {
    ReportUnknown("drop", remote_id);
    return false;
  }
  pfl::Log(pfl::Level::kInfo, kTag, "dropping remote", {{"remote", remote_id}});
  RemoveRemote(remote_id, true);
  return true;
}

std::optional<TransportRemote> NetSubscriber::FindRemote(
    const std::string& remote_id) const {
  auto it = remotes_.find(remote_id);
  if (it == remotes_.end()) {
    return std::nullopt;
  }
  return Snapshot(it->second);
}

void NetSubscriber::OnConnected() {
  connected_ = true;
  pfl::Log(pfl::Level::kInfo, kTag, "relay connected");
}

void NetSubscriber::OnFrame(const RelayFrame& frame) {
  if (!running_) {
    return;
  }
  switch (frame.type) {
    case RelayFrameType::kMessage: {
      MessagePayload message;
      if (!DecodeMessage(frame.payload, message)) {
        diagnostics_.Report(core::Anomaly::kMalformedPacket, kTag,
                            "undecodable relay message");
        return;
      }
      if (message.channel == control_channel_) {
        HandleControl(message);
      } else if (!content_channel_.empty() &&
                 message.channel == content_channel_) {
        HandleContent(message);
      }
      return;
    }
    case RelayFrameType::kPresence: {
      PresencePayload presence;
      if (!DecodePresence(frame.payload, presence)) {
        diagnostics_.Report(core::Anomaly::kMalformedPacket, kTag,
                            "undecodable presence");
        return;
      }
      HandlePresence(presence);
      return;
    }
    case RelayFrameType::kError: {
      std::string text;
      if (!DecodeError(frame.payload, text)) {
        text = "unreadable error";
      }
      diagnostics_.Report(core::Anomaly::kNetworkFailure, kTag,
                          "relay error: " + text);
      return;
    }
    case RelayFrameType::kHeartbeat:
      return;
    default:
      pfl::Log(pfl::Level::kDebug, kTag, "unexpected frame",
               {{"type", RelayFrameTypeName(frame.type)}});
      return;
  }
}

void NetSubscriber::OnClosed(const std::string& reason) {
  if (!running_) {
    return;
  }
  running_ = false;
  link_failed_ = true;
  if (!connected_) {
    diagnostics_.Report(core::Anomaly::kNetworkFailure, kTag,
                        "relay unreachable: " + reason);
    if (on_failure_) {
      on_failure_("Could not connect to the whisper relay");
    }
    return;
  }
  connected_ = false;
  diagnostics_.Report(core::Anomaly::kNetworkFailure, kTag,
                      "relay connection lost: " + reason);
  publisher_.clear();
  content_channel_.clear();
  LoseAll();
  if (callbacks_.on_status) {
    callbacks_.on_status(TransportStatus::kOff);
  }
}

void NetSubscriber::HandleControl(const MessagePayload& message) {
  if (message.sender.empty() || message.sender == identity_.client_id) {
    return;
  }
  Remote& remote = EnsureRemote(message.sender);
  remote.state.control_subscribed = true;
  core::ProtocolChunk chunk;
  if (!core::DecodeChunk(message.data, chunk)) {
    // The control stream cannot resynchronize; this whisperer is done.
    diagnostics_.Report(core::Anomaly::kMalformedPacket, kTag,
                        "malformed control data from " + message.sender);
    const TransportRemote lost = Snapshot(remote);
    RemoveRemote(message.sender, false);
    if (on_failure_) {
      on_failure_("Communication (bad data) failure while connecting to Whisperer");
    }
    if (callbacks_.on_lost) {
      callbacks_.on_lost(lost);
    }
    return;
  }
  if (core::HasOffset(chunk, core::ControlOffset::kDropping)) {
    pfl::Log(pfl::Level::kInfo, kTag, "whisperer dropped",
             {{"remote", remote.id}});
    const TransportRemote lost = Snapshot(remote);
    RemoveRemote(message.sender, false);
    if (callbacks_.on_lost) {
      callbacks_.on_lost(lost);
    }
    return;
  }
  if (core::HasOffset(chunk, core::ControlOffset::kListenAuthYes)) {
    core::ClientInfo info;
    if (core::DecodeClientInfo(chunk.text, info) && !info.content_id.empty()) {
      remote.content_id = info.content_id;
    } else {
      diagnostics_.Report(core::Anomaly::kMalformedPacket, kTag,
                          "authorization without content id from " +
                              message.sender);
    }
  }
  pfl::Log(pfl::Level::kDebug, kTag, "control in",
           {{"remote", remote.id},
            {"offset", core::ControlOffsetName(chunk.offset)}});
  if (callbacks_.on_control) {
    callbacks_.on_control(Snapshot(remote), chunk);
  }
}

void NetSubscriber::HandleContent(const MessagePayload& message) {
  if (message.sender != publisher_) {
    return;
  }
  auto it = remotes_.find(message.sender);
  if (it == remotes_.end()) {
    return;
  }
  core::ProtocolChunk chunk;
  if (!core::DecodeChunk(message.data, chunk)) {
    diagnostics_.Report(core::Anomaly::kMalformedPacket, kTag,
                        "ignoring malformed content from " + message.sender);
    return;
  }
  if (callbacks_.on_content) {
    callbacks_.on_content(Snapshot(it->second), chunk);
  }
}

void NetSubscriber::HandlePresence(const PresencePayload& presence) {
  if (presence.entered || presence.channel != control_channel_) {
    return;
  }
  auto it = remotes_.find(presence.client_id);
  if (it == remotes_.end()) {
    return;
  }
  pfl::Log(pfl::Level::kInfo, kTag, "whisperer left",
           {{"remote", presence.client_id}});
  const TransportRemote lost = Snapshot(it->second);
  RemoveRemote(presence.client_id, false);
  if (callbacks_.on_lost) {
    callbacks_.on_lost(lost);
  }
}

NetSubscriber::Remote& NetSubscriber::EnsureRemote(
    const std::string& client_id) {
  auto it = remotes_.find(client_id);
  if (it != remotes_.end()) {
    return it->second;
  }
  pfl::Log(pfl::Level::kInfo, kTag, "new remote", {{"remote", client_id}});
  Remote remote;
  remote.id = client_id;
  return remotes_.emplace(client_id, std::move(remote)).first->second;
}

void NetSubscriber::RemoveRemote(const std::string& client_id,
                                 bool notify_peer) {
  if (notify_peer &&
      !SendTo(control_channel_, client_id,
              core::Dropping(identity_.client_id))) {
    pfl::Log(pfl::Level::kDebug, kTag, "drop notice not sent",
             {{"remote", client_id}});
  }
  if (client_id == publisher_) {
    if (!link_.Send(LeaveFrame(content_channel_))) {
      pfl::Log(pfl::Level::kDebug, kTag, "content leave not sent");
    }
    publisher_.clear();
    content_channel_.clear();
  }
  remotes_.erase(client_id);
}

void NetSubscriber::LoseAll() {
  std::vector<TransportRemote> lost;
  for (const auto& entry : remotes_) {
    lost.push_back(Snapshot(entry.second));
  }
  remotes_.clear();
  if (!callbacks_.on_lost) {
    return;
  }
  for (const auto& remote : lost) {
    callbacks_.on_lost(remote);
  }
}

bool NetSubscriber::SendTo(const std::string& channel, std::string_view target,
                           const core::ProtocolChunk& chunk) {
  auto frame = PublishFrame(
      {channel, std::string(target), core::EncodeChunk(chunk)});
  if (frame.empty()) {
    pfl::Log(pfl::Level::kWarn, kTag, "chunk too large for relay frame",
             {{"bytes", std::to_string(chunk.text.size())}});
    return false;
  }
  return link_.Send(std::move(frame));
}

void NetSubscriber::ReportUnknown(const char* op,
                                  const std::string& remote_id) {
  diagnostics_.Report(core::Anomaly::kUnknownRemote, kTag,
                      std::string(op) + " for unknown remote " + remote_id);
}

TransportRemote NetSubscriber::Snapshot(const Remote& remote) {
  return GlobalRemote{remote.id, remote.state};
}

}  // namespace whisper::transport
