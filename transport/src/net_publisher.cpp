#include "net_publisher.h"

#include <cstddef>
#include <string>
#include <utility>

#include "platform_log.h"

namespace whisper::transport {

namespace pfl = whisper::platform::log;

namespace {

constexpr const char* kTag = "net_pub";

}  // namespace

NetPublisher::NetPublisher(core::EventQueue& queue,
                           const NetworkMonitor& monitor,
                           core::Diagnostics& diagnostics,
                           const core::NetworkSection& config,
                           core::LocalIdentity identity,
                           core::Conversation conversation,
                           std::string content_id)
    : monitor_(monitor),
      diagnostics_(diagnostics),
      identity_(std::move(identity)),
      conversation_(std::move(conversation)),
      content_id_(std::move(content_id)),
      control_channel_(ControlChannel(conversation_.id)),
      content_channel_(ContentChannel(conversation_.id, content_id_)),
      link_(queue, config) {}

NetPublisher::~NetPublisher() {
  Stop();
  link_.Close();
}

TransportStatus NetPublisher::status() const {
  if (link_failed_) {
    return TransportStatus::kOff;
  }
  return monitor_.status();
}

void NetPublisher::SetCallbacks(TransportCallbacks callbacks) {
  callbacks_ = std::move(callbacks);
}

void NetPublisher::Start(FailureCallback on_failure) {
  if (running_) {
    return;
  }
  on_failure_ = std::move(on_failure);
  link_failed_ = false;
  pfl::Log(pfl::Level::kInfo, kTag, "starting",
           {{"conversation", conversation_.id}, {"content", content_id_}});
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

  // Frames queue on the link until the connection is up.
  const auto offer =
      core::WhisperOffer(core::MakeClientInfo(identity_, conversation_));
  const bool queued =
      link_.Send(JoinFrame({RelayRole::kWhisper, control_channel_,
                            identity_.client_id})) &&
      link_.Send(JoinFrame({RelayRole::kWhisper, content_channel_,
                            identity_.client_id})) &&
      SendTo(control_channel_, kTargetAll, offer);
  if (!queued) {
    pfl::Log(pfl::Level::kWarn, kTag, "relay link refused the join frames");
  }
}

void NetPublisher::Stop() {
  if (!running_) {
    return;
  }
  pfl::Log(pfl::Level::kInfo, kTag, "stopping",
           {{"remotes", std::to_string(remotes_.size())}});
  running_ = false;
  const bool queued =
      SendTo(control_channel_, kTargetAll,
             core::Dropping(identity_.client_id)) &&
      link_.Send(LeaveFrame(content_channel_)) &&
      link_.Send(LeaveFrame(control_channel_));
  if (!queued) {
    pfl::Log(pfl::Level::kDebug, kTag, "leaving without a goodbye");
  }
  link_.Close();
  connected_ = false;
  remotes_.clear();
}

void NetPublisher::GoToBackground() {
  pfl::Log(pfl::Level::kDebug, kTag, "background");
}

void NetPublisher::GoToForeground() {
  pfl::Log(pfl::Level::kDebug, kTag, "foreground");
}

void NetPublisher::Publish(const std::vector<core::ProtocolChunk>& chunks) {
  if (!running_) {
    return;
  }
  // Directed per recipient; a listener still waiting on its catch-up is
  // not a recipient yet.
  const auto recipients = BroadcastRecipients();
  std::size_t failed = 0;
  for (const auto& chunk : chunks) {
    for (const auto& id : recipients) {
      if (!SendTo(content_channel_, id, chunk)) {
        ++failed;
      }
    }
  }
  if (failed != 0) {
    pfl::Log(pfl::Level::kWarn, kTag, "publish incomplete",
             {{"failed", std::to_string(failed)}});
  }
}

bool NetPublisher::SendContent(const std::string& remote_id,
                               const std::vector<core::ProtocolChunk>& chunks) {
  auto it = remotes_.find(remote_id);
  if (it == remotes_.end()) {
    ReportUnknown("send content", remote_id);
    return false;
  }
  Remote& remote = it->second;
  if (!remote.state.content_subscribed) {
    remote.held_content.insert(remote.held_content.end(), chunks.begin(),
                               chunks.end());
    return true;
  }
  bool sent = true;
  for (const auto& chunk : chunks) {
    sent = SendTo(content_channel_, remote_id, chunk) && sent;
  }
  return sent;
}

bool NetPublisher::SendControl(const std::string& remote_id,
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

bool NetPublisher::Authorize(const std::string& remote_id) {
  auto it = remotes_.find(remote_id);
  if (it == remotes_.end()) {
    ReportUnknown("authorize", remote_id);
    return false;
  }
  it->second.state.authorized = true;
  return true;
}

bool NetPublisher::Deauthorize(const std::string& remote_id) {
  auto it = remotes_.find(remote_id);
  if (it == remotes_.end()) {
    ReportUnknown("deauthorize", remote_id);
    return false;
  }
  it->second.state.authorized = false;
  return true;
}

bool NetPublisher::Drop(const std::string& remote_id) {
  auto it = remotes_.find(remote_id);
  if (it == remotes_.end()) {
    ReportUnknown("drop", remote_id);
    return false;
  }
  pfl::Log(pfl::Level::kInfo, kTag, "dropping remote", {{"remote", remote_id}});
  RemoveRemote(remote_id, !it->second.has_dropped);
  return true;
}

std::optional<TransportRemote> NetPublisher::FindRemote(
    const std::string& remote_id) const {
  auto it = remotes_.find(remote_id);
  if (it == remotes_.end()) {
    return std::nullopt;
  }
  return Snapshot(it->second);
}

std::vector<std::string> NetPublisher::BroadcastRecipients() const {
  std::vector<std::string> out;
  for (const auto& entry : remotes_) {
    const RemoteState& state = entry.second.state;
    if (state.authorized && state.content_subscribed) {
      out.push_back(entry.first);
    }
  }
  return out;
}

void NetPublisher::OnConnected() {
  connected_ = true;
  pfl::Log(pfl::Level::kInfo, kTag, "relay connected");
}

void NetPublisher::OnFrame(const RelayFrame& frame) {
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
      } else {
        pfl::Log(pfl::Level::kDebug, kTag, "ignoring message",
                 {{"channel", message.channel}, {"sender", message.sender}});
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

void NetPublisher::OnClosed(const std::string& reason) {
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
  LoseAll();
  if (callbacks_.on_status) {
    callbacks_.on_status(TransportStatus::kOff);
  }
}

void NetPublisher::HandleControl(const MessagePayload& message) {
  if (message.sender.empty() || message.sender == identity_.client_id) {
    return;
  }
  core::ProtocolChunk chunk;
  if (!core::DecodeChunk(message.data, chunk)) {
    diagnostics_.Report(core::Anomaly::kMalformedPacket, kTag,
                        "ignoring malformed control from " + message.sender);
    return;
  }
  Remote& remote = EnsureRemote(message.sender);
  remote.state.control_subscribed = true;
  if (core::HasOffset(chunk, core::ControlOffset::kDropping)) {
    pfl::Log(pfl::Level::kInfo, kTag, "remote dropped",
             {{"remote", remote.id}});
    remote.has_dropped = true;
    const TransportRemote lost = Snapshot(remote);
    remotes_.erase(message.sender);
    if (callbacks_.on_lost) {
      callbacks_.on_lost(lost);
    }
    return;
  }
  pfl::Log(pfl::Level::kDebug, kTag, "control in",
           {{"remote", remote.id},
            {"offset", core::ControlOffsetName(chunk.offset)}});
  if (callbacks_.on_control) {
    callbacks_.on_control(Snapshot(remote), chunk);
  }
}

void NetPublisher::HandlePresence(const PresencePayload& presence) {
  if (presence.client_id == identity_.client_id) {
    return;
  }
  auto it = remotes_.find(presence.client_id);
  if (it == remotes_.end()) {
    return;
  }
  Remote& remote = it->second;
  if (presence.channel == content_channel_) {
    remote.state.content_subscribed = presence.entered;
    if (presence.entered) {
      while (!remote.held_content.empty()) {
        if (!SendTo(content_channel_, remote.id,
                    remote.held_content.front())) {
          pfl::Log(pfl::Level::kWarn, kTag, "held content not sent",
                   {{"remote", remote.id}});
        }
        remote.held_content.pop_front();
      }
    }
    return;
  }
  if (presence.channel != control_channel_) {
    return;
  }
  if (presence.entered) {
    remote.state.control_subscribed = true;
    return;
  }
  if (remote.has_dropped) {
    return;
  }
  // Left without saying goodbye.
  pfl::Log(pfl::Level::kInfo, kTag, "remote left", {{"remote", remote.id}});
  const TransportRemote lost = Snapshot(remote);
  remotes_.erase(it);
  if (callbacks_.on_lost) {
    callbacks_.on_lost(lost);
  }
}

NetPublisher::Remote& NetPublisher::EnsureRemote(const std::string& client_id) {
  auto it = remotes_.find(client_id);
  if (it != remotes_.end()) {
    return it->second;
  }
  pfl::Log(pfl::Level::kInfo, kTag, "new remote", {{"remote", client_id}});
  Remote remote;
  remote.id = client_id;
  return remotes_.emplace(client_id, std::move(remote)).first->second;
}

void NetPublisher::RemoveRemote(const std::string& client_id,
                                bool notify_peer) {
  if (notify_peer &&
      !SendTo(control_channel_, client_id,
              core::Dropping(identity_.client_id))) {
    pfl::Log(pfl::Level::kWarn, kTag, "dropping not sent",
             {{"remote", client_id}});
  }
  remotes_.erase(client_id);
}

void NetPublisher::LoseAll() {
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

bool NetPublisher::SendTo(const std::string& channel, std::string_view target,
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

void NetPublisher::ReportUnknown(const char* op,
                                 const std::string& remote_id) {
  diagnostics_.Report(core::Anomaly::kUnknownRemote, kTag,
                      std::string(op) + " for unknown remote " + remote_id);
}

TransportRemote NetPublisher::Snapshot(const Remote& remote) {
  return GlobalRemote{remote.id, remote.state};
}

}  // namespace whisper::transport
