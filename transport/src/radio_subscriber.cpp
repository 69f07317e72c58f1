#include "radio_subscriber.h"

#include <utility>
#include <vector>

#include "platform_log.h"

namespace whisper::transport {

namespace pfl = whisper::platform::log;

namespace {

constexpr const char* kTag = "radio_sub";

}  // namespace

const char* SubscriberPhaseName(RadioSubscriber::Phase phase) {
  switch (phase) {
    case RadioSubscriber::Phase::kConnecting:
      return "connecting";
    case RadioSubscriber::Phase::kResolvingServices:
      return "resolving_services";
    case RadioSubscriber::Phase::kPairing:
      return "pairing";
    case RadioSubscriber::Phase::kAwaitingAuthorization:
      return "awaiting_authorization";
    case RadioSubscriber::Phase::kSubscribed:
      return "subscribed";
  }
  return "unknown";
}

RadioSubscriber::RadioSubscriber(core::EventQueue& queue, RadioAdapter& radio,
                                 core::Diagnostics& diagnostics,
                                 const core::RadioSection& config,
                                 core::LocalIdentity identity,
                                 std::optional<core::Conversation> target)
    : queue_(queue),
      radio_(radio),
      diagnostics_(diagnostics),
      config_(config),
      identity_(std::move(identity)),
      target_(std::move(target)) {}

RadioSubscriber::~RadioSubscriber() {
  Stop();
  radio_.RemoveObserver(this);
}

TransportStatus RadioSubscriber::status() const {
  return radio_.status();
}

void RadioSubscriber::SetCallbacks(TransportCallbacks callbacks) {
  callbacks_ = std::move(callbacks);
}

void RadioSubscriber::Start(FailureCallback on_failure) {
  if (running_) {
    return;
  }
  on_failure_ = std::move(on_failure);
  if (radio_.status() != TransportStatus::kOn) {
    diagnostics_.Report(core::Anomaly::kTransportUnavailable, kTag,
                        "radio is not on");
    if (on_failure_) {
      on_failure_("Bluetooth is not available");
    }
    return;
  }
  pfl::Log(pfl::Level::kInfo, kTag, "starting",
           {{"target", target_ ? target_->id : std::string("any")}});
  radio_.AddObserver(this);
  running_ = true;
  StartDiscovery();
}

void RadioSubscriber::Stop() {
  if (!running_) {
    return;
  }
  pfl::Log(pfl::Level::kInfo, kTag, "stopping");
  running_ = false;
  StopDiscovery();
  std::vector<std::string> ids;
  for (const auto& entry : remotes_) {
    ids.push_back(entry.first);
  }
  for (const auto& id : ids) {
    Drop(id);
  }
  publisher_.clear();
  radio_.RemoveObserver(this);
  drops_in_progress_.clear();
}

void RadioSubscriber::GoToBackground() {
  if (in_background_) {
    return;
  }
  in_background_ = true;
  StopDiscovery();
}

void RadioSubscriber::GoToForeground() {
  if (!in_background_) {
    return;
  }
  in_background_ = false;
  StartDiscovery();
}

bool RadioSubscriber::Subscribe(const std::string& remote_id,
                                const core::Conversation& conversation) {
  Remote* remote = Find(remote_id);
  if (!running_ || !remote) {
    ReportUnknown("subscribe", remote_id);
    return false;
  }
  if (remote->phase < Phase::kPairing) {
    pfl::Log(pfl::Level::kWarn, kTag, "subscribe before pairing",
             {{"remote", remote_id},
              {"phase", SubscriberPhaseName(remote->phase)}});
    return false;
  }
  pfl::Log(pfl::Level::kInfo, kTag, "subscribing", {{"remote", remote_id}});
  publisher_ = remote_id;
  target_ = conversation;
  remote->state.authorized = true;
  remote->handshake_timer.Cancel();
  StopDiscovery();
  radio_.SetNotify(remote_id, Characteristic::kContentOut, true);
  std::vector<std::string> others;
  for (const auto& entry : remotes_) {
    if (entry.first != publisher_) {
      others.push_back(entry.first);
    }
  }
  for (const auto& id : others) {
    Drop(id);
  }
  return true;
}

bool RadioSubscriber::SendControl(const std::string& remote_id,
                                  const core::ProtocolChunk& chunk) {
  Remote* remote = Find(remote_id);
  if (!remote) {
    ReportUnknown("send control", remote_id);
    return false;
  }
  if (remote->phase < Phase::kPairing) {
    pfl::Log(pfl::Level::kWarn, kTag, "no control channel yet",
             {{"remote", remote_id}});
    return false;
  }
  radio_.Write(remote_id, Characteristic::kControlIn,
               core::EncodeChunkBytes(chunk), true);
  return true;
}

bool RadioSubscriber::Drop(const std::string& remote_id) {
  Remote* remote = Find(remote_id);
  if (!remote) {
    ReportUnknown("drop", remote_id);
    return false;
  }
  if (remote->phase >= Phase::kPairing) {
    pfl::Log(pfl::Level::kInfo, kTag, "explicitly dropping remote",
             {{"remote", remote_id}});
    radio_.Write(remote_id, Characteristic::kControlIn,
                 core::EncodeChunkBytes(core::Dropping(identity_.client_id)),
                 false);
  } else {
    pfl::Log(pfl::Level::kInfo, kTag, "implicitly dropping remote",
             {{"remote", remote_id}});
  }
  RemoveRemote(remote_id);
  return true;
}

std::optional<TransportRemote> RadioSubscriber::FindRemote(
    const std::string& remote_id) const {
  const auto it = remotes_.find(remote_id);
  if (it == remotes_.end()) {
    return std::nullopt;
  }
  return Snapshot(it->second);
}

std::optional<RadioSubscriber::Phase> RadioSubscriber::PhaseOf(
    const std::string& remote_id) const {
  const auto it = remotes_.find(remote_id);
  if (it == remotes_.end()) {
    return std::nullopt;
  }
  return it->second.phase;
}

void RadioSubscriber::OnRadioStatus(TransportStatus status) {
  pfl::Log(pfl::Level::kInfo, kTag, "radio status",
           {{"status", TransportStatusName(status)}});
  if (running_) {
    if (status == TransportStatus::kOn) {
      StartDiscovery();
    } else {
      discovering_ = false;
      advertising_ = false;
      ad_timer_.Cancel();
      diagnostics_.Report(core::Anomaly::kTransportUnavailable, kTag,
                          "radio went off while listening");
    }
  }
  if (callbacks_.on_status) {
    callbacks_.on_status(status);
  }
}

void RadioSubscriber::OnAdvertisement(const Advertisement& ad) {
  if (!running_ || ad.service_uuid != kWhisperServiceUuid) {
    return;
  }
  if (!publisher_.empty()) {
    pfl::Log(pfl::Level::kDebug, kTag, "ignoring ad after subscription",
             {{"peer", ad.peer_id}});
    return;
  }
  if (!advertisers_.insert(ad.peer_id).second) {
    return;
  }
  if (remotes_.count(ad.peer_id) != 0 ||
      drops_in_progress_.count(ad.peer_id) != 0) {
    return;
  }
  if (ad.local_name.empty()) {
    pfl::Log(pfl::Level::kWarn, kTag, "ignoring ad with no conversation id",
             {{"peer", ad.peer_id}});
    return;
  }
  if (target_ && !core::MatchesShortId(ad.local_name, target_->id)) {
    pfl::Log(pfl::Level::kDebug, kTag, "ignoring ad for other conversation",
             {{"peer", ad.peer_id}, {"name", ad.local_name}});
    return;
  }
  pfl::Log(pfl::Level::kInfo, kTag, "connecting to whisperer",
           {{"peer", ad.peer_id}});
  Remote remote;
  remote.id = ad.peer_id;
  const std::string id = ad.peer_id;
  remote.handshake_timer =
      queue_.Schedule(config_.handshake_timeout_ms, [this, id]() {
        Remote* pending = Find(id);
        if (!pending || pending->phase >= Phase::kAwaitingAuthorization) {
          return;
        }
        diagnostics_.Report(core::Anomaly::kHandshakeTimeout, kTag,
                            "pairing did not complete with " + id);
        RemoveRemote(id);
      });
  remotes_.emplace(id, std::move(remote));
  radio_.Connect(id);
}

void RadioSubscriber::OnConnected(const std::string& peripheral_id) {
  Remote* remote = Find(peripheral_id);
  if (!remote) {
    pfl::Log(pfl::Level::kDebug, kTag, "ignoring unrequested connection",
             {{"peer", peripheral_id}});
    return;
  }
  remote->phase = Phase::kResolvingServices;
  radio_.DiscoverServices(peripheral_id, kWhisperServiceUuid);
}

void RadioSubscriber::OnConnectFailed(const std::string& peripheral_id,
                                      const std::string& error) {
  drops_in_progress_.erase(peripheral_id);
  if (remotes_.erase(peripheral_id) == 0) {
    return;
  }
  diagnostics_.Report(core::Anomaly::kRadioFailure, kTag,
                      "connect to " + peripheral_id + " failed: " + error);
  // Let a later advertisement retry.
  advertisers_.erase(peripheral_id);
}

void RadioSubscriber::OnDisconnected(const std::string& peripheral_id,
                                     const std::string& error) {
  if (drops_in_progress_.erase(peripheral_id) != 0) {
    pfl::Log(pfl::Level::kDebug, kTag, "completed disconnect",
             {{"remote", peripheral_id}});
    return;
  }
  auto it = remotes_.find(peripheral_id);
  if (it == remotes_.end()) {
    pfl::Log(pfl::Level::kDebug, kTag, "ignoring disconnect from unknown peer",
             {{"peer", peripheral_id}});
    return;
  }
  pfl::Log(pfl::Level::kWarn, kTag, "remote disconnected unexpectedly",
           {{"remote", peripheral_id}, {"error", error}});
  it->second.state.content_subscribed = false;
  it->second.state.control_subscribed = false;
  const TransportRemote lost = Snapshot(it->second);
  remotes_.erase(it);
  advertisers_.erase(peripheral_id);
  if (peripheral_id == publisher_) {
    publisher_.clear();
    StartDiscovery();
  }
  if (callbacks_.on_lost) {
    callbacks_.on_lost(lost);
  }
}

void RadioSubscriber::OnServicesDiscovered(const std::string& peripheral_id,
                                           bool found,
                                           const std::string& error) {
  Remote* remote = Find(peripheral_id);
  if (!remote) {
    return;
  }
  if (!error.empty() || !found) {
    diagnostics_.Report(core::Anomaly::kRadioFailure, kTag,
                        "no whisper service on " + peripheral_id +
                            (error.empty() ? std::string() : ": " + error));
    RemoveRemote(peripheral_id);
    return;
  }
  pfl::Log(pfl::Level::kDebug, kTag, "whisper service found, reading characteristics",
           {{"remote", peripheral_id}});
  radio_.DiscoverCharacteristics(peripheral_id);
}

void RadioSubscriber::OnCharacteristicsDiscovered(
    const std::string& peripheral_id, const std::string& error) {
  Remote* remote = Find(peripheral_id);
  if (!remote) {
    return;
  }
  if (!error.empty()) {
    diagnostics_.Report(core::Anomaly::kRadioFailure, kTag,
                        "characteristic discovery failed on " +
                            peripheral_id + ": " + error);
    RemoveRemote(peripheral_id);
    return;
  }
  remote->phase = Phase::kPairing;
  radio_.SetNotify(peripheral_id, Characteristic::kControlOut, true);
  // Content stays unsubscribed until we are authorized.
  const core::Conversation conversation =
      target_ ? *target_ : core::Conversation{};
  pfl::Log(pfl::Level::kInfo, kTag, "sending listen offer",
           {{"remote", peripheral_id}});
  radio_.Write(peripheral_id, Characteristic::kControlIn,
               core::EncodeChunkBytes(core::ListenOffer(
                   core::MakeClientInfo(identity_, conversation))),
               true);
}

void RadioSubscriber::OnNotifyStateChanged(const std::string& peripheral_id,
                                           Characteristic characteristic,
                                           bool enabled,
                                           const std::string& error) {
  if (drops_in_progress_.count(peripheral_id) != 0) {
    return;
  }
  Remote* remote = Find(peripheral_id);
  if (!remote || !enabled) {
    return;
  }
  if (!error.empty()) {
    Fail(peripheral_id, std::string("subscribe to ") +
                            CharacteristicName(characteristic) +
                            " failed: " + error);
    return;
  }
  if (characteristic == Characteristic::kControlOut) {
    remote->state.control_subscribed = true;
    MaybeAwaitAuthorization(*remote);
  } else if (characteristic == Characteristic::kContentOut) {
    remote->state.content_subscribed = true;
    remote->phase = Phase::kSubscribed;
    pfl::Log(pfl::Level::kInfo, kTag, "subscribed to whisperer",
             {{"remote", peripheral_id}});
  }
}

void RadioSubscriber::OnValueUpdated(const std::string& peripheral_id,
                                     Characteristic characteristic,
                                     const std::vector<std::uint8_t>& value) {
  if (!running_) {
    return;
  }
  if (characteristic == Characteristic::kContentOut) {
    HandleContent(peripheral_id, value);
  } else if (characteristic == Characteristic::kControlOut) {
    HandleControl(peripheral_id, value);
  } else {
    pfl::Log(pfl::Level::kWarn, kTag, "update of unexpected characteristic",
             {{"characteristic", CharacteristicName(characteristic)}});
  }
}

void RadioSubscriber::OnWriteCompleted(const std::string& peripheral_id,
                                       Characteristic characteristic,
                                       const std::string& error) {
  if (drops_in_progress_.count(peripheral_id) != 0) {
    pfl::Log(pfl::Level::kDebug, kTag, "write result during disconnect",
             {{"remote", peripheral_id}});
    return;
  }
  Remote* remote = Find(peripheral_id);
  if (!remote) {
    return;
  }
  if (!error.empty()) {
    Fail(peripheral_id, std::string("write to ") +
                            CharacteristicName(characteristic) +
                            " failed: " + error);
    return;
  }
  if (!remote->offer_delivered) {
    remote->offer_delivered = true;
    MaybeAwaitAuthorization(*remote);
  }
}

void RadioSubscriber::StartDiscovery() {
  if (!running_ || in_background_ || !publisher_.empty()) {
    return;
  }
  pfl::Log(pfl::Level::kInfo, kTag, "scanning for whisperers");
  advertisers_.clear();
  discovering_ = true;
  radio_.StartScan(kWhisperServiceUuid);
  StartAdvertising();
}

void RadioSubscriber::StopDiscovery() {
  StopAdvertising();
  if (discovering_) {
    pfl::Log(pfl::Level::kDebug, kTag, "stop scanning for whisperers");
    radio_.StopScan();
    discovering_ = false;
  }
}

void RadioSubscriber::StartAdvertising() {
  const std::string name = target_
                               ? core::ShortConversationId(target_->id)
                               : std::string(core::kOpenDiscovery);
  radio_.StartAdvertising(kListenServiceUuid, name);
  advertising_ = true;
  ad_timer_ = queue_.Schedule(config_.listen_advertise_ms,
                              [this]() { StopAdvertising(); });
}

void RadioSubscriber::StopAdvertising() {
  if (!advertising_) {
    return;
  }
  radio_.StopAdvertising();
  advertising_ = false;
  ad_timer_.Cancel();
}

RadioSubscriber::Remote* RadioSubscriber::Find(
    const std::string& peripheral_id) {
  const auto it = remotes_.find(peripheral_id);
  return it == remotes_.end() ? nullptr : &it->second;
}

void RadioSubscriber::MaybeAwaitAuthorization(Remote& remote) {
  if (remote.phase != Phase::kPairing || !remote.offer_delivered ||
      !remote.state.control_subscribed) {
    return;
  }
  remote.phase = Phase::kAwaitingAuthorization;
  remote.handshake_timer.Cancel();
  pfl::Log(pfl::Level::kInfo, kTag, "paired, awaiting authorization",
           {{"remote", remote.id}});
}

void RadioSubscriber::HandleControl(const std::string& peripheral_id,
                                    const std::vector<std::uint8_t>& value) {
  Remote* remote = Find(peripheral_id);
  if (!remote) {
    pfl::Log(pfl::Level::kDebug, kTag, "control from untracked peer",
             {{"peer", peripheral_id}});
    return;
  }
  core::ProtocolChunk chunk;
  if (!core::DecodeChunk(value.data(), value.size(), chunk)) {
    // The control stream cannot resynchronize; the connection ends here.
    diagnostics_.Report(core::Anomaly::kMalformedPacket, kTag,
                        "malformed control data from " + peripheral_id);
    const TransportRemote lost = Snapshot(*remote);
    RemoveRemote(peripheral_id);
    if (on_failure_) {
      on_failure_("Communication (bad data) failure while connecting to Whisperer");
    }
    if (callbacks_.on_lost) {
      callbacks_.on_lost(lost);
    }
    return;
  }
  if (core::HasOffset(chunk, core::ControlOffset::kDropping)) {
    pfl::Log(pfl::Level::kInfo, kTag, "advised of drop",
             {{"remote", peripheral_id}});
    const TransportRemote lost = Snapshot(*remote);
    RemoveRemote(peripheral_id);
    if (callbacks_.on_lost) {
      callbacks_.on_lost(lost);
    }
    return;
  }
  if (callbacks_.on_control) {
    callbacks_.on_control(Snapshot(*remote), chunk);
  }
}

void RadioSubscriber::HandleContent(const std::string& peripheral_id,
                                    const std::vector<std::uint8_t>& value) {
  if (peripheral_id != publisher_) {
    pfl::Log(pfl::Level::kDebug, kTag, "content from non-publisher",
             {{"peer", peripheral_id}});
    return;
  }
  Remote* remote = Find(peripheral_id);
  if (!remote) {
    return;
  }
  core::ProtocolChunk chunk;
  if (!core::DecodeChunk(value.data(), value.size(), chunk)) {
    diagnostics_.Report(core::Anomaly::kMalformedPacket, kTag,
                        "ignoring malformed content from " + peripheral_id);
    return;
  }
  if (callbacks_.on_content) {
    callbacks_.on_content(Snapshot(*remote), chunk);
  }
}

void RadioSubscriber::RemoveRemote(const std::string& peripheral_id) {
  auto it = remotes_.find(peripheral_id);
  if (it == remotes_.end()) {
    return;
  }
  const RemoteState state = it->second.state;
  remotes_.erase(it);
  drops_in_progress_.insert(peripheral_id);
  if (state.content_subscribed) {
    radio_.SetNotify(peripheral_id, Characteristic::kContentOut, false);
  }
  if (state.control_subscribed) {
    radio_.SetNotify(peripheral_id, Characteristic::kControlOut, false);
  }
  radio_.Disconnect(peripheral_id);
  if (peripheral_id == publisher_) {
    publisher_.clear();
    StartDiscovery();
  }
}

void RadioSubscriber::Fail(const std::string& peripheral_id,
                           const std::string& reason) {
  diagnostics_.Report(core::Anomaly::kRadioFailure, kTag,
                      peripheral_id + ": " + reason);
  if (on_failure_) {
    on_failure_("Communication failure while connecting to Whisperer");
  }
}

void RadioSubscriber::ReportUnknown(const char* op,
                                    const std::string& remote_id) {
  diagnostics_.Report(core::Anomaly::kUnknownRemote, kTag,
                      std::string(op) + " for unknown remote " + remote_id);
}

TransportRemote RadioSubscriber::Snapshot(const Remote& remote) {
  return LocalRemote{remote.id, remote.state};
}

}  // namespace whisper::transport
