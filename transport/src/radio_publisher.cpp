#include "radio_publisher.h"

#include <algorithm>
#include <utility>

#include "platform_log.h"

namespace whisper::transport {

namespace pfl = whisper::platform::log;

namespace {

constexpr const char* kTag = "radio_pub";

}  // namespace

RadioPublisher::RadioPublisher(core::EventQueue& queue, RadioAdapter& radio,
                               core::Diagnostics& diagnostics,
                               const core::RadioSection& config,
                               core::LocalIdentity identity,
                               core::Conversation conversation)
    : queue_(queue),
      radio_(radio),
      diagnostics_(diagnostics),
      config_(config),
      identity_(std::move(identity)),
      conversation_(std::move(conversation)) {}

RadioPublisher::~RadioPublisher() {
  running_ = false;
  Release();
}

TransportStatus RadioPublisher::status() const {
  return radio_.status();
}

void RadioPublisher::SetCallbacks(TransportCallbacks callbacks) {
  callbacks_ = std::move(callbacks);
}

void RadioPublisher::Start(FailureCallback on_failure) {
  if (running_) {
    return;
  }
  if (attached_) {
    // A previous Stop is still draining; cut it short.
    Release();
  }
  on_failure_ = std::move(on_failure);
  pfl::Log(pfl::Level::kInfo, kTag, "starting",
           {{"conversation", conversation_.id}});
  if (radio_.status() != TransportStatus::kOn) {
    diagnostics_.Report(core::Anomaly::kTransportUnavailable, kTag,
                        "radio is not on");
    if (on_failure_) {
      on_failure_("Bluetooth is not available");
    }
    return;
  }
  radio_.AddObserver(this);
  attached_ = true;
  if (!radio_.PublishService(kWhisperServiceUuid)) {
    diagnostics_.Report(core::Anomaly::kRadioFailure, kTag,
                        "publish whisper service failed");
    Release();
    if (on_failure_) {
      on_failure_("Bluetooth service could not be published");
    }
    return;
  }
  running_ = true;
  StartDiscovery();
}

void RadioPublisher::Stop() {
  if (!running_) {
    return;
  }
  pfl::Log(pfl::Level::kInfo, kTag, "stopping");
  running_ = false;
  StopDiscovery();
  LeaveConversation();
}

void RadioPublisher::GoToBackground() {
  if (in_background_) {
    return;
  }
  in_background_ = true;
  StopDiscovery();
}

void RadioPublisher::GoToForeground() {
  if (!in_background_) {
    return;
  }
  in_background_ = false;
  StartDiscovery();
}

void RadioPublisher::Publish(const std::vector<core::ProtocolChunk>& chunks) {
  if (!running_) {
    return;
  }
  pending_content_.insert(pending_content_.end(), chunks.begin(), chunks.end());
  UpdateControlAndContent();
}

bool RadioPublisher::SendContent(
    const std::string& remote_id,
    const std::vector<core::ProtocolChunk>& chunks) {
  if (!running_) {
    return false;
  }
  if (remotes_.find(remote_id) == remotes_.end()) {
    ReportUnknown("send content", remote_id);
    return false;
  }
  auto& queue = directed_content_[remote_id];
  queue.insert(queue.end(), chunks.begin(), chunks.end());
  UpdateControlAndContent();
  return true;
}

bool RadioPublisher::SendControl(const std::string& remote_id,
                                 const core::ProtocolChunk& chunk) {
  if (!running_) {
    return false;
  }
  if (remotes_.find(remote_id) == remotes_.end()) {
    ReportUnknown("send control", remote_id);
    return false;
  }
  directed_control_[remote_id].push_back(chunk);
  UpdateControl();
  return true;
}

bool RadioPublisher::Authorize(const std::string& remote_id) {
  const auto it = remotes_.find(remote_id);
  if (!running_ || it == remotes_.end()) {
    ReportUnknown("authorize", remote_id);
    return false;
  }
  it->second.state.authorized = true;
  const auto eaves =
      std::find(eavesdroppers_.begin(), eavesdroppers_.end(), remote_id);
  if (eaves != eavesdroppers_.end()) {
    eavesdroppers_.erase(eaves);
    listeners_.push_back(remote_id);
    pfl::Log(pfl::Level::kInfo, kTag, "eavesdropper promoted to listener",
             {{"remote", remote_id}});
  }
  return true;
}

bool RadioPublisher::Deauthorize(const std::string& remote_id) {
  const auto it = remotes_.find(remote_id);
  if (!running_ || it == remotes_.end()) {
    ReportUnknown("deauthorize", remote_id);
    return false;
  }
  it->second.state.authorized = false;
  const auto listener =
      std::find(listeners_.begin(), listeners_.end(), remote_id);
  if (listener != listeners_.end()) {
    listeners_.erase(listener);
    // Stays an eavesdropper until it disconnects or is re-authorized.
    eavesdroppers_.push_back(remote_id);
  }
  return true;
}

bool RadioPublisher::Drop(const std::string& remote_id) {
  const auto it = remotes_.find(remote_id);
  if (it == remotes_.end()) {
    ReportUnknown("drop", remote_id);
    return false;
  }
  pfl::Log(pfl::Level::kInfo, kTag, "dropping remote", {{"remote", remote_id}});
  RemoveRemote(remote_id, !it->second.has_dropped);
  return true;
}

std::optional<TransportRemote> RadioPublisher::FindRemote(
    const std::string& remote_id) const {
  auto it = remotes_.find(remote_id);
  if (it != remotes_.end()) {
    return Snapshot(it->second);
  }
  it = removed_.find(remote_id);
  if (it != removed_.end()) {
    return Snapshot(it->second);
  }
  return std::nullopt;
}

std::vector<std::string> RadioPublisher::BroadcastRecipients() const {
  return listeners_;
}

std::vector<std::string> RadioPublisher::Eavesdroppers() const {
  return eavesdroppers_;
}

void RadioPublisher::OnRadioStatus(TransportStatus status) {
  pfl::Log(pfl::Level::kInfo, kTag, "radio status",
           {{"status", TransportStatusName(status)}});
  if (running_) {
    if (status == TransportStatus::kOn) {
      if (radio_.PublishService(kWhisperServiceUuid)) {
        StartDiscovery();
      } else {
        diagnostics_.Report(core::Anomaly::kRadioFailure, kTag,
                            "republish whisper service failed");
      }
    } else {
      advertising_ = false;
      ad_timer_.Cancel();
      advertisers_.clear();
      diagnostics_.Report(core::Anomaly::kTransportUnavailable, kTag,
                          "radio went off while whispering");
    }
  }
  if (callbacks_.on_status) {
    callbacks_.on_status(status);
  }
}

void RadioPublisher::OnAdvertisement(const Advertisement& ad) {
  if (!running_ || in_background_ || ad.service_uuid != kListenServiceUuid) {
    return;
  }
  if (!advertisers_.insert(ad.peer_id).second) {
    return;
  }
  if (ad.local_name != core::kOpenDiscovery &&
      !core::MatchesShortId(ad.local_name, conversation_.id)) {
    pfl::Log(pfl::Level::kDebug, kTag, "ignoring advertisement",
             {{"peer", ad.peer_id}, {"name", ad.local_name}});
    return;
  }
  pfl::Log(pfl::Level::kDebug, kTag, "responding to listener advertisement",
           {{"peer", ad.peer_id}});
  StartAdvertising();
}

void RadioPublisher::OnCentralSubscribed(const std::string& central_id,
                                         Characteristic characteristic) {
  if (!running_) {
    return;
  }
  if (characteristic == Characteristic::kControlOut) {
    Remote& remote = EnsureRemote(central_id);
    remote.state.control_subscribed = true;
    UpdateControl();
    return;
  }
  if (characteristic != Characteristic::kContentOut) {
    pfl::Log(pfl::Level::kWarn, kTag, "subscribe to unexpected characteristic",
             {{"central", central_id},
              {"characteristic", CharacteristicName(characteristic)}});
    return;
  }
  Remote& remote = EnsureRemote(central_id);
  if (remote.state.content_subscribed) {
    return;
  }
  remote.state.content_subscribed = true;
  if (remote.state.authorized) {
    pfl::Log(pfl::Level::kInfo, kTag, "adding content listener",
             {{"remote", central_id}});
    listeners_.push_back(central_id);
  } else {
    pfl::Log(pfl::Level::kWarn, kTag, "found an eavesdropper",
             {{"remote", central_id}});
    eavesdroppers_.push_back(central_id);
  }
  UpdateControlAndContent();
}

void RadioPublisher::OnCentralUnsubscribed(const std::string& central_id,
                                           Characteristic characteristic) {
  std::optional<TransportRemote> lost;
  const auto active = remotes_.find(central_id);
  if (active != remotes_.end()) {
    // Unsubscribing without a dropping message counts as the peer dropping.
    pfl::Log(pfl::Level::kWarn, kTag, "unsubscribe by remote that hasn't dropped",
             {{"remote", central_id}});
    active->second.has_dropped = true;
    RemoveRemote(central_id, false);
    lost = FindRemote(central_id);
  }
  const auto removed = removed_.find(central_id);
  if (removed != removed_.end()) {
    RemoteState& state = removed->second.state;
    if (characteristic == Characteristic::kContentOut) {
      state.content_subscribed = false;
    } else if (characteristic == Characteristic::kControlOut) {
      state.control_subscribed = false;
    }
    if (!state.content_subscribed && !state.control_subscribed) {
      ForgetRemoved(central_id);
    }
  } else if (!lost) {
    pfl::Log(pfl::Level::kDebug, kTag, "ignoring unsubscribe from unknown central",
             {{"central", central_id}});
  }
  if (lost && callbacks_.on_lost) {
    callbacks_.on_lost(*lost);
  }
  MaybeFinishDrain();
}

void RadioPublisher::OnWriteRequests(const std::vector<WriteRequest>& requests) {
  if (requests.empty()) {
    return;
  }
  if (requests.size() != 1) {
    pfl::Log(pfl::Level::kWarn, kTag, "multiple write requests in a batch");
    for (const auto& request : requests) {
      radio_.RespondToWrite(request.request_id, AttStatus::kRequestNotSupported);
    }
    return;
  }
  const WriteRequest& request = requests.front();
  if (!running_) {
    radio_.RespondToWrite(request.request_id, AttStatus::kUnlikelyError);
    return;
  }
  if (request.characteristic != Characteristic::kControlIn) {
    pfl::Log(pfl::Level::kWarn, kTag, "write to unexpected characteristic",
             {{"central", request.central_id},
              {"characteristic", CharacteristicName(request.characteristic)}});
    radio_.RespondToWrite(request.request_id, AttStatus::kAttributeNotFound);
    return;
  }
  core::ProtocolChunk chunk;
  if (!core::DecodeChunk(request.value.data(), request.value.size(), chunk)) {
    radio_.RespondToWrite(request.request_id, AttStatus::kUnlikelyError);
    diagnostics_.Report(core::Anomaly::kMalformedPacket, kTag,
                        "malformed control write from " + request.central_id);
    return;
  }
  Remote& remote = EnsureRemote(request.central_id);
  radio_.RespondToWrite(request.request_id, AttStatus::kSuccess);
  if (core::HasOffset(chunk, core::ControlOffset::kDropping)) {
    pfl::Log(pfl::Level::kInfo, kTag, "remote is dropping",
             {{"remote", remote.id}});
    remote.has_dropped = true;
    const TransportRemote snapshot = Snapshot(remote);
    const std::string id = remote.id;
    remotes_.erase(id);
    EraseId(listeners_, id);
    EraseId(eavesdroppers_, id);
    directed_content_.erase(id);
    directed_control_.erase(id);
    if (callbacks_.on_lost) {
      callbacks_.on_lost(snapshot);
    }
    MaybeFinishDrain();
    return;
  }
  if (callbacks_.on_control) {
    callbacks_.on_control(Snapshot(remote), chunk);
  }
}

void RadioPublisher::OnReadyToUpdate() {
  if (attached_) {
    UpdateControlAndContent();
  }
}

void RadioPublisher::StartDiscovery() {
  if (!running_ || in_background_) {
    return;
  }
  radio_.StartScan(kListenServiceUuid);
  advertisers_.clear();
  StartAdvertising();
}

void RadioPublisher::StopDiscovery() {
  StopAdvertising();
  radio_.StopScan();
}

void RadioPublisher::StartAdvertising() {
  const std::uint64_t now = queue_.Now();
  const std::uint64_t cap = ad_burst_started_ms_ + config_.advertise_max_ms;
  if (advertising_) {
    if (now >= cap) {
      pfl::Log(pfl::Level::kDebug, kTag, "advertising cap reached");
      return;
    }
    pfl::Log(pfl::Level::kDebug, kTag, "refresh advertising window");
  } else {
    pfl::Log(pfl::Level::kInfo, kTag, "advertising whisperer");
    ad_burst_started_ms_ = now;
  }
  radio_.StartAdvertising(kWhisperServiceUuid,
                          core::ShortConversationId(conversation_.id));
  advertising_ = true;
  const std::uint64_t deadline =
      std::min<std::uint64_t>(now + config_.advertise_window_ms,
                              ad_burst_started_ms_ + config_.advertise_max_ms);
  ad_timer_ = queue_.Schedule(deadline - now, [this]() { StopAdvertising(); });
}

void RadioPublisher::StopAdvertising() {
  if (!advertising_) {
    return;
  }
  pfl::Log(pfl::Level::kDebug, kTag, "stop advertising whisperer");
  radio_.StopAdvertising();
  advertising_ = false;
  ad_timer_.Cancel();
  // Forget who triggered this burst so they can rejoin later.
  advertisers_.clear();
}

bool RadioPublisher::UpdateControl() {
  for (auto it = directed_control_.begin(); it != directed_control_.end();) {
    const std::string& id = it->first;
    auto active = remotes_.find(id);
    const Remote* remote = nullptr;
    if (active != remotes_.end()) {
      remote = &active->second;
    } else {
      auto removed = removed_.find(id);
      if (removed != removed_.end()) {
        remote = &removed->second;
      }
    }
    if (!remote) {
      it = directed_control_.erase(it);
      continue;
    }
    if (!remote->state.control_subscribed) {
      // Held until the control channel opens.
      ++it;
      continue;
    }
    auto& chunks = it->second;
    while (!chunks.empty()) {
      pfl::Log(pfl::Level::kDebug, kTag, "sending control chunk",
               {{"remote", id},
                {"kind", core::ControlOffsetName(chunks.front().offset)}});
      if (!radio_.NotifyCentrals(Characteristic::kControlOut,
                                 core::EncodeChunkBytes(chunks.front()),
                                 {id})) {
        return true;
      }
      chunks.pop_front();
    }
    it = directed_control_.erase(it);
  }
  while (!pending_control_.empty()) {
    if (!radio_.NotifyAll(Characteristic::kControlOut,
                          core::EncodeChunkBytes(pending_control_.front()))) {
      return true;
    }
    pending_control_.pop_front();
  }
  return false;
}

bool RadioPublisher::UpdateContent() {
  if (remotes_.empty()) {
    directed_content_.clear();
    pending_content_.clear();
    return false;
  }
  // Remotes catching up finish before live updates resume.
  for (auto it = directed_content_.begin(); it != directed_content_.end();) {
    const auto remote = remotes_.find(it->first);
    if (remote == remotes_.end()) {
      it = directed_content_.erase(it);
      continue;
    }
    if (!remote->second.state.content_subscribed) {
      ++it;
      continue;
    }
    auto& chunks = it->second;
    while (!chunks.empty()) {
      if (!radio_.NotifyCentrals(Characteristic::kContentOut,
                                 core::EncodeChunkBytes(chunks.front()),
                                 {it->first})) {
        return true;
      }
      chunks.pop_front();
    }
    it = directed_content_.erase(it);
  }
  if (listeners_.empty()) {
    pending_content_.clear();
    return false;
  }
  while (!pending_content_.empty()) {
    if (!radio_.NotifyCentrals(Characteristic::kContentOut,
                               core::EncodeChunkBytes(pending_content_.front()),
                               listeners_)) {
      return true;
    }
    pending_content_.pop_front();
  }
  return false;
}

void RadioPublisher::UpdateControlAndContent() {
  if (UpdateControl()) {
    return;
  }
  UpdateContent();
}

RadioPublisher::Remote& RadioPublisher::EnsureRemote(
    const std::string& central_id) {
  auto it = remotes_.find(central_id);
  if (it != remotes_.end()) {
    return it->second;
  }
  pfl::Log(pfl::Level::kInfo, kTag, "central is connecting",
           {{"central", central_id}});
  Remote remote;
  remote.id = central_id;
  return remotes_.emplace(central_id, std::move(remote)).first->second;
}

void RadioPublisher::RemoveRemote(const std::string& central_id,
                                  bool notify_peer) {
  auto node = remotes_.extract(central_id);
  if (node.empty()) {
    return;
  }
  Remote remote = std::move(node.mapped());
  EraseId(listeners_, central_id);
  EraseId(eavesdroppers_, central_id);
  directed_content_.erase(central_id);
  remote.state.drop_in_progress = true;
  remote.removal_timer =
      queue_.Schedule(config_.drop_timeout_ms, [this, central_id]() {
        diagnostics_.Report(core::Anomaly::kTeardownFailure, kTag,
                            "remote never unsubscribed: " + central_id);
        ForgetRemoved(central_id);
        MaybeFinishDrain();
      });
  removed_[central_id] = std::move(remote);
  if (notify_peer) {
    directed_control_[central_id].push_back(
        core::Dropping(identity_.client_id));
    UpdateControl();
  }
}

void RadioPublisher::ForgetRemoved(const std::string& central_id) {
  directed_control_.erase(central_id);
  directed_content_.erase(central_id);
  removed_.erase(central_id);
}

void RadioPublisher::LeaveConversation() {
  if (remotes_.empty() && removed_.empty()) {
    Release();
    return;
  }
  if (!remotes_.empty()) {
    pfl::Log(pfl::Level::kInfo, kTag, "telling remotes we are leaving",
             {{"remotes", std::to_string(remotes_.size())}});
    for (auto& entry : remotes_) {
      entry.second.state.drop_in_progress = true;
      removed_[entry.first] = std::move(entry.second);
    }
    remotes_.clear();
    listeners_.clear();
    eavesdroppers_.clear();
    directed_content_.clear();
    pending_content_.clear();
    pending_control_.push_back(core::Dropping(identity_.client_id));
    UpdateControl();
  }
  // Backup in case a remote never unsubscribes.
  release_timer_ = queue_.Schedule(config_.drop_timeout_ms, [this]() {
    if (!removed_.empty()) {
      pfl::Log(pfl::Level::kWarn, kTag, "releasing with remotes still attached",
               {{"remotes", std::to_string(removed_.size())}});
    }
    Release();
  });
}

void RadioPublisher::MaybeFinishDrain() {
  if (!running_ && attached_ && remotes_.empty() && removed_.empty()) {
    pfl::Log(pfl::Level::kInfo, kTag, "all remotes gone, releasing radio");
    Release();
  }
}

void RadioPublisher::Release() {
  ad_timer_.Cancel();
  release_timer_.Cancel();
  StopAdvertising();
  if (attached_) {
    radio_.StopScan();
    radio_.RemoveObserver(this);
    radio_.UnpublishService(kWhisperServiceUuid);
    attached_ = false;
  }
  remotes_.clear();
  removed_.clear();
  listeners_.clear();
  eavesdroppers_.clear();
  advertisers_.clear();
  pending_content_.clear();
  directed_content_.clear();
  pending_control_.clear();
  directed_control_.clear();
}

void RadioPublisher::ReportUnknown(const char* op,
                                   const std::string& remote_id) {
  diagnostics_.Report(core::Anomaly::kUnknownRemote, kTag,
                      std::string(op) + " for unknown remote " + remote_id);
}

TransportRemote RadioPublisher::Snapshot(const Remote& remote) {
  return LocalRemote{remote.id, remote.state};
}

void RadioPublisher::EraseId(std::vector<std::string>& list,
                             const std::string& id) {
  list.erase(std::remove(list.begin(), list.end(), id), list.end());
}

}  // namespace whisper::transport
