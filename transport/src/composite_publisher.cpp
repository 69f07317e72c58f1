#include "composite_publisher.h"

#include <utility>

#include "platform_log.h"

namespace whisper::transport {

namespace pfl = whisper::platform::log;

namespace {

constexpr const char* kTag = "composite_pub";

TransportKind Other(TransportKind kind) {
  return kind == TransportKind::kLocal ? TransportKind::kGlobal
                                       : TransportKind::kLocal;
}

}  // namespace

CompositePublisher::CompositePublisher(core::EventQueue& queue,
                                       core::Diagnostics& diagnostics,
                                       const core::CompositeSection& config,
                                       std::unique_ptr<PublishTransport> local,
                                       std::unique_ptr<PublishTransport> global)
    : queue_(queue), diagnostics_(diagnostics), config_(config) {
  local_.transport = std::move(local);
  global_.transport = std::move(global);
  Wire(TransportKind::kLocal);
  Wire(TransportKind::kGlobal);
}

CompositePublisher::~CompositePublisher() {
  Stop();
  for (Slot* slot : {&local_, &global_}) {
    if (slot->transport) {
      slot->transport->SetCallbacks(TransportCallbacks{});
    }
  }
}

TransportKind CompositePublisher::kind() const {
  return IsOn(global_) ? TransportKind::kGlobal : TransportKind::kLocal;
}

TransportStatus CompositePublisher::status() const {
  if (IsOn(local_) || IsOn(global_)) {
    return TransportStatus::kOn;
  }
  const auto disabled = [](const Slot& slot) {
    return !slot.transport ||
           slot.transport->status() == TransportStatus::kDisabled;
  };
  return disabled(local_) && disabled(global_) ? TransportStatus::kDisabled
                                               : TransportStatus::kOff;
}

void CompositePublisher::SetCallbacks(TransportCallbacks callbacks) {
  callbacks_ = std::move(callbacks);
}

void CompositePublisher::Start(FailureCallback on_failure) {
  if (running_) {
    return;
  }
  on_failure_ = std::move(on_failure);
  const bool local_on = IsOn(local_);
  const bool global_on = IsOn(global_);
  pfl::Log(pfl::Level::kInfo, kTag, "starting",
           {{"radio", local_on ? "on" : "off"},
            {"network", global_on ? "on" : "off"}});
  if (!local_on && !global_on) {
    diagnostics_.Report(core::Anomaly::kNoTransportAvailable, kTag,
                        "neither radio nor network is on");
    if (on_failure_) {
      on_failure_("Cannot whisper unless Bluetooth or the Internet is available");
    }
    return;
  }
  running_ = true;
  if (global_on) {
    StartSlot(TransportKind::kGlobal);
  }
  if (local_on) {
    if (global_on) {
      // The network handshake gets a head start on the radio.
      radio_timer_ = queue_.Schedule(config_.radio_start_delay_ms, [this]() {
        StartSlot(TransportKind::kLocal);
      });
    } else {
      StartSlot(TransportKind::kLocal);
    }
  }
}

void CompositePublisher::Stop() {
  radio_timer_.Cancel();
  if (!running_) {
    return;
  }
  pfl::Log(pfl::Level::kInfo, kTag, "stopping",
           {{"remotes", std::to_string(remotes_.size())}});
  running_ = false;
  for (Slot* slot : {&global_, &local_}) {
    if (slot->started) {
      slot->started = false;
      slot->transport->Stop();
    }
  }
  remotes_.Clear();
}

void CompositePublisher::GoToBackground() {
  for (Slot* slot : {&local_, &global_}) {
    if (slot->started) {
      slot->transport->GoToBackground();
    }
  }
}

void CompositePublisher::GoToForeground() {
  for (Slot* slot : {&local_, &global_}) {
    if (slot->started) {
      slot->transport->GoToForeground();
    }
  }
}

void CompositePublisher::Publish(
    const std::vector<core::ProtocolChunk>& chunks) {
  for (Slot* slot : {&local_, &global_}) {
    if (slot->started) {
      slot->transport->Publish(chunks);
    }
  }
}

bool CompositePublisher::SendContent(
    const std::string& remote_id,
    const std::vector<core::ProtocolChunk>& chunks) {
  std::string inner_id;
  PublishTransport* transport = Route("send content", remote_id, inner_id);
  return transport != nullptr && transport->SendContent(inner_id, chunks);
}

bool CompositePublisher::SendControl(const std::string& remote_id,
                                     const core::ProtocolChunk& chunk) {
  std::string inner_id;
  PublishTransport* transport = Route("send control", remote_id, inner_id);
  return transport != nullptr && transport->SendControl(inner_id, chunk);
}

bool CompositePublisher::Authorize(const std::string& remote_id) {
  std::string inner_id;
  PublishTransport* transport = Route("authorize", remote_id, inner_id);
  return transport != nullptr && transport->Authorize(inner_id);
}

bool CompositePublisher::Deauthorize(const std::string& remote_id) {
  std::string inner_id;
  PublishTransport* transport = Route("deauthorize", remote_id, inner_id);
  return transport != nullptr && transport->Deauthorize(inner_id);
}

bool CompositePublisher::Drop(const std::string& remote_id) {
  std::string inner_id;
  PublishTransport* transport = Route("drop", remote_id, inner_id);
  if (transport == nullptr) {
    return false;
  }
  remotes_.Unbind(remote_id);
  return transport->Drop(inner_id);
}

std::optional<TransportRemote> CompositePublisher::FindRemote(
    const std::string& remote_id) const {
  const auto binding = remotes_.Find(remote_id);
  if (!binding) {
    return std::nullopt;
  }
  const Slot& slot = SlotFor(binding->kind);
  if (!slot.transport) {
    return std::nullopt;
  }
  auto remote = slot.transport->FindRemote(binding->inner_id);
  if (!remote) {
    return std::nullopt;
  }
  return WithId(std::move(*remote), remote_id);
}

std::vector<std::string> CompositePublisher::BroadcastRecipients() const {
  std::vector<std::string> ids;
  for (const Slot* slot : {&local_, &global_}) {
    if (!slot->started) {
      continue;
    }
    const TransportKind kind = slot->transport->kind();
    for (const auto& inner : slot->transport->BroadcastRecipients()) {
      if (auto client = remotes_.ClientOf(kind, inner)) {
        ids.push_back(*client);
      }
    }
  }
  return ids;
}

bool CompositePublisher::started(TransportKind kind) const {
  return SlotFor(kind).started;
}

PublishTransport* CompositePublisher::transport(TransportKind kind) {
  return SlotFor(kind).transport.get();
}

CompositePublisher::Slot& CompositePublisher::SlotFor(TransportKind kind) {
  return kind == TransportKind::kLocal ? local_ : global_;
}

const CompositePublisher::Slot& CompositePublisher::SlotFor(
    TransportKind kind) const {
  return kind == TransportKind::kLocal ? local_ : global_;
}

bool CompositePublisher::IsOn(const Slot& slot) const {
  return slot.transport && slot.transport->status() == TransportStatus::kOn;
}

bool CompositePublisher::OtherActive(TransportKind kind) const {
  const TransportKind other = Other(kind);
  const Slot& slot = SlotFor(other);
  if (!IsOn(slot)) {
    return false;
  }
  return slot.started ||
         (other == TransportKind::kLocal && radio_timer_.pending());
}

void CompositePublisher::Wire(TransportKind kind) {
  Slot& slot = SlotFor(kind);
  if (!slot.transport) {
    return;
  }
  TransportCallbacks cb;
  cb.on_control = [this, kind](const TransportRemote& remote,
                               const core::ProtocolChunk& chunk) {
    OnControl(kind, remote, chunk);
  };
  cb.on_content = [this, kind](const TransportRemote& remote,
                               const core::ProtocolChunk& chunk) {
    OnContent(kind, remote, chunk);
  };
  cb.on_lost = [this, kind](const TransportRemote& remote) {
    OnLost(kind, remote);
  };
  cb.on_status = [this, kind](TransportStatus status) {
    OnStatus(kind, status);
  };
  slot.transport->SetCallbacks(std::move(cb));
}

void CompositePublisher::StartSlot(TransportKind kind) {
  Slot& slot = SlotFor(kind);
  if (!running_ || !slot.transport || slot.started) {
    return;
  }
  pfl::Log(pfl::Level::kInfo, kTag, "starting transport",
           {{"kind", TransportKindName(kind)}});
  slot.started = true;
  slot.transport->Start([this, kind](const std::string& reason) {
    OnFailure(kind, reason);
  });
}

void CompositePublisher::OnControl(TransportKind kind,
                                   const TransportRemote& remote,
                                   const core::ProtocolChunk& chunk) {
  const std::string& inner_id = RemoteId(remote);
  if (auto client = remotes_.ClientOf(kind, inner_id)) {
    if (callbacks_.on_control) {
      callbacks_.on_control(WithId(remote, *client), chunk);
    }
    return;
  }
  const auto client_id = PresenceClientId(chunk);
  if (!client_id) {
    pfl::Log(pfl::Level::kDebug, kTag, "control before identification",
             {{"kind", TransportKindName(kind)},
              {"remote", inner_id},
              {"offset", core::ControlOffsetName(chunk.offset)}});
    return;
  }
  if (remotes_.Bind(*client_id, kind, inner_id) ==
      CompositeRemotes::BindResult::kDuplicate) {
    pfl::Log(pfl::Level::kWarn, kTag, "duplicate remote rejected",
             {{"client", *client_id},
              {"kind", TransportKindName(kind)},
              {"remote", inner_id}});
    diagnostics_.Report(core::Anomaly::kDuplicateRemote, kTag,
                        *client_id + " already bound to another transport");
    if (!SlotFor(kind).transport->Drop(inner_id)) {
      pfl::Log(pfl::Level::kDebug, kTag, "duplicate already gone",
               {{"remote", inner_id}});
    }
    return;
  }
  pfl::Log(pfl::Level::kInfo, kTag, "remote identified",
           {{"client", *client_id}, {"kind", TransportKindName(kind)}});
  if (callbacks_.on_control) {
    callbacks_.on_control(WithId(remote, *client_id), chunk);
  }
}

void CompositePublisher::OnContent(TransportKind kind,
                                   const TransportRemote& remote,
                                   const core::ProtocolChunk& chunk) {
  auto client = remotes_.ClientOf(kind, RemoteId(remote));
  if (!client) {
    pfl::Log(pfl::Level::kDebug, kTag, "content from unidentified remote",
             {{"remote", RemoteId(remote)}});
    return;
  }
  if (callbacks_.on_content) {
    callbacks_.on_content(WithId(remote, *client), chunk);
  }
}

void CompositePublisher::OnLost(TransportKind kind,
                                const TransportRemote& remote) {
  auto client = remotes_.ClientOf(kind, RemoteId(remote));
  if (!client) {
    return;
  }
  remotes_.Unbind(*client);
  if (callbacks_.on_lost) {
    callbacks_.on_lost(WithId(remote, *client));
  }
}

void CompositePublisher::OnStatus(TransportKind kind, TransportStatus status) {
  pfl::Log(pfl::Level::kInfo, kTag, "transport status",
           {{"kind", TransportKindName(kind)},
            {"status", TransportStatusName(status)}});
  Slot& slot = SlotFor(kind);
  if (running_) {
    if (status == TransportStatus::kOn) {
      if (!(kind == TransportKind::kLocal && radio_timer_.pending())) {
        StartSlot(kind);
      }
    } else if (slot.started) {
      if (OtherActive(kind)) {
        diagnostics_.Report(core::Anomaly::kTransportUnavailable, kTag,
                            std::string(TransportKindName(kind)) +
                                " transport became unavailable");
      } else {
        diagnostics_.Report(core::Anomaly::kNoTransportAvailable, kTag,
                            "last transport became unavailable");
        if (on_failure_) {
          on_failure_("Neither Bluetooth nor the Internet is available");
        }
      }
    }
  }
  if (callbacks_.on_status) {
    callbacks_.on_status(this->status());
  }
}

void CompositePublisher::OnFailure(TransportKind kind,
                                   const std::string& reason) {
  pfl::Log(pfl::Level::kWarn, kTag, "transport failure",
           {{"kind", TransportKindName(kind)}, {"reason", reason}});
  // A path that stopped itself no longer counts as active and is started
  // again when its status comes back on.
  Slot& slot = SlotFor(kind);
  if (slot.transport && !slot.transport->running()) {
    slot.started = false;
  }
  if (running_ && OtherActive(kind)) {
    diagnostics_.Report(core::Anomaly::kTransportUnavailable, kTag,
                        std::string(TransportKindName(kind)) +
                            " transport failed: " + reason);
    return;
  }
  if (on_failure_) {
    on_failure_(reason);
  }
}

PublishTransport* CompositePublisher::Route(const char* op,
                                            const std::string& remote_id,
                                            std::string& inner_id) {
  const auto binding = remotes_.Find(remote_id);
  if (!binding || !SlotFor(binding->kind).transport) {
    pfl::Log(pfl::Level::kWarn, kTag, "unknown remote",
             {{"op", op}, {"remote", remote_id}});
    diagnostics_.Report(core::Anomaly::kUnknownRemote, kTag,
                        std::string(op) + " for unknown remote " + remote_id);
    return nullptr;
  }
  inner_id = binding->inner_id;
  return SlotFor(binding->kind).transport.get();
}

}  // namespace whisper::transport
