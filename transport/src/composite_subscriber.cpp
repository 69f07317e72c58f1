#include "composite_subscriber.h"

#include <utility>
#include <vector>

#include "platform_log.h"

namespace whisper::transport {

namespace pfl = whisper::platform::log;

namespace {

constexpr const char* kTag = "composite_sub";

TransportKind Other(TransportKind kind) {
  return kind == TransportKind::kLocal ? TransportKind::kGlobal
                                       : TransportKind::kLocal;
}

}  // namespace

CompositeSubscriber::CompositeSubscriber(
    core::EventQueue& queue, core::Diagnostics& diagnostics,
    const core::CompositeSection& config,
    std::unique_ptr<SubscribeTransport> local,
    std::unique_ptr<SubscribeTransport> global)
    : queue_(queue), diagnostics_(diagnostics), config_(config) {
  local_.transport = std::move(local);
  global_.transport = std::move(global);
  Wire(TransportKind::kLocal);
  Wire(TransportKind::kGlobal);
}

CompositeSubscriber::~CompositeSubscriber() {
  Stop();
  for (Slot* slot : {&local_, &global_}) {
    if (slot->transport) {
      slot->transport->SetCallbacks(TransportCallbacks{});
    }
  }
}

TransportKind CompositeSubscriber::kind() const {
  if (!publisher_.empty()) {
    if (const auto binding = remotes_.Find(publisher_)) {
      return binding->kind;
    }
  }
  return IsOn(global_) ? TransportKind::kGlobal : TransportKind::kLocal;
}

TransportStatus CompositeSubscriber::status() const {
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

void CompositeSubscriber::SetCallbacks(TransportCallbacks callbacks) {
  callbacks_ = std::move(callbacks);
}

void CompositeSubscriber::Start(FailureCallback on_failure) {
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
      on_failure_("Cannot listen unless Bluetooth or the Internet is available");
    }
    return;
  }
  running_ = true;
  publisher_.clear();
  if (global_on) {
    StartSlot(TransportKind::kGlobal);
  }
  if (local_on) {
    if (global_on) {
      radio_timer_ = queue_.Schedule(config_.radio_start_delay_ms, [this]() {
        StartSlot(TransportKind::kLocal);
      });
    } else {
      StartSlot(TransportKind::kLocal);
    }
  }
}

void CompositeSubscriber::Stop() {
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
  publisher_.clear();
}

void CompositeSubscriber::GoToBackground() {
  for (Slot* slot : {&local_, &global_}) {
    if (slot->started) {
      slot->transport->GoToBackground();
    }
  }
}

void CompositeSubscriber::GoToForeground() {
  for (Slot* slot : {&local_, &global_}) {
    if (slot->started) {
      slot->transport->GoToForeground();
    }
  }
}

bool CompositeSubscriber::Subscribe(const std::string& remote_id,
                                    const core::Conversation& conversation) {
  std::string inner_id;
  SubscribeTransport* transport = Route("subscribe", remote_id, inner_id);
  if (transport == nullptr) {
    return false;
  }
  const TransportKind winner = transport->kind();
  if (!transport->Subscribe(inner_id, conversation)) {
    return false;
  }
  publisher_ = remote_id;
  // The committed whisperer is the only one kept, whatever its transport.
  for (const auto& client : remotes_.ClientIds()) {
    if (client == remote_id) {
      continue;
    }
    const auto binding = remotes_.Find(client);
    remotes_.Unbind(client);
    if (!binding || binding->kind == winner) {
      // The subscribing transport already dropped its other candidates.
      continue;
    }
    if (!SlotFor(binding->kind).transport->Drop(binding->inner_id)) {
      pfl::Log(pfl::Level::kDebug, kTag, "candidate already gone",
               {{"client", client}});
    }
  }
  pfl::Log(pfl::Level::kInfo, kTag, "subscribed",
           {{"client", remote_id}, {"kind", TransportKindName(winner)}});
  return true;
}

bool CompositeSubscriber::SendControl(const std::string& remote_id,
                                      const core::ProtocolChunk& chunk) {
  std::string inner_id;
  SubscribeTransport* transport = Route("send control", remote_id, inner_id);
  return transport != nullptr && transport->SendControl(inner_id, chunk);
}

bool CompositeSubscriber::Drop(const std::string& remote_id) {
  std::string inner_id;
  SubscribeTransport* transport = Route("drop", remote_id, inner_id);
  if (transport == nullptr) {
    return false;
  }
  remotes_.Unbind(remote_id);
  if (publisher_ == remote_id) {
    publisher_.clear();
  }
  return transport->Drop(inner_id);
}

std::optional<TransportRemote> CompositeSubscriber::FindRemote(
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

bool CompositeSubscriber::started(TransportKind kind) const {
  return SlotFor(kind).started;
}

SubscribeTransport* CompositeSubscriber::transport(TransportKind kind) {
  return SlotFor(kind).transport.get();
}

CompositeSubscriber::Slot& CompositeSubscriber::SlotFor(TransportKind kind) {
  return kind == TransportKind::kLocal ? local_ : global_;
}

const CompositeSubscriber::Slot& CompositeSubscriber::SlotFor(
    TransportKind kind) const {
  return kind == TransportKind::kLocal ? local_ : global_;
}

bool CompositeSubscriber::IsOn(const Slot& slot) const {
  return slot.transport && slot.transport->status() == TransportStatus::kOn;
}

bool CompositeSubscriber::OtherActive(TransportKind kind) const {
  const TransportKind other = Other(kind);
  const Slot& slot = SlotFor(other);
  if (!IsOn(slot)) {
    return false;
  }
  return slot.started ||
         (other == TransportKind::kLocal && radio_timer_.pending());
}

void CompositeSubscriber::Wire(TransportKind kind) {
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

void CompositeSubscriber::StartSlot(TransportKind kind) {
  Slot& slot = SlotFor(kind);
  if (!running_ || !slot.transport || slot.started) {
    return;
  }
  if (kind == TransportKind::kLocal && !publisher_.empty()) {
    pfl::Log(pfl::Level::kDebug, kTag, "radio start skipped, subscribed");
    return;
  }
  pfl::Log(pfl::Level::kInfo, kTag, "starting transport",
           {{"kind", TransportKindName(kind)}});
  slot.started = true;
  slot.transport->Start([this, kind](const std::string& reason) {
    OnFailure(kind, reason);
  });
}

void CompositeSubscriber::OnControl(TransportKind kind,
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

void CompositeSubscriber::OnContent(TransportKind kind,
                                    const TransportRemote& remote,
                                    const core::ProtocolChunk& chunk) {
  auto client = remotes_.ClientOf(kind, RemoteId(remote));
  if (!client || *client != publisher_) {
    pfl::Log(pfl::Level::kDebug, kTag, "content from unsubscribed remote",
             {{"remote", RemoteId(remote)}});
    return;
  }
  if (callbacks_.on_content) {
    callbacks_.on_content(WithId(remote, *client), chunk);
  }
}

void CompositeSubscriber::OnLost(TransportKind kind,
                                 const TransportRemote& remote) {
  auto client = remotes_.ClientOf(kind, RemoteId(remote));
  if (!client) {
    return;
  }
  remotes_.Unbind(*client);
  if (publisher_ == *client) {
    publisher_.clear();
  }
  if (callbacks_.on_lost) {
    callbacks_.on_lost(WithId(remote, *client));
  }
}

void CompositeSubscriber::OnStatus(TransportKind kind,
                                   TransportStatus status) {
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

void CompositeSubscriber::OnFailure(TransportKind kind,
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

SubscribeTransport* CompositeSubscriber::Route(const char* op,
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
