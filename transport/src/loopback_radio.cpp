#include "loopback_radio.h"

#include <algorithm>
#include <utility>

#include "platform_log.h"

namespace whisper::transport {

namespace pfl = whisper::platform::log;

namespace {

bool IsNotifyCharacteristic(Characteristic characteristic) {
  return characteristic == Characteristic::kContentOut ||
         characteristic == Characteristic::kControlOut;
}

const char* AttStatusText(AttStatus status) {
  switch (status) {
    case AttStatus::kSuccess:
      return "success";
    case AttStatus::kInvalidOffset:
      return "invalid offset";
    case AttStatus::kRequestNotSupported:
      return "request not supported";
    case AttStatus::kAttributeNotFound:
      return "attribute not found";
    case AttStatus::kUnlikelyError:
      return "unlikely error";
  }
  return "unlikely error";
}

}  // namespace

LoopbackAir::LoopbackAir(core::EventQueue& queue) : queue_(queue) {}

LoopbackAir::~LoopbackAir() = default;

std::unique_ptr<LoopbackRadio> LoopbackAir::CreateRadio(
    const std::string& device_id) {
  return std::make_unique<LoopbackRadio>(*this, device_id);
}

void LoopbackAir::Attach(LoopbackRadio* radio) {
  radios_[radio->device_id_] = radio;
}

void LoopbackAir::Detach(LoopbackRadio* radio) {
  const auto it = radios_.find(radio->device_id_);
  if (it != radios_.end() && it->second == radio) {
    radios_.erase(it);
  }
}

LoopbackRadio* LoopbackAir::Find(const std::string& device_id) const {
  const auto it = radios_.find(device_id);
  return it == radios_.end() ? nullptr : it->second;
}

LoopbackRadio::LoopbackRadio(LoopbackAir& air, std::string device_id)
    : air_(air),
      device_id_(std::move(device_id)),
      alive_(std::make_shared<bool>(true)) {
  air_.Attach(this);
}

LoopbackRadio::~LoopbackRadio() {
  DropLinks("device destroyed");
  air_.Detach(this);
}

void LoopbackRadio::AddObserver(RadioObserver* observer) {
  if (observer &&
      std::find(observers_.begin(), observers_.end(), observer) ==
          observers_.end()) {
    observers_.push_back(observer);
  }
}

void LoopbackRadio::RemoveObserver(RadioObserver* observer) {
  observers_.erase(std::remove(observers_.begin(), observers_.end(), observer),
                   observers_.end());
}

void LoopbackRadio::Emit(std::function<void(RadioObserver&)> event) {
  std::weak_ptr<bool> alive = alive_;
  air_.queue_.Post([this, alive, event = std::move(event)]() {
    if (alive.expired()) {
      return;
    }
    const std::vector<RadioObserver*> snapshot = observers_;
    for (RadioObserver* observer : snapshot) {
      if (alive.expired()) {
        return;
      }
      if (std::find(observers_.begin(), observers_.end(), observer) ==
          observers_.end()) {
        continue;
      }
      event(*observer);
    }
  });
}

void LoopbackRadio::StartScan(std::string_view service_uuid) {
  if (status_ != TransportStatus::kOn) {
    return;
  }
  scanning_ = std::string(service_uuid);
  for (const auto& entry : air_.radios_) {
    LoopbackRadio* other = entry.second;
    if (other == this || !other->advertising_ ||
        other->advertising_->service_uuid != *scanning_) {
      continue;
    }
    Advertisement ad{other->device_id_, other->advertising_->service_uuid,
                     other->advertising_->local_name};
    Emit([ad](RadioObserver& o) { o.OnAdvertisement(ad); });
  }
}

void LoopbackRadio::StopScan() {
  scanning_.reset();
}

void LoopbackRadio::StartAdvertising(std::string_view service_uuid,
                                     std::string_view local_name) {
  if (status_ != TransportStatus::kOn) {
    return;
  }
  advertising_ = Advertising{std::string(service_uuid), std::string(local_name)};
  ++advertise_starts_;
  const Advertisement ad{device_id_, advertising_->service_uuid,
                         advertising_->local_name};
  for (const auto& entry : air_.radios_) {
    LoopbackRadio* other = entry.second;
    if (other == this || !other->scanning_ ||
        *other->scanning_ != ad.service_uuid) {
      continue;
    }
    other->Emit([ad](RadioObserver& o) { o.OnAdvertisement(ad); });
  }
}

void LoopbackRadio::StopAdvertising() {
  advertising_.reset();
}

std::string LoopbackRadio::advertised_name() const {
  return advertising_ ? advertising_->local_name : std::string();
}

bool LoopbackRadio::PublishService(std::string_view service_uuid) {
  if (status_ != TransportStatus::kOn) {
    return false;
  }
  published_.insert(std::string(service_uuid));
  return true;
}

void LoopbackRadio::UnpublishService(std::string_view service_uuid) {
  published_.erase(std::string(service_uuid));
  if (!published_.empty()) {
    return;
  }
  const std::set<std::string> centrals = connected_centrals_;
  for (const auto& central_id : centrals) {
    ReleaseCentral(central_id);
    LoopbackRadio* central = air_.Find(central_id);
    if (central) {
      central->connected_peripherals_.erase(device_id_);
      const std::string me = device_id_;
      central->Emit([me](RadioObserver& o) {
        o.OnDisconnected(me, "service unpublished");
      });
    }
  }
}

bool LoopbackRadio::service_published(std::string_view service_uuid) const {
  return published_.count(std::string(service_uuid)) != 0;
}

bool LoopbackRadio::IsSubscribed(const std::string& central_id,
                                 Characteristic characteristic) const {
  const auto it = subscriptions_.find(central_id);
  return it != subscriptions_.end() && it->second.count(characteristic) != 0;
}

bool LoopbackRadio::NotifyAll(Characteristic characteristic,
                              const std::vector<std::uint8_t>& value) {
  std::vector<std::string> recipients;
  for (const auto& entry : subscriptions_) {
    if (entry.second.count(characteristic) != 0) {
      recipients.push_back(entry.first);
    }
  }
  return Deliver(characteristic, value, recipients);
}

bool LoopbackRadio::NotifyCentrals(Characteristic characteristic,
                                   const std::vector<std::uint8_t>& value,
                                   const std::vector<std::string>& centrals) {
  std::vector<std::string> recipients;
  for (const auto& central_id : centrals) {
    if (IsSubscribed(central_id, characteristic)) {
      recipients.push_back(central_id);
    }
  }
  return Deliver(characteristic, value, recipients);
}

bool LoopbackRadio::Deliver(Characteristic characteristic,
                            const std::vector<std::uint8_t>& value,
                            const std::vector<std::string>& recipients) {
  if (notify_budget_) {
    if (*notify_budget_ == 0) {
      wants_ready_ = true;
      return false;
    }
    --*notify_budget_;
  }
  sent_.push_back(SentNotification{characteristic, value, recipients});
  const std::string me = device_id_;
  for (const auto& central_id : recipients) {
    LoopbackRadio* central = air_.Find(central_id);
    if (!central) {
      continue;
    }
    central->Emit([me, characteristic, value](RadioObserver& o) {
      o.OnValueUpdated(me, characteristic, value);
    });
  }
  return true;
}

void LoopbackRadio::RespondToWrite(std::uint64_t request_id, AttStatus status) {
  const auto it = pending_writes_.find(request_id);
  if (it == pending_writes_.end()) {
    return;
  }
  const PendingWrite pending = it->second;
  pending_writes_.erase(it);
  if (!pending.with_response) {
    return;
  }
  LoopbackRadio* central = air_.Find(pending.central_id);
  if (!central) {
    return;
  }
  const std::string me = device_id_;
  const std::string error =
      status == AttStatus::kSuccess
          ? std::string()
          : std::string("att error: ") + AttStatusText(status);
  central->Emit([me, pending, error](RadioObserver& o) {
    o.OnWriteCompleted(me, pending.characteristic, error);
  });
}

bool LoopbackRadio::IsConnectedTo(const std::string& peripheral_id) const {
  return connected_peripherals_.count(peripheral_id) != 0;
}

void LoopbackRadio::Connect(const std::string& peripheral_id) {
  LoopbackRadio* target = air_.Find(peripheral_id);
  std::string error;
  if (!fail_connect_.empty()) {
    error = std::move(fail_connect_);
    fail_connect_.clear();
  } else if (status_ != TransportStatus::kOn) {
    error = "radio not on";
  } else if (!target || target->status_ != TransportStatus::kOn ||
             target->published_.empty()) {
    error = "peripheral unreachable";
  }
  if (!error.empty()) {
    Emit([peripheral_id, error](RadioObserver& o) {
      o.OnConnectFailed(peripheral_id, error);
    });
    return;
  }
  connected_peripherals_.insert(peripheral_id);
  target->connected_centrals_.insert(device_id_);
  Emit([peripheral_id](RadioObserver& o) { o.OnConnected(peripheral_id); });
}

void LoopbackRadio::Disconnect(const std::string& peripheral_id) {
  if (!IsConnectedTo(peripheral_id)) {
    return;
  }
  connected_peripherals_.erase(peripheral_id);
  LoopbackRadio* target = air_.Find(peripheral_id);
  if (target) {
    target->ReleaseCentral(device_id_);
  }
  Emit([peripheral_id](RadioObserver& o) {
    o.OnDisconnected(peripheral_id, std::string());
  });
}

void LoopbackRadio::ReleaseCentral(const std::string& central_id) {
  connected_centrals_.erase(central_id);
  const auto it = subscriptions_.find(central_id);
  if (it == subscriptions_.end()) {
    return;
  }
  const std::set<Characteristic> characteristics = it->second;
  subscriptions_.erase(it);
  for (const Characteristic characteristic : characteristics) {
    Emit([central_id, characteristic](RadioObserver& o) {
      o.OnCentralUnsubscribed(central_id, characteristic);
    });
  }
}

void LoopbackRadio::DiscoverServices(const std::string& peripheral_id,
                                     std::string_view service_uuid) {
  LoopbackRadio* target = air_.Find(peripheral_id);
  if (!IsConnectedTo(peripheral_id) || !target) {
    Emit([peripheral_id](RadioObserver& o) {
      o.OnServicesDiscovered(peripheral_id, false, "not connected");
    });
    return;
  }
  const bool found = target->service_published(service_uuid);
  Emit([peripheral_id, found](RadioObserver& o) {
    o.OnServicesDiscovered(peripheral_id, found, std::string());
  });
}

void LoopbackRadio::DiscoverCharacteristics(const std::string& peripheral_id) {
  const std::string error =
      IsConnectedTo(peripheral_id) ? std::string() : "not connected";
  Emit([peripheral_id, error](RadioObserver& o) {
    o.OnCharacteristicsDiscovered(peripheral_id, error);
  });
}

void LoopbackRadio::SetNotify(const std::string& peripheral_id,
                              Characteristic characteristic, bool enable) {
  LoopbackRadio* target = air_.Find(peripheral_id);
  std::string error;
  if (!IsConnectedTo(peripheral_id) || !target) {
    error = "not connected";
  } else if (!IsNotifyCharacteristic(characteristic)) {
    error = "notify not supported";
  } else if (enable && !fail_subscribe_.empty()) {
    error = std::move(fail_subscribe_);
    fail_subscribe_.clear();
  }
  if (error.empty()) {
    auto& subs = target->subscriptions_[device_id_];
    const bool changed = enable ? subs.insert(characteristic).second
                                : subs.erase(characteristic) != 0;
    if (subs.empty()) {
      target->subscriptions_.erase(device_id_);
    }
    if (changed) {
      const std::string me = device_id_;
      target->Emit([me, characteristic, enable](RadioObserver& o) {
        if (enable) {
          o.OnCentralSubscribed(me, characteristic);
        } else {
          o.OnCentralUnsubscribed(me, characteristic);
        }
      });
    }
  }
  Emit([peripheral_id, characteristic, enable, error](RadioObserver& o) {
    o.OnNotifyStateChanged(peripheral_id, characteristic, enable, error);
  });
}

void LoopbackRadio::Write(const std::string& peripheral_id,
                          Characteristic characteristic,
                          const std::vector<std::uint8_t>& value,
                          bool with_response) {
  LoopbackRadio* target = air_.Find(peripheral_id);
  std::string error;
  if (!IsConnectedTo(peripheral_id) || !target) {
    error = "not connected";
  } else if (!fail_write_.empty()) {
    error = std::move(fail_write_);
    fail_write_.clear();
  }
  if (!error.empty()) {
    Emit([peripheral_id, characteristic, error](RadioObserver& o) {
      o.OnWriteCompleted(peripheral_id, characteristic, error);
    });
    return;
  }
  WriteRequest request;
  request.request_id = air_.NextRequestId();
  request.central_id = device_id_;
  request.characteristic = characteristic;
  request.value = value;
  request.with_response = with_response;
  target->pending_writes_[request.request_id] =
      PendingWrite{device_id_, characteristic, with_response};
  target->Emit([request](RadioObserver& o) {
    o.OnWriteRequests(std::vector<WriteRequest>{request});
  });
}

void LoopbackRadio::DropLinks(const std::string& reason) {
  const std::string me = device_id_;
  // As peripheral: centrals lose the connection and we lose their
  // subscriptions.
  const std::set<std::string> centrals = connected_centrals_;
  for (const auto& central_id : centrals) {
    ReleaseCentral(central_id);
    LoopbackRadio* central = air_.Find(central_id);
    if (central && central->connected_peripherals_.erase(me) != 0) {
      central->Emit([me, reason](RadioObserver& o) {
        o.OnDisconnected(me, reason);
      });
    }
  }
  pending_writes_.clear();
  // As central: peripherals see our subscriptions go away.
  const std::set<std::string> peripherals = connected_peripherals_;
  connected_peripherals_.clear();
  for (const auto& peripheral_id : peripherals) {
    LoopbackRadio* peripheral = air_.Find(peripheral_id);
    if (peripheral) {
      peripheral->ReleaseCentral(me);
    }
    Emit([peripheral_id, reason](RadioObserver& o) {
      o.OnDisconnected(peripheral_id, reason);
    });
  }
}

void LoopbackRadio::SetStatus(TransportStatus status) {
  if (status_ == status) {
    return;
  }
  status_ = status;
  pfl::Log(pfl::Level::kDebug, "loopback_radio", "status changed",
           {{"device", device_id_}, {"status", TransportStatusName(status)}});
  if (status != TransportStatus::kOn) {
    scanning_.reset();
    advertising_.reset();
    DropLinks("radio powered off");
  }
  Emit([status](RadioObserver& o) { o.OnRadioStatus(status); });
}

void LoopbackRadio::Vanish() {
  scanning_.reset();
  advertising_.reset();
  DropLinks("connection timed out");
}

void LoopbackRadio::SetNotifyBudget(std::optional<std::size_t> budget) {
  notify_budget_ = budget;
}

void LoopbackRadio::ReplenishNotifyBudget(std::size_t count) {
  if (!notify_budget_) {
    return;
  }
  *notify_budget_ += count;
  if (wants_ready_ && *notify_budget_ > 0) {
    wants_ready_ = false;
    Emit([](RadioObserver& o) { o.OnReadyToUpdate(); });
  }
}

void LoopbackRadio::FailNextConnect(std::string error) {
  fail_connect_ = std::move(error);
}

void LoopbackRadio::FailNextSubscribe(std::string error) {
  fail_subscribe_ = std::move(error);
}

void LoopbackRadio::FailNextWrite(std::string error) {
  fail_write_ = std::move(error);
}

}  // namespace whisper::transport
