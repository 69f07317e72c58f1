#ifndef WHISPER_TRANSPORT_LOOPBACK_RADIO_H
#define WHISPER_TRANSPORT_LOOPBACK_RADIO_H

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "event_queue.h"
#include "radio_gatt.h"

namespace whisper::transport {

class LoopbackRadio;

// In-process radio medium. Devices attached to the same air see each other's
// advertisements and can connect; every event is posted to the queue.
class LoopbackAir {
 public:
  explicit LoopbackAir(core::EventQueue& queue);
  ~LoopbackAir();

  LoopbackAir(const LoopbackAir&) = delete;
  LoopbackAir& operator=(const LoopbackAir&) = delete;

  std::unique_ptr<LoopbackRadio> CreateRadio(const std::string& device_id);

 private:
  friend class LoopbackRadio;

  void Attach(LoopbackRadio* radio);
  void Detach(LoopbackRadio* radio);
  LoopbackRadio* Find(const std::string& device_id) const;
  std::uint64_t NextRequestId() { return ++next_request_id_; }

  core::EventQueue& queue_;
  std::map<std::string, LoopbackRadio*> radios_;
  std::uint64_t next_request_id_{0};
};

class LoopbackRadio final : public RadioAdapter {
 public:
  struct SentNotification {
    Characteristic characteristic{Characteristic::kContentOut};
    std::vector<std::uint8_t> value;
    std::vector<std::string> recipients;
  };

  LoopbackRadio(LoopbackAir& air, std::string device_id);
  ~LoopbackRadio() override;

  std::string device_id() const override { return device_id_; }
  TransportStatus status() const override { return status_; }
  void AddObserver(RadioObserver* observer) override;
  void RemoveObserver(RadioObserver* observer) override;

  void StartScan(std::string_view service_uuid) override;
  void StopScan() override;
  void StartAdvertising(std::string_view service_uuid,
                        std::string_view local_name) override;
  void StopAdvertising() override;

  bool PublishService(std::string_view service_uuid) override;
  void UnpublishService(std::string_view service_uuid) override;
  bool NotifyAll(Characteristic characteristic,
                 const std::vector<std::uint8_t>& value) override;
  bool NotifyCentrals(Characteristic characteristic,
                      const std::vector<std::uint8_t>& value,
                      const std::vector<std::string>& centrals) override;
  void RespondToWrite(std::uint64_t request_id, AttStatus status) override;

  void Connect(const std::string& peripheral_id) override;
  void Disconnect(const std::string& peripheral_id) override;
  void DiscoverServices(const std::string& peripheral_id,
                        std::string_view service_uuid) override;
  void DiscoverCharacteristics(const std::string& peripheral_id) override;
  void SetNotify(const std::string& peripheral_id,
                 Characteristic characteristic, bool enable) override;
  void Write(const std::string& peripheral_id, Characteristic characteristic,
             const std::vector<std::uint8_t>& value,
             bool with_response) override;

  // Test controls.
  void SetStatus(TransportStatus status);
  // Severs every link as if the device left radio range.
  void Vanish();
  // nullopt means unlimited. A refused notify raises OnReadyToUpdate once
  // budget is replenished.
  void SetNotifyBudget(std::optional<std::size_t> budget);
  void ReplenishNotifyBudget(std::size_t count);
  void FailNextConnect(std::string error);
  void FailNextSubscribe(std::string error);
  void FailNextWrite(std::string error);

  bool advertising() const { return advertising_.has_value(); }
  std::string advertised_name() const;
  bool scanning() const { return scanning_.has_value(); }
  bool service_published(std::string_view service_uuid) const;
  bool IsSubscribed(const std::string& central_id,
                    Characteristic characteristic) const;
  std::size_t advertise_starts() const { return advertise_starts_; }
  const std::vector<SentNotification>& sent() const { return sent_; }
  void ClearSent() { sent_.clear(); }

 private:
  friend class LoopbackAir;

  struct Advertising {
    std::string service_uuid;
    std::string local_name;
  };

  struct PendingWrite {
    std::string central_id;
    Characteristic characteristic{Characteristic::kControlIn};
    bool with_response{true};
  };

  void Emit(std::function<void(RadioObserver&)> event);
  bool Deliver(Characteristic characteristic,
               const std::vector<std::uint8_t>& value,
               const std::vector<std::string>& recipients);
  void DropLinks(const std::string& reason);
  void ReleaseCentral(const std::string& central_id);
  bool IsConnectedTo(const std::string& peripheral_id) const;

  LoopbackAir& air_;
  std::string device_id_;
  std::shared_ptr<bool> alive_;
  TransportStatus status_{TransportStatus::kOn};
  std::vector<RadioObserver*> observers_;

  std::optional<std::string> scanning_;
  std::optional<Advertising> advertising_;
  std::size_t advertise_starts_{0};

  // Peripheral role.
  std::set<std::string> published_;
  std::set<std::string> connected_centrals_;
  std::map<std::string, std::set<Characteristic>> subscriptions_;
  std::map<std::uint64_t, PendingWrite> pending_writes_;
  std::optional<std::size_t> notify_budget_;
  bool wants_ready_{false};
  std::vector<SentNotification> sent_;

  // Central role.
  std::set<std::string> connected_peripherals_;

  std::string fail_connect_;
  std::string fail_subscribe_;
  std::string fail_write_;
};

}  // namespace whisper::transport

#endif  // WHISPER_TRANSPORT_LOOPBACK_RADIO_H
