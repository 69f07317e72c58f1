#ifndef WHISPER_TRANSPORT_RADIO_GATT_H
#define WHISPER_TRANSPORT_RADIO_GATT_H

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "transport.h"

namespace whisper::transport {

// Published by the whisperer (peripheral role).
constexpr std::string_view kWhisperServiceUuid =
    "2583870B-59EB-4526-9ADE-CD037E24DE17";
// Advertised by listeners looking for a whisperer.
constexpr std::string_view kListenServiceUuid =
    "1A4DCFF2-A3E8-47E7-BC16-99C8AFD05934";

enum class Characteristic : std::uint8_t {
  kContentOut = 0,  // notify
  kContentIn = 1,   // unused
  kControlOut = 2,  // notify
  kControlIn = 3    // write, write without response
};

std::string_view CharacteristicUuid(Characteristic characteristic);
const char* CharacteristicName(Characteristic characteristic);

enum class AttStatus : std::uint8_t {
  kSuccess = 0,
  kInvalidOffset,
  kRequestNotSupported,
  kAttributeNotFound,
  kUnlikelyError
};

struct Advertisement {
  std::string peer_id;
  std::string service_uuid;
  std::string local_name;
};

struct WriteRequest {
  std::uint64_t request_id{0};
  std::string central_id;
  Characteristic characteristic{Characteristic::kControlIn};
  std::vector<std::uint8_t> value;
  bool with_response{true};
};

// Events from the platform radio stack. All of them are delivered on the
// session event queue.
class RadioObserver {
 public:
  virtual ~RadioObserver() = default;

  virtual void OnRadioStatus(TransportStatus /*status*/) {}
  virtual void OnAdvertisement(const Advertisement& /*ad*/) {}

  // Peripheral role.
  virtual void OnCentralSubscribed(const std::string& /*central_id*/,
                                   Characteristic /*characteristic*/) {}
  virtual void OnCentralUnsubscribed(const std::string& /*central_id*/,
                                     Characteristic /*characteristic*/) {}
  virtual void OnWriteRequests(
      const std::vector<WriteRequest>& /*requests*/) {}
  virtual void OnReadyToUpdate() {}

  // Central role. An empty error means success or a requested disconnect.
  virtual void OnConnected(const std::string& /*peripheral_id*/) {}
  virtual void OnConnectFailed(const std::string& /*peripheral_id*/,
                               const std::string& /*error*/) {}
  virtual void OnDisconnected(const std::string& /*peripheral_id*/,
                              const std::string& /*error*/) {}
  virtual void OnServicesDiscovered(const std::string& /*peripheral_id*/,
                                    bool /*found*/,
                                    const std::string& /*error*/) {}
  virtual void OnCharacteristicsDiscovered(
      const std::string& /*peripheral_id*/, const std::string& /*error*/) {}
  virtual void OnNotifyStateChanged(const std::string& /*peripheral_id*/,
                                    Characteristic /*characteristic*/,
                                    bool /*enabled*/,
                                    const std::string& /*error*/) {}
  virtual void OnValueUpdated(const std::string& /*peripheral_id*/,
                              Characteristic /*characteristic*/,
                              const std::vector<std::uint8_t>& /*value*/) {}
  virtual void OnWriteCompleted(const std::string& /*peripheral_id*/,
                                Characteristic /*characteristic*/,
                                const std::string& /*error*/) {}
};

// Host radio stack, both roles. Calls are non-blocking; outcomes arrive on
// the observers.
class RadioAdapter {
 public:
  virtual ~RadioAdapter() = default;

  virtual std::string device_id() const = 0;
  virtual TransportStatus status() const = 0;
  virtual void AddObserver(RadioObserver* observer) = 0;
  virtual void RemoveObserver(RadioObserver* observer) = 0;

  virtual void StartScan(std::string_view service_uuid) = 0;
  virtual void StopScan() = 0;
  virtual void StartAdvertising(std::string_view service_uuid,
                                std::string_view local_name) = 0;
  virtual void StopAdvertising() = 0;

  // Peripheral role.
  virtual bool PublishService(std::string_view service_uuid) = 0;
  virtual void UnpublishService(std::string_view service_uuid) = 0;
  // False when the transmit queue is full; OnReadyToUpdate follows.
  virtual bool NotifyAll(Characteristic characteristic,
                         const std::vector<std::uint8_t>& value) = 0;
  virtual bool NotifyCentrals(Characteristic characteristic,
                              const std::vector<std::uint8_t>& value,
                              const std::vector<std::string>& centrals) = 0;
  virtual void RespondToWrite(std::uint64_t request_id, AttStatus status) = 0;

  // Central role.
  virtual void Connect(const std::string& peripheral_id) = 0;
  virtual void Disconnect(const std::string& peripheral_id) = 0;
  virtual void DiscoverServices(const std::string& peripheral_id,
                                std::string_view service_uuid) = 0;
  virtual void DiscoverCharacteristics(const std::string& peripheral_id) = 0;
  virtual void SetNotify(const std::string& peripheral_id,
                         Characteristic characteristic, bool enable) = 0;
  virtual void Write(const std::string& peripheral_id,
                     Characteristic characteristic,
                     const std::vector<std::uint8_t>& value,
                     bool with_response) = 0;
};

}  // namespace whisper::transport

#endif  // WHISPER_TRANSPORT_RADIO_GATT_H
