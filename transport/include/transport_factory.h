#ifndef WHISPER_TRANSPORT_TRANSPORT_FACTORY_H
#define WHISPER_TRANSPORT_TRANSPORT_FACTORY_H

#include <memory>
#include <optional>
#include <string>

#include "composite_publisher.h"
#include "composite_subscriber.h"
#include "config.h"
#include "conversation.h"
#include "diagnostics.h"
#include "event_queue.h"
#include "network_monitor.h"
#include "radio_gatt.h"
#include "transport.h"

namespace whisper::transport {

// Builds the transports of one session. Made once at session start and
// handed by reference to whoever needs a transport; it must outlive them.
class TransportFactory {
 public:
  // `radio` and `monitor` may be null when the device has no such path.
  TransportFactory(core::EventQueue& queue, core::Diagnostics& diagnostics,
                   const core::ClientConfig& config, RadioAdapter* radio,
                   const NetworkMonitor* monitor);

  TransportFactory(const TransportFactory&) = delete;
  TransportFactory& operator=(const TransportFactory&) = delete;

  TransportStatus LocalStatus() const;
  TransportStatus GlobalStatus() const;

  // Null when the path is absent or disabled by configuration.
  std::unique_ptr<PublishTransport> MakeLocalPublisher(
      const core::Conversation& conversation) const;
  std::unique_ptr<PublishTransport> MakeGlobalPublisher(
      const core::Conversation& conversation,
      const std::string& content_id) const;
  std::unique_ptr<SubscribeTransport> MakeLocalSubscriber(
      const std::optional<core::Conversation>& target) const;
  std::unique_ptr<SubscribeTransport> MakeGlobalSubscriber(
      const std::optional<core::Conversation>& target) const;

  std::unique_ptr<CompositePublisher> MakePublisher(
      const core::Conversation& conversation,
      const std::string& content_id) const;
  std::unique_ptr<CompositeSubscriber> MakeSubscriber(
      const std::optional<core::Conversation>& target) const;

  core::EventQueue& queue() const { return queue_; }
  core::Diagnostics& diagnostics() const { return diagnostics_; }
  const core::ClientConfig& config() const { return config_; }

 private:
  core::EventQueue& queue_;
  core::Diagnostics& diagnostics_;
  core::ClientConfig config_;
  RadioAdapter* radio_;
  const NetworkMonitor* monitor_;
};

}  // namespace whisper::transport

#endif  // WHISPER_TRANSPORT_TRANSPORT_FACTORY_H
