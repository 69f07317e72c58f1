#include "transport_factory.h"

#include "net_publisher.h"
#include "net_subscriber.h"
#include "platform_log.h"
#include "radio_publisher.h"
#include "radio_subscriber.h"

namespace whisper::transport {

namespace pfl = whisper::platform::log;

namespace {

constexpr const char* kTag = "factory";

}  // namespace

TransportFactory::TransportFactory(core::EventQueue& queue,
                                   core::Diagnostics& diagnostics,
                                   const core::ClientConfig& config,
                                   RadioAdapter* radio,
                                   const NetworkMonitor* monitor)
    : queue_(queue),
      diagnostics_(diagnostics),
      config_(config),
      radio_(radio),
      monitor_(monitor) {}

TransportStatus TransportFactory::LocalStatus() const {
  if (radio_ == nullptr || !config_.radio.enable) {
    return TransportStatus::kDisabled;
  }
  return radio_->status();
}

TransportStatus TransportFactory::GlobalStatus() const {
  if (monitor_ == nullptr) {
    return TransportStatus::kDisabled;
  }
  return monitor_->status();
}

std::unique_ptr<PublishTransport> TransportFactory::MakeLocalPublisher(
    const core::Conversation& conversation) const {
  if (LocalStatus() == TransportStatus::kDisabled) {
    return nullptr;
  }
  return std::make_unique<RadioPublisher>(queue_, *radio_, diagnostics_,
                                          config_.radio, config_.identity,
                                          conversation);
}

std::unique_ptr<PublishTransport> TransportFactory::MakeGlobalPublisher(
    const core::Conversation& conversation,
    const std::string& content_id) const {
  if (GlobalStatus() == TransportStatus::kDisabled) {
    return nullptr;
  }
  return std::make_unique<NetPublisher>(queue_, *monitor_, diagnostics_,
                                        config_.network, config_.identity,
                                        conversation, content_id);
}

std::unique_ptr<SubscribeTransport> TransportFactory::MakeLocalSubscriber(
    const std::optional<core::Conversation>& target) const {
  if (LocalStatus() == TransportStatus::kDisabled) {
    return nullptr;
  }
  return std::make_unique<RadioSubscriber>(queue_, *radio_, diagnostics_,
                                           config_.radio, config_.identity,
                                           target);
}

std::unique_ptr<SubscribeTransport> TransportFactory::MakeGlobalSubscriber(
    const std::optional<core::Conversation>& target) const {
  // The relay channels are named after the conversation.
  if (GlobalStatus() == TransportStatus::kDisabled || !target) {
    return nullptr;
  }
  return std::make_unique<NetSubscriber>(queue_, *monitor_, diagnostics_,
                                         config_.network, config_.identity,
                                         target);
}

std::unique_ptr<CompositePublisher> TransportFactory::MakePublisher(
    const core::Conversation& conversation,
    const std::string& content_id) const {
  pfl::Log(pfl::Level::kDebug, kTag, "publisher",
           {{"radio", TransportStatusName(LocalStatus())},
            {"network", TransportStatusName(GlobalStatus())}});
  return std::make_unique<CompositePublisher>(
      queue_, diagnostics_, config_.composite,
      MakeLocalPublisher(conversation),
      MakeGlobalPublisher(conversation, content_id));
}

std::unique_ptr<CompositeSubscriber> TransportFactory::MakeSubscriber(
    const std::optional<core::Conversation>& target) const {
  pfl::Log(pfl::Level::kDebug, kTag, "subscriber",
           {{"radio", TransportStatusName(LocalStatus())},
            {"network", TransportStatusName(GlobalStatus())}});
  return std::make_unique<CompositeSubscriber>(
      queue_, diagnostics_, config_.composite, MakeLocalSubscriber(target),
      MakeGlobalSubscriber(target));
}

}  // namespace whisper::transport
