#include <cassert>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "composite_publisher.h"
#include "composite_subscriber.h"
#include "config.h"
#include "conversation.h"
#include "diagnostics.h"
#include "event_queue.h"
#include "loopback_radio.h"
#include "network_monitor.h"
#include "protocol.h"
#include "transport_factory.h"

using whisper::core::Anomaly;
using whisper::core::ClientInfo;
using whisper::core::Conversation;
using whisper::core::Diagnostics;
using whisper::core::EventQueue;
using whisper::core::LocalIdentity;
using whisper::core::ProtocolChunk;
using namespace whisper::transport;
namespace core = whisper::core;

namespace {

Conversation Talk() {
  Conversation c;
  c.id = "12345678-9ABC-4DEF-8123-456789ABCDEF";
  c.name = "Talk";
  c.owner_profile_id = "PW";
  return c;
}

ProtocolChunk OfferFrom(const std::string& client_id) {
  return core::ListenOffer(core::MakeClientInfo(
      LocalIdentity{client_id, "P-" + client_id, client_id}, Talk()));
}

TransportRemote MakeRemote(TransportKind kind, const std::string& id) {
  if (kind == TransportKind::kLocal) {
    return LocalRemote{id, RemoteState{}};
  }
  return GlobalRemote{id, RemoteState{}};
}

// Shared state of the test doubles, kept outside so tests can inspect it
// after the composite takes ownership.
struct FakeState {
  TransportKind kind{TransportKind::kLocal};
  TransportStatus status{TransportStatus::kOn};
  TransportCallbacks callbacks;
  FailureCallback on_failure;
  bool running{false};
  int starts{0};
  int stops{0};
  std::vector<std::string> known;
  std::vector<std::string> recipients;
  std::vector<std::pair<std::string, ProtocolChunk>> sent_control;
  std::vector<std::vector<ProtocolChunk>> published;
  std::vector<std::string> authorized;
  std::vector<std::string> dropped;
  std::vector<std::string> subscribed;

  bool Knows(const std::string& id) const {
    for (const auto& k : known) {
      if (k == id) {
        return true;
      }
    }
    return false;
  }

  void Control(const std::string& id, const ProtocolChunk& chunk) {
    known.push_back(id);
    callbacks.on_control(MakeRemote(kind, id), chunk);
  }
  void Content(const std::string& id, const ProtocolChunk& chunk) {
    callbacks.on_content(MakeRemote(kind, id), chunk);
  }
  void Lost(const std::string& id) { callbacks.on_lost(MakeRemote(kind, id)); }
  void Status(TransportStatus next) {
    status = next;
    callbacks.on_status(next);
  }
  // A start failure: the path stops itself and reports.
  void Fail(const std::string& reason) {
    running = false;
    on_failure(reason);
  }
};

class FakePublisher final : public PublishTransport {
 public:
  explicit FakePublisher(FakeState& state) : s_(state) {}

  TransportKind kind() const override { return s_.kind; }
  TransportStatus status() const override { return s_.status; }
  void SetCallbacks(TransportCallbacks callbacks) override {
    s_.callbacks = std::move(callbacks);
  }
  bool running() const override { return s_.running; }
  void Start(FailureCallback on_failure) override {
    ++s_.starts;
    s_.running = true;
    s_.on_failure = std::move(on_failure);
  }
  void Stop() override {
    ++s_.stops;
    s_.running = false;
  }
  void GoToBackground() override {}
  void GoToForeground() override {}
  void Publish(const std::vector<ProtocolChunk>& chunks) override {
    s_.published.push_back(chunks);
  }
  bool SendContent(const std::string& id,
                   const std::vector<ProtocolChunk>&) override {
    return s_.Knows(id);
  }
  bool SendControl(const std::string& id, const ProtocolChunk& chunk) override {
    s_.sent_control.emplace_back(id, chunk);
    return s_.Knows(id);
  }
  bool Authorize(const std::string& id) override {
    s_.authorized.push_back(id);
    return s_.Knows(id);
  }
  bool Deauthorize(const std::string& id) override { return s_.Knows(id); }
  bool Drop(const std::string& id) override {
    s_.dropped.push_back(id);
    return s_.Knows(id);
  }
  std::optional<TransportRemote> FindRemote(
      const std::string& id) const override {
    if (!s_.Knows(id)) {
      return std::nullopt;
    }
    return MakeRemote(s_.kind, id);
  }
  std::vector<std::string> BroadcastRecipients() const override {
    return s_.recipients;
  }

 private:
  FakeState& s_;
};

class FakeSubscriber final : public SubscribeTransport {
 public:
  explicit FakeSubscriber(FakeState& state) : s_(state) {}

  TransportKind kind() const override { return s_.kind; }
  TransportStatus status() const override { return s_.status; }
  void SetCallbacks(TransportCallbacks callbacks) override {
    s_.callbacks = std::move(callbacks);
  }
  bool running() const override { return s_.running; }
  void Start(FailureCallback on_failure) override {
    ++s_.starts;
    s_.running = true;
    s_.on_failure = std::move(on_failure);
  }
  void Stop() override {
    ++s_.stops;
    s_.running = false;
  }
  void GoToBackground() override {}
  void GoToForeground() override {}
  bool Subscribe(const std::string& id, const Conversation&) override {
    s_.subscribed.push_back(id);
    return s_.Knows(id);
  }
  bool SendControl(const std::string& id, const ProtocolChunk& chunk) override {
    s_.sent_control.emplace_back(id, chunk);
    return s_.Knows(id);
  }
  bool Drop(const std::string& id) override {
    s_.dropped.push_back(id);
    return s_.Knows(id);
  }
  std::optional<TransportRemote> FindRemote(
      const std::string& id) const override {
    if (!s_.Knows(id)) {
      return std::nullopt;
    }
    return MakeRemote(s_.kind, id);
  }

 private:
  FakeState& s_;
};

struct Inbox {
  std::vector<std::pair<std::string, ProtocolChunk>> control;
  std::vector<std::pair<std::string, ProtocolChunk>> content;
  std::vector<std::string> lost;
  std::vector<TransportStatus> statuses;
  std::vector<std::string> failures;

  TransportCallbacks Callbacks() {
    TransportCallbacks cb;
    cb.on_control = [this](const TransportRemote& r, const ProtocolChunk& c) {
      control.emplace_back(RemoteId(r), c);
    };
    cb.on_content = [this](const TransportRemote& r, const ProtocolChunk& c) {
      content.emplace_back(RemoteId(r), c);
    };
    cb.on_lost = [this](const TransportRemote& r) {
      lost.push_back(RemoteId(r));
    };
    cb.on_status = [this](TransportStatus s) { statuses.push_back(s); };
    return cb;
  }
  FailureCallback Failure() {
    return [this](const std::string& reason) { failures.push_back(reason); };
  }
};

struct PublisherRig {
  std::uint64_t now{0};
  EventQueue queue{[this]() { return now; }};
  Diagnostics diagnostics;
  core::CompositeSection config;
  FakeState local;
  FakeState global;
  Inbox inbox;
  std::unique_ptr<CompositePublisher> composite;

  PublisherRig(TransportStatus local_status, TransportStatus global_status) {
    local.kind = TransportKind::kLocal;
    local.status = local_status;
    global.kind = TransportKind::kGlobal;
    global.status = global_status;
    composite = std::make_unique<CompositePublisher>(
        queue, diagnostics, config, std::make_unique<FakePublisher>(local),
        std::make_unique<FakePublisher>(global));
    composite->SetCallbacks(inbox.Callbacks());
  }

  void Advance(std::uint64_t ms) {
    now += ms;
    queue.RunPending();
  }
};

void StaggeredStart() {
  PublisherRig rig(TransportStatus::kOn, TransportStatus::kOn);
  assert(rig.composite->status() == TransportStatus::kOn);
  assert(rig.composite->kind() == TransportKind::kGlobal);
  rig.composite->Start(rig.inbox.Failure());
  assert(rig.global.starts == 1);
  assert(rig.local.starts == 0);
  assert(rig.composite->radio_start_pending());
  rig.Advance(999);
  assert(rig.local.starts == 0);
  rig.Advance(1);
  assert(rig.local.starts == 1);
  assert(rig.composite->started(TransportKind::kLocal));
  assert(rig.inbox.failures.empty());

  // Radio alone starts at once.
  PublisherRig radio_only(TransportStatus::kOn, TransportStatus::kOff);
  radio_only.composite->Start(radio_only.inbox.Failure());
  assert(radio_only.local.starts == 1);
  assert(radio_only.global.starts == 0);
  assert(!radio_only.composite->radio_start_pending());

  // Stop before the delay: the radio never starts.
  PublisherRig stopped(TransportStatus::kOn, TransportStatus::kOn);
  stopped.composite->Start(stopped.inbox.Failure());
  stopped.composite->Stop();
  stopped.Advance(5000);
  assert(stopped.local.starts == 0);
  assert(stopped.global.stops == 1);
}

void NothingAvailable() {
  PublisherRig rig(TransportStatus::kOff, TransportStatus::kDisabled);
  assert(rig.composite->status() == TransportStatus::kOff);
  rig.composite->Start(rig.inbox.Failure());
  assert(!rig.composite->running());
  assert(rig.inbox.failures.size() == 1);
  assert(rig.diagnostics.count(Anomaly::kNoTransportAvailable) == 1);
  assert(rig.local.starts == 0 && rig.global.starts == 0);

  Diagnostics diagnostics;
  EventQueue queue([]() { return std::uint64_t{0}; });
  CompositePublisher empty(queue, diagnostics, core::CompositeSection{},
                           nullptr, nullptr);
  assert(empty.status() == TransportStatus::kDisabled);
}

void DeduplicationAndRouting() {
  PublisherRig rig(TransportStatus::kOn, TransportStatus::kOn);
  rig.composite->Start(rig.inbox.Failure());
  rig.Advance(1000);

  // Control before any presence chunk identifies the sender is ignored.
  rig.global.Control("conn-9", core::ReplayRequest(core::ReadType::kAll));
  assert(rig.inbox.control.empty());
  assert(!rig.composite->FindRemote("conn-9"));

  // First seen over the radio: bound there under its client id.
  rig.local.Control("radio-dev-1", OfferFrom("X"));
  assert(rig.inbox.control.size() == 1);
  assert(rig.inbox.control[0].first == "X");
  auto x = rig.composite->FindRemote("X");
  assert(x && std::holds_alternative<LocalRemote>(*x));

  // The same client over the network is rejected, not fatal.
  rig.global.Control("X", OfferFrom("X"));
  assert(rig.inbox.control.size() == 1);
  assert(rig.global.dropped == std::vector<std::string>{"X"});
  assert(rig.diagnostics.count(Anomaly::kDuplicateRemote) == 1);
  assert(rig.inbox.failures.empty());
  x = rig.composite->FindRemote("X");
  assert(x && RemoteKind(*x) == TransportKind::kLocal);

  // Later control from the bound remote passes through under the client id.
  rig.local.Control("radio-dev-1", core::ReplayRequest(core::ReadType::kPast));
  assert(rig.inbox.control.size() == 2);
  assert(rig.inbox.control[1].first == "X");

  rig.global.Control("Y", OfferFrom("Y"));
  assert(rig.composite->FindRemote("Y").has_value());

  // Routing follows the binding.
  assert(rig.composite->SendControl("X", core::ClearHistory()));
  assert(rig.local.sent_control.size() == 1);
  assert(rig.local.sent_control[0].first == "radio-dev-1");
  assert(rig.composite->Authorize("Y"));
  assert(rig.global.authorized == std::vector<std::string>{"Y"});
  assert(rig.local.authorized.empty());

  rig.local.recipients = {"radio-dev-1", "radio-dev-unbound"};
  rig.global.recipients = {"Y"};
  assert((rig.composite->BroadcastRecipients() ==
          std::vector<std::string>{"X", "Y"}));
  rig.composite->Publish({ProtocolChunk{0, "hi"}});
  assert(rig.local.published.size() == 1);
  assert(rig.global.published.size() == 1);

  // Unknown ids.
  assert(!rig.composite->SendControl("radio-dev-1", core::ClearHistory()));
  assert(!rig.composite->Authorize("nobody"));
  assert(!rig.composite->Drop("nobody"));
  assert(!rig.composite->SendContent("nobody", {ProtocolChunk{0, "x"}}));
  assert(rig.diagnostics.count(Anomaly::kUnknownRemote) == 4);

  // Loss unbinds; the client may then come back over the other transport.
  rig.local.Lost("radio-dev-1");
  assert(rig.inbox.lost == std::vector<std::string>{"X"});
  assert(!rig.composite->FindRemote("X"));
  rig.global.Control("X", OfferFrom("X"));
  x = rig.composite->FindRemote("X");
  assert(x && std::holds_alternative<GlobalRemote>(*x));

  // Local drop routes and forgets.
  assert(rig.composite->Drop("Y"));
  assert(rig.global.dropped.back() == "Y");
  assert(!rig.composite->FindRemote("Y"));
  rig.global.Lost("Y");
  assert(rig.inbox.lost.size() == 1);

  rig.composite->Stop();
  assert(rig.local.stops == 1 && rig.global.stops == 1);
  assert(!rig.composite->FindRemote("X"));
}

void StatusAndFailures() {
  PublisherRig rig(TransportStatus::kOn, TransportStatus::kOn);
  rig.composite->Start(rig.inbox.Failure());
  rig.Advance(1000);

  // One path failing is survivable.
  rig.global.on_failure("Could not connect to the whisper relay");
  assert(rig.inbox.failures.empty());
  assert(rig.diagnostics.count(Anomaly::kTransportUnavailable) == 1);

  rig.global.Status(TransportStatus::kOff);
  assert(rig.inbox.failures.empty());
  assert(rig.diagnostics.count(Anomaly::kTransportUnavailable) == 2);
  assert(rig.inbox.statuses.back() == TransportStatus::kOn);

  // Losing the last one is not.
  rig.local.Status(TransportStatus::kOff);
  assert(rig.inbox.failures.size() == 1);
  assert(rig.diagnostics.count(Anomaly::kNoTransportAvailable) == 1);
  assert(rig.inbox.statuses.back() == TransportStatus::kOff);

  // A path that comes back while running is restarted.
  PublisherRig late(TransportStatus::kOn, TransportStatus::kOff);
  late.composite->Start(late.inbox.Failure());
  assert(late.global.starts == 0);
  late.global.Status(TransportStatus::kOn);
  assert(late.global.starts == 1);

  // A relay that was never reached does not count as a live path: losing
  // the radio afterwards is a total outage.
  PublisherRig unreachable(TransportStatus::kOn, TransportStatus::kOn);
  unreachable.composite->Start(unreachable.inbox.Failure());
  unreachable.Advance(1000);
  unreachable.global.Fail("Could not connect to the whisper relay");
  assert(unreachable.inbox.failures.empty());
  assert(!unreachable.composite->started(TransportKind::kGlobal));
  unreachable.local.Status(TransportStatus::kOff);
  assert(unreachable.inbox.failures.size() == 1);
  assert(unreachable.diagnostics.count(Anomaly::kNoTransportAvailable) == 1);

  // The failed path is started again once its status comes back on.
  unreachable.global.Status(TransportStatus::kOn);
  assert(unreachable.global.starts == 2);
  assert(unreachable.composite->started(TransportKind::kGlobal));
}

void Subscriber() {
  std::uint64_t now = 0;
  EventQueue queue([&now]() { return now; });
  Diagnostics diagnostics;
  FakeState local;
  local.kind = TransportKind::kLocal;
  FakeState global;
  global.kind = TransportKind::kGlobal;
  Inbox inbox;
  CompositeSubscriber composite(queue, diagnostics, core::CompositeSection{},
                                std::make_unique<FakeSubscriber>(local),
                                std::make_unique<FakeSubscriber>(global));
  composite.SetCallbacks(inbox.Callbacks());
  composite.Start(inbox.Failure());
  assert(global.starts == 1 && local.starts == 0);

  const auto auth_from = [](const std::string& client) {
    return core::ListenAuthYes(core::MakeClientInfo(
        LocalIdentity{client, "P-" + client, client}, Talk(), "K-" + client));
  };
  global.Control("W1", auth_from("W1"));
  now += 1000;
  queue.RunPending();
  assert(local.starts == 1);
  local.Control("periph-2", auth_from("W2"));
  local.Control("periph-3", auth_from("W1"));
  assert(diagnostics.count(Anomaly::kDuplicateRemote) == 1);
  assert(local.dropped == std::vector<std::string>{"periph-3"});
  assert((composite.RemoteIds() == std::vector<std::string>{"W1", "W2"}));

  // Content before a subscription is not delivered.
  global.Content("W1", ProtocolChunk{0, "early"});
  assert(inbox.content.empty());

  assert(!composite.Subscribe("W3", Talk()));
  assert(diagnostics.count(Anomaly::kUnknownRemote) == 1);
  assert(composite.Subscribe("W1", Talk()));
  assert(global.subscribed == std::vector<std::string>{"W1"});
  assert(composite.publisher_id() == "W1");
  assert(composite.kind() == TransportKind::kGlobal);
  // The radio candidate is dropped.
  assert((local.dropped == std::vector<std::string>{"periph-3", "periph-2"}));
  assert(composite.RemoteIds() == std::vector<std::string>{"W1"});

  global.Content("W1", ProtocolChunk{0, "hi"});
  local.Content("periph-2", ProtocolChunk{0, "stray"});
  assert(inbox.content.size() == 1);
  assert(inbox.content[0].first == "W1");

  assert(composite.SendControl("W1", core::ReplayRequest(core::ReadType::kAll)));
  assert(global.sent_control.size() == 1);

  global.Lost("W1");
  assert(inbox.lost == std::vector<std::string>{"W1"});
  assert(composite.publisher_id().empty());

  composite.Stop();
  assert(global.stops == 1 && local.stops == 1);

  // An unreachable relay followed by a lost radio leaves nothing to listen
  // on, which is reported.
  FakeState radio;
  radio.kind = TransportKind::kLocal;
  FakeState relay;
  relay.kind = TransportKind::kGlobal;
  Inbox outage;
  CompositeSubscriber stranded(queue, diagnostics, core::CompositeSection{},
                               std::make_unique<FakeSubscriber>(radio),
                               std::make_unique<FakeSubscriber>(relay));
  stranded.SetCallbacks(outage.Callbacks());
  stranded.Start(outage.Failure());
  now += 1000;
  queue.RunPending();
  assert(radio.starts == 1 && relay.starts == 1);
  relay.Fail("Could not connect to the whisper relay");
  assert(outage.failures.empty());
  assert(!stranded.started(TransportKind::kGlobal));
  radio.Status(TransportStatus::kOff);
  assert(outage.failures.size() == 1);
  stranded.Stop();
  assert(relay.stops == 0 && radio.stops == 1);
}

void Factory() {
  std::uint64_t now = 0;
  EventQueue queue([&now]() { return now; });
  LoopbackAir air(queue);
  auto radio = air.CreateRadio("device");
  Diagnostics diagnostics;
  core::ClientConfig config;
  config.identity = LocalIdentity{"C", "P", "Pat"};
  config.network.relay_host = "relay.example";
  config.network.relay_port = 7443;
  NetworkMonitor monitor(config.network, []() { return true; });

  TransportFactory factory(queue, diagnostics, config, radio.get(), &monitor);
  assert(factory.LocalStatus() == TransportStatus::kOn);
  assert(factory.GlobalStatus() == TransportStatus::kOn);
  assert(factory.MakeLocalPublisher(Talk()));
  assert(factory.MakeGlobalPublisher(Talk(), "K"));
  // Network listening needs a conversation.
  assert(!factory.MakeGlobalSubscriber(std::nullopt));
  assert(factory.MakeGlobalSubscriber(Talk()));
  auto publisher = factory.MakePublisher(Talk(), "K");
  assert(publisher->transport(TransportKind::kLocal) != nullptr);
  assert(publisher->transport(TransportKind::kGlobal) != nullptr);
  auto open = factory.MakeSubscriber(std::nullopt);
  assert(open->transport(TransportKind::kLocal) != nullptr);
  assert(open->transport(TransportKind::kGlobal) == nullptr);

  core::ClientConfig radio_off = config;
  radio_off.radio.enable = false;
  TransportFactory no_radio(queue, diagnostics, radio_off, radio.get(),
                            &monitor);
  assert(no_radio.LocalStatus() == TransportStatus::kDisabled);
  assert(!no_radio.MakeLocalSubscriber(Talk()));

  TransportFactory bare(queue, diagnostics, config, nullptr, nullptr);
  auto nothing = bare.MakePublisher(Talk(), "K");
  assert(nothing->status() == TransportStatus::kDisabled);
  Inbox inbox;
  nothing->Start(inbox.Failure());
  assert(inbox.failures.size() == 1);
}

}  // namespace

int main() {
  StaggeredStart();
  NothingAvailable();
  DeduplicationAndRouting();
  StatusAndFailures();
  Subscriber();
  Factory();
  return 0;
}
