#include <cassert>
#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "config.h"
#include "conversation.h"
#include "diagnostics.h"
#include "event_queue.h"
#include "loopback_radio.h"
#include "protocol.h"
#include "radio_publisher.h"

using whisper::core::Anomaly;
using whisper::core::ControlOffset;
using whisper::core::Conversation;
using whisper::core::Diagnostics;
using whisper::core::EventQueue;
using whisper::core::LocalIdentity;
using whisper::core::ProtocolChunk;
using whisper::core::RadioSection;
using whisper::transport::Characteristic;
using whisper::transport::kListenServiceUuid;
using whisper::transport::kWhisperServiceUuid;
using whisper::transport::LoopbackAir;
using whisper::transport::LoopbackRadio;
using whisper::transport::RadioObserver;
using whisper::transport::RadioPublisher;
using whisper::transport::RemoteId;
using whisper::transport::StateOf;
using whisper::transport::TransportCallbacks;
using whisper::transport::TransportRemote;
using whisper::transport::TransportStatus;

namespace {

const char* kConversationId = "ABCDEF12-3456-4789-8ABC-DEF012345678";

LocalIdentity Whisperer() {
  return LocalIdentity{"W-CLIENT", "W-PROFILE", "Wendy"};
}

Conversation Talk() {
  Conversation c;
  c.id = kConversationId;
  c.name = "Talk";
  c.owner_profile_id = "W-PROFILE";
  return c;
}

struct Bench {
  std::uint64_t now{0};
  EventQueue queue{[this]() { return now; }};
  LoopbackAir air{queue};
  std::unique_ptr<LoopbackRadio> radio{air.CreateRadio("whisperer")};
  Diagnostics diagnostics;
  RadioSection config;
  RadioPublisher publisher{queue, *radio, diagnostics, config, Whisperer(),
                           Talk()};
  std::vector<std::pair<std::string, ProtocolChunk>> controls;
  std::vector<std::string> lost;
  std::vector<TransportStatus> statuses;
  std::vector<std::string> failures;

  Bench() {
    TransportCallbacks callbacks;
    callbacks.on_control = [this](const TransportRemote& remote,
                                  const ProtocolChunk& chunk) {
      controls.emplace_back(RemoteId(remote), chunk);
    };
    callbacks.on_lost = [this](const TransportRemote& remote) {
      lost.push_back(RemoteId(remote));
    };
    callbacks.on_status = [this](TransportStatus status) {
      statuses.push_back(status);
    };
    publisher.SetCallbacks(std::move(callbacks));
  }

  void Start() {
    publisher.Start([this](const std::string& reason) {
      failures.push_back(reason);
    });
    queue.RunPending();
  }

  void Run() { queue.RunPending(); }

  void Advance(std::uint64_t ms) {
    now += ms;
    queue.RunPending();
  }
};

// Plays the central side by hand.
struct CentralProbe : RadioObserver {
  std::vector<std::pair<Characteristic, ProtocolChunk>> values;
  std::vector<std::string> write_results;
  std::vector<std::string> disconnects;

  void OnValueUpdated(const std::string&, Characteristic characteristic,
                      const std::vector<std::uint8_t>& value) override {
    ProtocolChunk chunk;
    assert(whisper::core::DecodeChunk(value.data(), value.size(), chunk));
    values.emplace_back(characteristic, chunk);
  }
  void OnWriteCompleted(const std::string&, Characteristic,
                        const std::string& error) override {
    write_results.push_back(error);
  }
  void OnDisconnected(const std::string&, const std::string& error) override {
    disconnects.push_back(error);
  }
};

std::vector<std::uint8_t> Bytes(const std::string& text) {
  return std::vector<std::uint8_t>(text.begin(), text.end());
}

std::vector<std::uint8_t> OfferBytes(const std::string& client_id) {
  LocalIdentity listener{client_id, client_id + "-PROFILE", "Lee"};
  return whisper::core::EncodeChunkBytes(whisper::core::ListenOffer(
      whisper::core::MakeClientInfo(listener, Talk())));
}

// Connects, subscribes to control out and writes a listen offer.
void Pair(Bench& bench, LoopbackRadio& central) {
  central.Connect("whisperer");
  bench.Run();
  central.SetNotify("whisperer", Characteristic::kControlOut, true);
  bench.Run();
  central.Write("whisperer", Characteristic::kControlIn,
                OfferBytes(central.device_id()), true);
  bench.Run();
}

}  // namespace

int main() {
  // Start publishes the service, scans for listeners and advertises the
  // short conversation id.
  {
    Bench bench;
    bench.Start();
    assert(bench.failures.empty());
    assert(bench.publisher.running());
    assert(bench.radio->service_published(kWhisperServiceUuid));
    assert(bench.radio->scanning());
    assert(bench.radio->advertising());
    assert(bench.radio->advertised_name() == "ABCDEF12");
    assert(bench.publisher.advertising());
  }

  // The advertising window refreshes on each new qualifying sighting.
  {
    Bench bench;
    bench.Start();
    assert(bench.radio->advertise_starts() == 1);
    auto open = bench.air.CreateRadio("open-listener");
    open->StartAdvertising(kListenServiceUuid, "discover");
    bench.Run();
    assert(bench.radio->advertise_starts() == 2);
    // Repeat sightings of the same listener are ignored.
    open->StartAdvertising(kListenServiceUuid, "discover");
    bench.Run();
    assert(bench.radio->advertise_starts() == 2);
    // Other conversations do not qualify.
    auto stranger = bench.air.CreateRadio("stranger");
    stranger->StartAdvertising(kListenServiceUuid, "99999999");
    bench.Run();
    assert(bench.radio->advertise_starts() == 2);

    bench.Advance(1500);
    auto targeted = bench.air.CreateRadio("targeted-listener");
    targeted->StartAdvertising(kListenServiceUuid, "ABCDEF12");
    bench.Run();
    assert(bench.radio->advertise_starts() == 3);
    bench.Advance(1000);
    assert(bench.publisher.advertising());
    bench.Advance(1000);
    assert(!bench.publisher.advertising());
    assert(!bench.radio->advertising());

    // A new burst can start once the old one is over.
    open->StartAdvertising(kListenServiceUuid, "discover");
    bench.Run();
    assert(bench.publisher.advertising());
  }

  // The cap bounds one burst no matter how many listeners show up.
  {
    Bench bench;
    bench.config.advertise_max_ms = 3000;
    RadioPublisher capped(bench.queue, *bench.radio, bench.diagnostics,
                          bench.config, Whisperer(), Talk());
    capped.Start([](const std::string&) {});
    bench.Run();
    std::vector<std::unique_ptr<LoopbackRadio>> listeners;
    for (int i = 0; i < 3; ++i) {
      bench.Advance(900);
      listeners.push_back(bench.air.CreateRadio("l" + std::to_string(i)));
      listeners.back()->StartAdvertising(kListenServiceUuid, "discover");
      bench.Run();
    }
    assert(capped.advertising());
    bench.Advance(300);
    assert(!capped.advertising());
    capped.Stop();
    bench.Run();
  }

  // Background suspends discovery; foreground resumes it.
  {
    Bench bench;
    bench.Start();
    bench.publisher.GoToBackground();
    assert(!bench.radio->scanning());
    assert(!bench.radio->advertising());
    bench.publisher.GoToForeground();
    assert(bench.radio->scanning());
    assert(bench.radio->advertising());
  }

  // Pairing: the listen offer reaches the control callback and the write
  // is acknowledged.
  {
    Bench bench;
    bench.Start();
    auto central = bench.air.CreateRadio("c1");
    CentralProbe probe;
    central->AddObserver(&probe);
    Pair(bench, *central);
    assert(bench.controls.size() == 1);
    assert(bench.controls[0].first == "c1");
    assert(whisper::core::IsListenOffer(bench.controls[0].second));
    assert(probe.write_results.size() == 1 && probe.write_results[0].empty());
    const auto remote = bench.publisher.FindRemote("c1");
    assert(remote.has_value());
    assert(StateOf(*remote).control_subscribed);
    assert(!StateOf(*remote).content_subscribed);

    // Malformed writes are rejected but keep the remote.
    central->Write("whisperer", Characteristic::kControlIn, Bytes("garbage"),
                   true);
    bench.Run();
    assert(probe.write_results.back() == "att error: unlikely error");
    assert(bench.diagnostics.count(Anomaly::kMalformedPacket) == 1);
    assert(bench.publisher.FindRemote("c1").has_value());

    central->Write("whisperer", Characteristic::kContentIn, Bytes("0|x"), true);
    bench.Run();
    assert(probe.write_results.back() == "att error: attribute not found");
    assert(bench.controls.size() == 1);
    central->RemoveObserver(&probe);
  }

  // Eavesdroppers never receive broadcasts; directed content still reaches
  // them and drains before broadcast after authorization.
  {
    Bench bench;
    bench.Start();
    auto central = bench.air.CreateRadio("c1");
    CentralProbe probe;
    central->AddObserver(&probe);
    Pair(bench, *central);
    central->SetNotify("whisperer", Characteristic::kContentOut, true);
    bench.Run();
    assert(bench.publisher.Eavesdroppers() == std::vector<std::string>{"c1"});
    assert(bench.publisher.BroadcastRecipients().empty());

    bench.radio->ClearSent();
    bench.publisher.Publish({ProtocolChunk{0, "secret"}});
    assert(bench.radio->sent().empty());

    assert(bench.publisher.SendContent("c1", {whisper::core::PastText("old")}));
    assert(bench.publisher.Authorize("c1"));
    assert(bench.publisher.BroadcastRecipients() ==
           std::vector<std::string>{"c1"});
    assert(bench.publisher.Eavesdroppers().empty());
    bench.publisher.Publish({ProtocolChunk{0, "hi"}});
    bench.Run();
    assert(probe.values.size() == 2);
    assert(probe.values[0].first == Characteristic::kContentOut);
    assert(probe.values[0].second == whisper::core::PastText("old"));
    assert((probe.values[1].second == ProtocolChunk{0, "hi"}));
    assert(bench.radio->sent().back().recipients ==
           std::vector<std::string>{"c1"});

    // Back-pressure: nothing goes out until the radio is ready again, then
    // catch-up precedes the live update.
    probe.values.clear();
    bench.radio->SetNotifyBudget(0);
    assert(bench.publisher.SendContent("c1", {whisper::core::LiveText("catch")}));
    bench.publisher.Publish({ProtocolChunk{0, "x"}});
    bench.Run();
    assert(probe.values.empty());
    bench.radio->ReplenishNotifyBudget(2);
    bench.Run();
    assert(probe.values.size() == 2);
    assert(probe.values[0].second == whisper::core::LiveText("catch"));
    assert((probe.values[1].second == ProtocolChunk{0, "x"}));
    bench.radio->SetNotifyBudget(std::nullopt);

    assert(bench.publisher.Deauthorize("c1"));
    assert(bench.publisher.BroadcastRecipients().empty());
    assert(bench.publisher.Eavesdroppers() == std::vector<std::string>{"c1"});
    central->RemoveObserver(&probe);
  }

  // Operations on unknown remotes fail without side effects.
  {
    Bench bench;
    bench.Start();
    assert(!bench.publisher.Authorize("nobody"));
    assert(!bench.publisher.Deauthorize("nobody"));
    assert(!bench.publisher.SendControl("nobody", whisper::core::ClearHistory()));
    assert(!bench.publisher.SendContent("nobody", {ProtocolChunk{0, "a"}}));
    assert(!bench.publisher.Drop("nobody"));
    assert(bench.diagnostics.count(Anomaly::kUnknownRemote) == 5);
  }

  // Local drop: a dropping chunk goes out, the remote lingers until both
  // channels are unsubscribed and is then forgotten.
  {
    Bench bench;
    bench.Start();
    auto central = bench.air.CreateRadio("c1");
    CentralProbe probe;
    central->AddObserver(&probe);
    Pair(bench, *central);
    central->SetNotify("whisperer", Characteristic::kContentOut, true);
    bench.Run();

    assert(bench.publisher.Drop("c1"));
    bench.Run();
    assert(probe.values.size() == 1);
    assert(probe.values[0].first == Characteristic::kControlOut);
    assert(whisper::core::HasOffset(probe.values[0].second,
                                    ControlOffset::kDropping));
    assert(probe.values[0].second.text == "||W-CLIENT|||");
    const auto pending = bench.publisher.FindRemote("c1");
    assert(pending.has_value() && StateOf(*pending).drop_in_progress);
    assert(bench.publisher.removed_count() == 1);

    central->SetNotify("whisperer", Characteristic::kContentOut, false);
    central->SetNotify("whisperer", Characteristic::kControlOut, false);
    bench.Run();
    assert(bench.publisher.removed_count() == 0);
    assert(!bench.publisher.FindRemote("c1").has_value());
    assert(bench.lost.empty());
    central->RemoveObserver(&probe);
  }

  // A remote that never unsubscribes is forgotten after the safety timeout.
  {
    Bench bench;
    bench.Start();
    auto central = bench.air.CreateRadio("c2");
    Pair(bench, *central);
    assert(bench.publisher.Drop("c2"));
    bench.Run();
    assert(bench.publisher.removed_count() == 1);
    bench.Advance(999);
    assert(bench.publisher.removed_count() == 1);
    bench.Advance(1);
    assert(bench.publisher.removed_count() == 0);
    assert(bench.diagnostics.count(Anomaly::kTeardownFailure) == 1);
  }

  // A peer that says it is dropping is removed at once; dropping it
  // afterwards sends nothing back.
  {
    Bench bench;
    bench.Start();
    auto central = bench.air.CreateRadio("c3");
    CentralProbe probe;
    central->AddObserver(&probe);
    Pair(bench, *central);
    bench.radio->ClearSent();
    central->Write("whisperer", Characteristic::kControlIn,
                   whisper::core::EncodeChunkBytes(
                       whisper::core::Dropping("c3-client")),
                   true);
    bench.Run();
    assert(probe.write_results.back().empty());
    assert(bench.lost == std::vector<std::string>{"c3"});
    assert(!bench.publisher.FindRemote("c3").has_value());
    assert(!bench.publisher.Drop("c3"));
    bench.Run();
    assert(bench.radio->sent().empty());
    assert(probe.values.empty());
    central->RemoveObserver(&probe);
  }

  // An unexpected disconnect is reported as a loss exactly once.
  {
    Bench bench;
    bench.Start();
    auto central = bench.air.CreateRadio("c4");
    Pair(bench, *central);
    central->SetNotify("whisperer", Characteristic::kContentOut, true);
    bench.Run();
    central->Vanish();
    bench.Run();
    assert(bench.lost == std::vector<std::string>{"c4"});
    assert(bench.publisher.removed_count() == 0);
    assert(!bench.publisher.FindRemote("c4").has_value());
  }

  // Stop broadcasts one dropping chunk and releases the service once every
  // remote has unsubscribed.
  {
    Bench bench;
    bench.Start();
    auto central = bench.air.CreateRadio("c5");
    CentralProbe probe;
    central->AddObserver(&probe);
    Pair(bench, *central);
    bench.publisher.Stop();
    assert(bench.publisher.draining());
    assert(!bench.radio->advertising());
    bench.Run();
    assert(probe.values.size() == 1);
    assert(whisper::core::HasOffset(probe.values[0].second,
                                    ControlOffset::kDropping));
    assert(bench.radio->service_published(kWhisperServiceUuid));
    central->Disconnect("whisperer");
    bench.Run();
    assert(!bench.publisher.draining());
    assert(!bench.radio->service_published(kWhisperServiceUuid));
    central->RemoveObserver(&probe);
  }

  // Stop never waits past the safety timeout.
  {
    Bench bench;
    bench.Start();
    auto central = bench.air.CreateRadio("c6");
    Pair(bench, *central);
    bench.publisher.Stop();
    bench.Run();
    assert(bench.publisher.draining());
    bench.Advance(bench.config.drop_timeout_ms);
    assert(!bench.publisher.draining());
    assert(!bench.radio->service_published(kWhisperServiceUuid));
  }

  // Stop with nobody connected releases immediately.
  {
    Bench bench;
    bench.Start();
    bench.publisher.Stop();
    assert(!bench.publisher.draining());
    assert(!bench.radio->service_published(kWhisperServiceUuid));
    assert(bench.queue.pending_timers() == 0);
  }

  // Radio status changes are forwarded and reported.
  {
    Bench bench;
    bench.Start();
    bench.radio->SetStatus(TransportStatus::kOff);
    bench.Run();
    assert(bench.statuses == std::vector<TransportStatus>{TransportStatus::kOff});
    assert(bench.diagnostics.count(Anomaly::kTransportUnavailable) == 1);
    assert(!bench.publisher.advertising());
    bench.radio->SetStatus(TransportStatus::kOn);
    bench.Run();
    assert(bench.publisher.advertising());
    assert(bench.radio->scanning());
  }

  // Starting with the radio off fails through the callback.
  {
    Bench bench;
    bench.radio->SetStatus(TransportStatus::kOff);
    bench.Start();
    assert(bench.failures.size() == 1);
    assert(!bench.publisher.running());
    assert(bench.diagnostics.count(Anomaly::kTransportUnavailable) == 1);
  }

  return 0;
}
