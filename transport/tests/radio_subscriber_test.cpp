#include <cassert>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "config.h"
#include "conversation.h"
#include "diagnostics.h"
#include "event_queue.h"
#include "loopback_radio.h"
#include "protocol.h"
#include "radio_subscriber.h"

using whisper::core::Anomaly;
using whisper::core::ClientInfo;
using whisper::core::ControlOffset;
using whisper::core::Conversation;
using whisper::core::Diagnostics;
using whisper::core::EventQueue;
using whisper::core::LocalIdentity;
using whisper::core::ProtocolChunk;
using whisper::core::RadioSection;
using whisper::transport::AttStatus;
using whisper::transport::Characteristic;
using whisper::transport::kListenServiceUuid;
using whisper::transport::kWhisperServiceUuid;
using whisper::transport::LoopbackAir;
using whisper::transport::LoopbackRadio;
using whisper::transport::RadioObserver;
using whisper::transport::RadioSubscriber;
using whisper::transport::RemoteId;
using whisper::transport::StateOf;
using whisper::transport::TransportCallbacks;
using whisper::transport::TransportRemote;
using whisper::transport::WriteRequest;

namespace {

using Phase = RadioSubscriber::Phase;

const char* kConversationId = "ABCDEF12-3456-4789-8ABC-DEF012345678";

LocalIdentity Listener() {
  return LocalIdentity{"L-CLIENT", "L-PROFILE", "Lee"};
}

Conversation Talk() {
  Conversation c;
  c.id = kConversationId;
  c.name = "Talk";
  c.owner_profile_id = "W-PROFILE";
  return c;
}

std::vector<std::uint8_t> Bytes(const std::string& text) {
  return std::vector<std::uint8_t>(text.begin(), text.end());
}

// Plays the whisperer side by hand.
struct PeripheralProbe : RadioObserver {
  LoopbackRadio* radio{nullptr};
  bool respond{true};
  std::vector<ProtocolChunk> writes;
  std::vector<Characteristic> subscribed;
  std::vector<Characteristic> unsubscribed;

  void OnWriteRequests(const std::vector<WriteRequest>& requests) override {
    for (const auto& request : requests) {
      ProtocolChunk chunk;
      if (whisper::core::DecodeChunk(request.value.data(),
                                     request.value.size(), chunk)) {
        writes.push_back(chunk);
      }
      if (respond) {
        radio->RespondToWrite(request.request_id, AttStatus::kSuccess);
      }
    }
  }
  void OnCentralSubscribed(const std::string&,
                           Characteristic characteristic) override {
    subscribed.push_back(characteristic);
  }
  void OnCentralUnsubscribed(const std::string&,
                             Characteristic characteristic) override {
    unsubscribed.push_back(characteristic);
  }
};

struct Bench {
  explicit Bench(std::optional<Conversation> target = Talk())
      : subscriber(queue, *radio, diagnostics, config, Listener(),
                   std::move(target)) {
    TransportCallbacks callbacks;
    callbacks.on_control = [this](const TransportRemote& remote,
                                  const ProtocolChunk& chunk) {
      controls.emplace_back(RemoteId(remote), chunk);
    };
    callbacks.on_content = [this](const TransportRemote& remote,
                                  const ProtocolChunk& chunk) {
      contents.emplace_back(RemoteId(remote), chunk);
    };
    callbacks.on_lost = [this](const TransportRemote& remote) {
      lost.push_back(RemoteId(remote));
    };
    subscriber.SetCallbacks(std::move(callbacks));
  }

  // A whisperer advertising `name`, answered by `probe`.
  std::unique_ptr<LoopbackRadio> AddWhisperer(const std::string& id,
                                              const std::string& name,
                                              PeripheralProbe& probe) {
    auto peripheral = air.CreateRadio(id);
    probe.radio = peripheral.get();
    peripheral->AddObserver(&probe);
    peripheral->PublishService(kWhisperServiceUuid);
    peripheral->StartAdvertising(kWhisperServiceUuid, name);
    return peripheral;
  }

  void Start() {
    subscriber.Start([this](const std::string& reason) {
      failures.push_back(reason);
    });
    queue.RunPending();
  }

  void Run() { queue.RunPending(); }

  void Advance(std::uint64_t ms) {
    now += ms;
    queue.RunPending();
  }

  std::uint64_t now{0};
  EventQueue queue{[this]() { return now; }};
  LoopbackAir air{queue};
  std::unique_ptr<LoopbackRadio> radio{air.CreateRadio("listener")};
  Diagnostics diagnostics;
  RadioSection config;
  RadioSubscriber subscriber;
  std::vector<std::pair<std::string, ProtocolChunk>> controls;
  std::vector<std::pair<std::string, ProtocolChunk>> contents;
  std::vector<std::string> lost;
  std::vector<std::string> failures;
};

void Notify(LoopbackRadio& peripheral, Characteristic characteristic,
            const std::vector<std::uint8_t>& value) {
  peripheral.NotifyCentrals(characteristic, value, {"listener"});
}

}  // namespace

int main() {
  // Discovery, connection and pairing up to awaiting authorization.
  {
    Bench bench;
    PeripheralProbe probe;
    auto whisperer = bench.AddWhisperer("pub1", "ABCDEF12", probe);
    bench.Start();
    assert(bench.subscriber.running());
    assert(bench.subscriber.discovering());
    assert(bench.radio->scanning());
    assert(bench.radio->advertising());
    assert(bench.radio->advertised_name() == "ABCDEF12");
    assert(bench.subscriber.PhaseOf("pub1") == Phase::kAwaitingAuthorization);
    assert(probe.subscribed ==
           std::vector<Characteristic>{Characteristic::kControlOut});
    assert(probe.writes.size() == 1);
    assert(whisper::core::IsListenOffer(probe.writes[0]));
    ClientInfo info;
    assert(whisper::core::DecodeClientInfo(probe.writes[0].text, info));
    assert(info.conversation_id == kConversationId);
    assert(info.client_id == "L-CLIENT");
    assert(info.profile_id == "L-PROFILE");
    const auto remote = bench.subscriber.FindRemote("pub1");
    assert(remote.has_value());
    assert(StateOf(*remote).control_subscribed);
    assert(!StateOf(*remote).content_subscribed);

    // The listener advertisement is short-lived.
    bench.Advance(bench.config.listen_advertise_ms);
    assert(!bench.subscriber.advertising());
    assert(!bench.radio->advertising());
    assert(bench.subscriber.discovering());

    // Control before subscription is delivered; content is not.
    Notify(*whisperer, Characteristic::kControlOut,
           whisper::core::EncodeChunkBytes(whisper::core::ListenAuthYes(info)));
    bench.Run();
    assert(bench.controls.size() == 1);
    assert(bench.controls[0].first == "pub1");
    assert(whisper::core::HasOffset(bench.controls[0].second,
                                    ControlOffset::kListenAuthYes));

    assert(bench.subscriber.Subscribe("pub1", Talk()));
    bench.Run();
    assert(bench.subscriber.PhaseOf("pub1") == Phase::kSubscribed);
    assert(bench.subscriber.publisher_id() == "pub1");
    assert(!bench.subscriber.discovering());
    assert(!bench.radio->scanning());
    assert(whisperer->IsSubscribed("listener", Characteristic::kContentOut));

    Notify(*whisperer, Characteristic::kContentOut, Bytes("0|hi"));
    bench.Run();
    assert(bench.contents.size() == 1);
    assert((bench.contents[0].second == ProtocolChunk{0, "hi"}));

    // Malformed content is dropped and the stream carries on.
    Notify(*whisperer, Characteristic::kContentOut, Bytes("junk"));
    Notify(*whisperer, Characteristic::kContentOut, Bytes("2|!"));
    bench.Run();
    assert(bench.contents.size() == 2);
    assert((bench.contents[1].second == ProtocolChunk{2, "!"}));
    assert(bench.diagnostics.count(Anomaly::kMalformedPacket) == 1);
    assert(bench.lost.empty());
    assert(bench.failures.empty());

    // Malformed control ends the connection.
    whisperer->StopAdvertising();
    Notify(*whisperer, Characteristic::kControlOut, Bytes("oops"));
    bench.Run();
    assert(bench.diagnostics.count(Anomaly::kMalformedPacket) == 2);
    assert(bench.failures.size() == 1);
    assert(bench.lost == std::vector<std::string>{"pub1"});
    assert(!bench.subscriber.PhaseOf("pub1").has_value());
    assert(!whisperer->IsSubscribed("listener", Characteristic::kControlOut));
    assert(!whisperer->IsSubscribed("listener", Characteristic::kContentOut));
    assert(bench.subscriber.publisher_id().empty());
    assert(bench.subscriber.discovering());
    whisperer->RemoveObserver(&probe);
  }

  // A whisperer advising of its drop is lost without a reply.
  {
    Bench bench;
    PeripheralProbe probe;
    auto whisperer = bench.AddWhisperer("pub1", "ABCDEF12", probe);
    bench.Start();
    assert(bench.subscriber.Subscribe("pub1", Talk()));
    bench.Run();
    whisperer->StopAdvertising();
    Notify(*whisperer, Characteristic::kControlOut,
           whisper::core::EncodeChunkBytes(whisper::core::Dropping("W")));
    bench.Run();
    assert(bench.lost == std::vector<std::string>{"pub1"});
    assert(bench.failures.empty());
    assert(bench.controls.empty());
    assert(probe.writes.size() == 1);
    assert(probe.unsubscribed.size() == 2);
    whisperer->RemoveObserver(&probe);
  }

  // Advertisements for other conversations are ignored.
  {
    Bench bench;
    PeripheralProbe probe;
    auto whisperer = bench.AddWhisperer("other", "99999999", probe);
    bench.Start();
    assert(!bench.subscriber.PhaseOf("other").has_value());
    assert(probe.writes.empty());
    whisperer->RemoveObserver(&probe);
  }

  // Without a target any whisperer is a candidate and the listener
  // advertises open discovery.
  {
    Bench bench(std::nullopt);
    PeripheralProbe probe;
    auto whisperer = bench.AddWhisperer("other", "99999999", probe);
    bench.Start();
    assert(bench.radio->advertised_name() == "discover");
    assert(bench.subscriber.PhaseOf("other") == Phase::kAwaitingAuthorization);
    ClientInfo info;
    assert(probe.writes.size() == 1);
    assert(whisper::core::DecodeClientInfo(probe.writes[0].text, info));
    assert(info.conversation_id.empty());
    assert(info.client_id == "L-CLIENT");
    whisperer->RemoveObserver(&probe);
  }

  // A candidate that never finishes pairing is dropped after the timeout.
  {
    Bench bench;
    PeripheralProbe probe;
    probe.respond = false;
    auto whisperer = bench.AddWhisperer("slow", "ABCDEF12", probe);
    bench.Start();
    assert(bench.subscriber.PhaseOf("slow") == Phase::kPairing);
    bench.Advance(bench.config.handshake_timeout_ms - 1);
    assert(bench.subscriber.PhaseOf("slow") == Phase::kPairing);
    bench.Advance(1);
    assert(!bench.subscriber.PhaseOf("slow").has_value());
    assert(bench.diagnostics.count(Anomaly::kHandshakeTimeout) == 1);
    assert(bench.lost.empty());
    whisperer->RemoveObserver(&probe);
  }

  // Write and subscribe failures surface through the failure callback.
  {
    Bench bench;
    PeripheralProbe probe;
    auto whisperer = bench.AddWhisperer("pub1", "ABCDEF12", probe);
    bench.radio->FailNextWrite("write refused");
    bench.Start();
    assert(bench.failures.size() == 1);
    assert(bench.diagnostics.count(Anomaly::kRadioFailure) == 1);
    assert(bench.subscriber.PhaseOf("pub1") == Phase::kPairing);
    whisperer->RemoveObserver(&probe);
  }
  {
    Bench bench;
    PeripheralProbe probe;
    auto whisperer = bench.AddWhisperer("pub1", "ABCDEF12", probe);
    bench.radio->FailNextSubscribe("subscribe refused");
    bench.Start();
    assert(bench.failures.size() == 1);
    assert(bench.subscriber.PhaseOf("pub1") == Phase::kPairing);
    whisperer->RemoveObserver(&probe);
  }

  // The whisperer going out of range is an unexpected loss.
  {
    Bench bench;
    PeripheralProbe probe;
    auto whisperer = bench.AddWhisperer("pub1", "ABCDEF12", probe);
    bench.Start();
    whisperer->RemoveObserver(&probe);
    whisperer->Vanish();
    bench.Run();
    assert(bench.lost == std::vector<std::string>{"pub1"});
    assert(!bench.subscriber.FindRemote("pub1").has_value());
  }

  // Subscribing commits to one whisperer and drops every other candidate.
  {
    Bench bench;
    PeripheralProbe probe_a;
    PeripheralProbe probe_b;
    auto a = bench.AddWhisperer("pubA", "ABCDEF12", probe_a);
    auto b = bench.AddWhisperer("pubB", "ABCDEF12", probe_b);
    bench.Start();
    assert(bench.subscriber.PhaseOf("pubA") == Phase::kAwaitingAuthorization);
    assert(bench.subscriber.PhaseOf("pubB") == Phase::kAwaitingAuthorization);
    assert(bench.subscriber.Subscribe("pubA", Talk()));
    bench.Run();
    assert(bench.subscriber.PhaseOf("pubA") == Phase::kSubscribed);
    assert(!bench.subscriber.FindRemote("pubB").has_value());
    assert(probe_b.writes.size() == 2);
    assert(whisper::core::HasOffset(probe_b.writes[1], ControlOffset::kDropping));
    assert(!b->IsSubscribed("listener", Characteristic::kControlOut));
    assert(bench.lost.empty());

    // Control goes out on the control-in characteristic.
    assert(bench.subscriber.SendControl(
        "pubA", whisper::core::ReplayRequest(whisper::core::ReadType::kAll)));
    bench.Run();
    assert(probe_a.writes.size() == 2);
    assert(whisper::core::IsReplayRequest(probe_a.writes[1]));

    // Stop tells the committed whisperer we are leaving.
    bench.subscriber.Stop();
    bench.Run();
    assert(!bench.subscriber.running());
    assert(probe_a.writes.size() == 3);
    assert(whisper::core::HasOffset(probe_a.writes[2], ControlOffset::kDropping));
    assert(!a->IsSubscribed("listener", Characteristic::kContentOut));
    assert(bench.lost.empty());
    a->RemoveObserver(&probe_a);
    b->RemoveObserver(&probe_b);
  }

  // Operations on unknown remotes fail without side effects.
  {
    Bench bench;
    bench.Start();
    assert(!bench.subscriber.Subscribe("ghost", Talk()));
    assert(!bench.subscriber.SendControl("ghost", whisper::core::ClearHistory()));
    assert(!bench.subscriber.Drop("ghost"));
    assert(bench.diagnostics.count(Anomaly::kUnknownRemote) == 3);
  }

  return 0;
}
