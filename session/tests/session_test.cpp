#include <cassert>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "config.h"
#include "conversation.h"
#include "diagnostics.h"
#include "event_queue.h"
#include "listen_session.h"
#include "loopback_radio.h"
#include "protocol.h"
#include "radio_gatt.h"
#include "transport_factory.h"
#include "whisper_session.h"

using whisper::core::Anomaly;
using whisper::core::ClientConfig;
using whisper::core::Conversation;
using whisper::core::Diagnostics;
using whisper::core::EventQueue;
using whisper::core::LocalIdentity;
using whisper::core::ProtocolChunk;
using whisper::core::ReadType;
using whisper::session::ListenSession;
using whisper::session::WhisperSession;
using whisper::transport::Characteristic;
using whisper::transport::LoopbackAir;
using whisper::transport::LoopbackRadio;
using whisper::transport::TransportFactory;

namespace {

Conversation Talk() {
  Conversation c;
  c.id = "ABCDEF12-3456-4789-8ABC-DEF012345678";
  c.name = "Talk";
  c.owner_profile_id = "W-PROFILE";
  c.Authorize("lee-profile", "Lee");
  return c;
}

struct World {
  std::uint64_t now{0};
  EventQueue queue{[this]() { return now; }};
  LoopbackAir air{queue};
  Diagnostics diagnostics;

  void Run() { queue.RunPending(); }
};

ClientConfig ConfigFor(const LocalIdentity& identity) {
  ClientConfig config;
  config.identity = identity;
  return config;
}

// A device with a radio and no network.
struct Device {
  Device(World& world, const LocalIdentity& identity)
      : radio(world.air.CreateRadio(identity.username)),
        factory(world.queue, world.diagnostics, ConfigFor(identity),
                radio.get(), nullptr) {}

  std::unique_ptr<LoopbackRadio> radio;
  TransportFactory factory;
};

struct Listener {
  Listener(World& world, const LocalIdentity& identity)
      : device(world, identity), session(device.factory, Talk()) {
    session.SetLineSink(
        [this](const std::string& line) { lines.push_back(line); });
    session.SetEffectSink(
        [this](const ProtocolChunk& chunk) { effects.push_back(chunk); });
  }

  void Start() {
    session.Start(
        [this](const std::string& reason) { failures.push_back(reason); });
  }

  Device device;
  ListenSession session;
  std::vector<std::string> lines;
  std::vector<ProtocolChunk> effects;
  std::vector<std::string> failures;
};

std::vector<std::uint8_t> Bytes(const std::string& text) {
  return std::vector<std::uint8_t>(text.begin(), text.end());
}

}  // namespace

int main() {
  World world;
  Device wendy(world, LocalIdentity{"W-CLIENT", "W-PROFILE", "wendy"});
  WhisperSession whisper(wendy.factory, Talk(), "content-1");
  std::vector<std::string> whisper_failures;
  whisper.Start([&whisper_failures](const std::string& reason) {
    whisper_failures.push_back(reason);
  });
  assert(whisper.running());
  assert(whisper.content_id() == "content-1");

  // Text typed before anyone listens is kept for the catch-up.
  whisper.UpdateLiveText("hello\nwor");
  assert(whisper.past_lines() == std::vector<std::string>{"hello"});
  assert(whisper.live_text() == "wor");
  world.Run();

  // An authorized listener is admitted, joins and catches up.
  Listener lee(world, LocalIdentity{"lee-client", "lee-profile", "lee"});
  lee.Start();
  world.Run();
  assert(lee.session.subscribed());
  assert(lee.session.whisperer_id() == "W-CLIENT");
  assert(lee.session.whisperer().has_value());
  assert(lee.session.whisperer()->content_id == "content-1");
  assert(whisper.listeners().count("lee-client") == 1);
  assert(whisper.listeners().at("lee-client").joined);
  assert(lee.session.past_lines() == std::vector<std::string>{"hello"});
  assert(lee.session.live_text() == "wor");
  assert(lee.lines == std::vector<std::string>{"hello"});

  // Live edits and commits.
  whisper.UpdateLiveText("world");
  world.Run();
  assert(lee.session.live_text() == "world");
  whisper.CommitLiveText();
  world.Run();
  assert(whisper.live_text().empty());
  assert((lee.session.past_lines() ==
          std::vector<std::string>{"hello", "world"}));
  assert(lee.session.live_text().empty());
  assert((lee.lines == std::vector<std::string>{"hello", "world"}));
  whisper.UpdateLiveText("again");
  world.Run();
  assert(lee.session.live_text() == "again");

  // Effects bypass the transcript.
  whisper.PlaySound("chime");
  whisper.PlaySpeech("hi there");
  whisper.ShareTranscript("T-1");
  world.Run();
  assert(lee.effects.size() == 3);
  assert(lee.effects[0] == whisper::core::Sound("chime"));
  assert(lee.effects[1] == whisper::core::Speech("hi there"));
  assert(lee.effects[2] == whisper::core::ShareTranscript("T-1"));
  assert(lee.session.live_text() == "again");

  // A full replay rebuilds the transcript without repeating lines.
  assert(lee.session.RequestReplay(ReadType::kAll));
  world.Run();
  assert(!lee.session.rereading());
  assert((lee.session.past_lines() ==
          std::vector<std::string>{"hello", "world"}));
  assert(lee.session.live_text() == "again");
  assert(lee.lines.size() == 2);

  // A diff past the end of the live line means the listener is out of
  // sync; it asks for everything again.
  wendy.radio->NotifyCentrals(Characteristic::kContentOut, Bytes("40|zzz"),
                              {"lee"});
  world.Run();
  assert(!lee.session.rereading());
  assert(lee.session.live_text() == "again");
  assert(lee.session.past_lines().size() == 2);

  // Malformed content is dropped without ending the session.
  wendy.radio->NotifyCentrals(Characteristic::kContentOut, Bytes("junk"),
                              {"lee"});
  world.Run();
  assert(world.diagnostics.count(Anomaly::kMalformedPacket) == 1);
  assert(lee.session.subscribed());
  assert(lee.failures.empty());

  whisper.ClearHistory();
  world.Run();
  assert(whisper.past_lines().empty());
  assert(lee.session.past_lines().empty());
  assert(lee.session.live_text() == "again");

  // A listener whose profile is not authorized is refused and stops.
  Listener eve(world, LocalIdentity{"eve-client", "eve-profile", "eve"});
  eve.Start();
  world.Run();
  assert(!eve.session.subscribed());
  assert(!eve.session.running());
  assert(eve.failures.size() == 1);
  assert(world.diagnostics.count(Anomaly::kAuthorizationDenied) == 2);
  assert(whisper.listeners().count("eve-client") == 0);
  assert(whisper.listeners().size() == 1);
  whisper.UpdateLiveText("again!");
  world.Run();
  assert(lee.session.live_text() == "again!");

  // Stopping the whisperer releases the listener.
  whisper.Stop();
  world.Run();
  assert(!whisper.running());
  assert(whisper.listeners().empty());
  assert(!lee.session.subscribed());
  assert(lee.session.running());
  assert(whisper_failures.empty());

  lee.session.Stop();
  world.Run();
  assert(!lee.session.running());
  return 0;
}
