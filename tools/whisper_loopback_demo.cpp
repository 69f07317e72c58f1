#include <iostream>
#include <memory>
#include <string>

#include "config.h"
#include "conversation.h"
#include "diagnostics.h"
#include "event_queue.h"
#include "listen_session.h"
#include "loopback_radio.h"
#include "platform_log.h"
#include "protocol.h"
#include "transport_factory.h"
#include "whisper_session.h"

namespace {

namespace pfl = whisper::platform::log;

constexpr const char* kTag = "demo";

void PrintUsage() {
  std::cerr << "usage: whisper_loopback_demo [--debug] [client.ini]\n"
               "Whispers stdin line by line to an in-process listener over "
               "a loopback radio.\n";
}

// Pumps until nothing is ready. Timers only fire once due, which the demo
// never waits for.
void Drain(whisper::core::EventQueue& queue) {
  while (queue.RunPending() != 0) {
  }
}

}  // namespace

int main(int argc, char** argv) {
  std::string config_path;
  bool debug = false;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--debug") {
      debug = true;
    } else if (arg == "-h" || arg == "--help") {
      PrintUsage();
      return 0;
    } else if (config_path.empty()) {
      config_path = arg;
    } else {
      PrintUsage();
      return 2;
    }
  }

  std::string error;
  whisper::core::ClientConfig whisper_cfg;
  if (!config_path.empty()) {
    if (!whisper::core::LoadClientConfig(config_path, whisper_cfg, error)) {
      pfl::Log(pfl::Level::kError, kTag, error);
      return 1;
    }
  } else {
    whisper_cfg.network.enable = false;
    if (!whisper::core::ValidateClientConfig(whisper_cfg, error)) {
      pfl::Log(pfl::Level::kError, kTag, error);
      return 1;
    }
  }
  if (debug || whisper_cfg.debug_log) {
    pfl::SetMinLevel(pfl::Level::kDebug);
  }
  whisper_cfg.identity.username = "whisperer";

  whisper::core::ClientConfig listen_cfg;
  listen_cfg.radio = whisper_cfg.radio;
  listen_cfg.network.enable = false;
  listen_cfg.identity.username = "listener";
  if (!whisper::core::ValidateClientConfig(listen_cfg, error)) {
    pfl::Log(pfl::Level::kError, kTag, error);
    return 1;
  }

  whisper::core::Conversation conversation;
  if (!whisper::core::NewRandomId(conversation.id)) {
    pfl::Log(pfl::Level::kError, kTag, "conversation id generation failed");
    return 1;
  }
  conversation.name = "Demo";
  conversation.owner_profile_id = whisper_cfg.identity.profile_id;
  conversation.Authorize(listen_cfg.identity.profile_id,
                         listen_cfg.identity.username);

  whisper::core::EventQueue queue;
  whisper::core::Diagnostics diagnostics;
  whisper::transport::LoopbackAir air(queue);
  std::unique_ptr<whisper::transport::LoopbackRadio> whisper_radio =
      air.CreateRadio("whisperer-radio");
  std::unique_ptr<whisper::transport::LoopbackRadio> listen_radio =
      air.CreateRadio("listener-radio");
  whisper::transport::TransportFactory whisper_factory(
      queue, diagnostics, whisper_cfg, whisper_radio.get(), nullptr);
  whisper::transport::TransportFactory listen_factory(
      queue, diagnostics, listen_cfg, listen_radio.get(), nullptr);

  bool failed = false;
  auto on_failure = [&failed](const std::string& reason) {
    pfl::Log(pfl::Level::kError, kTag, reason);
    failed = true;
  };

  whisper::session::WhisperSession whisperer(whisper_factory, conversation);
  whisper::session::ListenSession listener(listen_factory, conversation);
  listener.SetLineSink(
      [](const std::string& line) { std::cout << "> " << line << "\n"; });
  listener.SetEffectSink([](const whisper::core::ProtocolChunk& chunk) {
    std::cout << "* " << whisper::core::ControlOffsetName(chunk.offset) << " "
              << chunk.text << "\n";
  });

  whisperer.Start(on_failure);
  listener.Start(on_failure);
  Drain(queue);
  if (failed || !listener.subscribed()) {
    pfl::Log(pfl::Level::kError, kTag, "listener did not join");
    return 1;
  }

  std::string line;
  while (!failed && std::getline(std::cin, line)) {
    if (line == "/sound") {
      whisperer.PlaySound("chime");
    } else if (line == "/clear") {
      whisperer.ClearHistory();
    } else {
      whisperer.UpdateLiveText(line);
      Drain(queue);
      whisperer.CommitLiveText();
    }
    Drain(queue);
  }

  listener.Stop();
  whisperer.Stop();
  Drain(queue);
  pfl::Log(pfl::Level::kInfo, kTag, "done",
           {{"lines", std::to_string(whisperer.past_lines().size())},
            {"malformed", std::to_string(diagnostics.count(
                              whisper::core::Anomaly::kMalformedPacket))}});
  return failed ? 1 : 0;
}
