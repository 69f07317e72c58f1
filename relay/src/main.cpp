#include <csignal>
#include <string>

#include "platform_log.h"
#include "platform_time.h"
#include "relay_config.h"
#include "relay_server.h"

namespace {

namespace pfl = whisper::platform::log;

constexpr const char* kTag = "relay";

volatile std::sig_atomic_t g_stop = 0;

void HandleSignal(int) { g_stop = 1; }

}  // namespace

int main(int argc, char** argv) {
  const std::string config_path = (argc > 1) ? argv[1] : "relay.ini";

  std::string error;
  whisper::relay::RelayConfig cfg;
  if (!whisper::relay::LoadRelayConfig(config_path, cfg, error)) {
    pfl::Log(pfl::Level::kError, kTag, error);
    return 1;
  }
  if (cfg.relay.debug_log) {
    pfl::SetMinLevel(pfl::Level::kDebug);
  }

  whisper::relay::RelayServer server(cfg.relay);
  if (!server.Start(error)) {
    pfl::Log(pfl::Level::kError, kTag,
             error.empty() ? "relay start failed" : error);
    return 1;
  }

  std::signal(SIGINT, HandleSignal);
  std::signal(SIGTERM, HandleSignal);
  while (!g_stop) {
    whisper::platform::SleepMs(200);
  }
  pfl::Log(pfl::Level::kInfo, kTag, "shutting down",
           {{"connections", std::to_string(server.connection_count())}});
  server.Stop();
  return 0;
}
