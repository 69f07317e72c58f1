#ifndef WHISPER_RELAY_RELAY_CONFIG_H
#define WHISPER_RELAY_RELAY_CONFIG_H

#include <cstdint>
#include <string>

namespace whisper::relay {

struct RelaySection {
  std::string bind_host{"0.0.0.0"};
  std::uint16_t listen_port{0};
  std::uint32_t max_connections{256};
  std::uint32_t max_connections_per_ip{64};
  // Unsent bytes a slow connection may accumulate before it is closed.
  std::uint32_t max_pending_bytes{4u * 1024u * 1024u};
  bool tls_enable{false};
  std::string tls_cert;
  std::string tls_key;
  bool debug_log{false};
};

struct RelayConfig {
  RelaySection relay;
};

bool LoadRelayConfig(const std::string& path, RelayConfig& out_config,
                     std::string& error);
bool ParseRelayConfig(const std::string& text, RelayConfig& out_config,
                      std::string& error);

}  // namespace whisper::relay

#endif  // WHISPER_RELAY_RELAY_CONFIG_H
