#ifndef WHISPER_CORE_CONFIG_H
#define WHISPER_CORE_CONFIG_H

#include <cstdint>
#include <string>

#include "conversation.h"

namespace whisper::core {

struct RadioSection {
  bool enable{true};
  // Advertising stays on this long after the last qualifying sighting.
  std::uint32_t advertise_window_ms{2000};
  // Upper bound on one continuous advertising burst.
  std::uint32_t advertise_max_ms{30000};
  std::uint32_t listen_advertise_ms{2000};
  std::uint32_t drop_timeout_ms{1000};
  std::uint32_t handshake_timeout_ms{15000};
};

struct NetworkSection {
  bool enable{true};
  std::string relay_host;
  std::uint16_t relay_port{0};
  bool tls_enable{false};
  bool tls_verify{true};
  std::string tls_ca_file;
  std::uint32_t heartbeat_ms{15000};
};

struct CompositeSection {
  std::uint32_t radio_start_delay_ms{1000};
};

struct ClientConfig {
  LocalIdentity identity;
  RadioSection radio;
  NetworkSection network;
  CompositeSection composite;
  bool debug_log{false};
};

// Fills missing identity fields (random client id, profile id = client id).
bool LoadClientConfig(const std::string& path, ClientConfig& out_config,
                      std::string& error);
bool ParseClientConfig(const std::string& text, ClientConfig& out_config,
                       std::string& error);
bool ValidateClientConfig(ClientConfig& config, std::string& error);

}  // namespace whisper::core

#endif  // WHISPER_CORE_CONFIG_H
