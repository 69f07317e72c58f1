#include "relay_config.h"

#include "ini.h"
#include "platform_log.h"

namespace whisper::relay {

namespace {

bool ApplyKV(RelayConfig& cfg, const std::string& section,
             const std::string& key, const std::string& value,
             std::string& error) {
  if (section != "relay") {
    return true;
  }
  bool ok = true;
  RelaySection& relay = cfg.relay;
  if (key == "bind_host") {
    relay.bind_host = value;
  } else if (key == "listen_port") {
    ok = core::ParseUint16(value, relay.listen_port);
  } else if (key == "max_connections") {
    ok = core::ParseUint32(value, relay.max_connections);
  } else if (key == "max_connections_per_ip") {
    ok = core::ParseUint32(value, relay.max_connections_per_ip);
  } else if (key == "max_pending_bytes") {
    ok = core::ParseUint32(value, relay.max_pending_bytes);
  } else if (key == "tls_enable") {
    ok = core::ParseBool(value, relay.tls_enable);
  } else if (key == "tls_cert") {
    relay.tls_cert = value;
  } else if (key == "tls_key") {
    relay.tls_key = value;
  } else if (key == "debug_log") {
    ok = core::ParseBool(value, relay.debug_log);
  }
  if (!ok) {
    error = "invalid value for relay." + key;
  }
  return ok;
}

bool Validate(const RelayConfig& cfg, std::string& error) {
  if (cfg.relay.listen_port == 0) {
    error = "relay listen port missing";
    return false;
  }
  if (cfg.relay.max_connections == 0 ||
      cfg.relay.max_connections_per_ip == 0) {
    error = "relay connection limits must be non-zero";
    return false;
  }
  if (cfg.relay.max_pending_bytes == 0) {
    error = "relay max_pending_bytes must be non-zero";
    return false;
  }
  if (cfg.relay.tls_enable &&
      (cfg.relay.tls_cert.empty() || cfg.relay.tls_key.empty())) {
    error = "tls_enable requires tls_cert and tls_key";
    return false;
  }
  return true;
}

}  // namespace

bool ParseRelayConfig(const std::string& text, RelayConfig& out_config,
                      std::string& error) {
  out_config = RelayConfig{};
  const bool parsed = core::ParseIniText(
      text,
      [&out_config](const std::string& section, const std::string& key,
                    const std::string& value, std::string& err) {
        return ApplyKV(out_config, section, key, value, err);
      },
      error);
  return parsed && Validate(out_config, error);
}

bool LoadRelayConfig(const std::string& path, RelayConfig& out_config,
                     std::string& error) {
  out_config = RelayConfig{};
  const bool parsed = core::ParseIniFile(
      path,
      [&out_config](const std::string& section, const std::string& key,
                    const std::string& value, std::string& err) {
        return ApplyKV(out_config, section, key, value, err);
      },
      error);
  if (!parsed || !Validate(out_config, error)) {
    return false;
  }
  platform::log::Log(platform::log::Level::kInfo, "config",
                     "relay config loaded",
                     {{"path", path},
                      {"port", std::to_string(out_config.relay.listen_port)},
                      {"tls", out_config.relay.tls_enable ? "on" : "off"}});
  return true;
}

}  // namespace whisper::relay
