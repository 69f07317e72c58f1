#include "config.h"

#include "ini.h"
#include "platform_log.h"

namespace whisper::core {

namespace {

bool ApplyKV(ClientConfig& cfg, const std::string& section,
             const std::string& key, const std::string& value,
             std::string& error) {
  bool ok = true;
  if (section == "identity") {
    if (key == "client_id") {
      cfg.identity.client_id = value;
    } else if (key == "profile_id") {
      cfg.identity.profile_id = value;
    } else if (key == "username") {
      cfg.identity.username = value;
    }
  } else if (section == "radio") {
    if (key == "enable") {
      ok = ParseBool(value, cfg.radio.enable);
    } else if (key == "advertise_window_ms") {
      ok = ParseUint32(value, cfg.radio.advertise_window_ms);
    } else if (key == "advertise_max_ms") {
      ok = ParseUint32(value, cfg.radio.advertise_max_ms);
    } else if (key == "listen_advertise_ms") {
      ok = ParseUint32(value, cfg.radio.listen_advertise_ms);
    } else if (key == "drop_timeout_ms") {
      ok = ParseUint32(value, cfg.radio.drop_timeout_ms);
    } else if (key == "handshake_timeout_ms") {
      ok = ParseUint32(value, cfg.radio.handshake_timeout_ms);
    }
  } else if (section == "network") {
    if (key == "enable") {
      ok = ParseBool(value, cfg.network.enable);
    } else if (key == "relay_host") {
      cfg.network.relay_host = value;
    } else if (key == "relay_port") {
      ok = ParseUint16(value, cfg.network.relay_port);
    } else if (key == "tls_enable") {
      ok = ParseBool(value, cfg.network.tls_enable);
    } else if (key == "tls_verify") {
      ok = ParseBool(value, cfg.network.tls_verify);
    } else if (key == "tls_ca_file") {
      cfg.network.tls_ca_file = value;
    } else if (key == "heartbeat_ms") {
      ok = ParseUint32(value, cfg.network.heartbeat_ms);
    }
  } else if (section == "composite") {
    if (key == "radio_start_delay_ms") {
      ok = ParseUint32(value, cfg.composite.radio_start_delay_ms);
    }
  } else if (section == "log") {
    if (key == "debug_log") {
      ok = ParseBool(value, cfg.debug_log);
    }
  }
  if (!ok) {
    error = "invalid value for " + section + "." + key;
  }
  return ok;
}

}  // namespace

bool ValidateClientConfig(ClientConfig& config, std::string& error) {
  if (!config.radio.enable && !config.network.enable) {
    error = "radio and network both disabled";
    return false;
  }
  if (config.radio.advertise_window_ms == 0 ||
      config.radio.listen_advertise_ms == 0 ||
      config.radio.drop_timeout_ms == 0 ||
      config.radio.handshake_timeout_ms == 0) {
    error = "radio timeouts must be non-zero";
    return false;
  }
  if (config.radio.advertise_max_ms < config.radio.advertise_window_ms) {
    config.radio.advertise_max_ms = config.radio.advertise_window_ms;
  }
  if (config.network.enable) {
    if (config.network.relay_host.empty() || config.network.relay_port == 0) {
      error = "network enabled without relay_host/relay_port";
      return false;
    }
    if (config.network.heartbeat_ms == 0) {
      error = "network heartbeat_ms must be non-zero";
      return false;
    }
  }
  if (config.identity.client_id.empty() &&
      !NewRandomId(config.identity.client_id)) {
    error = "client id generation failed";
    return false;
  }
  if (config.identity.profile_id.empty()) {
    config.identity.profile_id = config.identity.client_id;
  }
  return true;
}

bool ParseClientConfig(const std::string& text, ClientConfig& out_config,
                       std::string& error) {
  out_config = ClientConfig{};
  const bool parsed = ParseIniText(
      text,
      [&out_config](const std::string& section, const std::string& key,
                    const std::string& value, std::string& err) {
        return ApplyKV(out_config, section, key, value, err);
      },
      error);
  if (!parsed) {
    return false;
  }
  return ValidateClientConfig(out_config, error);
}

bool LoadClientConfig(const std::string& path, ClientConfig& out_config,
                      std::string& error) {
  out_config = ClientConfig{};
  const bool parsed = ParseIniFile(
      path,
      [&out_config](const std::string& section, const std::string& key,
                    const std::string& value, std::string& err) {
        return ApplyKV(out_config, section, key, value, err);
      },
      error);
  if (!parsed) {
    return false;
  }
  if (!ValidateClientConfig(out_config, error)) {
    return false;
  }
  platform::log::Log(platform::log::Level::kInfo, "config",
                     "client config loaded",
                     {{"path", path},
                      {"radio", out_config.radio.enable ? "on" : "off"},
                      {"network", out_config.network.enable ? "on" : "off"}});
  return true;
}

}  // namespace whisper::core
