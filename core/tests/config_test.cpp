#include <cassert>
#include <cstdint>
#include <fstream>
#include <string>

#include "config.h"
#include "ini.h"

using whisper::core::ClientConfig;
using whisper::core::LoadClientConfig;
using whisper::core::ParseClientConfig;

static void WriteFile(const std::string& path, const std::string& content) {
  std::ofstream f(path, std::ios::binary);
  f << content;
}

int main() {
  {
    const std::string path = "tmp_client_config.ini";
    WriteFile(path,
              "# whisper client\n"
              "[identity]\nclient_id = C1\nprofile_id = P1\nusername = Ana\n"
              "[radio]\nenable = 1\nadvertise_window_ms = 2500  # refresh\n"
              "drop_timeout_ms=1500\n"
              "[network]\nenable=true\nrelay_host=relay.local\n"
              "relay_port=7443\ntls_enable=on\ntls_ca_file=ca.pem\n"
              "[composite]\nradio_start_delay_ms=250\n"
              "[log]\ndebug_log=1\n");
    ClientConfig cfg;
    std::string err;
    const bool ok = LoadClientConfig(path, cfg, err);
    assert(ok);
    assert(cfg.identity.client_id == "C1");
    assert(cfg.identity.profile_id == "P1");
    assert(cfg.identity.username == "Ana");
    assert(cfg.radio.enable);
    assert(cfg.radio.advertise_window_ms == 2500);
    assert(cfg.radio.listen_advertise_ms == 2000);
    assert(cfg.radio.drop_timeout_ms == 1500);
    assert(cfg.network.relay_host == "relay.local");
    assert(cfg.network.relay_port == 7443);
    assert(cfg.network.tls_enable);
    assert(cfg.network.tls_ca_file == "ca.pem");
    assert(cfg.composite.radio_start_delay_ms == 250);
    assert(cfg.debug_log);
  }

  // Missing identity is generated.
  {
    ClientConfig cfg;
    std::string err;
    const bool ok = ParseClientConfig("[network]\nenable=0\n", cfg, err);
    assert(ok);
    assert(cfg.identity.client_id.size() == 36);
    assert(cfg.identity.client_id[8] == '-');
    assert(cfg.identity.client_id[14] == '4');
    assert(cfg.identity.profile_id == cfg.identity.client_id);
  }

  {
    ClientConfig cfg;
    std::string err;
    assert(!ParseClientConfig("[network]\nenable=1\n", cfg, err));
    assert(err.find("relay_host") != std::string::npos);
  }

  {
    ClientConfig cfg;
    std::string err;
    assert(!ParseClientConfig("[radio]\nenable=0\n[network]\nenable=0\n", cfg,
                              err));
  }

  {
    ClientConfig cfg;
    std::string err;
    assert(!ParseClientConfig("[radio]\ndrop_timeout_ms=soon\n", cfg, err));
    assert(err.find("radio.drop_timeout_ms") != std::string::npos);
    assert(!ParseClientConfig("[radio]\njust text\n", cfg, err));
    assert(!ParseClientConfig("[radio]\nhandshake_timeout_ms=0\n"
                              "[network]\nenable=0\n",
                              cfg, err));
  }

  {
    ClientConfig cfg;
    std::string err;
    assert(!LoadClientConfig("does_not_exist.ini", cfg, err));
    assert(err.find("not found") != std::string::npos);
  }

  {
    assert(whisper::core::Trim("  a b \t") == "a b");
    assert(whisper::core::StripInlineComment("v # c") == "v");
    assert(whisper::core::StripInlineComment("a#b") == "a#b");
    std::uint16_t port = 0;
    assert(!whisper::core::ParseUint16("70000", port));
    assert(whisper::core::ParseUint16("443", port) && port == 443);
  }

  return 0;
}
