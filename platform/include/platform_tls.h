#ifndef WHISPER_PLATFORM_TLS_H
#define WHISPER_PLATFORM_TLS_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace whisper::platform::tls {

// TLS over memory buffers. Callers own the socket and move ciphertext
// between it and the session, so the same session works in poll loops.

struct ClientVerifyConfig {
  bool verify_peer{true};
  bool verify_hostname{true};
  std::string ca_bundle_path;
};

struct Credentials {
  void* impl{nullptr};
};

struct Session {
  void* impl{nullptr};
};

bool IsSupported();

bool ClientInitCredentials(const ClientVerifyConfig& verify,
                           Credentials& out,
                           std::string& error);
bool ServerInitCredentials(const std::string& cert_pem_path,
                           const std::string& key_pem_path,
                           Credentials& out,
                           std::string& error);

// host is used for SNI and hostname verification on client sessions.
bool NewClientSession(Credentials& creds, const std::string& host,
                      Session& out, std::string& error);
bool NewServerSession(Credentials& creds, Session& out, std::string& error);

// Starts the client handshake; out_cipher receives the ClientHello.
bool StartHandshake(Session& session, std::vector<std::uint8_t>& out_cipher,
                    std::string& error);
bool HandshakeDone(const Session& session);

// Consumes ciphertext read from the socket. Appends decrypted bytes to
// out_plain and any ciphertext that must be written back to out_cipher.
bool Feed(Session& session, const std::uint8_t* data, std::size_t len,
          std::vector<std::uint8_t>& out_plain,
          std::vector<std::uint8_t>& out_cipher,
          std::string& error);

// Plaintext written before the handshake completes is held and flushed by
// the Feed call that finishes it.
bool Write(Session& session, const std::uint8_t* data, std::size_t len,
           std::vector<std::uint8_t>& out_cipher,
           std::string& error);

void Close(Session& session);
void Close(Credentials& creds);

}  // namespace whisper::platform::tls

#endif  // WHISPER_PLATFORM_TLS_H
