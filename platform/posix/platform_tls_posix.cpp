#include "platform_tls.h"

#include <openssl/err.h>
#include <openssl/ssl.h>
#include <openssl/x509.h>
#include <openssl/x509v3.h>

#include <cstddef>
#include <filesystem>
#include <limits>
#include <memory>
#include <mutex>

namespace whisper::platform::tls {

namespace {

struct CredentialsImpl {
  SSL_CTX* ctx{nullptr};
  bool server{false};
  bool verify_peer{false};
  bool verify_hostname{false};

  ~CredentialsImpl() {
    if (ctx) {
      SSL_CTX_free(ctx);
      ctx = nullptr;
    }
  }
};

struct SessionImpl {
  SSL* ssl{nullptr};
  BIO* rbio{nullptr};
  BIO* wbio{nullptr};
  bool handshake_done{false};
  std::vector<std::uint8_t> pending_plain;

  ~SessionImpl() {
    if (ssl) {
      SSL_free(ssl);
      ssl = nullptr;
    }
    rbio = nullptr;
    wbio = nullptr;
  }
};

bool EnsureOpenSsl() {
  static std::once_flag init_once;
  static bool ok = false;
  std::call_once(init_once, []() {
    ok = OPENSSL_init_ssl(0, nullptr) == 1;
  });
  return ok;
}

std::string GetOpenSslError() {
  const unsigned long err = ERR_get_error();
  if (err == 0) {
    return "openssl error";
  }
  char buf[256] = {};
  ERR_error_string_n(err, buf, sizeof(buf));
  return std::string(buf);
}

void ApplyBaseOptions(SSL_CTX* ctx) {
  SSL_CTX_set_options(ctx, SSL_OP_NO_SSLv2 | SSL_OP_NO_SSLv3);
  SSL_CTX_set_options(ctx, SSL_OP_NO_COMPRESSION);
  SSL_CTX_set_min_proto_version(ctx, TLS1_2_VERSION);
}

void DrainBio(BIO* bio, std::vector<std::uint8_t>& out) {
  if (!bio) {
    return;
  }
  std::uint8_t buf[4096];
  for (;;) {
    const int n = BIO_read(bio, buf, static_cast<int>(sizeof(buf)));
    if (n <= 0) {
      break;
    }
    out.insert(out.end(), buf, buf + n);
  }
}

bool NewSession(Credentials& creds, bool server, const std::string& host,
                Session& out, std::string& error) {
  error.clear();
  if (!creds.impl) {
    error = "tls credentials missing";
    return false;
  }
  auto* cred = static_cast<CredentialsImpl*>(creds.impl);
  auto impl = std::make_unique<SessionImpl>();
  impl->ssl = SSL_new(cred->ctx);
  if (!impl->ssl) {
    error = GetOpenSslError();
    return false;
  }
  impl->rbio = BIO_new(BIO_s_mem());
  impl->wbio = BIO_new(BIO_s_mem());
  if (!impl->rbio || !impl->wbio) {
    if (impl->rbio) {
      BIO_free(impl->rbio);
    }
    if (impl->wbio) {
      BIO_free(impl->wbio);
    }
    impl->rbio = nullptr;
    impl->wbio = nullptr;
    error = "BIO_new failed";
    return false;
  }
  SSL_set_bio(impl->ssl, impl->rbio, impl->wbio);
  if (server) {
    SSL_set_accept_state(impl->ssl);
  } else {
    SSL_set_connect_state(impl->ssl);
    if (!host.empty()) {
      SSL_set_tlsext_host_name(impl->ssl, host.c_str());
    }
    if (cred->verify_peer && cred->verify_hostname && !host.empty()) {
      if (SSL_set1_host(impl->ssl, host.c_str()) != 1) {
        error = "tls host verify setup failed";
        return false;
      }
    }
  }
  out.impl = impl.release();
  return true;
}

bool FlushPlain(SessionImpl* impl, std::vector<std::uint8_t>& out_cipher,
                std::string& error) {
  std::size_t offset = 0;
  while (offset < impl->pending_plain.size()) {
    const std::size_t remaining = impl->pending_plain.size() - offset;
    const int chunk =
        remaining > static_cast<std::size_t>((std::numeric_limits<int>::max)())
            ? (std::numeric_limits<int>::max)()
            : static_cast<int>(remaining);
    const int ret = SSL_write(impl->ssl, impl->pending_plain.data() + offset,
                              chunk);
    if (ret <= 0) {
      const int err = SSL_get_error(impl->ssl, ret);
      if (err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE) {
        break;
      }
      error = GetOpenSslError();
      return false;
    }
    offset += static_cast<std::size_t>(ret);
    DrainBio(impl->wbio, out_cipher);
  }
  impl->pending_plain.erase(
      impl->pending_plain.begin(),
      impl->pending_plain.begin() + static_cast<std::ptrdiff_t>(offset));
  DrainBio(impl->wbio, out_cipher);
  return true;
}

bool StepHandshake(SessionImpl* impl, std::vector<std::uint8_t>& out_cipher,
                   std::string& error) {
  if (impl->handshake_done) {
    return true;
  }
  const int ret = SSL_do_handshake(impl->ssl);
  if (ret == 1) {
    impl->handshake_done = true;
  } else {
    const int err = SSL_get_error(impl->ssl, ret);
    if (err != SSL_ERROR_WANT_READ && err != SSL_ERROR_WANT_WRITE) {
      error = GetOpenSslError();
      DrainBio(impl->wbio, out_cipher);
      return false;
    }
  }
  DrainBio(impl->wbio, out_cipher);
  return true;
}

}  // namespace

bool IsSupported() {
  return EnsureOpenSsl();
}

bool ClientInitCredentials(const ClientVerifyConfig& verify,
                           Credentials& out,
                           std::string& error) {
  error.clear();
  if (!EnsureOpenSsl()) {
    error = "openssl init failed";
    return false;
  }
  auto impl = std::make_unique<CredentialsImpl>();
  impl->ctx = SSL_CTX_new(TLS_client_method());
  if (!impl->ctx) {
    error = "SSL_CTX_new failed";
    return false;
  }
  ApplyBaseOptions(impl->ctx);
  impl->verify_peer = verify.verify_peer;
  impl->verify_hostname = verify.verify_hostname;
  if (verify.verify_peer) {
    if (!verify.ca_bundle_path.empty()) {
      const std::filesystem::path ca_path(verify.ca_bundle_path);
      const std::string ca_path_str = ca_path.string();
      std::error_code ec;
      const bool is_dir = std::filesystem::is_directory(ca_path, ec);
      const char* ca_file = is_dir ? nullptr : ca_path_str.c_str();
      const char* ca_dir = is_dir ? ca_path_str.c_str() : nullptr;
      if (SSL_CTX_load_verify_locations(impl->ctx, ca_file, ca_dir) != 1) {
        error = "tls ca bundle load failed";
        return false;
      }
    } else if (SSL_CTX_set_default_verify_paths(impl->ctx) != 1) {
      error = "tls ca bundle missing";
      return false;
    }
    SSL_CTX_set_verify(impl->ctx, SSL_VERIFY_PEER, nullptr);
  } else {
    SSL_CTX_set_verify(impl->ctx, SSL_VERIFY_NONE, nullptr);
  }
  out.impl = impl.release();
  return true;
}

bool ServerInitCredentials(const std::string& cert_pem_path,
                           const std::string& key_pem_path,
                           Credentials& out,
                           std::string& error) {
  error.clear();
  if (!EnsureOpenSsl()) {
    error = "openssl init failed";
    return false;
  }
  if (cert_pem_path.empty() || key_pem_path.empty()) {
    error = "tls_cert/tls_key empty";
    return false;
  }
  auto impl = std::make_unique<CredentialsImpl>();
  impl->server = true;
  impl->ctx = SSL_CTX_new(TLS_server_method());
  if (!impl->ctx) {
    error = "SSL_CTX_new failed";
    return false;
  }
  ApplyBaseOptions(impl->ctx);
  if (SSL_CTX_use_certificate_chain_file(impl->ctx, cert_pem_path.c_str()) != 1) {
    error = "load tls_cert failed: " + GetOpenSslError();
    return false;
  }
  if (SSL_CTX_use_PrivateKey_file(impl->ctx, key_pem_path.c_str(),
                                  SSL_FILETYPE_PEM) != 1) {
    error = "load tls_key failed: " + GetOpenSslError();
    return false;
  }
  if (SSL_CTX_check_private_key(impl->ctx) != 1) {
    error = "tls_key does not match tls_cert";
    return false;
  }
  out.impl = impl.release();
  return true;
}

bool NewClientSession(Credentials& creds, const std::string& host,
                      Session& out, std::string& error) {
  return NewSession(creds, false, host, out, error);
}

bool NewServerSession(Credentials& creds, Session& out, std::string& error) {
  return NewSession(creds, true, std::string(), out, error);
}

bool StartHandshake(Session& session, std::vector<std::uint8_t>& out_cipher,
                    std::string& error) {
  error.clear();
  if (!session.impl) {
    error = "tls session missing";
    return false;
  }
  return StepHandshake(static_cast<SessionImpl*>(session.impl), out_cipher,
                       error);
}

bool HandshakeDone(const Session& session) {
  return session.impl &&
         static_cast<const SessionImpl*>(session.impl)->handshake_done;
}

bool Feed(Session& session, const std::uint8_t* data, std::size_t len,
          std::vector<std::uint8_t>& out_plain,
          std::vector<std::uint8_t>& out_cipher,
          std::string& error) {
  error.clear();
  if (!session.impl) {
    error = "tls session missing";
    return false;
  }
  auto* impl = static_cast<SessionImpl*>(session.impl);
  if (data && len > 0) {
    const int wrote = BIO_write(impl->rbio, data, static_cast<int>(len));
    if (wrote <= 0 || static_cast<std::size_t>(wrote) != len) {
      error = "tls BIO_write failed";
      return false;
    }
  }
  if (!impl->handshake_done) {
    if (!StepHandshake(impl, out_cipher, error)) {
      return false;
    }
    if (!impl->handshake_done) {
      return true;
    }
    if (!FlushPlain(impl, out_cipher, error)) {
      return false;
    }
  }
  std::uint8_t buf[4096];
  while (true) {
    const int ret = SSL_read(impl->ssl, buf, sizeof(buf));
    if (ret > 0) {
      out_plain.insert(out_plain.end(), buf, buf + ret);
      continue;
    }
    const int err = SSL_get_error(impl->ssl, ret);
    if (err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE) {
      break;
    }
    if (err == SSL_ERROR_ZERO_RETURN) {
      error = "tls closed by peer";
      return false;
    }
    error = GetOpenSslError();
    return false;
  }
  DrainBio(impl->wbio, out_cipher);
  return true;
}

bool Write(Session& session, const std::uint8_t* data, std::size_t len,
           std::vector<std::uint8_t>& out_cipher,
           std::string& error) {
  error.clear();
  if (!session.impl) {
    error = "tls session missing";
    return false;
  }
  auto* impl = static_cast<SessionImpl*>(session.impl);
  if (data && len > 0) {
    impl->pending_plain.insert(impl->pending_plain.end(), data, data + len);
  }
  if (!impl->handshake_done) {
    return true;
  }
  return FlushPlain(impl, out_cipher, error);
}

void Close(Session& session) {
  if (session.impl) {
    delete static_cast<SessionImpl*>(session.impl);
    session.impl = nullptr;
  }
}

void Close(Credentials& creds) {
  if (creds.impl) {
    delete static_cast<CredentialsImpl*>(creds.impl);
    creds.impl = nullptr;
  }
}

}  // namespace whisper::platform::tls
