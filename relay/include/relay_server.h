#ifndef WHISPER_RELAY_RELAY_SERVER_H
#define WHISPER_RELAY_RELAY_SERVER_H

#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include "platform_net.h"
#include "platform_tls.h"
#include "relay_config.h"
#include "relay_hub.h"

namespace whisper::relay {

// TCP/TLS front end of the hub: one poll loop on its own thread.
class RelayServer {
 public:
  explicit RelayServer(const RelaySection& config);
  ~RelayServer();

  RelayServer(const RelayServer&) = delete;
  RelayServer& operator=(const RelayServer&) = delete;

  bool Start(std::string& error);
  void Stop();

  // The bound port; differs from the configured one when that was 0.
  std::uint16_t port() const { return port_; }
  std::size_t connection_count() const { return active_connections_.load(); }

 private:
  struct Connection {
    ConnectionId id{0};
    platform::net::Socket sock{platform::net::kInvalidSocket};
    std::string remote_ip;
    platform::tls::Session tls;
    bool use_tls{false};
    std::vector<std::uint8_t> recv_buf;
    std::vector<std::uint8_t> send_buf;
    std::size_t send_off{0};
    bool closed{false};
  };

  void Run();
  void AcceptPending();
  void HandleReadable(Connection& conn);
  void HandleWrite(Connection& conn);
  void Deliver(std::vector<Outgoing>& out);
  void Queue(Connection& conn, const std::vector<std::uint8_t>& frame);
  void CloseConnection(Connection& conn, const char* reason);
  void ReapClosed();
  bool TryAcquireConnectionSlot(const std::string& remote_ip);
  void ReleaseConnectionSlot(const std::string& remote_ip);

  RelaySection config_;
  RelayHub hub_;
  std::uint16_t port_{0};
  std::atomic<bool> running_{false};
  std::thread worker_;
  platform::net::Socket listen_fd_{platform::net::kInvalidSocket};
  platform::net::Socket wake_read_{platform::net::kInvalidSocket};
  platform::net::Socket wake_write_{platform::net::kInvalidSocket};
  platform::tls::Credentials creds_;

  std::atomic<std::uint32_t> active_connections_{0};
  std::unordered_map<std::string, std::uint32_t> connections_by_ip_;
  ConnectionId next_id_{1};
  std::map<ConnectionId, std::unique_ptr<Connection>> connections_;
};

}  // namespace whisper::relay

#endif  // WHISPER_RELAY_RELAY_SERVER_H
