#include "relay_server.h"

#include <cerrno>
#include <utility>

#include "platform_log.h"

namespace whisper::relay {

namespace pfl = whisper::platform::log;
namespace net = whisper::platform::net;
namespace tls = whisper::platform::tls;

namespace {

constexpr const char* kTag = "relay";
constexpr std::uint32_t kPollMs = 1000;
constexpr std::size_t kRecvChunk = 4096;

}  // namespace

RelayServer::RelayServer(const RelaySection& config) : config_(config) {}

RelayServer::~RelayServer() { Stop(); }

bool RelayServer::Start(std::string& error) {
  error.clear();
  if (running_.load()) {
    error = "relay already running";
    return false;
  }
  if (config_.tls_enable &&
      !tls::ServerInitCredentials(config_.tls_cert, config_.tls_key, creds_,
                                  error)) {
    return false;
  }
  if (!net::CreateTcpListener(config_.bind_host, config_.listen_port,
                              listen_fd_, error)) {
    tls::Close(creds_);
    return false;
  }
  if (!net::SetNonBlocking(listen_fd_)) {
    error = "listener non-blocking failed";
    net::CloseSocket(listen_fd_);
    tls::Close(creds_);
    return false;
  }
  if (!net::CreateWakePair(wake_read_, wake_write_, error)) {
    net::CloseSocket(listen_fd_);
    tls::Close(creds_);
    return false;
  }
  port_ = net::LocalPort(listen_fd_);
  running_.store(true);
  worker_ = std::thread(&RelayServer::Run, this);
  pfl::Log(pfl::Level::kInfo, kTag, "relay listening",
           {{"bind", config_.bind_host},
            {"port", std::to_string(port_)},
            {"tls", config_.tls_enable ? "on" : "off"}});
  return true;
}

void RelayServer::Stop() {
  running_.store(false);
  net::SignalWake(wake_write_);
  if (worker_.joinable()) {
    worker_.join();
  }
  for (auto& entry : connections_) {
    CloseConnection(*entry.second, "relay stopping");
  }
  connections_.clear();
  connections_by_ip_.clear();
  net::CloseSocket(listen_fd_);
  net::CloseSocket(wake_read_);
  net::CloseSocket(wake_write_);
  tls::Close(creds_);
}

void RelayServer::Run() {
  std::vector<net::PollFd> fds;
  std::vector<ConnectionId> ids;
  while (running_.load()) {
    fds.clear();
    ids.clear();
    net::PollFd listen_fd;
    listen_fd.sock = listen_fd_;
    listen_fd.events = net::kPollIn;
    fds.push_back(listen_fd);
    net::PollFd wake_fd;
    wake_fd.sock = wake_read_;
    wake_fd.events = net::kPollIn;
    fds.push_back(wake_fd);
    for (const auto& entry : connections_) {
      const Connection& conn = *entry.second;
      net::PollFd fd;
      fd.sock = conn.sock;
      fd.events = net::kPollIn;
      if (conn.send_off < conn.send_buf.size()) {
        fd.events |= net::kPollOut;
      }
      fds.push_back(fd);
      ids.push_back(entry.first);
    }

    const int rc = net::Poll(fds.data(), fds.size(), kPollMs);
    if (rc < 0) {
      if (errno == EINTR) {
        continue;
      }
      pfl::Log(pfl::Level::kError, kTag, "poll failed");
      break;
    }
    if (rc == 0) {
      continue;
    }
    if (fds[1].revents != 0) {
      net::DrainWake(wake_read_);
    }
    if ((fds[0].revents & net::kPollIn) != 0) {
      AcceptPending();
    }
    for (std::size_t i = 0; i < ids.size(); ++i) {
      auto it = connections_.find(ids[i]);
      if (it == connections_.end() || it->second->closed) {
        continue;
      }
      Connection& conn = *it->second;
      const short revents = fds[i + 2].revents;
      if ((revents & (net::kPollIn | net::kPollErr)) != 0) {
        HandleReadable(conn);
      }
      if (!conn.closed && (revents & net::kPollOut) != 0) {
        HandleWrite(conn);
      }
    }
    ReapClosed();
  }
}

void RelayServer::AcceptPending() {
  while (true) {
    net::Socket sock = net::kInvalidSocket;
    std::string remote_ip;
    std::string error;
    if (!net::AcceptTcp(listen_fd_, sock, remote_ip, error)) {
      if (!net::SocketWouldBlock()) {
        pfl::Log(pfl::Level::kWarn, kTag, "accept failed", {{"error", error}});
      }
      return;
    }
    if (!TryAcquireConnectionSlot(remote_ip)) {
      pfl::Log(pfl::Level::kWarn, kTag, "connection refused by limits",
               {{"ip", remote_ip}});
      net::CloseSocket(sock);
      continue;
    }
    if (!net::SetNonBlocking(sock)) {
      ReleaseConnectionSlot(remote_ip);
      net::CloseSocket(sock);
      continue;
    }
    if (!net::SetNoDelay(sock)) {
      pfl::Log(pfl::Level::kDebug, kTag, "TCP_NODELAY not applied");
    }
    auto conn = std::make_unique<Connection>();
    conn->id = next_id_++;
    conn->sock = sock;
    conn->remote_ip = remote_ip;
    if (config_.tls_enable) {
      if (!tls::NewServerSession(creds_, conn->tls, error)) {
        pfl::Log(pfl::Level::kWarn, kTag, "tls session failed",
                 {{"error", error}});
        ReleaseConnectionSlot(remote_ip);
        net::CloseSocket(sock);
        continue;
      }
      conn->use_tls = true;
    }
    pfl::Log(pfl::Level::kDebug, kTag, "accepted",
             {{"conn", std::to_string(conn->id)}, {"ip", remote_ip}});
    connections_.emplace(conn->id, std::move(conn));
  }
}

void RelayServer::HandleReadable(Connection& conn) {
  bool peer_closed = false;
  std::uint8_t buf[kRecvChunk];
  while (true) {
    const int n = net::Recv(conn.sock, buf, sizeof(buf));
    if (n > 0) {
      if (!conn.use_tls) {
        conn.recv_buf.insert(conn.recv_buf.end(), buf, buf + n);
        continue;
      }
      std::vector<std::uint8_t> cipher;
      std::string error;
      const bool fed = tls::Feed(conn.tls, buf, static_cast<std::size_t>(n),
                                 conn.recv_buf, cipher, error);
      conn.send_buf.insert(conn.send_buf.end(), cipher.begin(), cipher.end());
      if (!fed) {
        pfl::Log(pfl::Level::kDebug, kTag, "tls failure", {{"error", error}});
        HandleWrite(conn);
        CloseConnection(conn, "tls failure");
        return;
      }
      continue;
    }
    if (n == 0) {
      peer_closed = true;
      break;
    }
    if (net::SocketWouldBlock()) {
      break;
    }
    CloseConnection(conn, "recv failed");
    return;
  }

  std::vector<transport::RelayFrame> frames;
  bool ok = transport::TakeFrames(conn.recv_buf, frames);
  std::vector<Outgoing> out;
  for (const auto& frame : frames) {
    if (!hub_.HandleFrame(conn.id, frame, out)) {
      ok = false;
      break;
    }
  }
  Deliver(out);
  if (!ok) {
    HandleWrite(conn);
    CloseConnection(conn, "protocol violation");
    return;
  }
  if (peer_closed) {
    CloseConnection(conn, "peer closed");
    return;
  }
  if (conn.send_off < conn.send_buf.size()) {
    HandleWrite(conn);
  }
}

void RelayServer::HandleWrite(Connection& conn) {
  if (conn.closed) {
    return;
  }
  while (conn.send_off < conn.send_buf.size()) {
    const int n = net::Send(conn.sock, conn.send_buf.data() + conn.send_off,
                            conn.send_buf.size() - conn.send_off);
    if (n > 0) {
      conn.send_off += static_cast<std::size_t>(n);
      continue;
    }
    if (n < 0 && net::SocketWouldBlock()) {
      return;
    }
    CloseConnection(conn, "send failed");
    return;
  }
  conn.send_buf.clear();
  conn.send_off = 0;
}

void RelayServer::Deliver(std::vector<Outgoing>& out) {
  for (auto& item : out) {
    auto it = connections_.find(item.to);
    if (it == connections_.end() || it->second->closed) {
      continue;
    }
    Queue(*it->second, item.frame);
  }
  out.clear();
}

void RelayServer::Queue(Connection& conn,
                        const std::vector<std::uint8_t>& frame) {
  if (!conn.use_tls) {
    conn.send_buf.insert(conn.send_buf.end(), frame.begin(), frame.end());
  } else {
    std::vector<std::uint8_t> cipher;
    std::string error;
    if (!tls::Write(conn.tls, frame.data(), frame.size(), cipher, error)) {
      CloseConnection(conn, "tls write failed");
      return;
    }
    conn.send_buf.insert(conn.send_buf.end(), cipher.begin(), cipher.end());
  }
  if (conn.send_buf.size() - conn.send_off > config_.max_pending_bytes) {
    CloseConnection(conn, "too many unsent bytes");
    return;
  }
  HandleWrite(conn);
}

void RelayServer::CloseConnection(Connection& conn, const char* reason) {
  if (conn.closed) {
    return;
  }
  conn.closed = true;
  pfl::Log(pfl::Level::kDebug, kTag, "closing",
           {{"conn", std::to_string(conn.id)}, {"reason", reason}});
  net::CloseSocket(conn.sock);
  tls::Close(conn.tls);
  ReleaseConnectionSlot(conn.remote_ip);
}

void RelayServer::ReapClosed() {
  bool reaped = true;
  while (reaped) {
    reaped = false;
    std::vector<Outgoing> out;
    for (auto it = connections_.begin(); it != connections_.end();) {
      if (!it->second->closed) {
        ++it;
        continue;
      }
      hub_.Disconnect(it->first, out);
      it = connections_.erase(it);
      reaped = true;
    }
    // Presence delivery can close further slow connections.
    Deliver(out);
  }
}

bool RelayServer::TryAcquireConnectionSlot(const std::string& remote_ip) {
  if (active_connections_.load() >= config_.max_connections) {
    return false;
  }
  std::uint32_t& per_ip = connections_by_ip_[remote_ip];
  if (per_ip >= config_.max_connections_per_ip) {
    return false;
  }
  ++per_ip;
  active_connections_.fetch_add(1);
  return true;
}

void RelayServer::ReleaseConnectionSlot(const std::string& remote_ip) {
  auto it = connections_by_ip_.find(remote_ip);
  if (it != connections_by_ip_.end()) {
    if (it->second <= 1) {
      connections_by_ip_.erase(it);
    } else {
      --it->second;
    }
  }
  if (active_connections_.load() > 0) {
    active_connections_.fetch_sub(1);
  }
}

}  // namespace whisper::relay
