#include "relay_link.h"

#include <cerrno>
#include <utility>

#include "platform_log.h"
#include "platform_time.h"

namespace whisper::transport {

namespace pfl = whisper::platform::log;
namespace net = whisper::platform::net;
namespace tls = whisper::platform::tls;

namespace {

constexpr const char* kTag = "relay_link";
constexpr std::uint32_t kIdlePollMs = 1000;
constexpr std::uint64_t kLingerMs = 500;
constexpr std::size_t kRecvChunk = 4096;

}  // namespace

RelayLink::RelayLink(core::EventQueue& queue,
                     const core::NetworkSection& config)
    : queue_(queue), config_(config) {}

RelayLink::~RelayLink() { Close(); }

void RelayLink::SetHandlers(Handlers handlers) {
  handlers_ = std::move(handlers);
}

bool RelayLink::Open(std::string& error) {
  error.clear();
  if (running_.load()) {
    error = "relay link already open";
    return false;
  }
  Close();
  if (config_.relay_host.empty() || config_.relay_port == 0) {
    error = "relay endpoint not configured";
    return false;
  }
  if (config_.tls_enable && !tls::IsSupported()) {
    error = "tls not supported";
    return false;
  }
  if (!net::CreateWakePair(wake_read_, wake_write_, error)) {
    return false;
  }
  token_ = std::make_shared<int>(0);
  pfl::Log(pfl::Level::kInfo, kTag, "opening",
           {{"host", config_.relay_host},
            {"port", std::to_string(config_.relay_port)},
            {"tls", config_.tls_enable ? "1" : "0"}});
  running_.store(true);
  thread_ = std::thread(&RelayLink::Run, this, std::weak_ptr<int>(token_));
  return true;
}

void RelayLink::Close() {
  running_.store(false);
  net::SignalWake(wake_write_);
  if (thread_.joinable()) {
    thread_.join();
  }
  net::CloseSocket(wake_read_);
  net::CloseSocket(wake_write_);
  {
    std::lock_guard<std::mutex> lock(mutex_);
    outbox_.clear();
  }
  token_.reset();
}

bool RelayLink::Send(std::vector<std::uint8_t> frame) {
  if (frame.empty()) {
    return false;
  }
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!running_.load()) {
      return false;
    }
    outbox_.push_back(std::move(frame));
  }
  net::SignalWake(wake_write_);
  return true;
}

void RelayLink::Run(std::weak_ptr<int> token) {
  io_token_ = std::move(token);
  std::string error;
  if (!Connect(error)) {
    running_.store(false);
    pfl::Log(pfl::Level::kWarn, kTag, "connect failed", {{"error", error}});
    PostClosed(error);
    Teardown();
    return;
  }
  if (!use_tls_) {
    announced_ = true;
    PostConnected();
  }
  last_send_ms_ = platform::NowSteadyMs();
  const std::uint32_t poll_ms =
      config_.heartbeat_ms > 0 ? config_.heartbeat_ms : kIdlePollMs;

  bool failed = false;
  while (running_.load()) {
    if (!TakeOutbox(error) || !WritePending(error)) {
      failed = true;
      break;
    }
    net::PollFd fds[2];
    fds[0].sock = sock_;
    fds[0].events = net::kPollIn;
    if (send_off_ < send_buf_.size()) {
      fds[0].events |= net::kPollOut;
    }
    fds[1].sock = wake_read_;
    fds[1].events = net::kPollIn;
    const int rc = net::Poll(fds, 2, poll_ms);
    if (rc < 0) {
      if (errno == EINTR) {
        continue;
      }
      error = "poll failed";
      failed = true;
      break;
    }
    if (fds[1].revents != 0) {
      net::DrainWake(wake_read_);
    }
    if ((fds[0].revents & (net::kPollIn | net::kPollErr)) != 0) {
      std::vector<RelayFrame> frames;
      const bool ok = ReadAvailable(frames, error);
      if (!frames.empty()) {
        PostFrames(std::move(frames));
      }
      if (!ok) {
        failed = true;
        break;
      }
    }
    if (config_.heartbeat_ms > 0 && announced_ &&
        platform::NowSteadyMs() - last_send_ms_ >= config_.heartbeat_ms) {
      std::lock_guard<std::mutex> lock(mutex_);
      outbox_.push_back(HeartbeatFrame());
    }
  }

  if (failed) {
    running_.store(false);
    pfl::Log(pfl::Level::kWarn, kTag, "connection lost", {{"error", error}});
    PostClosed(error);
  } else {
    Linger();
  }
  Teardown();
}

bool RelayLink::Connect(std::string& error) {
  if (!net::ConnectTcp(config_.relay_host, config_.relay_port, sock_, error)) {
    return false;
  }
  if (!net::SetNonBlocking(sock_)) {
    error = "set non-blocking failed";
    return false;
  }
  if (!net::SetNoDelay(sock_)) {
    pfl::Log(pfl::Level::kDebug, kTag, "TCP_NODELAY not applied");
  }
  use_tls_ = config_.tls_enable;
  if (!use_tls_) {
    return true;
  }
  tls::ClientVerifyConfig verify;
  verify.verify_peer = config_.tls_verify;
  verify.verify_hostname = config_.tls_verify;
  verify.ca_bundle_path = config_.tls_ca_file;
  if (!tls::ClientInitCredentials(verify, creds_, error)) {
    return false;
  }
  if (!tls::NewClientSession(creds_, config_.relay_host, tls_, error)) {
    return false;
  }
  std::vector<std::uint8_t> hello;
  if (!tls::StartHandshake(tls_, hello, error)) {
    return false;
  }
  send_buf_.insert(send_buf_.end(), hello.begin(), hello.end());
  return true;
}

bool RelayLink::TakeOutbox(std::string& error) {
  std::vector<std::vector<std::uint8_t>> pending;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    pending.swap(outbox_);
  }
  for (const auto& frame : pending) {
    if (!use_tls_) {
      send_buf_.insert(send_buf_.end(), frame.begin(), frame.end());
      continue;
    }
    std::vector<std::uint8_t> cipher;
    if (!tls::Write(tls_, frame.data(), frame.size(), cipher, error)) {
      return false;
    }
    send_buf_.insert(send_buf_.end(), cipher.begin(), cipher.end());
  }
  return true;
}

bool RelayLink::WritePending(std::string& error) {
  while (send_off_ < send_buf_.size()) {
    const int n = net::Send(sock_, send_buf_.data() + send_off_,
                            send_buf_.size() - send_off_);
    if (n > 0) {
      send_off_ += static_cast<std::size_t>(n);
      last_send_ms_ = platform::NowSteadyMs();
      continue;
    }
    if (n < 0 && net::SocketWouldBlock()) {
      return true;
    }
    error = "send failed";
    return false;
  }
  send_buf_.clear();
  send_off_ = 0;
  return true;
}

bool RelayLink::ReadAvailable(std::vector<RelayFrame>& frames,
                              std::string& error) {
  bool ok = true;
  std::uint8_t buf[kRecvChunk];
  while (true) {
    const int n = net::Recv(sock_, buf, sizeof(buf));
    if (n > 0) {
      if (!use_tls_) {
        recv_buf_.insert(recv_buf_.end(), buf, buf + n);
        continue;
      }
      std::vector<std::uint8_t> cipher;
      if (!tls::Feed(tls_, buf, static_cast<std::size_t>(n), recv_buf_,
                     cipher, error)) {
        return false;
      }
      send_buf_.insert(send_buf_.end(), cipher.begin(), cipher.end());
      if (!announced_ && tls::HandshakeDone(tls_)) {
        announced_ = true;
        PostConnected();
      }
      continue;
    }
    if (n == 0) {
      error = "relay closed the connection";
      ok = false;
      break;
    }
    if (net::SocketWouldBlock()) {
      break;
    }
    error = "recv failed";
    ok = false;
    break;
  }
  if (!TakeFrames(recv_buf_, frames)) {
    error = "bad frame from relay";
    return false;
  }
  return ok;
}

void RelayLink::Linger() {
  if (sock_ == net::kInvalidSocket) {
    return;
  }
  std::string error;
  if (!TakeOutbox(error)) {
    return;
  }
  const std::uint64_t deadline = platform::NowSteadyMs() + kLingerMs;
  while (send_off_ < send_buf_.size()) {
    if (!WritePending(error)) {
      return;
    }
    const std::uint64_t now = platform::NowSteadyMs();
    if (send_off_ >= send_buf_.size()) {
      break;
    }
    if (now >= deadline) {
      pfl::Log(pfl::Level::kWarn, kTag, "unsent bytes dropped at close",
               {{"bytes", std::to_string(send_buf_.size() - send_off_)}});
      return;
    }
    net::PollFd fd;
    fd.sock = sock_;
    fd.events = net::kPollOut;
    net::Poll(&fd, 1, static_cast<std::uint32_t>(deadline - now));
  }
  net::ShutdownSend(sock_);
}

void RelayLink::Teardown() {
  net::CloseSocket(sock_);
  tls::Close(tls_);
  tls::Close(creds_);
  recv_buf_.clear();
  send_buf_.clear();
  send_off_ = 0;
  announced_ = false;
  use_tls_ = false;
}

void RelayLink::PostConnected() {
  queue_.Post([this, token = io_token_]() {
    if (token.expired() || !handlers_.on_connected) {
      return;
    }
    handlers_.on_connected();
  });
}

void RelayLink::PostFrames(std::vector<RelayFrame> frames) {
  queue_.Post([this, token = io_token_, frames = std::move(frames)]() {
    for (const auto& frame : frames) {
      // A handler may close the link mid-batch.
      if (token.expired() || !handlers_.on_frame) {
        return;
      }
      handlers_.on_frame(frame);
    }
  });
}

void RelayLink::PostClosed(std::string reason) {
  queue_.Post([this, token = io_token_, reason = std::move(reason)]() {
    if (token.expired() || !handlers_.on_closed) {
      return;
    }
    handlers_.on_closed(reason);
  });
}

}  // namespace whisper::transport
