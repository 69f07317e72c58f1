#ifndef WHISPER_TRANSPORT_RELAY_LINK_H
#define WHISPER_TRANSPORT_RELAY_LINK_H

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "config.h"
#include "event_queue.h"
#include "platform_net.h"
#include "platform_tls.h"
#include "relay_frame.h"

namespace whisper::transport {

// One connection to the relay. Socket I/O runs on a private thread; every
// handler runs on the event queue. No handler runs after Close returns.
class RelayLink final {
 public:
  struct Handlers {
    std::function<void()> on_connected;
    std::function<void(const RelayFrame&)> on_frame;
    // Not called for a Close requested by the owner.
    std::function<void(const std::string& reason)> on_closed;
  };

  RelayLink(core::EventQueue& queue, const core::NetworkSection& config);
  ~RelayLink();

  RelayLink(const RelayLink&) = delete;
  RelayLink& operator=(const RelayLink&) = delete;

  void SetHandlers(Handlers handlers);

  // Connects in the background; the outcome arrives as on_connected or
  // on_closed.
  bool Open(std::string& error);
  // Flushes queued frames (bounded by the linger time) and joins the thread.
  void Close();
  // Thread-safe. Frames sent before the connection is up are held.
  bool Send(std::vector<std::uint8_t> frame);

  bool open() const { return running_.load(); }

 private:
  void Run(std::weak_ptr<int> token);
  bool Connect(std::string& error);
  bool TakeOutbox(std::string& error);
  bool WritePending(std::string& error);
  bool ReadAvailable(std::vector<RelayFrame>& frames, std::string& error);
  void Linger();
  void Teardown();

  void PostConnected();
  void PostFrames(std::vector<RelayFrame> frames);
  void PostClosed(std::string reason);

  core::EventQueue& queue_;
  core::NetworkSection config_;
  Handlers handlers_;
  std::shared_ptr<int> token_;

  std::atomic<bool> running_{false};
  std::thread thread_;
  std::mutex mutex_;
  std::vector<std::vector<std::uint8_t>> outbox_;
  platform::net::Socket wake_read_{platform::net::kInvalidSocket};
  platform::net::Socket wake_write_{platform::net::kInvalidSocket};

  // I/O thread only.
  std::weak_ptr<int> io_token_;
  platform::net::Socket sock_{platform::net::kInvalidSocket};
  bool use_tls_{false};
  bool announced_{false};
  platform::tls::Credentials creds_;
  platform::tls::Session tls_;
  std::vector<std::uint8_t> recv_buf_;
  std::vector<std::uint8_t> send_buf_;
  std::size_t send_off_{0};
  std::uint64_t last_send_ms_{0};
};

}  // namespace whisper::transport

#endif  // WHISPER_TRANSPORT_RELAY_LINK_H
