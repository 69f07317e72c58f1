#ifndef WHISPER_PLATFORM_NET_H
#define WHISPER_PLATFORM_NET_H

#include <cstddef>
#include <cstdint>
#include <string>

#include <sys/socket.h>

namespace whisper::platform::net {

using Socket = int;
constexpr Socket kInvalidSocket = -1;

bool SetNonBlocking(Socket sock);
bool SetNoDelay(Socket sock);
bool SocketWouldBlock();

// Return bytes transferred, 0 on orderly close (Recv), -1 on error.
int Send(Socket sock, const std::uint8_t* data, std::size_t len);
int Recv(Socket sock, std::uint8_t* data, std::size_t len);

bool ConnectTcp(const std::string& host, std::uint16_t port, Socket& out,
                std::string& error);
// Port 0 binds an ephemeral port; read it back with LocalPort.
bool CreateTcpListener(const std::string& bind_host, std::uint16_t port,
                       Socket& out, std::string& error);
bool AcceptTcp(Socket listen_sock, Socket& out, std::string& remote_ip,
               std::string& error);
std::uint16_t LocalPort(Socket sock);
bool SockaddrToIp(const sockaddr* addr, socklen_t addr_len, std::string& out);

// Self-pipe used to interrupt Poll from another thread.
bool CreateWakePair(Socket& read_end, Socket& write_end, std::string& error);
void SignalWake(Socket write_end);
void DrainWake(Socket read_end);

// True when a non-loopback interface is up.
bool HasRoutableInterface();

constexpr short kPollIn = 0x01;
constexpr short kPollOut = 0x02;
constexpr short kPollErr = 0x04;

struct PollFd {
  Socket sock{kInvalidSocket};
  short events{0};
  short revents{0};
};

int Poll(PollFd* fds, std::size_t count, std::uint32_t timeout_ms);

bool ShutdownSend(Socket sock);
void CloseSocket(Socket& sock);

}  // namespace whisper::platform::net

#endif  // WHISPER_PLATFORM_NET_H
