#include "platform_net.h"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <arpa/inet.h>
#include <fcntl.h>
#include <ifaddrs.h>
#include <limits>
#include <net/if.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>
#include <vector>

namespace whisper::platform::net {

namespace {

std::string ErrnoText(const char* what) {
  return std::string(what) + ": " + std::to_string(errno) + " " +
         std::string(std::strerror(errno));
}

}  // namespace

bool SetNonBlocking(Socket sock) {
  const int flags = fcntl(sock, F_GETFL, 0);
  if (flags < 0) {
    return false;
  }
  return fcntl(sock, F_SETFL, flags | O_NONBLOCK) == 0;
}

bool SetNoDelay(Socket sock) {
  int yes = 1;
  return setsockopt(sock, IPPROTO_TCP, TCP_NODELAY, &yes, sizeof(yes)) == 0;
}

bool SocketWouldBlock() {
  return errno == EAGAIN || errno == EWOULDBLOCK;
}

int Send(Socket sock, const std::uint8_t* data, std::size_t len) {
  if (!data || len == 0) {
    return 0;
  }
  const std::size_t chunk =
      std::min<std::size_t>(len,
                            static_cast<std::size_t>((std::numeric_limits<int>::max)()));
  const ssize_t n = ::send(sock, data, chunk, MSG_NOSIGNAL);
  if (n < 0) {
    return -1;
  }
  return static_cast<int>(n);
}

int Recv(Socket sock, std::uint8_t* data, std::size_t len) {
  if (!data || len == 0) {
    return 0;
  }
  const std::size_t chunk =
      std::min<std::size_t>(len,
                            static_cast<std::size_t>((std::numeric_limits<int>::max)()));
  const ssize_t n = ::recv(sock, data, chunk, 0);
  if (n < 0) {
    return -1;
  }
  return static_cast<int>(n);
}

bool ConnectTcp(const std::string& host, std::uint16_t port, Socket& out,
                std::string& error) {
  out = kInvalidSocket;
  error.clear();
  if (host.empty() || port == 0) {
    error = "invalid endpoint";
    return false;
  }

  addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  hints.ai_protocol = IPPROTO_TCP;

  addrinfo* result = nullptr;
  const std::string port_str = std::to_string(port);
  if (getaddrinfo(host.c_str(), port_str.c_str(), &hints, &result) != 0) {
    error = "dns resolve failed";
    return false;
  }

  for (addrinfo* rp = result; rp != nullptr; rp = rp->ai_next) {
    Socket sock = ::socket(rp->ai_family, rp->ai_socktype, rp->ai_protocol);
    if (sock < 0) {
      continue;
    }
    if (::connect(sock, rp->ai_addr, rp->ai_addrlen) == 0) {
      out = sock;
      break;
    }
    ::close(sock);
  }
  freeaddrinfo(result);

  if (out < 0) {
    error = "connect failed";
    return false;
  }
  return true;
}

bool CreateTcpListener(const std::string& bind_host, std::uint16_t port,
                       Socket& out, std::string& error) {
  out = kInvalidSocket;
  error.clear();
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(port);
  if (bind_host.empty() || bind_host == "0.0.0.0") {
    addr.sin_addr.s_addr = htonl(INADDR_ANY);
  } else if (inet_pton(AF_INET, bind_host.c_str(), &addr.sin_addr) != 1) {
    error = "invalid bind address";
    return false;
  }
  Socket sock = ::socket(AF_INET, SOCK_STREAM, 0);
  if (sock < 0) {
    error = ErrnoText("tcp socket failed");
    return false;
  }
  int yes = 1;
  ::setsockopt(sock, SOL_SOCKET, SO_REUSEADDR, &yes, sizeof(yes));
  if (::bind(sock, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
    error = ErrnoText(("bind(" + bind_host + ":" + std::to_string(port) +
                       ") failed").c_str());
    ::close(sock);
    return false;
  }
  if (::listen(sock, 16) < 0) {
    error = ErrnoText("listen failed");
    ::close(sock);
    return false;
  }
  out = sock;
  return true;
}

bool AcceptTcp(Socket listen_sock, Socket& out, std::string& remote_ip,
               std::string& error) {
  out = kInvalidSocket;
  remote_ip.clear();
  error.clear();
  sockaddr_storage cli{};
  socklen_t len = sizeof(cli);
  const int client =
      ::accept(listen_sock, reinterpret_cast<sockaddr*>(&cli), &len);
  if (client < 0) {
    error = "accept failed";
    return false;
  }
  SockaddrToIp(reinterpret_cast<const sockaddr*>(&cli), len, remote_ip);
  out = client;
  return true;
}

std::uint16_t LocalPort(Socket sock) {
  sockaddr_storage addr{};
  socklen_t len = sizeof(addr);
  if (::getsockname(sock, reinterpret_cast<sockaddr*>(&addr), &len) != 0) {
    return 0;
  }
  if (addr.ss_family == AF_INET) {
    return ntohs(reinterpret_cast<const sockaddr_in*>(&addr)->sin_port);
  }
  if (addr.ss_family == AF_INET6) {
    return ntohs(reinterpret_cast<const sockaddr_in6*>(&addr)->sin6_port);
  }
  return 0;
}

bool SockaddrToIp(const sockaddr* addr, socklen_t addr_len, std::string& out) {
  out.clear();
  if (!addr || addr_len == 0) {
    return false;
  }
  char ip_buf[64] = {};
  const char* ip_ptr = nullptr;
  if (addr->sa_family == AF_INET) {
    const auto* in = reinterpret_cast<const sockaddr_in*>(addr);
    ip_ptr = inet_ntop(AF_INET, &in->sin_addr, ip_buf, sizeof(ip_buf));
  } else if (addr->sa_family == AF_INET6) {
    const auto* in6 = reinterpret_cast<const sockaddr_in6*>(addr);
    ip_ptr = inet_ntop(AF_INET6, &in6->sin6_addr, ip_buf, sizeof(ip_buf));
  }
  if (!ip_ptr) {
    return false;
  }
  out.assign(ip_ptr);
  return true;
}

bool CreateWakePair(Socket& read_end, Socket& write_end, std::string& error) {
  read_end = kInvalidSocket;
  write_end = kInvalidSocket;
  int fds[2] = {-1, -1};
  if (::pipe(fds) != 0) {
    error = ErrnoText("pipe failed");
    return false;
  }
  if (!SetNonBlocking(fds[0]) || !SetNonBlocking(fds[1])) {
    error = "wake pipe non-blocking failed";
    ::close(fds[0]);
    ::close(fds[1]);
    return false;
  }
  read_end = fds[0];
  write_end = fds[1];
  return true;
}

void SignalWake(Socket write_end) {
  if (write_end < 0) {
    return;
  }
  const std::uint8_t byte = 1;
  // A full pipe already guarantees a pending wakeup.
  (void)::write(write_end, &byte, 1);
}

void DrainWake(Socket read_end) {
  std::uint8_t buf[64];
  while (::read(read_end, buf, sizeof(buf)) > 0) {
  }
}

bool HasRoutableInterface() {
  ifaddrs* list = nullptr;
  if (getifaddrs(&list) != 0) {
    return false;
  }
  bool up = false;
  for (ifaddrs* it = list; it != nullptr; it = it->ifa_next) {
    if (!it->ifa_addr) {
      continue;
    }
    const int family = it->ifa_addr->sa_family;
    if (family != AF_INET && family != AF_INET6) {
      continue;
    }
    if ((it->ifa_flags & IFF_UP) == 0 || (it->ifa_flags & IFF_LOOPBACK) != 0) {
      continue;
    }
    up = true;
    break;
  }
  freeifaddrs(list);
  return up;
}

int Poll(PollFd* fds, std::size_t count, std::uint32_t timeout_ms) {
  if (!fds || count == 0) {
    return 0;
  }
  std::vector<pollfd> native(count);
  for (std::size_t i = 0; i < count; ++i) {
    native[i].fd = fds[i].sock;
    native[i].events = 0;
    if (fds[i].events & kPollIn) {
      native[i].events |= POLLIN;
    }
    if (fds[i].events & kPollOut) {
      native[i].events |= POLLOUT;
    }
    native[i].revents = 0;
  }
  const int rc = ::poll(native.data(), static_cast<nfds_t>(count),
                        static_cast<int>(timeout_ms));
  if (rc <= 0) {
    for (std::size_t i = 0; i < count; ++i) {
      fds[i].revents = 0;
    }
    return rc;
  }
  for (std::size_t i = 0; i < count; ++i) {
    short out = 0;
    if (native[i].revents & POLLIN) {
      out |= kPollIn;
    }
    if (native[i].revents & POLLOUT) {
      out |= kPollOut;
    }
    if (native[i].revents & (POLLERR | POLLHUP | POLLNVAL)) {
      out |= kPollErr;
    }
    fds[i].revents = out;
  }
  return rc;
}

bool ShutdownSend(Socket sock) {
  return shutdown(sock, SHUT_WR) == 0;
}

void CloseSocket(Socket& sock) {
  if (sock >= 0) {
    ::close(sock);
    sock = kInvalidSocket;
  }
}

}  // namespace whisper::platform::net
