#ifndef WHISPER_RELAY_RELAY_HUB_H
#define WHISPER_RELAY_RELAY_HUB_H

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "relay_frame.h"

namespace whisper::relay {

using ConnectionId = std::uint64_t;

struct Outgoing {
  ConnectionId to{0};
  std::vector<std::uint8_t> frame;
};

// Channel membership and routing. Holds no sockets; the server feeds it
// decoded frames and writes out whatever it returns.
class RelayHub {
 public:
  // Returns false for a frame a client must never send; the caller closes
  // that connection.
  bool HandleFrame(ConnectionId from, const transport::RelayFrame& frame,
                   std::vector<Outgoing>& out);
  // Implicit leave of every channel the connection joined.
  void Disconnect(ConnectionId id, std::vector<Outgoing>& out);

  std::size_t channel_count() const { return channels_.size(); }
  std::vector<std::string> Members(const std::string& channel) const;
  std::optional<transport::RelayRole> RoleOf(const std::string& channel,
                                             const std::string& client_id) const;

 private:
  struct Member {
    ConnectionId conn{0};
    std::string client_id;
    transport::RelayRole role{transport::RelayRole::kListen};
  };

  bool HandleJoin(ConnectionId from, const transport::RelayFrame& frame,
                  std::vector<Outgoing>& out);
  bool HandleLeave(ConnectionId from, const transport::RelayFrame& frame,
                   std::vector<Outgoing>& out);
  bool HandlePublish(ConnectionId from, const transport::RelayFrame& frame,
                     std::vector<Outgoing>& out);
  void RemoveMember(ConnectionId conn, const std::string& channel,
                    std::vector<Outgoing>& out);
  void Broadcast(const std::string& channel, ConnectionId except,
                 const std::vector<std::uint8_t>& frame,
                 std::vector<Outgoing>& out) const;
  const Member* FindMember(const std::string& channel,
                           ConnectionId conn) const;

  static void Reply(ConnectionId to, std::vector<std::uint8_t> frame,
                    std::vector<Outgoing>& out);

  std::map<std::string, std::vector<Member>> channels_;
  std::map<ConnectionId, std::set<std::string>> joined_;
};

// True when a publish with this target reaches the member.
bool TargetMatches(const std::string& target, const std::string& client_id,
                   transport::RelayRole role);

}  // namespace whisper::relay

#endif  // WHISPER_RELAY_RELAY_HUB_H
