#ifndef WHISPER_TRANSPORT_COMPOSITE_REMOTES_H
#define WHISPER_TRANSPORT_COMPOSITE_REMOTES_H

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "protocol.h"
#include "transport.h"

namespace whisper::transport {

// Where a unified remote lives: the transport kind and that transport's own
// remote id.
struct RemoteBinding {
  TransportKind kind{TransportKind::kLocal};
  std::string inner_id;
};

// Unified remote set of a composite transport, keyed by ClientInfo client
// id. One client is bound to exactly one transport remote at a time.
class CompositeRemotes {
 public:
  enum class BindResult : std::uint8_t { kBound = 0, kExisting, kDuplicate };

  BindResult Bind(const std::string& client_id, TransportKind kind,
                  const std::string& inner_id);
  void Unbind(const std::string& client_id);
  void Clear();

  std::optional<RemoteBinding> Find(const std::string& client_id) const;
  // Client id bound to a transport remote, if any.
  std::optional<std::string> ClientOf(TransportKind kind,
                                      const std::string& inner_id) const;
  std::vector<std::string> ClientIds() const;
  std::size_t size() const { return by_client_.size(); }

 private:
  std::map<std::string, RemoteBinding> by_client_;
  std::map<std::pair<TransportKind, std::string>, std::string> by_inner_;
};

// Client id carried by presence chunks that hold a ClientInfo payload.
std::optional<std::string> PresenceClientId(const core::ProtocolChunk& chunk);

// Copy of a transport remote under another id, same alternative and state.
TransportRemote WithId(TransportRemote remote, const std::string& id);

}  // namespace whisper::transport

#endif  // WHISPER_TRANSPORT_COMPOSITE_REMOTES_H
