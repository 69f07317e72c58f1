#include "transport.h"

namespace whisper::transport {

const char* TransportKindName(TransportKind kind) {
  return kind == TransportKind::kLocal ? "local" : "global";
}

const char* TransportStatusName(TransportStatus status) {
  switch (status) {
    case TransportStatus::kOn:
      return "on";
    case TransportStatus::kOff:
      return "off";
    case TransportStatus::kDisabled:
      return "disabled";
  }
  return "off";
}

const std::string& RemoteId(const TransportRemote& remote) {
  return std::visit([](const auto& r) -> const std::string& { return r.id; },
                    remote);
}

TransportKind RemoteKind(const TransportRemote& remote) {
  return std::holds_alternative<LocalRemote>(remote) ? TransportKind::kLocal
                                                     : TransportKind::kGlobal;
}

const RemoteState& StateOf(const TransportRemote& remote) {
  return std::visit([](const auto& r) -> const RemoteState& { return r.state; },
                    remote);
}

RemoteState& StateOf(TransportRemote& remote) {
  return std::visit([](auto& r) -> RemoteState& { return r.state; }, remote);
}

}  // namespace whisper::transport
