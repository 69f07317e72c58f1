#include "composite_remotes.h"

#include <variant>

namespace whisper::transport {

CompositeRemotes::BindResult CompositeRemotes::Bind(
    const std::string& client_id, TransportKind kind,
    const std::string& inner_id) {
  auto it = by_client_.find(client_id);
  if (it != by_client_.end()) {
    if (it->second.kind == kind && it->second.inner_id == inner_id) {
      return BindResult::kExisting;
    }
    return BindResult::kDuplicate;
  }
  const auto key = std::make_pair(kind, inner_id);
  if (by_inner_.count(key) != 0) {
    // Same transport remote presenting a second client id.
    return BindResult::kDuplicate;
  }
  RemoteBinding binding;
  binding.kind = kind;
  binding.inner_id = inner_id;
  by_client_.emplace(client_id, binding);
  by_inner_.emplace(key, client_id);
  return BindResult::kBound;
}

void CompositeRemotes::Unbind(const std::string& client_id) {
  auto it = by_client_.find(client_id);
  if (it == by_client_.end()) {
    return;
  }
  by_inner_.erase(std::make_pair(it->second.kind, it->second.inner_id));
  by_client_.erase(it);
}

void CompositeRemotes::Clear() {
  by_client_.clear();
  by_inner_.clear();
}

std::optional<RemoteBinding> CompositeRemotes::Find(
    const std::string& client_id) const {
  auto it = by_client_.find(client_id);
  if (it == by_client_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::optional<std::string> CompositeRemotes::ClientOf(
    TransportKind kind, const std::string& inner_id) const {
  auto it = by_inner_.find(std::make_pair(kind, inner_id));
  if (it == by_inner_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<std::string> CompositeRemotes::ClientIds() const {
  std::vector<std::string> ids;
  ids.reserve(by_client_.size());
  for (const auto& entry : by_client_) {
    ids.push_back(entry.first);
  }
  return ids;
}

std::optional<std::string> PresenceClientId(const core::ProtocolChunk& chunk) {
  using core::ControlOffset;
  if (!core::IsPresenceMessage(chunk) ||
      core::HasOffset(chunk, ControlOffset::kDropping) ||
      core::HasOffset(chunk, ControlOffset::kRestart)) {
    return std::nullopt;
  }
  core::ClientInfo info;
  if (!core::DecodeClientInfo(chunk.text, info) || info.client_id.empty()) {
    return std::nullopt;
  }
  return info.client_id;
}

TransportRemote WithId(TransportRemote remote, const std::string& id) {
  std::visit([&id](auto& r) { r.id = id; }, remote);
  return remote;
}

}  // namespace whisper::transport
