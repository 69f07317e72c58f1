#include "relay_hub.h"

#include <algorithm>
#include <utility>

#include "platform_log.h"

namespace whisper::relay {

namespace pfl = whisper::platform::log;
using transport::RelayFrame;
using transport::RelayFrameType;
using transport::RelayRole;

namespace {

constexpr const char* kTag = "relay";

}  // namespace

bool TargetMatches(const std::string& target, const std::string& client_id,
                   RelayRole role) {
  if (target == transport::kTargetAll) {
    return true;
  }
  if (target == transport::kTargetWhisperers) {
    return role == RelayRole::kWhisper;
  }
  return target == client_id;
}

bool RelayHub::HandleFrame(ConnectionId from, const RelayFrame& frame,
                           std::vector<Outgoing>& out) {
  switch (frame.type) {
    case RelayFrameType::kJoin:
      return HandleJoin(from, frame, out);
    case RelayFrameType::kLeave:
      return HandleLeave(from, frame, out);
    case RelayFrameType::kPublish:
      return HandlePublish(from, frame, out);
    case RelayFrameType::kHeartbeat:
      Reply(from, transport::HeartbeatFrame(), out);
      return true;
    case RelayFrameType::kMessage:
    case RelayFrameType::kPresence:
    case RelayFrameType::kError:
      break;
  }
  pfl::Log(pfl::Level::kWarn, kTag, "client sent a relay-only frame",
           {{"conn", std::to_string(from)},
            {"type", transport::RelayFrameTypeName(frame.type)}});
  return false;
}

void RelayHub::Disconnect(ConnectionId id, std::vector<Outgoing>& out) {
  auto it = joined_.find(id);
  if (it == joined_.end()) {
    return;
  }
  const std::set<std::string> channels = it->second;
  for (const auto& channel : channels) {
    RemoveMember(id, channel, out);
  }
  joined_.erase(id);
}

std::vector<std::string> RelayHub::Members(const std::string& channel) const {
  std::vector<std::string> ids;
  auto it = channels_.find(channel);
  if (it == channels_.end()) {
    return ids;
  }
  for (const auto& member : it->second) {
    ids.push_back(member.client_id);
  }
  return ids;
}

std::optional<RelayRole> RelayHub::RoleOf(const std::string& channel,
                                          const std::string& client_id) const {
  auto it = channels_.find(channel);
  if (it == channels_.end()) {
    return std::nullopt;
  }
  for (const auto& member : it->second) {
    if (member.client_id == client_id) {
      return member.role;
    }
  }
  return std::nullopt;
}

bool RelayHub::HandleJoin(ConnectionId from, const RelayFrame& frame,
                          std::vector<Outgoing>& out) {
  transport::JoinPayload join;
  if (!transport::DecodeJoin(frame.payload, join)) {
    Reply(from, transport::ErrorFrame("bad join"), out);
    return false;
  }
  auto& members = channels_[join.channel];
  for (auto& member : members) {
    if (member.conn == from) {
      member.client_id = join.client_id;
      member.role = join.role;
      return true;
    }
  }
  members.push_back(Member{from, join.client_id, join.role});
  joined_[from].insert(join.channel);
  pfl::Log(pfl::Level::kDebug, kTag, "join",
           {{"channel", join.channel},
            {"client", join.client_id},
            {"role", transport::RelayRoleName(join.role)}});
  Broadcast(join.channel, from,
            transport::PresenceFrame({join.channel, true, join.client_id}),
            out);
  return true;
}

bool RelayHub::HandleLeave(ConnectionId from, const RelayFrame& frame,
                           std::vector<Outgoing>& out) {
  std::string channel;
  if (!transport::DecodeLeave(frame.payload, channel)) {
    Reply(from, transport::ErrorFrame("bad leave"), out);
    return false;
  }
  auto it = joined_.find(from);
  if (it == joined_.end() || it->second.erase(channel) == 0) {
    return true;
  }
  if (it->second.empty()) {
    joined_.erase(it);
  }
  RemoveMember(from, channel, out);
  return true;
}

bool RelayHub::HandlePublish(ConnectionId from, const RelayFrame& frame,
                             std::vector<Outgoing>& out) {
  transport::PublishPayload publish;
  if (!transport::DecodePublish(frame.payload, publish)) {
    Reply(from, transport::ErrorFrame("bad publish"), out);
    return false;
  }
  const Member* sender = FindMember(publish.channel, from);
  if (!sender) {
    Reply(from, transport::ErrorFrame("not joined: " + publish.channel), out);
    return true;
  }
  const auto message = transport::MessageFrame(
      {publish.channel, sender->client_id, publish.data});
  if (message.empty()) {
    Reply(from, transport::ErrorFrame("message too large"), out);
    return true;
  }
  for (const auto& member : channels_[publish.channel]) {
    if (member.conn == from ||
        !TargetMatches(publish.target, member.client_id, member.role)) {
      continue;
    }
    out.push_back(Outgoing{member.conn, message});
  }
  return true;
}

void RelayHub::RemoveMember(ConnectionId conn, const std::string& channel,
                            std::vector<Outgoing>& out) {
  auto it = channels_.find(channel);
  if (it == channels_.end()) {
    return;
  }
  auto& members = it->second;
  auto pos = std::find_if(members.begin(), members.end(),
                          [conn](const Member& m) { return m.conn == conn; });
  if (pos == members.end()) {
    return;
  }
  const std::string client_id = pos->client_id;
  members.erase(pos);
  pfl::Log(pfl::Level::kDebug, kTag, "leave",
           {{"channel", channel}, {"client", client_id}});
  if (members.empty()) {
    channels_.erase(it);
    return;
  }
  Broadcast(channel, conn,
            transport::PresenceFrame({channel, false, client_id}), out);
}

void RelayHub::Broadcast(const std::string& channel, ConnectionId except,
                         const std::vector<std::uint8_t>& frame,
                         std::vector<Outgoing>& out) const {
  auto it = channels_.find(channel);
  if (it == channels_.end() || frame.empty()) {
    return;
  }
  for (const auto& member : it->second) {
    if (member.conn != except) {
      out.push_back(Outgoing{member.conn, frame});
    }
  }
}

const RelayHub::Member* RelayHub::FindMember(const std::string& channel,
                                             ConnectionId conn) const {
  auto it = channels_.find(channel);
  if (it == channels_.end()) {
    return nullptr;
  }
  for (const auto& member : it->second) {
    if (member.conn == conn) {
      return &member;
    }
  }
  return nullptr;
}

void RelayHub::Reply(ConnectionId to, std::vector<std::uint8_t> frame,
                     std::vector<Outgoing>& out) {
  if (frame.empty()) {
    return;
  }
  out.push_back(Outgoing{to, std::move(frame)});
}

}  // namespace whisper::relay
