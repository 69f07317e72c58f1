#include "relay_frame.h"

#include <cstring>
#include <utility>

namespace whisper::transport {

namespace {

constexpr std::size_t kMaxStringLen = 0xFFFFu;

std::uint16_t ReadUint16Le(const std::uint8_t* p) {
  return static_cast<std::uint16_t>(p[0] | (p[1] << 8));
}

std::uint32_t ReadUint32Le(const std::uint8_t* p) {
  return static_cast<std::uint32_t>(p[0]) |
         (static_cast<std::uint32_t>(p[1]) << 8) |
         (static_cast<std::uint32_t>(p[2]) << 16) |
         (static_cast<std::uint32_t>(p[3]) << 24);
}

void WriteUint16Le(std::uint16_t v, std::uint8_t* p) {
  p[0] = static_cast<std::uint8_t>(v & 0xFF);
  p[1] = static_cast<std::uint8_t>((v >> 8) & 0xFF);
}

void WriteUint32Le(std::uint32_t v, std::uint8_t* p) {
  p[0] = static_cast<std::uint8_t>(v & 0xFF);
  p[1] = static_cast<std::uint8_t>((v >> 8) & 0xFF);
  p[2] = static_cast<std::uint8_t>((v >> 16) & 0xFF);
  p[3] = static_cast<std::uint8_t>((v >> 24) & 0xFF);
}

bool WriteString(std::string_view s, std::vector<std::uint8_t>& out) {
  if (s.size() > kMaxStringLen) {
    return false;
  }
  std::uint8_t len[2];
  WriteUint16Le(static_cast<std::uint16_t>(s.size()), len);
  out.insert(out.end(), len, len + 2);
  out.insert(out.end(), s.begin(), s.end());
  return true;
}

bool ReadString(const std::vector<std::uint8_t>& data, std::size_t& offset,
                std::string& out) {
  if (offset + 2 > data.size()) {
    return false;
  }
  const std::uint16_t len = ReadUint16Le(data.data() + offset);
  offset += 2;
  if (offset + len > data.size()) {
    return false;
  }
  out.assign(reinterpret_cast<const char*>(data.data() + offset), len);
  offset += len;
  return true;
}

bool WriteBytes(std::string_view s, std::vector<std::uint8_t>& out) {
  if (s.size() > kMaxRelayPayloadBytes) {
    return false;
  }
  std::uint8_t len[4];
  WriteUint32Le(static_cast<std::uint32_t>(s.size()), len);
  out.insert(out.end(), len, len + 4);
  out.insert(out.end(), s.begin(), s.end());
  return true;
}

bool ReadBytes(const std::vector<std::uint8_t>& data, std::size_t& offset,
               std::string& out) {
  if (offset + 4 > data.size()) {
    return false;
  }
  const std::uint32_t len = ReadUint32Le(data.data() + offset);
  offset += 4;
  if (len > data.size() - offset) {
    return false;
  }
  out.assign(reinterpret_cast<const char*>(data.data() + offset), len);
  offset += len;
  return true;
}

std::vector<std::uint8_t> BuildFrame(RelayFrameType type,
                                     std::vector<std::uint8_t> payload) {
  RelayFrame frame;
  frame.type = type;
  frame.payload = std::move(payload);
  std::vector<std::uint8_t> out;
  if (!EncodeFrame(frame, out)) {
    out.clear();
  }
  return out;
}

}  // namespace

const char* RelayFrameTypeName(RelayFrameType type) {
  switch (type) {
    case RelayFrameType::kJoin:
      return "join";
    case RelayFrameType::kLeave:
      return "leave";
    case RelayFrameType::kPublish:
      return "publish";
    case RelayFrameType::kMessage:
      return "message";
    case RelayFrameType::kPresence:
      return "presence";
    case RelayFrameType::kHeartbeat:
      return "heartbeat";
    case RelayFrameType::kError:
      return "error";
  }
  return "unknown";
}

const char* RelayRoleName(RelayRole role) {
  return role == RelayRole::kWhisper ? "whisper" : "listen";
}

bool ParseRelayRole(std::string_view text, RelayRole& out) {
  if (text == "whisper") {
    out = RelayRole::kWhisper;
    return true;
  }
  if (text == "listen") {
    out = RelayRole::kListen;
    return true;
  }
  return false;
}

std::string ControlChannel(std::string_view conversation_id) {
  std::string out(conversation_id);
  out.append(":control");
  return out;
}

std::string ContentChannel(std::string_view conversation_id,
                           std::string_view content_id) {
  std::string out(conversation_id);
  out.push_back(':');
  out.append(content_id);
  return out;
}

bool EncodeFrame(const RelayFrame& frame, std::vector<std::uint8_t>& out) {
  if (frame.payload.size() > kMaxRelayPayloadBytes) {
    return false;
  }
  out.resize(kRelayHeaderSize + frame.payload.size());
  WriteUint32Le(kRelayMagic, out.data());
  WriteUint16Le(kRelayVersion, out.data() + 4);
  WriteUint16Le(static_cast<std::uint16_t>(frame.type), out.data() + 6);
  WriteUint32Le(static_cast<std::uint32_t>(frame.payload.size()),
                out.data() + 8);
  if (!frame.payload.empty()) {
    std::memcpy(out.data() + kRelayHeaderSize, frame.payload.data(),
                frame.payload.size());
  }
  return true;
}

bool DecodeFrameHeader(const std::uint8_t* data, std::size_t len,
                       RelayFrameType& out_type,
                       std::uint32_t& out_payload_len) {
  if (!data || len < kRelayHeaderSize) {
    return false;
  }
  if (ReadUint32Le(data) != kRelayMagic) {
    return false;
  }
  if (ReadUint16Le(data + 4) != kRelayVersion) {
    return false;
  }
  const std::uint16_t type = ReadUint16Le(data + 6);
  if (type < static_cast<std::uint16_t>(RelayFrameType::kJoin) ||
      type > static_cast<std::uint16_t>(RelayFrameType::kError)) {
    return false;
  }
  const std::uint32_t payload_len = ReadUint32Le(data + 8);
  if (payload_len > kMaxRelayPayloadBytes) {
    return false;
  }
  out_type = static_cast<RelayFrameType>(type);
  out_payload_len = payload_len;
  return true;
}

bool DecodeFrame(const std::uint8_t* data, std::size_t len, RelayFrame& out) {
  RelayFrameType type;
  std::uint32_t payload_len = 0;
  if (!DecodeFrameHeader(data, len, type, payload_len)) {
    return false;
  }
  if (len != kRelayHeaderSize + payload_len) {
    return false;
  }
  out.type = type;
  out.payload.assign(data + kRelayHeaderSize,
                     data + kRelayHeaderSize + payload_len);
  return true;
}

bool TakeFrames(std::vector<std::uint8_t>& buffer,
                std::vector<RelayFrame>& out) {
  std::size_t offset = 0;
  bool ok = true;
  while (buffer.size() - offset >= kRelayHeaderSize) {
    RelayFrameType type;
    std::uint32_t payload_len = 0;
    if (!DecodeFrameHeader(buffer.data() + offset, buffer.size() - offset,
                           type, payload_len)) {
      ok = false;
      break;
    }
    const std::size_t total = kRelayHeaderSize + payload_len;
    if (buffer.size() - offset < total) {
      break;
    }
    RelayFrame frame;
    frame.type = type;
    frame.payload.assign(buffer.begin() + offset + kRelayHeaderSize,
                         buffer.begin() + offset + total);
    out.push_back(std::move(frame));
    offset += total;
  }
  buffer.erase(buffer.begin(), buffer.begin() + offset);
  return ok;
}

bool EncodeJoin(const JoinPayload& join, std::vector<std::uint8_t>& out) {
  out.clear();
  return WriteString(RelayRoleName(join.role), out) &&
         WriteString(join.channel, out) && WriteString(join.client_id, out);
}

bool DecodeJoin(const std::vector<std::uint8_t>& payload, JoinPayload& out) {
  std::size_t off = 0;
  std::string role;
  if (!ReadString(payload, off, role) ||
      !ReadString(payload, off, out.channel) ||
      !ReadString(payload, off, out.client_id)) {
    return false;
  }
  return off == payload.size() && ParseRelayRole(role, out.role) &&
         !out.channel.empty() && !out.client_id.empty();
}

bool EncodeLeave(std::string_view channel, std::vector<std::uint8_t>& out) {
  out.clear();
  return WriteString(channel, out);
}

bool DecodeLeave(const std::vector<std::uint8_t>& payload, std::string& out) {
  std::size_t off = 0;
  return ReadString(payload, off, out) && off == payload.size() &&
         !out.empty();
}

bool EncodePublish(const PublishPayload& publish,
                   std::vector<std::uint8_t>& out) {
  out.clear();
  return WriteString(publish.channel, out) &&
         WriteString(publish.target, out) && WriteBytes(publish.data, out);
}

bool DecodePublish(const std::vector<std::uint8_t>& payload,
                   PublishPayload& out) {
  std::size_t off = 0;
  return ReadString(payload, off, out.channel) &&
         ReadString(payload, off, out.target) &&
         ReadBytes(payload, off, out.data) && off == payload.size() &&
         !out.channel.empty() && !out.target.empty();
}

bool EncodeMessage(const MessagePayload& message,
                   std::vector<std::uint8_t>& out) {
  out.clear();
  return WriteString(message.channel, out) &&
         WriteString(message.sender, out) && WriteBytes(message.data, out);
}

bool DecodeMessage(const std::vector<std::uint8_t>& payload,
                   MessagePayload& out) {
  std::size_t off = 0;
  return ReadString(payload, off, out.channel) &&
         ReadString(payload, off, out.sender) &&
         ReadBytes(payload, off, out.data) && off == payload.size();
}

bool EncodePresence(const PresencePayload& presence,
                    std::vector<std::uint8_t>& out) {
  out.clear();
  return WriteString(presence.channel, out) &&
         WriteString(presence.entered ? "enter" : "leave", out) &&
         WriteString(presence.client_id, out);
}

bool DecodePresence(const std::vector<std::uint8_t>& payload,
                    PresencePayload& out) {
  std::size_t off = 0;
  std::string kind;
  if (!ReadString(payload, off, out.channel) ||
      !ReadString(payload, off, kind) ||
      !ReadString(payload, off, out.client_id) || off != payload.size()) {
    return false;
  }
  if (kind == "enter") {
    out.entered = true;
  } else if (kind == "leave") {
    out.entered = false;
  } else {
    return false;
  }
  return true;
}

bool EncodeError(std::string_view text, std::vector<std::uint8_t>& out) {
  out.clear();
  return WriteString(text, out);
}

bool DecodeError(const std::vector<std::uint8_t>& payload, std::string& out) {
  std::size_t off = 0;
  return ReadString(payload, off, out) && off == payload.size();
}

std::vector<std::uint8_t> JoinFrame(const JoinPayload& join) {
  std::vector<std::uint8_t> payload;
  if (!EncodeJoin(join, payload)) {
    return {};
  }
  return BuildFrame(RelayFrameType::kJoin, std::move(payload));
}

std::vector<std::uint8_t> LeaveFrame(std::string_view channel) {
  std::vector<std::uint8_t> payload;
  if (!EncodeLeave(channel, payload)) {
    return {};
  }
  return BuildFrame(RelayFrameType::kLeave, std::move(payload));
}

std::vector<std::uint8_t> PublishFrame(const PublishPayload& publish) {
  std::vector<std::uint8_t> payload;
  if (!EncodePublish(publish, payload)) {
    return {};
  }
  return BuildFrame(RelayFrameType::kPublish, std::move(payload));
}

std::vector<std::uint8_t> MessageFrame(const MessagePayload& message) {
  std::vector<std::uint8_t> payload;
  if (!EncodeMessage(message, payload)) {
    return {};
  }
  return BuildFrame(RelayFrameType::kMessage, std::move(payload));
}

std::vector<std::uint8_t> PresenceFrame(const PresencePayload& presence) {
  std::vector<std::uint8_t> payload;
  if (!EncodePresence(presence, payload)) {
    return {};
  }
  return BuildFrame(RelayFrameType::kPresence, std::move(payload));
}

std::vector<std::uint8_t> HeartbeatFrame() {
  return BuildFrame(RelayFrameType::kHeartbeat, {});
}

std::vector<std::uint8_t> ErrorFrame(std::string_view text) {
  std::vector<std::uint8_t> payload;
  if (!EncodeError(text, payload)) {
    return {};
  }
  return BuildFrame(RelayFrameType::kError, std::move(payload));
}

}  // namespace whisper::transport
