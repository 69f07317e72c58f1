#ifndef WHISPER_TRANSPORT_RELAY_FRAME_H
#define WHISPER_TRANSPORT_RELAY_FRAME_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace whisper::transport {

constexpr std::uint32_t kRelayMagic = 0x52505357;  // "WSPR"
constexpr std::uint16_t kRelayVersion = 1;
constexpr std::size_t kRelayHeaderSize = 12;
constexpr std::size_t kMaxRelayPayloadBytes = 64u * 1024u;

enum class RelayFrameType : std::uint16_t {
  kJoin = 1,
  kLeave = 2,
  kPublish = 3,
  kMessage = 4,
  kPresence = 5,
  kHeartbeat = 6,
  kError = 7
};

const char* RelayFrameTypeName(RelayFrameType type);

struct RelayFrame {
  RelayFrameType type{RelayFrameType::kHeartbeat};
  std::vector<std::uint8_t> payload;
};

enum class RelayRole : std::uint8_t { kWhisper = 0, kListen = 1 };

const char* RelayRoleName(RelayRole role);
bool ParseRelayRole(std::string_view text, RelayRole& out);

// Publish targets besides a literal client id.
constexpr std::string_view kTargetAll = "all";
constexpr std::string_view kTargetWhisperers = "whisperer";

struct JoinPayload {
  RelayRole role{RelayRole::kListen};
  std::string channel;
  std::string client_id;
};

struct PublishPayload {
  std::string channel;
  std::string target;
  std::string data;
};

struct MessagePayload {
  std::string channel;
  std::string sender;
  std::string data;
};

struct PresencePayload {
  std::string channel;
  bool entered{true};
  std::string client_id;
};

std::string ControlChannel(std::string_view conversation_id);
std::string ContentChannel(std::string_view conversation_id,
                           std::string_view content_id);

bool EncodeFrame(const RelayFrame& frame, std::vector<std::uint8_t>& out);
bool DecodeFrameHeader(const std::uint8_t* data, std::size_t len,
                       RelayFrameType& out_type,
                       std::uint32_t& out_payload_len);
bool DecodeFrame(const std::uint8_t* data, std::size_t len, RelayFrame& out);

// Splits complete frames off the front of a receive buffer. Returns false
// on a bad header; the connection should be closed.
bool TakeFrames(std::vector<std::uint8_t>& buffer,
                std::vector<RelayFrame>& out);

// Payload fields are little-endian length-prefixed strings: a 16-bit length
// for names and ids, a 32-bit length for data.
bool EncodeJoin(const JoinPayload& join, std::vector<std::uint8_t>& out);
bool DecodeJoin(const std::vector<std::uint8_t>& payload, JoinPayload& out);
bool EncodeLeave(std::string_view channel, std::vector<std::uint8_t>& out);
bool DecodeLeave(const std::vector<std::uint8_t>& payload, std::string& out);
bool EncodePublish(const PublishPayload& publish,
                   std::vector<std::uint8_t>& out);
bool DecodePublish(const std::vector<std::uint8_t>& payload,
                   PublishPayload& out);
bool EncodeMessage(const MessagePayload& message,
                   std::vector<std::uint8_t>& out);
bool DecodeMessage(const std::vector<std::uint8_t>& payload,
                   MessagePayload& out);
bool EncodePresence(const PresencePayload& presence,
                    std::vector<std::uint8_t>& out);
bool DecodePresence(const std::vector<std::uint8_t>& payload,
                    PresencePayload& out);
bool EncodeError(std::string_view text, std::vector<std::uint8_t>& out);
bool DecodeError(const std::vector<std::uint8_t>& payload, std::string& out);

// Whole frames ready to send.
std::vector<std::uint8_t> JoinFrame(const JoinPayload& join);
std::vector<std::uint8_t> LeaveFrame(std::string_view channel);
std::vector<std::uint8_t> PublishFrame(const PublishPayload& publish);
std::vector<std::uint8_t> MessageFrame(const MessagePayload& message);
std::vector<std::uint8_t> PresenceFrame(const PresencePayload& presence);
std::vector<std::uint8_t> HeartbeatFrame();
std::vector<std::uint8_t> ErrorFrame(std::string_view text);

}  // namespace whisper::transport

#endif  // WHISPER_TRANSPORT_RELAY_FRAME_H
