#ifndef WHISPER_CORE_PROTOCOL_H
#define WHISPER_CORE_PROTOCOL_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace whisper::core {

constexpr int kProtocolVersion = 2;

// Negative chunk offsets. Values are part of the wire format.
enum class ControlOffset : int {
  // line management
  kNewline = -1,
  kPastText = -2,
  kLiveText = -3,
  kStartReread = -4,
  kRetiredReread = -5,  // reserved, never sent
  kClearHistory = -6,
  // side effects
  kPlaySound = -7,
  kPlaySpeech = -8,
  // presence
  kWhisperOffer = -20,
  kListenRequest = -21,
  kListenAuthYes = -22,
  kListenAuthNo = -23,
  kJoining = -24,
  kDropping = -25,
  kListenOffer = -26,
  kRestart = -27,
  // flow control
  kRequestReread = -40,
  // out of band
  kShareTranscript = -50
};

constexpr int kPresenceFirst = static_cast<int>(ControlOffset::kRestart);
constexpr int kPresenceLast = static_cast<int>(ControlOffset::kWhisperOffer);

enum class ReadType : std::uint8_t { kLive = 0, kPast = 1, kAll = 2 };

struct ProtocolChunk {
  int offset{0};
  std::string text;

  bool operator==(const ProtocolChunk& other) const {
    return offset == other.offset && text == other.text;
  }
  bool operator!=(const ProtocolChunk& other) const {
    return !(*this == other);
  }
};

// Identity payload carried by presence chunks.
struct ClientInfo {
  std::string conversation_id;
  std::string conversation_name;
  std::string client_id;
  std::string profile_id;
  std::string username;
  std::string content_id;

  bool operator==(const ClientInfo& other) const {
    return conversation_id == other.conversation_id &&
           conversation_name == other.conversation_name &&
           client_id == other.client_id && profile_id == other.profile_id &&
           username == other.username && content_id == other.content_id;
  }
};

constexpr std::size_t kClientInfoFieldCount = 6;

std::string EncodeChunk(const ProtocolChunk& chunk);
std::vector<std::uint8_t> EncodeChunkBytes(const ProtocolChunk& chunk);

// Fails on a missing '|' or a prefix that is not a complete signed
// decimal integer. Text after the first '|' is taken verbatim.
bool DecodeChunk(std::string_view data, ProtocolChunk& out);
bool DecodeChunk(const std::uint8_t* data, std::size_t len,
                 ProtocolChunk& out);

std::string EncodeClientInfo(const ClientInfo& info);
bool DecodeClientInfo(std::string_view text, ClientInfo& out);

bool IsDiff(const ProtocolChunk& chunk);
bool IsCompleteLine(const ProtocolChunk& chunk);
bool IsPresenceMessage(const ProtocolChunk& chunk);
bool IsKnownControlOffset(int offset);
bool IsFirstRead(const ProtocolChunk& chunk);
bool IsLastRead(const ProtocolChunk& chunk);
bool IsSound(const ProtocolChunk& chunk);
bool IsReplayRequest(const ProtocolChunk& chunk);
bool IsListenOffer(const ProtocolChunk& chunk);
bool IsRestart(const ProtocolChunk& chunk);
bool IsTranscriptId(const ProtocolChunk& chunk);
bool HasOffset(const ProtocolChunk& chunk, ControlOffset offset);

const char* ControlOffsetName(int offset);
const char* ReadTypeName(ReadType type);
bool ParseReadType(std::string_view text, ReadType& out);

// Chunk builders.
ProtocolChunk PastText(std::string_view line);
ProtocolChunk LiveText(std::string_view line);
ProtocolChunk AcknowledgeRead(ReadType type);
ProtocolChunk ReplayRequest(ReadType type);
ProtocolChunk ClearHistory();
ProtocolChunk Sound(std::string_view name);
ProtocolChunk Speech(std::string_view text);
ProtocolChunk ShareTranscript(std::string_view transcript_id);
ProtocolChunk WhisperOffer(const ClientInfo& info);
ProtocolChunk ListenRequest(const ClientInfo& info);
ProtocolChunk ListenAuthYes(const ClientInfo& info);
ProtocolChunk ListenAuthNo(const ClientInfo& info);
ProtocolChunk Joining(const ClientInfo& info);
ProtocolChunk Dropping(std::string_view client_id);
ProtocolChunk ListenOffer(const ClientInfo& info);
ProtocolChunk Restart(std::string_view client_id);

}  // namespace whisper::core

#endif  // WHISPER_CORE_PROTOCOL_H
