#include "protocol.h"

#include <charconv>
#include <utility>

namespace whisper::core {

namespace {

ProtocolChunk Control(ControlOffset offset, std::string_view text) {
  ProtocolChunk chunk;
  chunk.offset = static_cast<int>(offset);
  chunk.text.assign(text.data(), text.size());
  return chunk;
}

ProtocolChunk Presence(ControlOffset offset, const ClientInfo& info) {
  return Control(offset, EncodeClientInfo(info));
}

ProtocolChunk PresenceForClient(ControlOffset offset,
                                std::string_view client_id) {
  ClientInfo info;
  info.client_id.assign(client_id.data(), client_id.size());
  return Presence(offset, info);
}

}  // namespace

std::string EncodeChunk(const ProtocolChunk& chunk) {
  std::string out = std::to_string(chunk.offset);
  out.reserve(out.size() + 1 + chunk.text.size());
  out.push_back('|');
  out.append(chunk.text);
  return out;
}

std::vector<std::uint8_t> EncodeChunkBytes(const ProtocolChunk& chunk) {
  const std::string text = EncodeChunk(chunk);
  return std::vector<std::uint8_t>(text.begin(), text.end());
}

bool DecodeChunk(std::string_view data, ProtocolChunk& out) {
  const std::size_t bar = data.find('|');
  if (bar == std::string_view::npos || bar == 0) {
    return false;
  }
  int offset = 0;
  const char* begin = data.data();
  const char* end = data.data() + bar;
  const auto result = std::from_chars(begin, end, offset);
  if (result.ec != std::errc() || result.ptr != end) {
    return false;
  }
  out.offset = offset;
  out.text.assign(data.data() + bar + 1, data.size() - bar - 1);
  return true;
}

bool DecodeChunk(const std::uint8_t* data, std::size_t len,
                 ProtocolChunk& out) {
  if (!data && len != 0) {
    return false;
  }
  return DecodeChunk(
      std::string_view(reinterpret_cast<const char*>(data), len), out);
}

std::string EncodeClientInfo(const ClientInfo& info) {
  std::string out;
  out.reserve(info.conversation_id.size() + info.conversation_name.size() +
              info.client_id.size() + info.profile_id.size() +
              info.username.size() + info.content_id.size() + 5);
  out.append(info.conversation_id);
  out.push_back('|');
  out.append(info.conversation_name);
  out.push_back('|');
  out.append(info.client_id);
  out.push_back('|');
  out.append(info.profile_id);
  out.push_back('|');
  out.append(info.username);
  out.push_back('|');
  out.append(info.content_id);
  return out;
}

bool DecodeClientInfo(std::string_view text, ClientInfo& out) {
  ClientInfo parsed;
  std::string* fields[kClientInfoFieldCount] = {
      &parsed.conversation_id, &parsed.conversation_name, &parsed.client_id,
      &parsed.profile_id,      &parsed.username,          &parsed.content_id};
  std::size_t field = 0;
  std::size_t start = 0;
  bool reached_end = false;
  while (field < kClientInfoFieldCount) {
    const std::size_t bar = text.find('|', start);
    if (bar == std::string_view::npos) {
      fields[field++]->assign(text.substr(start));
      reached_end = true;
      break;
    }
    fields[field++]->assign(text.substr(start, bar - start));
    start = bar + 1;
  }
  if (!reached_end || field != kClientInfoFieldCount) {
    return false;
  }
  out = std::move(parsed);
  return true;
}

bool IsDiff(const ProtocolChunk& chunk) {
  return chunk.offset >= static_cast<int>(ControlOffset::kNewline);
}

bool IsCompleteLine(const ProtocolChunk& chunk) {
  return chunk.offset == static_cast<int>(ControlOffset::kNewline);
}

bool IsPresenceMessage(const ProtocolChunk& chunk) {
  return chunk.offset >= kPresenceFirst && chunk.offset <= kPresenceLast;
}

bool IsKnownControlOffset(int offset) {
  switch (static_cast<ControlOffset>(offset)) {
    case ControlOffset::kNewline:
    case ControlOffset::kPastText:
    case ControlOffset::kLiveText:
    case ControlOffset::kStartReread:
    case ControlOffset::kClearHistory:
    case ControlOffset::kPlaySound:
    case ControlOffset::kPlaySpeech:
    case ControlOffset::kWhisperOffer:
    case ControlOffset::kListenRequest:
    case ControlOffset::kListenAuthYes:
    case ControlOffset::kListenAuthNo:
    case ControlOffset::kJoining:
    case ControlOffset::kDropping:
    case ControlOffset::kListenOffer:
    case ControlOffset::kRestart:
    case ControlOffset::kRequestReread:
    case ControlOffset::kShareTranscript:
      return true;
    case ControlOffset::kRetiredReread:
      return false;
  }
  return false;
}

bool HasOffset(const ProtocolChunk& chunk, ControlOffset offset) {
  return chunk.offset == static_cast<int>(offset);
}

bool IsFirstRead(const ProtocolChunk& chunk) {
  return HasOffset(chunk, ControlOffset::kStartReread);
}

// A full read ends with the live text that follows the history.
bool IsLastRead(const ProtocolChunk& chunk) {
  return HasOffset(chunk, ControlOffset::kLiveText);
}

bool IsSound(const ProtocolChunk& chunk) {
  return HasOffset(chunk, ControlOffset::kPlaySound);
}

bool IsReplayRequest(const ProtocolChunk& chunk) {
  return HasOffset(chunk, ControlOffset::kRequestReread);
}

bool IsListenOffer(const ProtocolChunk& chunk) {
  return HasOffset(chunk, ControlOffset::kListenOffer);
}

bool IsRestart(const ProtocolChunk& chunk) {
  return HasOffset(chunk, ControlOffset::kRestart);
}

bool IsTranscriptId(const ProtocolChunk& chunk) {
  return HasOffset(chunk, ControlOffset::kShareTranscript);
}

const char* ControlOffsetName(int offset) {
  if (offset >= 0) {
    return "diff";
  }
  switch (static_cast<ControlOffset>(offset)) {
    case ControlOffset::kNewline:
      return "newline";
    case ControlOffset::kPastText:
      return "past_text";
    case ControlOffset::kLiveText:
      return "live_text";
    case ControlOffset::kStartReread:
      return "start_reread";
    case ControlOffset::kRetiredReread:
      return "retired_reread";
    case ControlOffset::kClearHistory:
      return "clear_history";
    case ControlOffset::kPlaySound:
      return "play_sound";
    case ControlOffset::kPlaySpeech:
      return "play_speech";
    case ControlOffset::kWhisperOffer:
      return "whisper_offer";
    case ControlOffset::kListenRequest:
      return "listen_request";
    case ControlOffset::kListenAuthYes:
      return "listen_auth_yes";
    case ControlOffset::kListenAuthNo:
      return "listen_auth_no";
    case ControlOffset::kJoining:
      return "joining";
    case ControlOffset::kDropping:
      return "dropping";
    case ControlOffset::kListenOffer:
      return "listen_offer";
    case ControlOffset::kRestart:
      return "restart";
    case ControlOffset::kRequestReread:
      return "request_reread";
    case ControlOffset::kShareTranscript:
      return "share_transcript";
  }
  return "unknown";
}

const char* ReadTypeName(ReadType type) {
  switch (type) {
    case ReadType::kLive:
      return "live";
    case ReadType::kPast:
      return "past";
    case ReadType::kAll:
      return "all";
  }
  return "all";
}

bool ParseReadType(std::string_view text, ReadType& out) {
  if (text == "live") {
    out = ReadType::kLive;
    return true;
  }
  if (text == "past") {
    out = ReadType::kPast;
    return true;
  }
  if (text == "all") {
    out = ReadType::kAll;
    return true;
  }
  return false;
}

ProtocolChunk PastText(std::string_view line) {
  return Control(ControlOffset::kPastText, line);
}

ProtocolChunk LiveText(std::string_view line) {
  return Control(ControlOffset::kLiveText, line);
}

ProtocolChunk AcknowledgeRead(ReadType type) {
  return Control(ControlOffset::kStartReread, ReadTypeName(type));
}

ProtocolChunk ReplayRequest(ReadType type) {
  return Control(ControlOffset::kRequestReread, ReadTypeName(type));
}

ProtocolChunk ClearHistory() {
  return Control(ControlOffset::kClearHistory, "");
}

ProtocolChunk Sound(std::string_view name) {
  return Control(ControlOffset::kPlaySound, name);
}

ProtocolChunk Speech(std::string_view text) {
  return Control(ControlOffset::kPlaySpeech, text);
}

ProtocolChunk ShareTranscript(std::string_view transcript_id) {
  return Control(ControlOffset::kShareTranscript, transcript_id);
}

ProtocolChunk WhisperOffer(const ClientInfo& info) {
  return Presence(ControlOffset::kWhisperOffer, info);
}

ProtocolChunk ListenRequest(const ClientInfo& info) {
  return Presence(ControlOffset::kListenRequest, info);
}

ProtocolChunk ListenAuthYes(const ClientInfo& info) {
  return Presence(ControlOffset::kListenAuthYes, info);
}

ProtocolChunk ListenAuthNo(const ClientInfo& info) {
  return Presence(ControlOffset::kListenAuthNo, info);
}

ProtocolChunk Joining(const ClientInfo& info) {
  return Presence(ControlOffset::kJoining, info);
}

ProtocolChunk Dropping(std::string_view client_id) {
  return PresenceForClient(ControlOffset::kDropping, client_id);
}

ProtocolChunk ListenOffer(const ClientInfo& info) {
  return Presence(ControlOffset::kListenOffer, info);
}

ProtocolChunk Restart(std::string_view client_id) {
  return PresenceForClient(ControlOffset::kRestart, client_id);
}

}  // namespace whisper::core
