#include <cassert>
#include <cstdint>
#include <string>
#include <vector>

#include "protocol.h"

using whisper::core::ClientInfo;
using whisper::core::ControlOffset;
using whisper::core::DecodeChunk;
using whisper::core::DecodeClientInfo;
using whisper::core::EncodeChunk;
using whisper::core::EncodeChunkBytes;
using whisper::core::EncodeClientInfo;
using whisper::core::IsDiff;
using whisper::core::IsKnownControlOffset;
using whisper::core::IsPresenceMessage;
using whisper::core::ProtocolChunk;
using whisper::core::ReadType;

int main() {
  {
    const ProtocolChunk c{12, "hello"};
    assert(EncodeChunk(c) == "12|hello");
    ProtocolChunk back;
    assert(DecodeChunk(EncodeChunk(c), back));
    assert(back == c);

    const ProtocolChunk newline{-1, ""};
    assert(EncodeChunk(newline) == "-1|");
    const auto bytes = EncodeChunkBytes(newline);
    assert(DecodeChunk(bytes.data(), bytes.size(), back));
    assert(back.offset == -1 && back.text.empty());
  }

  // Only the first separator is significant.
  {
    ProtocolChunk c;
    assert(DecodeChunk("-20|a|b||c", c));
    assert(c.offset == -20);
    assert(c.text == "a|b||c");
    assert(DecodeChunk("0|", c));
    assert(c.offset == 0 && c.text.empty());
  }

  // Malformed input is rejected and leaves the output untouched.
  {
    ProtocolChunk c{7, "keep"};
    assert(!DecodeChunk("", c));
    assert(!DecodeChunk("nobar", c));
    assert(!DecodeChunk("|text", c));
    assert(!DecodeChunk("abc|text", c));
    assert(!DecodeChunk("12x|text", c));
    assert(!DecodeChunk("-|text", c));
    assert(!DecodeChunk(" 3|text", c));
    assert(!DecodeChunk("99999999999999999999|x", c));
    assert(!DecodeChunk(nullptr, 3, c));
    assert(c.offset == 7 && c.text == "keep");
  }

  // Presence band is exactly [-27, -20].
  {
    for (int offset = -60; offset <= 5; ++offset) {
      const ProtocolChunk c{offset, ""};
      const bool expected = offset >= -27 && offset <= -20;
      assert(IsPresenceMessage(c) == expected);
      assert(IsDiff(c) == (offset >= -1));
    }
    assert(!IsKnownControlOffset(-5));
    assert(!IsKnownControlOffset(-9));
    assert(IsKnownControlOffset(-40));
    assert(IsKnownControlOffset(-50));
    assert(static_cast<int>(ControlOffset::kShareTranscript) == -50);
    assert(static_cast<int>(ControlOffset::kRequestReread) == -40);
  }

  // ClientInfo keeps all six fields, empty ones included.
  {
    ClientInfo info;
    info.conversation_id = "C0FFEE11-2222";
    info.conversation_name = "Kitchen";
    info.client_id = "client-a";
    info.profile_id = "";
    info.username = "Ana";
    info.content_id = "content-9";
    const std::string text = EncodeClientInfo(info);
    assert(text == "C0FFEE11-2222|Kitchen|client-a||Ana|content-9");
    ClientInfo back;
    assert(DecodeClientInfo(text, back));
    assert(back == info);

    assert(DecodeClientInfo("|||||", back));
    assert(back.client_id.empty());
    assert(!DecodeClientInfo("a|b|c|d|e", back));
    assert(!DecodeClientInfo("a|b|c|d|e|f|g", back));
    assert(!DecodeClientInfo("a|b|c|d|e|f|", back));
  }

  // Builders.
  {
    ClientInfo info;
    info.conversation_id = "conv";
    info.client_id = "me";
    const ProtocolChunk offer = whisper::core::WhisperOffer(info);
    assert(offer.offset == -20);
    assert(IsPresenceMessage(offer));
    ClientInfo parsed;
    assert(DecodeClientInfo(offer.text, parsed));
    assert(parsed.client_id == "me");

    const ProtocolChunk drop = whisper::core::Dropping("me");
    assert(drop.offset == -25);
    assert(drop.text == "||me|||");
    assert(whisper::core::IsRestart(whisper::core::Restart("me")));
    assert(whisper::core::IsListenOffer(whisper::core::ListenOffer(info)));

    const ProtocolChunk replay = whisper::core::ReplayRequest(ReadType::kAll);
    assert(whisper::core::IsReplayRequest(replay));
    ReadType type = ReadType::kLive;
    assert(whisper::core::ParseReadType(replay.text, type));
    assert(type == ReadType::kAll);
    assert(!whisper::core::ParseReadType("most", type));

    assert(whisper::core::AcknowledgeRead(ReadType::kPast).offset == -4);
    assert(whisper::core::ClearHistory().offset == -6);
    assert(whisper::core::IsSound(whisper::core::Sound("bell")));
    assert(whisper::core::IsTranscriptId(whisper::core::ShareTranscript("t1")));
    assert(std::string(whisper::core::ControlOffsetName(-22)) ==
           "listen_auth_yes");
  }

  return 0;
}
