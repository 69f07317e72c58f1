#include <cassert>
#include <cstdint>
#include <string>
#include <vector>

#include "relay_frame.h"

using namespace whisper::transport;

int main() {
  // Header layout.
  {
    const auto bytes = HeartbeatFrame();
    assert(bytes.size() == kRelayHeaderSize);
    assert(bytes[0] == 0x57 && bytes[1] == 0x53 && bytes[2] == 0x50 &&
           bytes[3] == 0x52);
    assert(bytes[4] == 1 && bytes[5] == 0);
    assert(bytes[6] == static_cast<std::uint8_t>(RelayFrameType::kHeartbeat));
    assert(bytes[8] == 0 && bytes[9] == 0 && bytes[10] == 0 && bytes[11] == 0);

    RelayFrame frame;
    assert(DecodeFrame(bytes.data(), bytes.size(), frame));
    assert(frame.type == RelayFrameType::kHeartbeat);
    assert(frame.payload.empty());
  }

  // Bad magic, version, type or size is rejected.
  {
    auto bytes = HeartbeatFrame();
    RelayFrameType type;
    std::uint32_t len = 0;
    auto bad = bytes;
    bad[0] ^= 0xFF;
    assert(!DecodeFrameHeader(bad.data(), bad.size(), type, len));
    bad = bytes;
    bad[4] = 9;
    assert(!DecodeFrameHeader(bad.data(), bad.size(), type, len));
    bad = bytes;
    bad[6] = 0;
    assert(!DecodeFrameHeader(bad.data(), bad.size(), type, len));
    bad = bytes;
    bad[6] = 8;
    assert(!DecodeFrameHeader(bad.data(), bad.size(), type, len));
    bad = bytes;
    bad[10] = 0x02;  // 128 KiB
    assert(!DecodeFrameHeader(bad.data(), bad.size(), type, len));
    assert(!DecodeFrameHeader(bytes.data(), kRelayHeaderSize - 1, type, len));

    RelayFrame oversized;
    oversized.type = RelayFrameType::kPublish;
    oversized.payload.assign(kMaxRelayPayloadBytes + 1, 0);
    std::vector<std::uint8_t> out;
    assert(!EncodeFrame(oversized, out));
  }

  // Payload fields.
  {
    JoinPayload join{RelayRole::kWhisper, ControlChannel("CONV"), "C1"};
    std::vector<std::uint8_t> payload;
    assert(EncodeJoin(join, payload));
    JoinPayload back;
    assert(DecodeJoin(payload, back));
    assert(back.role == RelayRole::kWhisper);
    assert(back.channel == "CONV:control");
    assert(back.client_id == "C1");
    payload.push_back(0);
    assert(!DecodeJoin(payload, back));

    JoinPayload anonymous{RelayRole::kListen, "CONV:control", ""};
    assert(EncodeJoin(anonymous, payload));
    assert(!DecodeJoin(payload, back));

    PublishPayload publish{ContentChannel("CONV", "K9"), "all",
                           std::string("0|a\0b", 5)};
    assert(EncodePublish(publish, payload));
    PublishPayload pub_back;
    assert(DecodePublish(payload, pub_back));
    assert(pub_back.channel == "CONV:K9");
    assert(pub_back.target == "all");
    assert(pub_back.data.size() == 5);
    payload.resize(payload.size() - 1);
    assert(!DecodePublish(payload, pub_back));

    PresencePayload presence{"CONV:control", false, "C2"};
    assert(EncodePresence(presence, payload));
    PresencePayload pres_back;
    assert(DecodePresence(payload, pres_back));
    assert(!pres_back.entered && pres_back.client_id == "C2");

    std::string text;
    assert(EncodeError("no such channel", payload));
    assert(DecodeError(payload, text));
    assert(text == "no such channel");
  }

  // Stream splitting keeps partial frames for the next read.
  {
    std::vector<std::uint8_t> stream;
    const auto a = MessageFrame({"CONV:control", "C1", "-20|x"});
    const auto b = LeaveFrame("CONV:control");
    stream.insert(stream.end(), a.begin(), a.end());
    stream.insert(stream.end(), b.begin(), b.begin() + 5);

    std::vector<RelayFrame> frames;
    assert(TakeFrames(stream, frames));
    assert(frames.size() == 1);
    assert(frames[0].type == RelayFrameType::kMessage);
    assert(stream.size() == 5);

    stream.insert(stream.end(), b.begin() + 5, b.end());
    assert(TakeFrames(stream, frames));
    assert(frames.size() == 2);
    assert(stream.empty());
    std::string channel;
    assert(DecodeLeave(frames[1].payload, channel));
    assert(channel == "CONV:control");

    MessagePayload message;
    assert(DecodeMessage(frames[0].payload, message));
    assert(message.sender == "C1" && message.data == "-20|x");

    std::vector<std::uint8_t> junk(16, 0xAB);
    frames.clear();
    assert(!TakeFrames(junk, frames));
    assert(frames.empty());
  }

  return 0;
}
