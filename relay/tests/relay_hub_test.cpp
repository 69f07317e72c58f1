#include <cassert>
#include <string>
#include <vector>

#include "relay_frame.h"
#include "relay_hub.h"

using whisper::relay::ConnectionId;
using whisper::relay::Outgoing;
using whisper::relay::RelayHub;
using whisper::relay::TargetMatches;
using namespace whisper::transport;

namespace {

RelayFrame Parse(const std::vector<std::uint8_t>& bytes) {
  RelayFrame frame;
  const bool ok = DecodeFrame(bytes.data(), bytes.size(), frame);
  assert(ok);
  return frame;
}

bool Join(RelayHub& hub, ConnectionId conn, RelayRole role,
          const std::string& channel, const std::string& client,
          std::vector<Outgoing>& out) {
  return hub.HandleFrame(conn, Parse(JoinFrame({role, channel, client})), out);
}

bool Publish(RelayHub& hub, ConnectionId conn, const std::string& channel,
             const std::string& target, const std::string& data,
             std::vector<Outgoing>& out) {
  return hub.HandleFrame(conn, Parse(PublishFrame({channel, target, data})),
                         out);
}

std::vector<ConnectionId> Recipients(const std::vector<Outgoing>& out) {
  std::vector<ConnectionId> ids;
  for (const auto& item : out) {
    ids.push_back(item.to);
  }
  return ids;
}

}  // namespace

int main() {
  assert(TargetMatches("all", "c1", RelayRole::kListen));
  assert(TargetMatches("whisperer", "w", RelayRole::kWhisper));
  assert(!TargetMatches("whisperer", "c1", RelayRole::kListen));
  assert(TargetMatches("c1", "c1", RelayRole::kListen));
  assert(!TargetMatches("c2", "c1", RelayRole::kListen));

  const std::string control = ControlChannel("CONV");
  RelayHub hub;
  std::vector<Outgoing> out;

  // Presence enter goes to the members already there.
  assert(Join(hub, 1, RelayRole::kWhisper, control, "W", out));
  assert(out.empty());
  assert(Join(hub, 2, RelayRole::kListen, control, "L1", out));
  assert(out.size() == 1 && out[0].to == 1);
  {
    const RelayFrame frame = Parse(out[0].frame);
    assert(frame.type == RelayFrameType::kPresence);
    PresencePayload presence;
    assert(DecodePresence(frame.payload, presence));
    assert(presence.entered && presence.client_id == "L1");
  }
  out.clear();
  assert(Join(hub, 3, RelayRole::kListen, control, "L2", out));
  assert((Recipients(out) == std::vector<ConnectionId>{1, 2}));
  out.clear();
  assert(hub.Members(control).size() == 3);
  assert(hub.RoleOf(control, "W") == RelayRole::kWhisper);

  // Target rules; the sender never hears itself.
  assert(Publish(hub, 2, control, "whisperer", "-26|offer", out));
  assert(Recipients(out) == std::vector<ConnectionId>{1});
  {
    MessagePayload message;
    assert(DecodeMessage(Parse(out[0].frame).payload, message));
    assert(message.sender == "L1");
    assert(message.channel == control);
    assert(message.data == "-26|offer");
  }
  out.clear();
  assert(Publish(hub, 1, control, "all", "-20|offer", out));
  assert((Recipients(out) == std::vector<ConnectionId>{2, 3}));
  out.clear();
  assert(Publish(hub, 1, control, "L2", "-22|yes", out));
  assert(Recipients(out) == std::vector<ConnectionId>{3});
  out.clear();

  // Publishing to a channel the sender has not joined is answered with an
  // error and keeps the connection.
  assert(Publish(hub, 2, ContentChannel("CONV", "K"), "all", "0|x", out));
  assert(out.size() == 1 && out[0].to == 2);
  assert(Parse(out[0].frame).type == RelayFrameType::kError);
  out.clear();

  // Heartbeats are answered.
  assert(hub.HandleFrame(3, Parse(HeartbeatFrame()), out));
  assert(out.size() == 1 && out[0].to == 3);
  assert(Parse(out[0].frame).type == RelayFrameType::kHeartbeat);
  out.clear();

  // Explicit leave.
  assert(hub.HandleFrame(3, Parse(LeaveFrame(control)), out));
  assert((Recipients(out) == std::vector<ConnectionId>{1, 2}));
  {
    PresencePayload presence;
    assert(DecodePresence(Parse(out[0].frame).payload, presence));
    assert(!presence.entered && presence.client_id == "L2");
  }
  out.clear();
  assert(hub.Members(control).size() == 2);

  // Disconnect leaves every channel.
  const std::string content = ContentChannel("CONV", "K");
  assert(Join(hub, 1, RelayRole::kWhisper, content, "W", out));
  assert(Join(hub, 2, RelayRole::kListen, content, "L1", out));
  out.clear();
  hub.Disconnect(2, out);
  assert(out.size() == 2);
  assert(out[0].to == 1 && out[1].to == 1);
  out.clear();
  assert(hub.Members(control) == std::vector<std::string>{"W"});
  assert(hub.Members(content) == std::vector<std::string>{"W"});

  // Empty channels disappear.
  hub.Disconnect(1, out);
  assert(out.empty());
  assert(hub.channel_count() == 0);

  // Frames only the relay sends are a protocol violation.
  assert(!hub.HandleFrame(5, Parse(MessageFrame({control, "x", "0|y"})), out));
  RelayFrame junk_join;
  junk_join.type = RelayFrameType::kJoin;
  junk_join.payload = {1, 2, 3};
  out.clear();
  assert(!hub.HandleFrame(5, junk_join, out));
  assert(out.size() == 1 && Parse(out[0].frame).type == RelayFrameType::kError);

  return 0;
}
