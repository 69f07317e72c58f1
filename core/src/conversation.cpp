#include "conversation.h"

#include <cstdint>
#include <cstdio>

#include "platform_random.h"

namespace whisper::core {

bool Conversation::IsAuthorized(std::string_view profile_id) const {
  if (profile_id.empty()) {
    return false;
  }
  if (profile_id == owner_profile_id) {
    return true;
  }
  return authorized_listeners.find(std::string(profile_id)) !=
         authorized_listeners.end();
}

void Conversation::Authorize(const std::string& profile_id,
                             const std::string& username) {
  if (profile_id.empty()) {
    return;
  }
  authorized_listeners[profile_id] = username;
}

void Conversation::Revoke(const std::string& profile_id) {
  authorized_listeners.erase(profile_id);
}

std::string ShortConversationId(std::string_view conversation_id) {
  return std::string(conversation_id.substr(0, kShortIdLength));
}

bool MatchesShortId(std::string_view advertised,
                    std::string_view conversation_id) {
  return !conversation_id.empty() &&
         advertised == conversation_id.substr(0, kShortIdLength);
}

bool NewRandomId(std::string& out) {
  std::uint8_t bytes[16] = {};
  if (!platform::RandomBytes(bytes, sizeof(bytes))) {
    return false;
  }
  bytes[6] = static_cast<std::uint8_t>((bytes[6] & 0x0Fu) | 0x40u);
  bytes[8] = static_cast<std::uint8_t>((bytes[8] & 0x3Fu) | 0x80u);
  char buf[37] = {};
  std::snprintf(buf, sizeof(buf),
                "%02X%02X%02X%02X-%02X%02X-%02X%02X-%02X%02X-"
                "%02X%02X%02X%02X%02X%02X",
                bytes[0], bytes[1], bytes[2], bytes[3], bytes[4], bytes[5],
                bytes[6], bytes[7], bytes[8], bytes[9], bytes[10], bytes[11],
                bytes[12], bytes[13], bytes[14], bytes[15]);
  out.assign(buf, 36);
  return true;
}

ClientInfo MakeClientInfo(const LocalIdentity& identity,
                          const Conversation& conversation,
                          std::string_view content_id) {
  ClientInfo info;
  info.conversation_id = conversation.id;
  info.conversation_name = conversation.name;
  info.client_id = identity.client_id;
  info.profile_id = identity.profile_id;
  info.username = identity.username;
  info.content_id.assign(content_id.data(), content_id.size());
  return info;
}

}  // namespace whisper::core
