#ifndef WHISPER_CORE_CONVERSATION_H
#define WHISPER_CORE_CONVERSATION_H

#include <cstddef>
#include <map>
#include <string>
#include <string_view>

#include "protocol.h"

namespace whisper::core {

// Advertised name used when a listener is not looking for a particular
// conversation.
constexpr std::string_view kOpenDiscovery = "discover";
constexpr std::size_t kShortIdLength = 8;

struct LocalIdentity {
  std::string client_id;
  std::string profile_id;
  std::string username;
};

struct Conversation {
  std::string id;
  std::string name;
  std::string owner_profile_id;
  std::map<std::string, std::string> authorized_listeners;  // profile -> name

  bool IsAuthorized(std::string_view profile_id) const;
  void Authorize(const std::string& profile_id, const std::string& username);
  void Revoke(const std::string& profile_id);
};

// First eight characters of a conversation id; the radio advertisement name.
std::string ShortConversationId(std::string_view conversation_id);
bool MatchesShortId(std::string_view advertised,
                    std::string_view conversation_id);

// Random RFC 4122 version 4 id in upper-case text form.
bool NewRandomId(std::string& out);

// ClientInfo describing this device in the given conversation.
ClientInfo MakeClientInfo(const LocalIdentity& identity,
                          const Conversation& conversation,
                          std::string_view content_id = {});

}  // namespace whisper::core

#endif  // WHISPER_CORE_CONVERSATION_H
