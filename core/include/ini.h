#ifndef WHISPER_CORE_INI_H
#define WHISPER_CORE_INI_H

#include <cstdint>
#include <functional>
#include <string>

namespace whisper::core {

std::string Trim(const std::string& input);
std::string StripInlineComment(const std::string& input);
bool ParseUint16(const std::string& text, std::uint16_t& out);
bool ParseUint32(const std::string& text, std::uint32_t& out);
bool ParseBool(const std::string& text, bool& out);

// Called once per "key = value" line with the enclosing [section] name.
// Returning false aborts parsing; the handler fills `error`.
using IniHandler = std::function<bool(const std::string& section,
                                      const std::string& key,
                                      const std::string& value,
                                      std::string& error)>;

bool ParseIniFile(const std::string& path, const IniHandler& handler,
                  std::string& error);
bool ParseIniText(const std::string& text, const IniHandler& handler,
                  std::string& error);

}  // namespace whisper::core

#endif  // WHISPER_CORE_INI_H
