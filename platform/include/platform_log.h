#ifndef WHISPER_PLATFORM_LOG_H
#define WHISPER_PLATFORM_LOG_H

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace whisper::platform::log {

enum class Level : std::uint8_t {
  kDebug = 0,
  kInfo = 1,
  kWarn = 2,
  kError = 3
};

struct Field {
  std::string_view key;
  std::string_view value;
};

using LogCallback = void (*)(Level level,
                             const char* tag,
                             const char* message,
                             const Field* fields,
                             std::size_t field_count,
                             void* user_data);

// Replaces the default stdout/stderr sink. Passing nullptr restores it.
void SetLogCallback(LogCallback cb, void* user_data);

// Records below this level are discarded before formatting. Default kInfo.
void SetMinLevel(Level level);
Level MinLevel();

void Log(Level level, std::string_view tag, std::string_view message);
void Log(Level level,
         std::string_view tag,
         std::string_view message,
         std::initializer_list<Field> fields);

const char* LevelName(Level level);
bool IsSensitiveKey(std::string_view key);
std::string RedactValue(std::string_view key, std::string_view value);
std::string RedactMessage(std::string_view message);

}  // namespace whisper::platform::log

#endif  // WHISPER_PLATFORM_LOG_H
