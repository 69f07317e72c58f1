#include "platform_log.h"

#include <atomic>
#include <cstdio>
#include <mutex>
#include <string>
#include <vector>

#include "platform_time.h"

namespace whisper::platform::log {

namespace {

struct Sink {
  std::mutex mutex;
  LogCallback callback{nullptr};
  void* user{nullptr};
};

Sink& GetSink() {
  static Sink sink;
  return sink;
}

std::atomic<std::uint8_t> g_min_level{static_cast<std::uint8_t>(Level::kInfo)};

// Process start, for the relative timestamps of the default sink.
const std::uint64_t g_epoch_ms = NowSteadyMs();

constexpr std::string_view kMask = "***";
constexpr std::string_view kSensitiveWords[] = {"token", "secret", "password"};

char LowerAscii(char ch) {
  return (ch >= 'A' && ch <= 'Z') ? static_cast<char>(ch - 'A' + 'a') : ch;
}

bool ContainsNoCase(std::string_view haystack, std::string_view needle) {
  if (needle.size() > haystack.size()) {
    return false;
  }
  for (std::size_t i = 0; i + needle.size() <= haystack.size(); ++i) {
    std::size_t j = 0;
    while (j < needle.size() && LowerAscii(haystack[i + j]) == needle[j]) {
      ++j;
    }
    if (j == needle.size()) {
      return true;
    }
  }
  return false;
}

bool EndsWithNoCase(std::string_view text, std::string_view suffix) {
  if (suffix.size() > text.size()) {
    return false;
  }
  const std::string_view tail = text.substr(text.size() - suffix.size());
  for (std::size_t i = 0; i < suffix.size(); ++i) {
    if (LowerAscii(tail[i]) != suffix[i]) {
      return false;
    }
  }
  return true;
}

bool EndsValue(char ch) {
  return ch == ' ' || ch == '\t' || ch == '\n' || ch == ',' || ch == ';' ||
         ch == '&';
}

void AppendValue(std::string& line, std::string_view value) {
  const bool quote = value.empty() ||
                     value.find_first_of(" \t\"") != std::string_view::npos;
  if (!quote) {
    line.append(value.data(), value.size());
    return;
  }
  line.push_back('"');
  for (char ch : value) {
    if (ch == '"' || ch == '\\') {
      line.push_back('\\');
    }
    line.push_back(ch);
  }
  line.push_back('"');
}

void WriteDefault(Level level, std::string_view tag, std::string_view message,
                  const Field* fields, std::size_t field_count) {
  const std::uint64_t elapsed = NowSteadyMs() - g_epoch_ms;
  char stamp[32];
  std::snprintf(stamp, sizeof(stamp), "%llu.%03llu",
                static_cast<unsigned long long>(elapsed / 1000u),
                static_cast<unsigned long long>(elapsed % 1000u));
  std::string line;
  line.reserve(48 + tag.size() + message.size() + field_count * 24);
  line.append("[whisper ").append(stamp).append("] ");
  line.append(LevelName(level));
  line.push_back(' ');
  line.append(tag.data(), tag.size());
  line.append(": ");
  line.append(message.data(), message.size());
  for (std::size_t i = 0; i < field_count; ++i) {
    if (fields[i].key.empty()) {
      continue;
    }
    line.push_back(' ');
    line.append(fields[i].key.data(), fields[i].key.size());
    line.push_back('=');
    AppendValue(line, fields[i].value);
  }
  line.push_back('\n');
  FILE* out = level >= Level::kWarn ? stderr : stdout;
  std::fwrite(line.data(), 1, line.size(), out);
  std::fflush(out);
}

}  // namespace

void SetLogCallback(LogCallback cb, void* user_data) {
  Sink& sink = GetSink();
  std::lock_guard<std::mutex> lock(sink.mutex);
  sink.callback = cb;
  sink.user = user_data;
}

void SetMinLevel(Level level) {
  g_min_level.store(static_cast<std::uint8_t>(level));
}

Level MinLevel() { return static_cast<Level>(g_min_level.load()); }

void Log(Level level, std::string_view tag, std::string_view message) {
  Log(level, tag, message, {});
}

void Log(Level level, std::string_view tag, std::string_view message,
         std::initializer_list<Field> fields) {
  if (static_cast<std::uint8_t>(level) < g_min_level.load()) {
    return;
  }
  const std::string tag_text(tag);
  const std::string text = RedactMessage(message);
  // Values are copied so the callback sees stable, redacted storage.
  std::vector<std::string> values;
  values.reserve(fields.size());
  for (const Field& field : fields) {
    values.push_back(RedactValue(field.key, field.value));
  }
  std::vector<Field> safe;
  safe.reserve(fields.size());
  std::size_t index = 0;
  for (const Field& field : fields) {
    safe.push_back(Field{field.key, values[index++]});
  }

  Sink& sink = GetSink();
  std::lock_guard<std::mutex> lock(sink.mutex);
  if (sink.callback) {
    sink.callback(level, tag_text.c_str(), text.c_str(), safe.data(),
                  safe.size(), sink.user);
    return;
  }
  WriteDefault(level, tag_text, text, safe.data(), safe.size());
}

const char* LevelName(Level level) {
  switch (level) {
    case Level::kDebug:
      return "DEBUG";
    case Level::kInfo:
      return "INFO";
    case Level::kWarn:
      return "WARN";
    case Level::kError:
      return "ERROR";
  }
  return "INFO";
}

bool IsSensitiveKey(std::string_view key) {
  if (key.empty()) {
    return false;
  }
  for (std::string_view word : kSensitiveWords) {
    if (ContainsNoCase(key, word)) {
      return true;
    }
  }
  // "key", "tls_key", "private_key"; not "keyboard" or "monkey_id".
  return EndsWithNoCase(key, "key") &&
         (key.size() == 3 || key[key.size() - 4] == '_');
}

std::string RedactValue(std::string_view key, std::string_view value) {
  if (IsSensitiveKey(key)) {
    return std::string(kMask);
  }
  return std::string(value);
}

std::string RedactMessage(std::string_view message) {
  std::string out;
  out.reserve(message.size());
  std::size_t i = 0;
  while (i < message.size()) {
    const std::size_t eq = message.find('=', i);
    if (eq == std::string_view::npos) {
      out.append(message.substr(i));
      break;
    }
    // The key is the word right before '='.
    std::size_t key_start = eq;
    while (key_start > i && !EndsValue(message[key_start - 1])) {
      --key_start;
    }
    out.append(message.substr(i, eq + 1 - i));
    std::size_t end = eq + 1;
    while (end < message.size() && !EndsValue(message[end])) {
      ++end;
    }
    const std::string_view key = message.substr(key_start, eq - key_start);
    if (IsSensitiveKey(key) && end > eq + 1) {
      out.append(kMask);
    } else {
      out.append(message.substr(eq + 1, end - eq - 1));
    }
    i = end;
  }
  return out;
}

}  // namespace whisper::platform::log
