#include "ini.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace whisper::core {

namespace {

bool ParseStream(std::istream& in, const IniHandler& handler,
                 std::string& error) {
  std::string section;
  std::string line;
  std::size_t line_no = 0;
  while (std::getline(in, line)) {
    ++line_no;
    const std::string trimmed = StripInlineComment(Trim(line));
    if (trimmed.empty()) {
      continue;
    }
    if (trimmed.front() == '[') {
      if (trimmed.back() != ']' || trimmed.size() < 3) {
        std::ostringstream oss;
        oss << "invalid section at line " << line_no;
        error = oss.str();
        return false;
      }
      section = Trim(trimmed.substr(1, trimmed.size() - 2));
      continue;
    }
    const auto pos = trimmed.find('=');
    if (pos == std::string::npos || pos == 0) {
      std::ostringstream oss;
      oss << "invalid line " << line_no;
      error = oss.str();
      return false;
    }
    const std::string key = Trim(trimmed.substr(0, pos));
    const std::string value = Trim(trimmed.substr(pos + 1));
    if (!handler(section, key, value, error)) {
      if (error.empty()) {
        error = "invalid value for " + key;
      }
      std::ostringstream oss;
      oss << error << " (line " << line_no << ")";
      error = oss.str();
      return false;
    }
  }
  return true;
}

}  // namespace

std::string Trim(const std::string& input) {
  const auto is_space = [](unsigned char ch) { return std::isspace(ch) != 0; };
  auto begin = std::find_if_not(input.begin(), input.end(), is_space);
  auto end = std::find_if_not(input.rbegin(), input.rend(), is_space).base();
  if (begin >= end) {
    return {};
  }
  return std::string(begin, end);
}

std::string StripInlineComment(const std::string& input) {
  for (std::size_t i = 0; i < input.size(); ++i) {
    const char ch = input[i];
    if ((ch == '#' || ch == ';') &&
        (i == 0 ||
         std::isspace(static_cast<unsigned char>(input[i - 1])) != 0)) {
      return Trim(input.substr(0, i));
    }
  }
  return input;
}

bool ParseUint16(const std::string& text, std::uint16_t& out) {
  std::uint32_t value = 0;
  if (!ParseUint32(text, value) || value > 65535u) {
    return false;
  }
  out = static_cast<std::uint16_t>(value);
  return true;
}

bool ParseUint32(const std::string& text, std::uint32_t& out) {
  if (text.empty() || text.front() == '-') {
    return false;
  }
  char* end_ptr = nullptr;
  const unsigned long long value = std::strtoull(text.c_str(), &end_ptr, 10);
  if (end_ptr == text.c_str() || *end_ptr != '\0' || value > 0xFFFFFFFFull) {
    return false;
  }
  out = static_cast<std::uint32_t>(value);
  return true;
}

bool ParseBool(const std::string& text, bool& out) {
  if (text == "1" || text == "true" || text == "on" || text == "yes") {
    out = true;
    return true;
  }
  if (text == "0" || text == "false" || text == "off" || text == "no") {
    out = false;
    return true;
  }
  return false;
}

bool ParseIniFile(const std::string& path, const IniHandler& handler,
                  std::string& error) {
  error.clear();
  std::ifstream file(path);
  if (!file.is_open()) {
    error = "config file not found: " + path;
    return false;
  }
  return ParseStream(file, handler, error);
}

bool ParseIniText(const std::string& text, const IniHandler& handler,
                  std::string& error) {
  error.clear();
  std::istringstream in(text);
  return ParseStream(in, handler, error);
}

}  // namespace whisper::core
