#include "line_diff.h"

#include <algorithm>
#include <cassert>

namespace whisper::core {

namespace {

bool IsContinuationByte(unsigned char ch) {
  return (ch & 0xC0u) == 0x80u;
}

std::size_t NextCodePoint(std::string_view text, std::size_t pos) {
  ++pos;
  while (pos < text.size() &&
         IsContinuationByte(static_cast<unsigned char>(text[pos]))) {
    ++pos;
  }
  return pos;
}

ProtocolChunk Diff(std::size_t offset, std::string_view text) {
  ProtocolChunk chunk;
  chunk.offset = static_cast<int>(offset);
  chunk.text.assign(text.data(), text.size());
  return chunk;
}

}  // namespace

std::size_t CodePointCount(std::string_view text) {
  std::size_t count = 0;
  for (const char ch : text) {
    if (!IsContinuationByte(static_cast<unsigned char>(ch))) {
      ++count;
    }
  }
  return count;
}

std::size_t CodePointByteOffset(std::string_view text, std::size_t cp_index) {
  std::size_t pos = 0;
  for (std::size_t i = 0; i < cp_index && pos < text.size(); ++i) {
    pos = NextCodePoint(text, pos);
  }
  return pos;
}

std::vector<ProtocolChunk> FromLiveTyping(std::string_view text,
                                          std::size_t start) {
  std::vector<ProtocolChunk> chunks;
  const std::size_t start_byte = CodePointByteOffset(text, start);
  std::string_view rest = text.substr(start_byte);
  std::size_t line_offset = start;
  while (true) {
    const std::size_t nl = rest.find('\n');
    if (nl == std::string_view::npos) {
      chunks.push_back(Diff(line_offset, rest));
      break;
    }
    chunks.push_back(Diff(line_offset, rest.substr(0, nl)));
    chunks.push_back(
        ProtocolChunk{static_cast<int>(ControlOffset::kNewline), std::string()});
    rest = rest.substr(nl + 1);
    line_offset = 0;
  }
  return chunks;
}

std::vector<ProtocolChunk> DiffLines(std::string_view old_text,
                                     std::string_view new_text) {
  if (old_text == new_text) {
    return {};
  }
  std::size_t byte = 0;
  std::size_t cp = 0;
  const std::size_t common = std::min(old_text.size(), new_text.size());
  while (byte < common) {
    const std::size_t old_next = NextCodePoint(old_text, byte);
    const std::size_t new_next = NextCodePoint(new_text, byte);
    if (old_next != new_next ||
        old_text.substr(byte, old_next - byte) !=
            new_text.substr(byte, new_next - byte)) {
      return FromLiveTyping(new_text, cp);
    }
    byte = old_next;
    ++cp;
  }
  if (old_text.size() < new_text.size()) {
    return FromLiveTyping(new_text, cp);
  }
  // new_text is a strict prefix of old_text: truncate.
  return {Diff(CodePointCount(new_text), std::string_view())};
}

std::string ApplyDiff(std::string_view old_text, const ProtocolChunk& chunk) {
  assert(chunk.offset >= 0);
  const std::size_t offset =
      chunk.offset < 0 ? 0 : static_cast<std::size_t>(chunk.offset);
  std::string out(old_text.substr(0, CodePointByteOffset(old_text, offset)));
  out.append(chunk.text);
  return out;
}

bool LineAssembler::Apply(const ProtocolChunk& chunk) {
  if (chunk.offset >= 0) {
    live_ = ApplyDiff(live_, chunk);
    return true;
  }
  switch (static_cast<ControlOffset>(chunk.offset)) {
    case ControlOffset::kNewline:
      past_.push_back(live_);
      live_.clear();
      return true;
    case ControlOffset::kPastText:
      past_.push_back(chunk.text);
      return true;
    case ControlOffset::kLiveText:
      live_ = chunk.text;
      return true;
    case ControlOffset::kClearHistory:
      past_.clear();
      return true;
    default:
      return false;
  }
}

void LineAssembler::Reset() {
  live_.clear();
  past_.clear();
}

}  // namespace whisper::core
