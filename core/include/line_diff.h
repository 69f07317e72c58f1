#ifndef WHISPER_CORE_LINE_DIFF_H
#define WHISPER_CORE_LINE_DIFF_H

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include "protocol.h"

namespace whisper::core {

// Offsets and lengths below count Unicode code points of UTF-8 text.
std::size_t CodePointCount(std::string_view text);
// Byte index of the code point at cp_index, or text.size() past the end.
std::size_t CodePointByteOffset(std::string_view text, std::size_t cp_index);

// Chunks that turn the live line `text` truncated at `start` into `text`,
// one diff per line with a newline chunk between lines.
std::vector<ProtocolChunk> FromLiveTyping(std::string_view text,
                                          std::size_t start);

// Minimal diff sequence from old_text to new_text. Empty when equal.
std::vector<ProtocolChunk> DiffLines(std::string_view old_text,
                                     std::string_view new_text);

// Keeps the first chunk.offset code points of old_text and appends
// chunk.text. The chunk must be a diff with a non-negative offset.
std::string ApplyDiff(std::string_view old_text, const ProtocolChunk& chunk);

// Rebuilds a transcript from a chunk stream: committed history lines plus
// the current live line.
class LineAssembler {
 public:
  // Returns true when the chunk changed the transcript.
  bool Apply(const ProtocolChunk& chunk);

  const std::string& live_text() const { return live_; }
  const std::vector<std::string>& past_lines() const { return past_; }
  void Reset();

 private:
  std::string live_;
  std::vector<std::string> past_;
};

}  // namespace whisper::core

#endif  // WHISPER_CORE_LINE_DIFF_H
