#ifndef WHISPER_PLATFORM_RANDOM_H
#define WHISPER_PLATFORM_RANDOM_H

#include <cstddef>
#include <cstdint>

namespace whisper::platform {

// Cryptographically strong bytes from the OS. False if the pool could not
// fill the whole buffer.
bool RandomBytes(std::uint8_t* out, std::size_t len);

}  // namespace whisper::platform

#endif  // WHISPER_PLATFORM_RANDOM_H
