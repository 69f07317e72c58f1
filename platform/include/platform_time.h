#ifndef WHISPER_PLATFORM_TIME_H
#define WHISPER_PLATFORM_TIME_H

#include <cstdint>

namespace whisper::platform {

std::uint64_t NowSteadyMs();
void SleepMs(std::uint32_t ms);

}  // namespace whisper::platform

#endif  // WHISPER_PLATFORM_TIME_H
