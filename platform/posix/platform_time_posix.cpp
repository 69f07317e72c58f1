#include "platform_time.h"

#include <time.h>

#include <cerrno>

namespace whisper::platform {

std::uint64_t NowSteadyMs() {
  timespec ts{};
  ::clock_gettime(CLOCK_MONOTONIC, &ts);
  return static_cast<std::uint64_t>(ts.tv_sec) * 1000u +
         static_cast<std::uint64_t>(ts.tv_nsec / 1000000);
}

void SleepMs(std::uint32_t ms) {
  timespec req{};
  req.tv_sec = static_cast<time_t>(ms / 1000u);
  req.tv_nsec = static_cast<long>(ms % 1000u) * 1000000L;
  while (::nanosleep(&req, &req) != 0 && errno == EINTR) {
  }
}

}  // namespace whisper::platform
