#include "platform_random.h"

#include <cerrno>
#include <string>

#include <fcntl.h>
#include <unistd.h>

#if defined(__linux__)
#include <sys/random.h>
#endif

#include "platform_log.h"

namespace whisper::platform {

namespace pfl = whisper::platform::log;

namespace {

constexpr const char* kTag = "random";

// Fills from the kernel pool; returns how many bytes were written.
std::size_t FillFromKernel(std::uint8_t* out, std::size_t len) {
  std::size_t done = 0;
#if defined(__linux__)
  while (done < len) {
    const ssize_t got = ::getrandom(out + done, len - done, 0);
    if (got < 0 && errno == EINTR) {
      continue;
    }
    if (got <= 0) {
      break;
    }
    done += static_cast<std::size_t>(got);
  }
#else
  (void)out;
  (void)len;
#endif
  return done;
}

std::size_t FillFromDevice(std::uint8_t* out, std::size_t len) {
  const int fd = ::open("/dev/urandom", O_RDONLY | O_CLOEXEC);
  if (fd < 0) {
    return 0;
  }
  std::size_t done = 0;
  while (done < len) {
    const ssize_t got = ::read(fd, out + done, len - done);
    if (got < 0 && errno == EINTR) {
      continue;
    }
    if (got <= 0) {
      break;
    }
    done += static_cast<std::size_t>(got);
  }
  ::close(fd);
  return done;
}

}  // namespace

bool RandomBytes(std::uint8_t* out, std::size_t len) {
  if (!out || len == 0) {
    return false;
  }
  std::size_t done = FillFromKernel(out, len);
  if (done < len) {
    done += FillFromDevice(out + done, len - done);
  }
  if (done < len) {
    pfl::Log(pfl::Level::kError, kTag, "entropy source exhausted",
             {{"wanted", std::to_string(len)},
              {"got", std::to_string(done)}});
    return false;
  }
  return true;
}

}  // namespace whisper::platform
