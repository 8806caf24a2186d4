#include "et/crypto/random.h"

#include <cerrno>
#include <cstdint>
#include <fstream>
#include <span>

#if defined(__APPLE__) || defined(__FreeBSD__) || defined(__OpenBSD__) || defined(__NetBSD__)
#include <stdlib.h>
#include <unistd.h>
#elif defined(__linux__) || defined(__ANDROID__)
#include <sys/random.h>
#include <unistd.h>
#endif

#include "et/error.h"
#include "et/errors.h"

namespace {

[[maybe_unused]] void ReadFromUrandom(std::span<uint8_t> out) { // TSK203 POSIX fallback
  std::ifstream urandom("/dev/urandom", std::ios::in | std::ios::binary);
  if (!urandom) {
    throw et::Error(et::ErrorDomain::IO, et::errors::io::kRandomSourceUnavailable,
                    "Failed to open /dev/urandom", errno, et::Retryability::kTransient);
  }
  urandom.read(reinterpret_cast<char*>(out.data()),
               static_cast<std::streamsize>(out.size()));
  if (urandom.gcount() != static_cast<std::streamsize>(out.size())) {
    throw et::Error(et::ErrorDomain::IO, et::errors::io::kRandomSourceUnavailable,
                    "Failed to read sufficient entropy from /dev/urandom", errno,
                    et::Retryability::kTransient);
  }
}

}  // namespace

namespace et::crypto {

void SystemRandomBytes(std::span<uint8_t> out) { // TSK203
  if (out.empty()) {
    return;
  }
#if defined(__APPLE__) || defined(__FreeBSD__) || defined(__OpenBSD__) || defined(__NetBSD__)
  arc4random_buf(out.data(), out.size());
#elif defined(__linux__) || defined(__ANDROID__)
  size_t offset = 0;
  while (offset < out.size()) {
    ssize_t result = ::getrandom(out.data() + offset, out.size() - offset, GRND_NONBLOCK);
    if (result < 0) {
      if (errno == EINTR) {
        continue;
      }
      if (errno == EAGAIN || errno == ENOSYS) {
        break; // fall back to /dev/urandom below
      }
      throw Error(ErrorDomain::IO, errors::io::kRandomSourceUnavailable,
                  std::string(errors::msg::kRandomSourceFailed) + ": getrandom", errno);
    }
    if (result == 0) {
      break;
    }
    offset += static_cast<size_t>(result);
  }
  if (offset < out.size()) {
    ReadFromUrandom(out.subspan(offset));
  }
#else
  ReadFromUrandom(out);
#endif
}

}  // namespace et::crypto
