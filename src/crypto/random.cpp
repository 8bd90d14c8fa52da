#include "pv/crypto/random.h"

#include <cerrno>
#include <cstdint>
#include <cstring>
#include <fstream>
#include <limits>
#include <span>

#if defined(_WIN32)
#include <windows.h>
#include <bcrypt.h>
#if defined(_MSC_VER)
#pragma comment(lib, "bcrypt.lib")
#endif
#if !defined(BCRYPT_SUCCESS)
#define BCRYPT_SUCCESS(status) ((status) >= 0)
#endif
#elif defined(__APPLE__) || defined(__FreeBSD__) || defined(__OpenBSD__) || defined(__NetBSD__)
#include <stdlib.h>
#include <unistd.h>
#elif defined(__linux__) || defined(__ANDROID__)
#include <sys/random.h>
#include <unistd.h>
#endif

#include "pv/error.h"

namespace {

void ReadFromUrandom(std::span<uint8_t> out) {
  std::ifstream urandom("/dev/urandom", std::ios::in | std::ios::binary);
  if (!urandom) {
    throw pv::Error(pv::ErrorDomain::Crypto, pv::errors::backup::kCryptoUnavailable,
                    "Failed to open /dev/urandom", errno);
  }
  urandom.read(reinterpret_cast<char*>(out.data()),
               static_cast<std::streamsize>(out.size()));
  if (urandom.gcount() != static_cast<std::streamsize>(out.size())) {
    throw pv::Error(pv::ErrorDomain::Crypto, pv::errors::backup::kCryptoUnavailable,
                    "Failed to read sufficient entropy from /dev/urandom", errno);
  }
}

}  // namespace

namespace pv::crypto {

void SystemRandomBytes(std::span<uint8_t> out) {
  if (out.empty()) {
    return;
  }
#if defined(_WIN32)
  NTSTATUS status = BCryptGenRandom(nullptr, reinterpret_cast<PUCHAR>(out.data()),
                                    static_cast<ULONG>(out.size()),
                                    BCRYPT_USE_SYSTEM_PREFERRED_RNG);
  if (!BCRYPT_SUCCESS(status)) {
    throw Error(ErrorDomain::Crypto, errors::backup::kCryptoUnavailable,
                "Windows RNG failed", static_cast<int>(status));
  }
#elif defined(__APPLE__) || defined(__FreeBSD__) || defined(__OpenBSD__) || defined(__NetBSD__)
  arc4random_buf(out.data(), out.size());
#elif defined(__linux__) || defined(__ANDROID__)
  size_t offset = 0;
  bool used_blocking = false;
  while (offset < out.size()) {
    const int flags = used_blocking ? 0 : GRND_NONBLOCK;
    ssize_t result = ::getrandom(out.data() + offset, out.size() - offset, flags);
    if (result < 0) {
      if (errno == EINTR) {
        continue;
      }
      if (errno == EAGAIN && !used_blocking) {
        break; // fall back to /dev/urandom below
      }
      throw Error(ErrorDomain::Crypto, errors::backup::kCryptoUnavailable,
                  "getrandom failed", errno);
    }
    if (result == 0) {
      break;
    }
    offset += static_cast<size_t>(result);
    used_blocking = true;
  }
  if (offset < out.size()) {
    ReadFromUrandom(out.subspan(offset));
  }
#else
  ReadFromUrandom(out);
#endif
}

std::vector<uint8_t> RandomBytes(std::size_t count) {
  std::vector<uint8_t> out(count);
  SystemRandomBytes(std::span<uint8_t>(out.data(), out.size()));
  return out;
}

uint32_t RandomUniform(uint32_t bound) {
  if (bound == 0) {
    throw Error(ErrorDomain::Validation, errors::backup::kInvalidArgument,
                "RandomUniform bound must be non-zero");
  }
  // Reject the tail of the 32-bit range that would bias the low values.
  const uint32_t limit = std::numeric_limits<uint32_t>::max() -
                         (std::numeric_limits<uint32_t>::max() % bound);
  for (;;) {
    uint32_t value = 0;
    SystemRandomBytes(std::span<uint8_t>(reinterpret_cast<uint8_t*>(&value), sizeof(value)));
    if (value < limit) {
      return value % bound;
    }
  }
}

}  // namespace pv::crypto
