#include "pv/crypto/pbkdf2.h"

#include <algorithm>
#include <vector>

#include "pv/crypto/hmac_sha256.h"
#include "pv/security/zeroizer.h"

namespace pv::crypto {

std::array<uint8_t, 32> PBKDF2_HMAC_SHA256(std::span<const uint8_t> password,
                                           std::span<const uint8_t> salt,
                                           uint32_t iterations,
                                           PBKDF2ProgressCallback progress) {
  iterations = std::max<uint32_t>(iterations, 1u);

  std::array<uint8_t, 32> output{};
  security::Zeroizer::ScopeWiper output_guard(std::span<uint8_t>(output.data(), output.size()));

  // INT_32_BE(1) appended to the salt for the first and only block.
  std::vector<uint8_t> block(salt.begin(), salt.end());
  block.insert(block.end(), {0x00, 0x00, 0x00, 0x01});
  security::Zeroizer::ScopeWiper block_guard(std::span<uint8_t>(block.data(), block.size()));

  auto iter = HMAC_SHA256::Compute(password, std::span<const uint8_t>(block.data(), block.size()));
  security::Zeroizer::ScopeWiper iter_guard(std::span<uint8_t>(iter.data(), iter.size()));
  output = iter;

  if (progress) {
    progress(1, iterations);
  }

  for (uint32_t i = 1; i < iterations; ++i) {
    iter = HMAC_SHA256::Compute(password, std::span<const uint8_t>(iter.data(), iter.size()));
    for (size_t j = 0; j < output.size(); ++j) {
      output[j] ^= iter[j];
    }

    if (progress && ((i + 1) % 10'000 == 0)) {
      progress(i + 1, iterations);
    }
  }

  if (progress && (iterations % 10'000 != 0)) {
    progress(iterations, iterations);
  }

  output_guard.Release();
  return output;
}

}  // namespace pv::crypto
