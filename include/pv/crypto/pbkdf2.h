#pragma once

#include <array>
#include <cstdint>
#include <functional>
#include <span>

namespace pv::crypto {

using PBKDF2ProgressCallback = std::function<void(uint32_t current, uint32_t total)>;

// Single-block PBKDF2 (32-byte output). |iterations| below 1 is treated as 1;
// callers validate the configured value before getting here.
std::array<uint8_t, 32> PBKDF2_HMAC_SHA256(std::span<const uint8_t> password,
                                           std::span<const uint8_t> salt,
                                           uint32_t iterations,
                                           PBKDF2ProgressCallback progress = {});

}  // namespace pv::crypto
