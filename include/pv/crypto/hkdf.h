#pragma once

#include <array>
#include <span>
#include <string_view>

#include "pv/common.h"

namespace pv::crypto {

std::array<uint8_t, 32> HKDF_SHA256(std::span<const uint8_t> ikm,
                                    std::span<const uint8_t> salt,
                                    std::span<const uint8_t> info);

inline std::array<uint8_t, 32> HKDF_SHA256(std::span<const uint8_t> ikm,
                                           std::span<const uint8_t> salt,
                                           std::string_view label) {
  return HKDF_SHA256(ikm, salt, pv::AsBytes(label));
}

}  // namespace pv::crypto
