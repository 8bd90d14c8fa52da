#pragma once

#include <cstdint>
#include <span>
#include <vector>

#include "pv/common.h"

namespace pv::crypto {

void SystemRandomBytes(std::span<uint8_t> out);

std::vector<uint8_t> RandomBytes(std::size_t count);

// Uniform value in [0, bound) without modulo bias. |bound| must be non-zero.
uint32_t RandomUniform(uint32_t bound);

}  // namespace pv::crypto
