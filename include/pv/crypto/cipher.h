#pragma once

#include <cstdint>
#include <span>
#include <vector>

namespace pv::crypto {

// Keystream cipher: out[i] = in[i] ^ key[i % key.size()].
// Applying it twice with the same key restores the input. It provides no
// integrity; callers authenticate or validate what they decrypt.
// Throws Crypto/kInvalidKey for an empty key.
std::vector<uint8_t> Encrypt(std::span<const uint8_t> plaintext, std::span<const uint8_t> key);
std::vector<uint8_t> Decrypt(std::span<const uint8_t> ciphertext, std::span<const uint8_t> key);

}  // namespace pv::crypto
