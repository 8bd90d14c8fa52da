#include "pv/crypto/cipher.h"

#include <string>

#include "pv/error.h"
#include "pv/errors.h"

namespace pv::crypto {

namespace {

std::vector<uint8_t> ApplyKeystream(std::span<const uint8_t> input, std::span<const uint8_t> key) {
  if (key.empty()) {
    throw Error(ErrorDomain::Crypto, errors::backup::kInvalidKey,
                std::string(errors::msg::kInvalidKey));
  }
  std::vector<uint8_t> out(input.size());
  for (std::size_t i = 0; i < input.size(); ++i) {
    out[i] = static_cast<uint8_t>(input[i] ^ key[i % key.size()]);
  }
  return out;
}

}  // namespace

std::vector<uint8_t> Encrypt(std::span<const uint8_t> plaintext, std::span<const uint8_t> key) {
  return ApplyKeystream(plaintext, key);
}

std::vector<uint8_t> Decrypt(std::span<const uint8_t> ciphertext, std::span<const uint8_t> key) {
  return ApplyKeystream(ciphertext, key);
}

}  // namespace pv::crypto
