#include "pv/crypto/cipher.h"

#include <cassert>
#include <cstdint>
#include <iostream>
#include <vector>

#include "pv/crypto/random.h"
#include "pv/error.h"

int main() {
  const std::vector<uint8_t> key{0x10, 0x20, 0x30};
  const std::vector<uint8_t> plaintext{0x00, 0x01, 0x02, 0x03, 0x04, 0x05, 0x06};

  auto ciphertext = pv::crypto::Encrypt(plaintext, key);
  assert(ciphertext.size() == plaintext.size());
  // Key bytes cycle: position 3 reuses key[0].
  assert(ciphertext[0] == (0x00 ^ 0x10));
  assert(ciphertext[3] == (0x03 ^ 0x10));
  assert(ciphertext[5] == (0x05 ^ 0x30));
  assert(pv::crypto::Decrypt(ciphertext, key) == plaintext);

  for (std::size_t length : {1u, 31u, 32u, 33u, 1000u}) {
    auto data = pv::crypto::RandomBytes(length);
    auto random_key = pv::crypto::RandomBytes(1 + length % 40);
    assert(pv::crypto::Decrypt(pv::crypto::Encrypt(data, random_key), random_key) == data);
  }

  assert(pv::crypto::Encrypt(std::vector<uint8_t>{}, key).empty());
  assert(pv::crypto::Decrypt(std::vector<uint8_t>{}, key).empty());

  bool threw = false;
  try {
    (void)pv::crypto::Encrypt(plaintext, std::vector<uint8_t>{});
  } catch (const pv::Error& err) {
    threw = err.code == pv::errors::backup::kInvalidKey;
  }
  assert(threw && "empty key must be rejected");

  threw = false;
  try {
    (void)pv::crypto::Decrypt(plaintext, std::vector<uint8_t>{});
  } catch (const pv::Error& err) {
    threw = err.code == pv::errors::backup::kInvalidKey;
  }
  assert(threw);

  // A different key does not give the plaintext back.
  const std::vector<uint8_t> wrong{0x11, 0x20, 0x30};
  assert(pv::crypto::Decrypt(ciphertext, wrong) != plaintext);

  std::cout << "cipher tests ok\n";
  return 0;
}
