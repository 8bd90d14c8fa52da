#include "pv/crypto/sha256.h"

#include "pv/common.h"
#include "pv/crypto/encoding.h"
#include "pv/crypto/provider.h"

namespace pv::crypto {

std::array<uint8_t, 32> SHA256_Hash(std::span<const uint8_t> data) {
  auto provider = GetCryptoProviderShared();
  return provider->SHA256(data);
}

std::array<uint8_t, 32> SHA256_Hash(const std::vector<uint8_t>& data) {
  return SHA256_Hash(std::span<const uint8_t>(data.data(), data.size()));
}

std::string SHA256_HexDigest(std::string_view text) {
  const auto digest = SHA256_Hash(pv::AsBytes(text));
  return HexEncode(std::span<const uint8_t>(digest.data(), digest.size()));
}

}  // namespace pv::crypto
