#include "pv/crypto/key_derivation.h"

#include <string>
#include <utility>

#include "pv/common.h"
#include "pv/crypto/encoding.h"
#include "pv/crypto/pbkdf2.h"
#include "pv/crypto/sha256.h"
#include "pv/error.h"
#include "pv/errors.h"
#include "pv/security/zeroizer.h"

namespace pv::crypto {

namespace {

void RequireRounds(uint32_t rounds) {
  if (rounds == 0) {
    throw Error(ErrorDomain::Validation, errors::backup::kInvalidArgument,
                std::string(errors::msg::kKdfRoundsInvalid));
  }
}

}  // namespace

namespace detail {

void RethrowAsCryptoUnavailable(const char* what, std::optional<int> native) {
  throw Error(ErrorDomain::Crypto, errors::backup::kCryptoUnavailable,
              std::string(errors::msg::kCryptoUnavailable) + ": " + what, native);
}

}  // namespace detail

Key::~Key() {
  security::Zeroizer::WipeVector(bytes_);
}

Key::Key(Key&& other) noexcept : bytes_(std::move(other.bytes_)) {
  other.bytes_.clear();
}

Key& Key::operator=(Key&& other) noexcept {
  if (this != &other) {
    security::Zeroizer::WipeVector(bytes_);
    bytes_ = std::move(other.bytes_);
    other.bytes_.clear();
  }
  return *this;
}

Key DeriveKey(std::string_view password, std::span<const uint8_t> salt, uint32_t rounds,
              const CancellationToken* cancel) {
  RequireRounds(rounds);
  if (cancel) {
    cancel->ThrowIfCancelled();
  }
  auto derived = GuardCryptoPrimitive([&]() {
    return PBKDF2_HMAC_SHA256(pv::AsBytes(password), salt, rounds);
  });
  security::Zeroizer::ScopeWiper wipe(std::span<uint8_t>(derived.data(), derived.size()));
  return Key(std::vector<uint8_t>(derived.begin(), derived.end()));
}

Key DeriveLegacyKey(std::string_view password, std::string_view salt, uint32_t rounds,
                    const CancellationToken* cancel) {
  RequireRounds(rounds);
  if (cancel) {
    cancel->ThrowIfCancelled();
  }
  std::string seed;
  seed.reserve(password.size() + salt.size());
  seed.append(password);
  seed.append(salt);

  GuardCryptoPrimitive([&]() {
    for (uint32_t i = 0; i < rounds; ++i) {
      std::string next = SHA256_HexDigest(seed);
      security::Zeroizer::WipeString(seed);
      seed = std::move(next);
    }
    return 0;
  });

  auto decoded = HexDecode(seed);
  security::Zeroizer::WipeString(seed);
  if (!decoded || decoded->size() != kDerivedKeySize) {
    throw Error(ErrorDomain::Crypto, errors::backup::kCryptoUnavailable,
                "Legacy key derivation produced an unexpected digest");
  }
  return Key(std::move(*decoded));
}

}  // namespace pv::crypto
