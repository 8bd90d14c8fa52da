#pragma once

#include <array>
#include <cstdint>
#include <memory>
#include <span>

namespace pv::crypto {

// Hash primitives used by key derivation and the backup integrity tag.
// Implementations throw pv::Error (ErrorDomain::Crypto) when the platform
// primitive fails.
class CryptoProvider {
public:
  virtual ~CryptoProvider() = default;

  virtual std::array<uint8_t, 32> HMACSHA256(
      std::span<const uint8_t> key,
      std::span<const uint8_t> message) = 0;

  virtual std::array<uint8_t, 32> SHA256(
      std::span<const uint8_t> data) = 0;
};

class OpenSSLCryptoProvider : public CryptoProvider {
public:
  std::array<uint8_t, 32> HMACSHA256(
      std::span<const uint8_t> key,
      std::span<const uint8_t> message) override;

  std::array<uint8_t, 32> SHA256(
      std::span<const uint8_t> data) override;
};

std::shared_ptr<CryptoProvider> GetCryptoProviderShared();
void SetCryptoProvider(std::shared_ptr<CryptoProvider> provider);
void EnsureCryptoProviderInitialized(); // runs the known-answer tests once
void ResetCryptoProviderForTesting();

}  // namespace pv::crypto
