#pragma once

#include <cstddef>
#include <cstdint>
#include <exception>
#include <new>
#include <optional>
#include <span>
#include <string_view>
#include <utility>
#include <vector>

#include "pv/cancellation.h"
#include "pv/error.h"

namespace pv::crypto {

inline constexpr uint32_t kDefaultKdfRounds = 10'000;
inline constexpr std::size_t kDerivedKeySize = 32;

// Owns derived key material and wipes it on destruction. Move-only.
class Key {
public:
  Key() = default;
  explicit Key(std::vector<uint8_t> bytes) noexcept : bytes_(std::move(bytes)) {}
  ~Key();

  Key(const Key&) = delete;
  Key& operator=(const Key&) = delete;
  Key(Key&& other) noexcept;
  Key& operator=(Key&& other) noexcept;

  [[nodiscard]] std::span<const uint8_t> bytes() const noexcept {
    return {bytes_.data(), bytes_.size()};
  }
  [[nodiscard]] std::size_t size() const noexcept { return bytes_.size(); }
  [[nodiscard]] bool empty() const noexcept { return bytes_.empty(); }

private:
  std::vector<uint8_t> bytes_;
};

// Runs |fn| and reports any failure of a hash primitive, including one thrown
// by an injected provider, as Crypto/kCryptoUnavailable. Framework error
// codes and errors from other domains pass through unchanged.
template <typename Fn>
auto GuardCryptoPrimitive(Fn&& fn) -> decltype(fn());

// PBKDF2-HMAC-SHA256 producing a 32-byte key. Throws Validation/kInvalidArgument
// for rounds == 0 and Crypto/kCryptoUnavailable when the hash primitive fails.
Key DeriveKey(std::string_view password, std::span<const uint8_t> salt,
              uint32_t rounds = kDefaultKdfRounds,
              const CancellationToken* cancel = nullptr);

// Iterated-hash scheme of the 1.2 to 1.4 formats:
//   seed = password || salt
//   repeat rounds: seed = lowercase_hex(SHA-256(seed))
//   key  = hex-decoded seed
// |salt| is the salt text exactly as stored in the backup file.
Key DeriveLegacyKey(std::string_view password, std::string_view salt,
                    uint32_t rounds = kDefaultKdfRounds,
                    const CancellationToken* cancel = nullptr);

namespace detail {
[[noreturn]] void RethrowAsCryptoUnavailable(const char* what,
                                             std::optional<int> native = std::nullopt);
}  // namespace detail

template <typename Fn>
auto GuardCryptoPrimitive(Fn&& fn) -> decltype(fn()) {
  try {
    return fn();
  } catch (const Error& err) {
    if (err.domain != ErrorDomain::Crypto || IsFrameworkErrorCode(err.domain, err.code)) {
      throw;
    }
    detail::RethrowAsCryptoUnavailable(err.what(), err.native_code);
  } catch (const std::bad_alloc&) {
    throw;
  } catch (const std::exception& ex) {
    detail::RethrowAsCryptoUnavailable(ex.what());
  }
}

}  // namespace pv::crypto
