#include "pv/crypto/key_derivation.h"

#include <array>
#include <cassert>
#include <cstdint>
#include <iostream>
#include <memory>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

#include "pv/cancellation.h"
#include "pv/common.h"
#include "pv/crypto/encoding.h"
#include "pv/crypto/provider.h"
#include "pv/crypto/sha256.h"
#include "pv/error.h"

namespace {

class FailingProvider : public pv::crypto::CryptoProvider {
public:
  std::array<uint8_t, 32> HMACSHA256(std::span<const uint8_t>, std::span<const uint8_t>) override {
    throw std::runtime_error("hmac engine offline");
  }
  std::array<uint8_t, 32> SHA256(std::span<const uint8_t>) override {
    throw pv::Error(pv::ErrorDomain::Crypto, 5, "digest engine offline");
  }
};

template <typename Fn>
int CodeOf(Fn&& fn) {
  try {
    fn();
  } catch (const pv::Error& err) {
    return err.code;
  }
  return 0;
}

void TestDeterministic() {
  const std::vector<uint8_t> salt{1, 2, 3, 4, 5, 6, 7, 8};
  auto a = pv::crypto::DeriveKey("correct horse", salt, 1000);
  auto b = pv::crypto::DeriveKey("correct horse", salt, 1000);
  assert(a.size() == pv::crypto::kDerivedKeySize);
  assert(std::vector<uint8_t>(a.bytes().begin(), a.bytes().end()) ==
         std::vector<uint8_t>(b.bytes().begin(), b.bytes().end()));

  auto other_salt = pv::crypto::DeriveKey("correct horse", std::vector<uint8_t>{9, 9, 9}, 1000);
  auto other_rounds = pv::crypto::DeriveKey("correct horse", salt, 1001);
  auto other_password = pv::crypto::DeriveKey("correct horse!", salt, 1000);
  const std::vector<uint8_t> base(a.bytes().begin(), a.bytes().end());
  assert(base != std::vector<uint8_t>(other_salt.bytes().begin(), other_salt.bytes().end()));
  assert(base != std::vector<uint8_t>(other_rounds.bytes().begin(), other_rounds.bytes().end()));
  assert(base !=
         std::vector<uint8_t>(other_password.bytes().begin(), other_password.bytes().end()));
}

// RFC 6070 style vector recomputed for SHA-256: P="password", S="salt", c=1.
void TestKnownAnswer() {
  const std::string salt = "salt";
  auto key = pv::crypto::DeriveKey("password", pv::AsBytes(salt), 1);
  assert(pv::crypto::HexEncode(key.bytes()) ==
         "120fb6cffcf8b32c43e7225256c4f837a86548c92ccc35480805987cb70be17b");
  auto key2 = pv::crypto::DeriveKey("password", pv::AsBytes(salt), 2);
  assert(pv::crypto::HexEncode(key2.bytes()) ==
         "ae4d0c95af6b46d32d0adff928f06dd02a303f8ef3c251dfd6e2d85a95474c43");
}

void TestRoundsValidation() {
  const std::vector<uint8_t> salt{1};
  assert(CodeOf([&] { (void)pv::crypto::DeriveKey("pw", salt, 0); }) ==
         pv::errors::backup::kInvalidArgument);
  assert(CodeOf([&] { (void)pv::crypto::DeriveLegacyKey("pw", "salt", 0); }) ==
         pv::errors::backup::kInvalidArgument);
}

void TestLegacyScheme() {
  // One round: the key is the SHA-256 digest of password || salt text.
  auto key = pv::crypto::DeriveLegacyKey("pw123", "pinvault-salt", 1);
  const auto digest = pv::crypto::SHA256_Hash(pv::AsBytes(std::string("pw123pinvault-salt")));
  assert(std::vector<uint8_t>(key.bytes().begin(), key.bytes().end()) ==
         std::vector<uint8_t>(digest.begin(), digest.end()));

  // Two rounds hash the lowercase hex text of the first digest.
  auto key2 = pv::crypto::DeriveLegacyKey("pw123", "pinvault-salt", 2);
  const auto hex = pv::crypto::SHA256_HexDigest("pw123pinvault-salt");
  const auto digest2 = pv::crypto::SHA256_Hash(pv::AsBytes(hex));
  assert(std::vector<uint8_t>(key2.bytes().begin(), key2.bytes().end()) ==
         std::vector<uint8_t>(digest2.begin(), digest2.end()));
}

void TestCancellation() {
  pv::CancellationToken token;
  token.Cancel();
  const std::vector<uint8_t> salt{1, 2};
  assert(CodeOf([&] { (void)pv::crypto::DeriveKey("pw", salt, 10, &token); }) ==
         pv::errors::backup::kCancelled);
  assert(CodeOf([&] { (void)pv::crypto::DeriveLegacyKey("pw", "s", 10, &token); }) ==
         pv::errors::backup::kCancelled);
}

void TestProviderFailure() {
  pv::crypto::SetCryptoProvider(std::make_shared<FailingProvider>());
  const std::vector<uint8_t> salt{1, 2, 3};
  bool threw = false;
  try {
    (void)pv::crypto::DeriveKey("pw", salt, 10);
  } catch (const pv::Error& err) {
    threw = true;
    assert(err.domain == pv::ErrorDomain::Crypto);
    assert(err.code == pv::errors::backup::kCryptoUnavailable);
  }
  assert(threw);
  assert(CodeOf([&] { (void)pv::crypto::DeriveLegacyKey("pw", "s", 3); }) ==
         pv::errors::backup::kCryptoUnavailable);
  pv::crypto::ResetCryptoProviderForTesting();

  auto key = pv::crypto::DeriveKey("pw", salt, 10);
  assert(!key.empty());
}

void TestMoveWipesSource() {
  auto key = pv::crypto::DeriveKey("pw", std::vector<uint8_t>{4, 5, 6}, 5);
  pv::crypto::Key moved(std::move(key));
  assert(moved.size() == pv::crypto::kDerivedKeySize);
  assert(key.empty());  // NOLINT(bugprone-use-after-move)
}

}  // namespace

int main() {
  pv::crypto::EnsureCryptoProviderInitialized();
  TestDeterministic();
  TestKnownAnswer();
  TestRoundsValidation();
  TestLegacyScheme();
  TestCancellation();
  TestProviderFailure();
  TestMoveWipesSource();
  std::cout << "key derivation tests ok\n";
  return 0;
}
