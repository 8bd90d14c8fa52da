#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "pv/cancellation.h"
#include "pv/core/envelope.h"
#include "pv/core/format_version.h"
#include "pv/model/record.h"

namespace pv::core {

inline constexpr std::string_view kCipherKeyLabel = "pinvault.backup.cipher";
inline constexpr std::string_view kIntegrityKeyLabel = "pinvault.backup.integrity";

struct CodecSettings {
  uint32_t kdf_iterations{10'000};
  uint32_t legacy_kdf_iterations{10'000};
  std::size_t salt_bytes{16};
  // Ceiling for rounds read from a file; larger values are treated as corrupt.
  uint32_t max_kdf_iterations{1'000'000};
};

struct DecodedBackup {
  std::vector<model::Record> records;
  std::vector<std::string> warnings;
  FormatTag format;
  std::string format_version;
  std::string timestamp;
};

// Turns record sets into encrypted envelopes and back.
//
// Encode always writes the current format. Decode accepts every known format;
// legacy payloads are upgraded through the version migrator. Both throw
// pv::Error:
//   Format/kUnsupportedVersion      unknown version label, before any key work
//   Format/kInvalidBackupOrPassword integrity tag mismatch, or a legacy payload
//                                   that does not decrypt to the expected JSON
//   Format/kCorruptBackup           current-format payload malformed after a
//                                   good tag, a record count mismatch, or KDF
//                                   rounds above max_kdf_iterations
//   Crypto/kCryptoUnavailable       hash primitive failure
//   State/kCancelled                token cancelled before derivation
class BackupCodec {
public:
  explicit BackupCodec(CodecSettings settings = {});

  BackupEnvelope Encode(const std::vector<model::Record>& records, std::string_view password,
                        const CancellationToken* cancel = nullptr,
                        std::optional<std::string> timestamp = std::nullopt) const;

  DecodedBackup Decode(const BackupEnvelope& envelope, std::string_view password,
                       const CancellationToken* cancel = nullptr) const;

  // Writes one of the 1.2, 1.3 or 1.4 layouts. Compatibility testing only;
  // the service never produces these.
  BackupEnvelope EncodeLegacy(const std::vector<model::Record>& records, std::string_view password,
                              FormatVersion version,
                              std::optional<std::string> timestamp = std::nullopt) const;

  const CodecSettings& settings() const noexcept { return settings_; }

private:
  DecodedBackup DecodeCurrent(const BackupEnvelope& envelope, std::string_view password,
                              const CancellationToken* cancel) const;
  DecodedBackup DecodeLegacy(const BackupEnvelope& envelope, std::string_view password,
                             const CancellationToken* cancel) const;

  CodecSettings settings_;
};

}  // namespace pv::core
