#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "pv/core/format_version.h"

namespace pv::core {

inline constexpr std::string_view kHeaderPrefix = "PINVAULT_BACKUP_V";
inline constexpr char kHeaderTerminator = ':';

// Static salt text of the 1.2 format.
inline constexpr std::string_view kLegacyStaticSalt = "pinvault-backup-v1.2-cross-device-salt-2025";

// Current-format TLV types.
inline constexpr uint16_t kTlvFormatVersion = 0x0101u;
inline constexpr uint16_t kTlvSalt = 0x0102u;
inline constexpr uint16_t kTlvTimestamp = 0x0103u;
inline constexpr uint16_t kTlvRecordCount = 0x0104u;
inline constexpr uint16_t kTlvKdfIterations = 0x0105u;
inline constexpr uint16_t kTlvCiphertext = 0x01F0u;
inline constexpr uint16_t kTlvIntegrityTag = 0x01FFu;

inline constexpr std::size_t kIntegrityTagSize = 32;

// One backup file. All byte fields are owned copies.
//
// For the legacy formats |salt| holds the salt text exactly as it appears in
// the file (the static salt for 1.2, the base64 string for 1.3 and 1.4), and
// for 1.2 the timestamp and version are only known after decryption.
struct BackupEnvelope {
  FormatTag format{};
  std::string format_version;
  std::vector<uint8_t> salt;
  std::string timestamp;
  std::optional<uint32_t> record_count;
  std::optional<uint32_t> kdf_iterations;
  std::vector<uint8_t> ciphertext;
  std::vector<uint8_t> integrity_tag;
};

// Parses the file text. Throws Format/kCorruptBackup when the header prefix is
// missing or the body of a known format is malformed. An unknown version
// label yields format.version == kUnsupported with only |format| filled in.
BackupEnvelope ParseEnvelope(std::string_view text);

// Inverse of ParseEnvelope for every known format.
std::string SerializeEnvelope(const BackupEnvelope& envelope);

// Bytes covered by the current-format integrity tag: the header prefix
// followed by every TLV except the tag itself.
std::vector<uint8_t> AuthenticatedBytes(const BackupEnvelope& envelope);

std::string HeaderFor(const FormatTag& format);

}  // namespace pv::core
