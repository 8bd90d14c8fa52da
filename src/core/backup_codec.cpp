#include "pv/core/backup_codec.h"

#include <array>
#include <string>
#include <utility>

#include "pv/common.h"
#include "pv/core/json_util.h"
#include "pv/core/record_codec.h"
#include "pv/core/version_migrator.h"
#include "pv/crypto/cipher.h"
#include "pv/crypto/ct.h"
#include "pv/crypto/encoding.h"
#include "pv/crypto/hkdf.h"
#include "pv/crypto/hmac_sha256.h"
#include "pv/crypto/key_derivation.h"
#include "pv/crypto/random.h"
#include "pv/error.h"
#include "pv/errors.h"
#include "pv/security/zeroizer.h"

namespace pv::core {
namespace {

constexpr Json::ArrayIndex kLegacyRowWidth = 5;

struct BackupKeys {
  crypto::Key cipher;
  crypto::Key mac;
};

crypto::Key ExpandSubkey(const crypto::Key& master, std::span<const uint8_t> salt,
                         std::string_view label) {
  auto derived = crypto::GuardCryptoPrimitive(
      [&]() { return crypto::HKDF_SHA256(master.bytes(), salt, label); });
  security::Zeroizer::ScopeWiper wipe(std::span<uint8_t>(derived.data(), derived.size()));
  return crypto::Key(std::vector<uint8_t>(derived.begin(), derived.end()));
}

BackupKeys DeriveBackupKeys(std::string_view password, std::span<const uint8_t> salt,
                            uint32_t iterations, const CancellationToken* cancel) {
  auto master = crypto::DeriveKey(password, salt, iterations, cancel);
  return BackupKeys{ExpandSubkey(master, salt, kCipherKeyLabel),
                    ExpandSubkey(master, salt, kIntegrityKeyLabel)};
}

std::array<uint8_t, kIntegrityTagSize> ComputeTag(const crypto::Key& mac_key,
                                                  const BackupEnvelope& envelope) {
  const auto authenticated = AuthenticatedBytes(envelope);
  return crypto::GuardCryptoPrimitive(
      [&]() { return crypto::HMAC_SHA256::Compute(mac_key.bytes(), authenticated); });
}

[[noreturn]] void ThrowWrongPassword(std::string_view detail) {
  throw Error(ErrorDomain::Format, errors::backup::kInvalidBackupOrPassword,
              std::string(errors::msg::kInvalidBackupOrPassword) + ": " + std::string(detail));
}

std::string ResolveTimestamp(std::optional<std::string> timestamp) {
  if (timestamp && !timestamp->empty()) {
    return std::move(*timestamp);
  }
  return model::CurrentIsoTimestamp();
}

Json::Value CellToJson(const model::Cell& cell) {
  Json::Value out(Json::objectValue);
  out["id"] = Json::UInt(cell.index);
  out["value"] = cell.digit ? Json::Value(Json::UInt(*cell.digit)) : Json::Value(Json::nullValue);
  out["color"] = std::string(model::ColorTagToString(cell.color));
  out["isPinDigit"] = cell.is_secret_digit;
  return out;
}

Json::Value RecordToLegacyJson(const model::Record& record, FormatVersion version) {
  Json::Value out(Json::objectValue);
  out["id"] = record.id;
  out["name"] = record.name;
  Json::Value grid(Json::arrayValue);
  if (version == FormatVersion::kV1_2) {
    // Rows of five numbers, "" for an empty slot.
    Json::Value row(Json::arrayValue);
    for (const auto& cell : record.cells) {
      row.append(cell.digit ? Json::Value(Json::UInt(*cell.digit)) : Json::Value(""));
      if (row.size() == kLegacyRowWidth) {
        grid.append(row);
        row = Json::Value(Json::arrayValue);
      }
    }
    out["gridData"] = grid;
    out["dateCreated"] = record.created_at;
  } else {
    for (const auto& cell : record.cells) {
      grid.append(CellToJson(cell));
    }
    out["grid"] = grid;
    out["createdAt"] = record.created_at;
  }
  out["updatedAt"] = record.updated_at;
  return out;
}

Json::Value LegacyPayload(const std::vector<model::Record>& records, FormatVersion version) {
  if (version == FormatVersion::kV1_4) {
    Json::Value out(Json::objectValue);
    for (const auto& record : records) {
      out[record.id] = RecordToLegacyJson(record, version);
    }
    return out;
  }
  Json::Value out(Json::arrayValue);
  for (const auto& record : records) {
    out.append(RecordToLegacyJson(record, version));
  }
  return out;
}

}  // namespace

BackupCodec::BackupCodec(CodecSettings settings) : settings_(settings) {
  if (settings_.kdf_iterations == 0 || settings_.legacy_kdf_iterations == 0) {
    throw Error(ErrorDomain::Validation, errors::backup::kInvalidArgument,
                std::string(errors::msg::kKdfRoundsInvalid));
  }
  if (settings_.kdf_iterations > settings_.max_kdf_iterations ||
      settings_.legacy_kdf_iterations > settings_.max_kdf_iterations) {
    throw Error(ErrorDomain::Validation, errors::backup::kInvalidArgument,
                std::string(errors::msg::kKdfRoundsTooHigh));
  }
  if (settings_.salt_bytes == 0) {
    throw Error(ErrorDomain::Validation, errors::backup::kInvalidArgument,
                "Salt size must be at least one byte");
  }
}

BackupEnvelope BackupCodec::Encode(const std::vector<model::Record>& records,
                                   std::string_view password, const CancellationToken* cancel,
                                   std::optional<std::string> timestamp) const {
  auto payload = EncodeRecords(records);
  security::Zeroizer::ScopeWiper payload_wipe(std::span<uint8_t>(payload.data(), payload.size()));

  BackupEnvelope envelope;
  envelope.format = MakeFormatTag(kCurrentFormat);
  envelope.format_version = std::string(FormatSemanticVersion(kCurrentFormat));
  envelope.salt = crypto::GuardCryptoPrimitive(
      [&]() { return crypto::RandomBytes(settings_.salt_bytes); });
  envelope.timestamp = ResolveTimestamp(std::move(timestamp));
  envelope.record_count = static_cast<uint32_t>(records.size());
  envelope.kdf_iterations = settings_.kdf_iterations;

  const auto keys = DeriveBackupKeys(password, envelope.salt, settings_.kdf_iterations, cancel);
  envelope.ciphertext = crypto::Encrypt(payload, keys.cipher.bytes());

  const auto tag = ComputeTag(keys.mac, envelope);
  envelope.integrity_tag.assign(tag.begin(), tag.end());
  return envelope;
}

DecodedBackup BackupCodec::Decode(const BackupEnvelope& envelope, std::string_view password,
                                  const CancellationToken* cancel) const {
  if (envelope.format.version != FormatVersion::kUnsupported && envelope.kdf_iterations &&
      *envelope.kdf_iterations > settings_.max_kdf_iterations) {
    throw Error(ErrorDomain::Format, errors::backup::kCorruptBackup,
                std::string(errors::msg::kCorruptBackup) + ": " +
                    std::string(errors::msg::kKdfRoundsTooHigh));
  }
  switch (envelope.format.version) {
  case FormatVersion::kV1_5:
    return DecodeCurrent(envelope, password, cancel);
  case FormatVersion::kV1_2:
  case FormatVersion::kV1_3:
  case FormatVersion::kV1_4:
    return DecodeLegacy(envelope, password, cancel);
  case FormatVersion::kUnsupported:
    break;
  }
  throw Error(ErrorDomain::Format, errors::backup::kUnsupportedVersion,
              std::string(errors::msg::kUnsupportedVersion) + ": " + envelope.format.label);
}

DecodedBackup BackupCodec::DecodeCurrent(const BackupEnvelope& envelope,
                                         std::string_view password,
                                         const CancellationToken* cancel) const {
  if (envelope.integrity_tag.size() != kIntegrityTagSize || !envelope.kdf_iterations ||
      !envelope.record_count || envelope.salt.empty()) {
    throw Error(ErrorDomain::Format, errors::backup::kCorruptBackup,
                std::string(errors::msg::kCorruptBackup) + ": " +
                    std::string(errors::msg::kRequiredTlvMissing));
  }

  const auto keys = DeriveBackupKeys(password, envelope.salt, *envelope.kdf_iterations, cancel);
  const auto expected = ComputeTag(keys.mac, envelope);
  if (!crypto::ct::CompareEqual(std::span<const uint8_t>(expected.data(), expected.size()),
                                std::span<const uint8_t>(envelope.integrity_tag))) {
    ThrowWrongPassword(errors::msg::kIntegrityTagMismatch);
  }

  auto payload = crypto::Decrypt(envelope.ciphertext, keys.cipher.bytes());
  security::Zeroizer::ScopeWiper payload_wipe(std::span<uint8_t>(payload.data(), payload.size()));

  DecodedBackup decoded;
  decoded.records = DecodeRecords(payload);
  if (decoded.records.size() != *envelope.record_count) {
    throw Error(ErrorDomain::Format, errors::backup::kCorruptBackup,
                std::string(errors::msg::kRecordCountMismatch));
  }
  decoded.format = envelope.format;
  decoded.format_version = envelope.format_version;
  decoded.timestamp = envelope.timestamp;
  return decoded;
}

DecodedBackup BackupCodec::DecodeLegacy(const BackupEnvelope& envelope,
                                        std::string_view password,
                                        const CancellationToken* cancel) const {
  const uint32_t rounds = envelope.kdf_iterations.value_or(settings_.legacy_kdf_iterations);
  const auto key =
      crypto::DeriveLegacyKey(password, pv::BytesToString(envelope.salt), rounds, cancel);

  auto plaintext = crypto::Decrypt(envelope.ciphertext, key.bytes());
  std::string text = pv::BytesToString(plaintext);
  security::Zeroizer::WipeVector(plaintext);

  DecodedBackup decoded;
  decoded.format = envelope.format;
  decoded.format_version = envelope.format_version;
  decoded.timestamp = envelope.timestamp;

  auto parsed = ParseJson(text);
  security::Zeroizer::WipeString(text);
  if (!parsed) {
    ThrowWrongPassword("payload did not decrypt to JSON");
  }

  Json::Value payload;
  if (envelope.format.version == FormatVersion::kV1_2) {
    // The whole 1.2 document is encrypted; the records sit in |data| as a
    // JSON string.
    const Json::Value& outer = *parsed;
    if (!outer.isObject() || !outer["data"].isString()) {
      ThrowWrongPassword("backup document has no data");
    }
    auto inner = ParseJson(outer["data"].asString());
    if (!inner) {
      ThrowWrongPassword("backup data is not JSON");
    }
    payload = std::move(*inner);
    if (outer["version"].isString()) {
      decoded.format_version = outer["version"].asString();
    }
    if (outer["timestamp"].isString()) {
      decoded.timestamp = outer["timestamp"].asString();
    }
  } else {
    payload = std::move(*parsed);
  }
  if (decoded.format_version.empty()) {
    decoded.format_version = std::string(FormatSemanticVersion(envelope.format.version));
  }

  if (envelope.record_count && CountPayloadEntries(payload) != *envelope.record_count) {
    ThrowWrongPassword(errors::msg::kRecordCountMismatch);
  }

  auto migrated = Migrate(payload, envelope.format.version, decoded.timestamp);
  decoded.records = std::move(migrated.records);
  decoded.warnings = std::move(migrated.warnings);
  return decoded;
}

BackupEnvelope BackupCodec::EncodeLegacy(const std::vector<model::Record>& records,
                                         std::string_view password, FormatVersion version,
                                         std::optional<std::string> timestamp) const {
  if (!IsLegacyFormat(version)) {
    throw Error(ErrorDomain::Format, errors::backup::kUnsupportedVersion,
                std::string(errors::msg::kUnsupportedVersion));
  }
  for (const auto& record : records) {
    model::ValidateRecord(record);
  }

  BackupEnvelope envelope;
  envelope.format = MakeFormatTag(version);
  envelope.format_version = std::string(FormatSemanticVersion(version));
  envelope.timestamp = ResolveTimestamp(std::move(timestamp));

  std::string salt_text;
  if (version == FormatVersion::kV1_2) {
    salt_text = std::string(kLegacyStaticSalt);
  } else {
    salt_text = crypto::Base64Encode(crypto::RandomBytes(settings_.salt_bytes));
    envelope.record_count = static_cast<uint32_t>(records.size());
  }
  if (version == FormatVersion::kV1_4) {
    envelope.kdf_iterations = settings_.legacy_kdf_iterations;
  }
  envelope.salt.assign(salt_text.begin(), salt_text.end());

  std::string plaintext = WriteJson(LegacyPayload(records, version));
  if (version == FormatVersion::kV1_2) {
    Json::Value document(Json::objectValue);
    document["version"] = envelope.format_version;
    document["timestamp"] = envelope.timestamp;
    document["data"] = plaintext;
    document["encryptionType"] = "password-based";
    document["saltInfo"] = "static-cross-device";
    security::Zeroizer::WipeString(plaintext);
    plaintext = WriteJson(document);
  }

  const auto key =
      crypto::DeriveLegacyKey(password, salt_text, settings_.legacy_kdf_iterations);
  envelope.ciphertext = crypto::Encrypt(pv::AsBytes(plaintext), key.bytes());
  security::Zeroizer::WipeString(plaintext);
  return envelope;
}

}  // namespace pv::core
