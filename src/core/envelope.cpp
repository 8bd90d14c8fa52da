#include "pv/core/envelope.h"

#include <array>
#include <string>

#include "pv/common.h"
#include "pv/core/json_util.h"
#include "pv/crypto/encoding.h"
#include "pv/error.h"
#include "pv/errors.h"
#include "pv/tlv/parser.h"
#include "pv/tlv/writer.h"

namespace pv::core {
namespace {

constexpr std::array<uint16_t, 7> kCurrentTlvOrder = {
    kTlvFormatVersion, kTlvSalt,       kTlvTimestamp,   kTlvRecordCount,
    kTlvKdfIterations, kTlvCiphertext, kTlvIntegrityTag};

[[noreturn]] void ThrowCorrupt(std::string_view detail) {
  throw Error(ErrorDomain::Format, errors::backup::kCorruptBackup,
              std::string(errors::msg::kCorruptBackup) + ": " + std::string(detail));
}

std::string_view TrimAscii(std::string_view text) {
  auto is_space = [](char c) { return c == ' ' || c == '\t' || c == '\r' || c == '\n'; };
  while (!text.empty() && is_space(text.front())) {
    text.remove_prefix(1);
  }
  while (!text.empty() && is_space(text.back())) {
    text.remove_suffix(1);
  }
  return text;
}

bool IsKnownCurrentType(uint16_t type) {
  for (uint16_t known : kCurrentTlvOrder) {
    if (known == type) {
      return true;
    }
  }
  return false;
}

tlv::Writer WriteCurrentMetadata(const BackupEnvelope& envelope) {
  if (!envelope.record_count || !envelope.kdf_iterations) {
    throw Error(ErrorDomain::Validation, errors::backup::kInvalidArgument,
                "Current-format envelope requires record count and KDF iterations");
  }
  tlv::Writer writer;
  writer.AppendString(kTlvFormatVersion, envelope.format_version)
      .Append(kTlvSalt, envelope.salt)
      .AppendString(kTlvTimestamp, envelope.timestamp)
      .AppendU32(kTlvRecordCount, *envelope.record_count)
      .AppendU32(kTlvKdfIterations, *envelope.kdf_iterations)
      .Append(kTlvCiphertext, envelope.ciphertext);
  return writer;
}

// Fields must appear exactly once, in canonical order, so the authenticated
// bytes can be rebuilt from the parsed fields.
void ParseCurrentBody(std::span<const uint8_t> body, BackupEnvelope& envelope) {
  tlv::Parser parser(body, kCurrentTlvOrder.size() + 1);
  if (!parser.valid()) {
    ThrowCorrupt(errors::msg::kEnvelopeTruncated);
  }
  std::size_t position = 0;
  for (const auto& record : parser) {
    if (!IsKnownCurrentType(record.type)) {
      ThrowCorrupt(errors::msg::kUnexpectedTlv);
    }
    if (position >= kCurrentTlvOrder.size() || record.type != kCurrentTlvOrder[position]) {
      ThrowCorrupt(errors::msg::kUnexpectedTlv);
    }
    switch (record.type) {
    case kTlvFormatVersion:
      envelope.format_version = pv::BytesToString(record.value);
      break;
    case kTlvSalt:
      envelope.salt.assign(record.value.begin(), record.value.end());
      break;
    case kTlvTimestamp:
      envelope.timestamp = pv::BytesToString(record.value);
      break;
    case kTlvRecordCount: {
      uint32_t count = 0;
      if (!tlv::ReadU32(record, count)) {
        ThrowCorrupt("record count field malformed");
      }
      envelope.record_count = count;
      break;
    }
    case kTlvKdfIterations: {
      uint32_t iterations = 0;
      if (!tlv::ReadU32(record, iterations) || iterations == 0) {
        ThrowCorrupt("KDF iteration field malformed");
      }
      envelope.kdf_iterations = iterations;
      break;
    }
    case kTlvCiphertext:
      envelope.ciphertext.assign(record.value.begin(), record.value.end());
      break;
    case kTlvIntegrityTag:
      if (record.value.size() != kIntegrityTagSize) {
        ThrowCorrupt("integrity tag has the wrong size");
      }
      envelope.integrity_tag.assign(record.value.begin(), record.value.end());
      break;
    default:
      ThrowCorrupt(errors::msg::kUnexpectedTlv);
    }
    ++position;
  }
  if (position != kCurrentTlvOrder.size()) {
    ThrowCorrupt(errors::msg::kRequiredTlvMissing);
  }
  const std::string_view expected_major_minor = "1.5";
  if (envelope.format_version.compare(0, expected_major_minor.size(), expected_major_minor) != 0 ||
      (envelope.format_version.size() > expected_major_minor.size() &&
       envelope.format_version[expected_major_minor.size()] != '.')) {
    ThrowCorrupt("format version field does not match the header");
  }
  if (envelope.salt.empty()) {
    ThrowCorrupt("salt is empty");
  }
}

std::optional<uint32_t> ReadOptionalCount(const Json::Value& root, const char* key) {
  if (!root.isMember(key) || root[key].isNull()) {
    return std::nullopt;
  }
  const Json::Value& value = root[key];
  if (!value.isUInt()) {
    ThrowCorrupt(std::string(key) + " is not a non-negative integer");
  }
  return value.asUInt();
}

void ParseLegacyContainer(std::span<const uint8_t> body, BackupEnvelope& envelope) {
  auto root = ParseJson(pv::BytesToString(body));
  if (!root || !root->isObject()) {
    ThrowCorrupt("legacy container is not a JSON object");
  }
  const Json::Value& salt = (*root)["salt"];
  const Json::Value& data = (*root)["encryptedData"];
  if (!salt.isString() || salt.asString().empty() || !data.isString()) {
    ThrowCorrupt(errors::msg::kRequiredTlvMissing);
  }
  const std::string salt_text = salt.asString();
  envelope.salt.assign(salt_text.begin(), salt_text.end());

  auto ciphertext = crypto::Base64Decode(data.asString());
  if (!ciphertext) {
    ThrowCorrupt(errors::msg::kInvalidBase64);
  }
  envelope.ciphertext = std::move(*ciphertext);

  if ((*root)["version"].isString()) {
    envelope.format_version = (*root)["version"].asString();
  } else {
    envelope.format_version = std::string(FormatSemanticVersion(envelope.format.version));
  }
  if ((*root)["timestamp"].isString()) {
    envelope.timestamp = (*root)["timestamp"].asString();
  }
  envelope.record_count = ReadOptionalCount(*root, "gridCount");
  envelope.kdf_iterations = ReadOptionalCount(*root, "iterations");
  if (envelope.kdf_iterations && *envelope.kdf_iterations == 0) {
    ThrowCorrupt(errors::msg::kKdfRoundsInvalid);
  }
}

std::string SerializeLegacyContainer(const BackupEnvelope& envelope) {
  Json::Value root(Json::objectValue);
  root["version"] = envelope.format_version.empty()
                        ? std::string(FormatSemanticVersion(envelope.format.version))
                        : envelope.format_version;
  root["salt"] = pv::BytesToString(envelope.salt);
  root["timestamp"] = envelope.timestamp;
  if (envelope.record_count) {
    root["gridCount"] = Json::UInt(*envelope.record_count);
  }
  if (envelope.kdf_iterations) {
    root["iterations"] = Json::UInt(*envelope.kdf_iterations);
  }
  root["encryptedData"] = crypto::Base64Encode(envelope.ciphertext);
  return WriteJson(root);
}

}  // namespace

std::string HeaderFor(const FormatTag& format) {
  std::string header(kHeaderPrefix);
  header.append(format.label);
  header.push_back(kHeaderTerminator);
  return header;
}

BackupEnvelope ParseEnvelope(std::string_view text) {
  text = TrimAscii(text);
  if (text.substr(0, kHeaderPrefix.size()) != kHeaderPrefix) {
    ThrowCorrupt(errors::msg::kMissingHeader);
  }
  const auto terminator = text.find(kHeaderTerminator, kHeaderPrefix.size());
  if (terminator == std::string_view::npos) {
    ThrowCorrupt(errors::msg::kMissingHeader);
  }

  BackupEnvelope envelope;
  envelope.format =
      ParseFormatLabel(text.substr(kHeaderPrefix.size(), terminator - kHeaderPrefix.size()));
  if (envelope.format.version == FormatVersion::kUnsupported) {
    return envelope;
  }

  auto body = crypto::Base64Decode(text.substr(terminator + 1));
  if (!body) {
    ThrowCorrupt(errors::msg::kInvalidBase64);
  }
  if (body->empty()) {
    ThrowCorrupt(errors::msg::kEnvelopeTruncated);
  }

  switch (envelope.format.version) {
  case FormatVersion::kV1_5:
    ParseCurrentBody(*body, envelope);
    break;
  case FormatVersion::kV1_2:
    envelope.salt.assign(kLegacyStaticSalt.begin(), kLegacyStaticSalt.end());
    envelope.ciphertext = std::move(*body);
    break;
  case FormatVersion::kV1_3:
  case FormatVersion::kV1_4:
    ParseLegacyContainer(*body, envelope);
    break;
  case FormatVersion::kUnsupported:
    break;
  }
  return envelope;
}

std::vector<uint8_t> AuthenticatedBytes(const BackupEnvelope& envelope) {
  const std::string header = HeaderFor(envelope.format);
  std::vector<uint8_t> out(header.begin(), header.end());
  const auto metadata = WriteCurrentMetadata(envelope);
  out.insert(out.end(), metadata.bytes().begin(), metadata.bytes().end());
  return out;
}

std::string SerializeEnvelope(const BackupEnvelope& envelope) {
  std::string text = HeaderFor(envelope.format);
  switch (envelope.format.version) {
  case FormatVersion::kV1_5: {
    if (envelope.integrity_tag.size() != kIntegrityTagSize) {
      throw Error(ErrorDomain::Validation, errors::backup::kInvalidArgument,
                  "Current-format envelope requires a 32-byte integrity tag");
    }
    auto writer = WriteCurrentMetadata(envelope);
    writer.Append(kTlvIntegrityTag, envelope.integrity_tag);
    text.append(crypto::Base64Encode(writer.bytes()));
    break;
  }
  case FormatVersion::kV1_2:
    text.append(crypto::Base64Encode(envelope.ciphertext));
    break;
  case FormatVersion::kV1_3:
  case FormatVersion::kV1_4:
    text.append(crypto::Base64Encode(pv::AsBytes(SerializeLegacyContainer(envelope))));
    break;
  case FormatVersion::kUnsupported:
    throw Error(ErrorDomain::Format, errors::backup::kUnsupportedVersion,
                std::string(errors::msg::kUnsupportedVersion) + ": " + envelope.format.label);
  }
  return text;
}

}  // namespace pv::core
