#include "pv/core/envelope.h"

#include <cassert>
#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

#include "pv/common.h"
#include "pv/core/json_util.h"
#include "pv/crypto/encoding.h"
#include "pv/error.h"
#include "pv/tlv/writer.h"

namespace {

using pv::core::BackupEnvelope;
using pv::core::FormatVersion;

int ParseCode(const std::string& text) {
  try {
    (void)pv::core::ParseEnvelope(text);
  } catch (const pv::Error& err) {
    return err.code;
  }
  return 0;
}

BackupEnvelope SampleCurrent() {
  BackupEnvelope envelope;
  envelope.format = pv::core::MakeFormatTag(FormatVersion::kV1_5);
  envelope.format_version = "1.5.0";
  envelope.salt = {1, 2, 3, 4, 5, 6, 7, 8, 9, 10, 11, 12, 13, 14, 15, 16};
  envelope.timestamp = "2025-03-01T12:00:00.000Z";
  envelope.record_count = 2;
  envelope.kdf_iterations = 10000;
  envelope.ciphertext = {0xAA, 0xBB, 0xCC};
  envelope.integrity_tag.assign(pv::core::kIntegrityTagSize, 0x5A);
  return envelope;
}

std::string CurrentText(const pv::tlv::Writer& writer) {
  return std::string(pv::core::kHeaderPrefix) + "1.5:" + pv::crypto::Base64Encode(writer.bytes());
}

void TestCurrentFormat() {
  const auto original = SampleCurrent();
  const auto text = pv::core::SerializeEnvelope(original);
  assert(text.rfind("PINVAULT_BACKUP_V1.5:", 0) == 0);

  const auto parsed = pv::core::ParseEnvelope("  " + text + "\n");
  assert(parsed.format.version == FormatVersion::kV1_5);
  assert(parsed.format.label == "1.5");
  assert(parsed.format_version == "1.5.0");
  assert(parsed.salt == original.salt);
  assert(parsed.timestamp == original.timestamp);
  assert(parsed.record_count == 2u);
  assert(parsed.kdf_iterations == 10000u);
  assert(parsed.ciphertext == original.ciphertext);
  assert(parsed.integrity_tag == original.integrity_tag);

  // The tag covers the header and all other fields.
  const auto covered = pv::core::AuthenticatedBytes(parsed);
  const std::string header = pv::core::HeaderFor(parsed.format);
  assert(std::string(covered.begin(), covered.begin() + header.size()) == header);
  auto changed = parsed;
  changed.record_count = 3;
  assert(pv::core::AuthenticatedBytes(changed) != covered);
}

void TestCurrentFormatRejects() {
  const auto sample = SampleCurrent();
  auto write_fields = [&](bool with_tag) {
    pv::tlv::Writer writer;
    writer.AppendString(pv::core::kTlvFormatVersion, "1.5.0")
        .Append(pv::core::kTlvSalt, sample.salt)
        .AppendString(pv::core::kTlvTimestamp, sample.timestamp)
        .AppendU32(pv::core::kTlvRecordCount, 2)
        .AppendU32(pv::core::kTlvKdfIterations, 10000)
        .Append(pv::core::kTlvCiphertext, sample.ciphertext);
    if (with_tag) {
      writer.Append(pv::core::kTlvIntegrityTag, sample.integrity_tag);
    }
    return writer;
  };

  assert(ParseCode(CurrentText(write_fields(true))) == 0);
  assert(ParseCode(CurrentText(write_fields(false))) == pv::errors::backup::kCorruptBackup);

  auto unknown = write_fields(true);
  unknown.AppendString(0x0999, "extra");
  assert(ParseCode(CurrentText(unknown)) == pv::errors::backup::kCorruptBackup);

  pv::tlv::Writer reordered;
  reordered.Append(pv::core::kTlvSalt, sample.salt)
      .AppendString(pv::core::kTlvFormatVersion, "1.5.0")
      .AppendString(pv::core::kTlvTimestamp, sample.timestamp)
      .AppendU32(pv::core::kTlvRecordCount, 2)
      .AppendU32(pv::core::kTlvKdfIterations, 10000)
      .Append(pv::core::kTlvCiphertext, sample.ciphertext)
      .Append(pv::core::kTlvIntegrityTag, sample.integrity_tag);
  assert(ParseCode(CurrentText(reordered)) == pv::errors::backup::kCorruptBackup);

  auto bytes = write_fields(true).Release();
  bytes.pop_back();
  assert(ParseCode(std::string(pv::core::kHeaderPrefix) + "1.5:" +
                   pv::crypto::Base64Encode(bytes)) == pv::errors::backup::kCorruptBackup);
}

void TestPrefixHandling() {
  assert(ParseCode("") == pv::errors::backup::kCorruptBackup);
  assert(ParseCode("hello world") == pv::errors::backup::kCorruptBackup);
  assert(ParseCode("PINVAULT_BACKUP_V1.5") == pv::errors::backup::kCorruptBackup);
  assert(ParseCode("PINVAULT_BACKUP_V1.5:not base64!") == pv::errors::backup::kCorruptBackup);
  assert(ParseCode("PINVAULT_BACKUP_V1.5:") == pv::errors::backup::kCorruptBackup);

  for (const char* label : {"2.0", "1.6", "1.1", "banana"}) {
    const auto envelope =
        pv::core::ParseEnvelope(std::string("PINVAULT_BACKUP_V") + label + ":AAAA");
    assert(envelope.format.version == FormatVersion::kUnsupported);
    assert(envelope.format.label == label);
  }

  bool threw = false;
  try {
    BackupEnvelope future;
    future.format = pv::core::ParseFormatLabel("9.0");
    (void)pv::core::SerializeEnvelope(future);
  } catch (const pv::Error& err) {
    threw = err.code == pv::errors::backup::kUnsupportedVersion;
  }
  assert(threw);
}

void TestLegacyFormats() {
  BackupEnvelope v12;
  v12.format = pv::core::MakeFormatTag(FormatVersion::kV1_2);
  v12.ciphertext = {0x10, 0x20, 0x30, 0x40};
  const auto v12_text = pv::core::SerializeEnvelope(v12);
  assert(v12_text == "PINVAULT_BACKUP_V1.2:" + pv::crypto::Base64Encode(v12.ciphertext));
  const auto v12_parsed = pv::core::ParseEnvelope(v12_text);
  assert(v12_parsed.format.version == FormatVersion::kV1_2);
  assert(v12_parsed.ciphertext == v12.ciphertext);
  assert(pv::BytesToString(v12_parsed.salt) == pv::core::kLegacyStaticSalt);

  BackupEnvelope v14;
  v14.format = pv::core::MakeFormatTag(FormatVersion::kV1_4);
  v14.format_version = "1.4.0";
  const std::string salt_text = "c2FsdHNhbHRzYWx0c2FsdA==";
  v14.salt.assign(salt_text.begin(), salt_text.end());
  v14.timestamp = "2024-11-05T09:00:00.000Z";
  v14.record_count = 3;
  v14.kdf_iterations = 5000;
  v14.ciphertext = {1, 2, 3, 4, 5};
  const auto v14_parsed = pv::core::ParseEnvelope(pv::core::SerializeEnvelope(v14));
  assert(v14_parsed.format.version == FormatVersion::kV1_4);
  assert(pv::BytesToString(v14_parsed.salt) == salt_text);
  assert(v14_parsed.timestamp == v14.timestamp);
  assert(v14_parsed.record_count == 3u);
  assert(v14_parsed.kdf_iterations == 5000u);
  assert(v14_parsed.ciphertext == v14.ciphertext);

  // 1.3 containers carry no iteration count.
  Json::Value container(Json::objectValue);
  container["version"] = "1.3.0";
  container["salt"] = salt_text;
  container["timestamp"] = "2024-06-01T00:00:00.000Z";
  container["gridCount"] = 1;
  container["encryptedData"] = pv::crypto::Base64Encode(std::vector<uint8_t>{9, 8, 7});
  const auto v13_parsed = pv::core::ParseEnvelope(
      "PINVAULT_BACKUP_V1.3:" + pv::crypto::Base64Encode(pv::AsBytes(pv::core::WriteJson(container))));
  assert(v13_parsed.format.version == FormatVersion::kV1_3);
  assert(v13_parsed.record_count == 1u);
  assert(!v13_parsed.kdf_iterations);
  assert(v13_parsed.ciphertext == (std::vector<uint8_t>{9, 8, 7}));

  container.removeMember("salt");
  assert(ParseCode("PINVAULT_BACKUP_V1.3:" +
                   pv::crypto::Base64Encode(pv::AsBytes(pv::core::WriteJson(container)))) ==
         pv::errors::backup::kCorruptBackup);
  assert(ParseCode("PINVAULT_BACKUP_V1.4:" +
                   pv::crypto::Base64Encode(pv::AsBytes(std::string("[1,2,3]")))) ==
         pv::errors::backup::kCorruptBackup);

  // Nesting past the JSON reader's stack limit is a corrupt body, not a crash.
  const std::string deep(5000, '[');
  assert(!pv::core::ParseJson(deep));
  assert(ParseCode("PINVAULT_BACKUP_V1.3:" + pv::crypto::Base64Encode(pv::AsBytes(deep))) ==
         pv::errors::backup::kCorruptBackup);
}

}  // namespace

int main() {
  TestCurrentFormat();
  TestCurrentFormatRejects();
  TestPrefixHandling();
  TestLegacyFormats();
  std::cout << "envelope tests ok\n";
  return 0;
}
