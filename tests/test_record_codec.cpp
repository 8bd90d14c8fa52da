#include "pv/core/record_codec.h"

#include <cassert>
#include <cstdint>
#include <iostream>
#include <vector>

#include "pv/error.h"
#include "pv/tlv/parser.h"
#include "pv/tlv/writer.h"
#include "test_support.h"

namespace {

int DecodeCode(const std::vector<uint8_t>& payload) {
  try {
    (void)pv::core::DecodeRecords(payload);
  } catch (const pv::Error& err) {
    return err.code;
  }
  return 0;
}

}  // namespace

int main() {
  using pv::testing::MakeTestRecord;
  const std::vector<pv::model::Record> records{MakeTestRecord("a", "Bank", 1),
                                               MakeTestRecord("b", "Gym locker", 4)};
  const auto payload = pv::core::EncodeRecords(records);
  const auto decoded = pv::core::DecodeRecords(payload);
  assert(decoded.size() == 2);
  assert(pv::model::RecordsEqual(decoded[0], records[0]));
  assert(pv::model::RecordsEqual(decoded[1], records[1]));

  // Empty sets carry only the schema version.
  const auto empty = pv::core::EncodeRecords({});
  assert(empty.size() == pv::tlv::kHeaderBytes + 4);
  assert(pv::core::DecodeRecords(empty).empty());

  // Invalid records never reach the wire.
  auto bad = records;
  bad[1].cells.resize(39);
  bool threw = false;
  try {
    (void)pv::core::EncodeRecords(bad);
  } catch (const pv::Error& err) {
    threw = err.code == pv::errors::backup::kInvalidRecord;
  }
  assert(threw);

  // Structural damage is reported as a corrupt backup.
  assert(DecodeCode({}) == pv::errors::backup::kCorruptBackup);
  auto truncated = payload;
  truncated.resize(payload.size() - 10);
  assert(DecodeCode(truncated) == pv::errors::backup::kCorruptBackup);

  pv::tlv::Writer wrong_schema;
  wrong_schema.AppendU32(pv::core::kTlvSchemaVersion, 4);
  assert(DecodeCode(wrong_schema.bytes()) == pv::errors::backup::kCorruptBackup);

  const auto duplicated = pv::core::EncodeRecords({records[0], records[0]});
  assert(DecodeCode(duplicated) == pv::errors::backup::kCorruptBackup);

  // Flip a color byte in the first cell block to an unknown tag.
  auto bad_color = payload;
  const std::size_t schema_bytes = pv::tlv::kHeaderBytes + 4;
  const std::size_t cells_offset = schema_bytes + pv::tlv::kHeaderBytes +  // record entry
                                   pv::tlv::kHeaderBytes + 1 +             // id "a"
                                   pv::tlv::kHeaderBytes + 4 +             // name "Bank"
                                   2 * (pv::tlv::kHeaderBytes + 24) +      // timestamps
                                   pv::tlv::kHeaderBytes;
  assert(bad_color[cells_offset] == static_cast<uint8_t>(records[0].cells[0].color));
  bad_color[cells_offset] = 7;
  assert(DecodeCode(bad_color) == pv::errors::backup::kCorruptBackup);

  // Digit byte out of range fails record validation.
  auto bad_digit = payload;
  bad_digit[cells_offset + 1] = 12;
  assert(DecodeCode(bad_digit) == pv::errors::backup::kCorruptBackup);

  std::cout << "record codec tests ok\n";
  return 0;
}
