#include "pv/core/record_codec.h"

#include <set>
#include <string>

#include "pv/common.h"
#include "pv/error.h"
#include "pv/errors.h"
#include "pv/tlv/parser.h"
#include "pv/tlv/writer.h"

namespace pv::core {
namespace {

[[noreturn]] void ThrowCorrupt(const std::string& detail) {
  throw Error(ErrorDomain::Format, errors::backup::kCorruptBackup,
              std::string(errors::msg::kCorruptBackup) + ": " + detail);
}

std::vector<uint8_t> EncodeCells(const std::vector<model::Cell>& cells) {
  std::vector<uint8_t> out;
  out.reserve(cells.size() * kCellWireBytes);
  for (const auto& cell : cells) {
    out.push_back(static_cast<uint8_t>(cell.color));
    out.push_back(cell.digit ? *cell.digit : kEmptyDigit);
    out.push_back(cell.is_secret_digit ? 1 : 0);
  }
  return out;
}

std::vector<model::Cell> DecodeCells(std::span<const uint8_t> bytes) {
  if (bytes.size() != model::kCellCount * kCellWireBytes) {
    ThrowCorrupt("cell block has " + std::to_string(bytes.size()) + " bytes");
  }
  std::vector<model::Cell> cells;
  cells.reserve(model::kCellCount);
  for (std::size_t i = 0; i < model::kCellCount; ++i) {
    const uint8_t* raw = bytes.data() + i * kCellWireBytes;
    auto color = model::ColorTagFromWire(raw[0]);
    if (!color) {
      ThrowCorrupt("unknown color tag " + std::to_string(raw[0]));
    }
    if (raw[2] > 1) {
      ThrowCorrupt("secret flag out of range");
    }
    model::Cell cell;
    cell.index = static_cast<uint8_t>(i);
    cell.color = *color;
    if (raw[1] != kEmptyDigit) {
      cell.digit = raw[1];
    }
    cell.is_secret_digit = raw[2] == 1;
    cells.push_back(cell);
  }
  return cells;
}

model::Record DecodeRecord(std::span<const uint8_t> bytes) {
  tlv::Parser parser(bytes, 5);
  if (!parser.valid() || parser.size() != 5) {
    ThrowCorrupt("record entry malformed");
  }
  model::Record record;
  bool seen[5] = {false, false, false, false, false};
  for (const auto& field : parser) {
    std::size_t slot = 0;
    switch (field.type) {
    case kTlvRecordId:
      record.id = pv::BytesToString(field.value);
      slot = 0;
      break;
    case kTlvRecordName:
      record.name = pv::BytesToString(field.value);
      slot = 1;
      break;
    case kTlvRecordCreatedAt:
      record.created_at = pv::BytesToString(field.value);
      slot = 2;
      break;
    case kTlvRecordUpdatedAt:
      record.updated_at = pv::BytesToString(field.value);
      slot = 3;
      break;
    case kTlvRecordCells:
      record.cells = DecodeCells(field.value);
      slot = 4;
      break;
    default:
      ThrowCorrupt("unexpected record field " + std::to_string(field.type));
    }
    if (seen[slot]) {
      ThrowCorrupt("duplicate record field " + std::to_string(field.type));
    }
    seen[slot] = true;
  }
  try {
    model::ValidateRecord(record);
  } catch (const Error& err) {
    ThrowCorrupt(err.what());
  }
  return record;
}

}  // namespace

std::vector<uint8_t> EncodeRecords(const std::vector<model::Record>& records) {
  if (records.size() > kMaxRecordsPerPayload) {
    throw Error(ErrorDomain::Validation, errors::backup::kInvalidArgument,
                "Too many records for one backup");
  }
  tlv::Writer writer;
  writer.AppendU32(kTlvSchemaVersion, kRecordSchemaVersion);
  for (const auto& record : records) {
    model::ValidateRecord(record);
    tlv::Writer entry;
    entry.AppendString(kTlvRecordId, record.id)
        .AppendString(kTlvRecordName, record.name)
        .AppendString(kTlvRecordCreatedAt, record.created_at)
        .AppendString(kTlvRecordUpdatedAt, record.updated_at)
        .Append(kTlvRecordCells, EncodeCells(record.cells));
    writer.Append(kTlvRecord, entry.bytes());
  }
  return writer.Release();
}

std::vector<model::Record> DecodeRecords(std::span<const uint8_t> payload) {
  tlv::Parser parser(payload, kMaxRecordsPerPayload + 1);
  if (!parser.valid() || parser.size() == 0) {
    ThrowCorrupt("record payload malformed");
  }
  auto it = parser.begin();
  uint32_t schema = 0;
  if (it->type != kTlvSchemaVersion || !tlv::ReadU32(*it, schema)) {
    ThrowCorrupt("record payload schema version missing");
  }
  if (schema != kRecordSchemaVersion) {
    ThrowCorrupt("record payload schema version " + std::to_string(schema));
  }
  std::vector<model::Record> records;
  records.reserve(parser.size() - 1);
  std::set<std::string> ids;
  for (++it; it != parser.end(); ++it) {
    if (it->type != kTlvRecord) {
      ThrowCorrupt("unexpected payload field " + std::to_string(it->type));
    }
    auto record = DecodeRecord(it->value);
    if (!ids.insert(record.id).second) {
      ThrowCorrupt("duplicate record id");
    }
    records.push_back(std::move(record));
  }
  return records;
}

}  // namespace pv::core
