#pragma once

#include <cstdint>
#include <span>
#include <vector>

#include "pv/model/record.h"

namespace pv::core {

inline constexpr uint32_t kRecordSchemaVersion = 5;

inline constexpr uint16_t kTlvSchemaVersion = 0x0201u;
inline constexpr uint16_t kTlvRecord = 0x0210u;
inline constexpr uint16_t kTlvRecordId = 0x0211u;
inline constexpr uint16_t kTlvRecordName = 0x0212u;
inline constexpr uint16_t kTlvRecordCreatedAt = 0x0213u;
inline constexpr uint16_t kTlvRecordUpdatedAt = 0x0214u;
inline constexpr uint16_t kTlvRecordCells = 0x0215u;

inline constexpr std::size_t kCellWireBytes = 3;
inline constexpr uint8_t kEmptyDigit = 0xFF;
inline constexpr std::size_t kMaxRecordsPerPayload = 65'535;

// Canonical binary form of a record set. Records are validated on the way in
// and on the way out; output order equals input order.
std::vector<uint8_t> EncodeRecords(const std::vector<model::Record>& records);

// Throws Format/kCorruptBackup on any structural or validation failure.
std::vector<model::Record> DecodeRecords(std::span<const uint8_t> payload);

}  // namespace pv::core
