#pragma once

#include <json/json.h>

#include <string>
#include <string_view>
#include <vector>

#include "pv/core/format_version.h"
#include "pv/model/record.h"

namespace pv::core {

struct MigrationResult {
  std::vector<model::Record> records;
  std::vector<std::string> warnings;
};

// Color assigned by position when a legacy cell carries none (or an unknown one).
model::ColorTag CycleColor(std::size_t index) noexcept;

// Number of record entries in a legacy payload (array, {"grids": ...}, or an
// object keyed by id). Throws Format/kInvalidBackupOrPassword for anything else.
std::size_t CountPayloadEntries(const Json::Value& payload);

// Upgrades a decrypted legacy payload to typed records, one schema generation
// at a time (1.2 -> 1.3 -> 1.4 -> records). Malformed records are dropped or
// repaired with a warning; the result holds every record that survived.
//
// Throws Format/kUnsupportedVersion for a source that is not a legacy format,
// Format/kNoRecoverableRecords when a non-empty payload yields nothing, and
// Format/kInvalidBackupOrPassword when the payload is not a record container.
// |backup_timestamp| fills in missing record timestamps.
MigrationResult Migrate(const Json::Value& raw_payload, FormatVersion source,
                        std::string_view backup_timestamp);

// Individual steps, each consuming one generation and producing the next.
// Warnings are appended.
Json::Value MigrateV12ToV13(const Json::Value& payload, std::vector<std::string>& warnings);
Json::Value MigrateV13ToV14(const Json::Value& payload, std::vector<std::string>& warnings);
std::vector<model::Record> MigrateV14ToRecords(const Json::Value& payload,
                                               std::string_view backup_timestamp,
                                               std::vector<std::string>& warnings);

}  // namespace pv::core
