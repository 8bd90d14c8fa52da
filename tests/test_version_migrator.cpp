#include "pv/core/version_migrator.h"

#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include "pv/error.h"
#include "pv/model/record.h"

namespace {

using pv::core::FormatVersion;
using pv::model::ColorTag;

constexpr const char* kBackupTime = "2024-05-05T05:05:05.000Z";

Json::Value CellObject(Json::UInt index, Json::Value value, const char* color, bool pin) {
  Json::Value cell(Json::objectValue);
  cell["id"] = index;
  cell["value"] = value;
  cell["color"] = color;
  cell["isPinDigit"] = pin;
  return cell;
}

Json::Value V14Record(const std::string& id, const std::string& name) {
  Json::Value record(Json::objectValue);
  record["id"] = id;
  record["name"] = name;
  Json::Value grid(Json::arrayValue);
  for (Json::UInt i = 0; i < 40; ++i) {
    grid.append(CellObject(i, Json::Value(i % 10), "green", i == 0));
  }
  record["grid"] = grid;
  record["createdAt"] = "2024-01-01T00:00:00.000Z";
  record["updatedAt"] = "2024-02-01T00:00:00.000Z";
  return record;
}

int MigrateCode(const Json::Value& payload, FormatVersion source) {
  try {
    (void)pv::core::Migrate(payload, source, kBackupTime);
  } catch (const pv::Error& err) {
    return err.code;
  }
  return 0;
}

void TestCycleColors() {
  assert(pv::core::CycleColor(0) == ColorTag::kBlue);
  assert(pv::core::CycleColor(1) == ColorTag::kRed);
  assert(pv::core::CycleColor(2) == ColorTag::kGreen);
  assert(pv::core::CycleColor(3) == ColorTag::kYellow);
  assert(pv::core::CycleColor(4) == ColorTag::kBlue);
}

void TestWellFormedV14() {
  Json::Value payload(Json::objectValue);
  payload["g1"] = V14Record("g1", "Bank");
  auto result = pv::core::Migrate(payload, FormatVersion::kV1_4, kBackupTime);
  assert(result.warnings.empty());
  assert(result.records.size() == 1);
  const auto& record = result.records[0];
  assert(record.id == "g1" && record.name == "Bank");
  assert(record.cells.size() == 40);
  assert(record.cells[0].digit == 0 && record.cells[0].is_secret_digit);
  assert(record.cells[13].digit == 3 && !record.cells[13].is_secret_digit);
  assert(record.cells[13].color == ColorTag::kGreen);
  assert(record.created_at == "2024-01-01T00:00:00.000Z");
  assert(record.updated_at == "2024-02-01T00:00:00.000Z");
}

// One good and one malformed record: one survivor, one warning.
void TestPartialTolerance() {
  Json::Value payload(Json::arrayValue);
  payload.append(V14Record("keep", "Keep me"));
  Json::Value broken = V14Record("", "No id");
  broken.removeMember("id");
  payload.append(broken);

  auto result = pv::core::Migrate(payload, FormatVersion::kV1_3, kBackupTime);
  assert(result.records.size() == 1);
  assert(result.records[0].id == "keep");
  assert(result.warnings.size() == 1);
}

void TestRepairs() {
  Json::Value record(Json::objectValue);
  record["id"] = 42;
  record["name"] = std::string(60, 'x');
  Json::Value grid(Json::arrayValue);
  for (Json::UInt i = 0; i < 38; ++i) {
    grid.append(CellObject(i, Json::Value(i == 5 ? 12 : 1), i == 7 ? "purple" : "red",
                           i == 9));
  }
  grid[9u]["value"] = Json::Value(Json::nullValue);
  record["grid"] = grid;
  record["createdAt"] = "2024-03-01T00:00:00.000Z";
  record["updatedAt"] = "2024-01-01T00:00:00.000Z";

  Json::Value payload(Json::objectValue);
  payload["ignored-key"] = record;
  auto result = pv::core::Migrate(payload, FormatVersion::kV1_4, kBackupTime);
  assert(result.records.size() == 1);
  const auto& migrated = result.records[0];
  assert(migrated.id == "42");
  assert(migrated.name.size() == pv::model::kMaxNameLength);
  assert(migrated.cells.size() == 40);
  assert(!migrated.cells[5].digit);
  assert(migrated.cells[7].color == pv::core::CycleColor(7));
  assert(!migrated.cells[9].digit && !migrated.cells[9].is_secret_digit);
  assert(!migrated.cells[39].digit);
  assert(migrated.cells[39].color == pv::core::CycleColor(39));
  assert(migrated.updated_at == migrated.created_at);
  // name, padding, color, digit, PIN marker
  assert(result.warnings.size() == 5);
  pv::model::ValidateRecord(migrated);
}

void TestV12Shapes() {
  Json::Value record(Json::objectValue);
  record["id"] = "old";
  record["name"] = "Old grid";
  Json::Value rows(Json::arrayValue);
  for (int r = 0; r < 8; ++r) {
    Json::Value row(Json::arrayValue);
    for (int c = 0; c < 5; ++c) {
      const int index = r * 5 + c;
      row.append(index % 4 == 0 ? Json::Value("") : Json::Value(index % 10));
    }
    rows.append(row);
  }
  record["gridData"] = rows;
  record["dateCreated"] = "2023-12-24T18:00:00.000Z";

  Json::Value wrapped(Json::objectValue);
  wrapped["grids"] = Json::Value(Json::arrayValue);
  wrapped["grids"].append(record);
  auto result = pv::core::Migrate(wrapped, FormatVersion::kV1_2, kBackupTime);
  assert(result.warnings.empty());
  assert(result.records.size() == 1);
  const auto& grid = result.records[0];
  assert(grid.id == "old");
  assert(!grid.cells[0].digit);
  assert(grid.cells[1].digit == 1);
  assert(grid.cells[17].digit == 7);
  assert(grid.cells[0].color == ColorTag::kBlue && grid.cells[1].color == ColorTag::kRed);
  assert(grid.created_at == "2023-12-24T18:00:00.000Z");
  assert(grid.updated_at == kBackupTime);

  // Keyed by id without an id member.
  Json::Value keyed(Json::objectValue);
  record.removeMember("id");
  keyed["from-key"] = record;
  auto keyed_result = pv::core::Migrate(keyed, FormatVersion::kV1_2, kBackupTime);
  assert(keyed_result.records.size() == 1);
  assert(keyed_result.records[0].id == "from-key");

  // Step by step: 1.2 rows flatten into cell objects.
  std::vector<std::string> warnings;
  auto v13 = pv::core::MigrateV12ToV13(wrapped, warnings);
  assert(v13.isArray() && v13.size() == 1);
  assert(v13[0u]["grid"].size() == 40);
  assert(v13[0u]["grid"][1u]["value"].asInt() == 1);
  assert(!v13[0u].isMember("gridData"));
  auto v14 = pv::core::MigrateV13ToV14(v13, warnings);
  assert(v14.isObject() && v14.isMember("old"));
  assert(warnings.empty());
}

bool HasWarning(const std::vector<std::string>& warnings, const std::string& needle) {
  for (const auto& warning : warnings) {
    if (warning.find(needle) != std::string::npos) {
      return true;
    }
  }
  return false;
}

// Integers past int64 must cost a digit or an id, never the whole migration.
void TestOutOfRangeNumbers() {
  Json::Value keep(Json::objectValue);
  keep["id"] = "keep";
  keep["name"] = "Keep";
  keep["grid"] = Json::Value(Json::arrayValue);
  keep["grid"].append(1);
  keep["grid"].append(2);
  keep["grid"].append(3);
  Json::Value huge(Json::objectValue);
  huge["id"] = "huge";
  huge["name"] = "Huge";
  huge["grid"] = Json::Value(Json::arrayValue);
  huge["grid"].append(Json::Value(Json::UInt64(18446744073709551615ULL)));
  Json::Value payload(Json::arrayValue);
  payload.append(keep);
  payload.append(huge);

  auto result = pv::core::Migrate(payload, FormatVersion::kV1_2, kBackupTime);
  assert(result.records.size() == 2);
  // Records come back ordered by id.
  assert(result.records[0].id == "huge" && !result.records[0].cells[0].digit);
  assert(result.records[1].id == "keep" && result.records[1].cells[2].digit == 3);
  assert(HasWarning(result.warnings, "Grid 'huge'"));
  assert(HasWarning(result.warnings, "digits were cleared"));

  Json::Value real_id = V14Record("", "Real id");
  real_id["id"] = 1e19;
  Json::Value v13(Json::arrayValue);
  v13.append(real_id);
  v13.append(V14Record("plain", "Plain"));
  auto ids = pv::core::Migrate(v13, FormatVersion::kV1_3, kBackupTime);
  assert(ids.records.size() == 2);
  assert(ids.records[0].id == "10000000000000000000");

  Json::Value negative_digit = V14Record("neg", "Negative");
  negative_digit["grid"][3u]["value"] = Json::Value(-1e19);
  Json::Value v14(Json::objectValue);
  v14["neg"] = negative_digit;
  auto digits = pv::core::Migrate(v14, FormatVersion::kV1_4, kBackupTime);
  assert(digits.records.size() == 1);
  assert(!digits.records[0].cells[3].digit);
}

// Mixed fraction precision orders by instant, not by text.
void TestMixedPrecisionTimestamps() {
  Json::Value record = V14Record("t", "Times");
  record["createdAt"] = "2024-01-01T12:00:00Z";
  record["updatedAt"] = "2024-01-01T12:00:00.500Z";
  Json::Value payload(Json::objectValue);
  payload["t"] = record;
  auto result = pv::core::Migrate(payload, FormatVersion::kV1_4, kBackupTime);
  assert(result.records.size() == 1);
  assert(result.records[0].updated_at == "2024-01-01T12:00:00.500Z");
  assert(result.warnings.empty());
}

void TestFailures() {
  assert(MigrateCode(Json::Value(Json::arrayValue), FormatVersion::kV1_3) == 0);
  assert(pv::core::Migrate(Json::Value(Json::objectValue), FormatVersion::kV1_4, kBackupTime)
             .records.empty());

  Json::Value all_bad(Json::arrayValue);
  all_bad.append(Json::Value(5));
  all_bad.append(Json::Value("text"));
  bool threw = false;
  try {
    (void)pv::core::Migrate(all_bad, FormatVersion::kV1_3, kBackupTime);
  } catch (const pv::Error& err) {
    threw = err.code == pv::errors::backup::kNoRecoverableRecords;
    assert(err.context.size() == 2);
  }
  assert(threw);

  assert(MigrateCode(Json::Value(7), FormatVersion::kV1_4) ==
         pv::errors::backup::kInvalidBackupOrPassword);
  assert(MigrateCode(Json::Value(Json::arrayValue), FormatVersion::kV1_5) ==
         pv::errors::backup::kUnsupportedVersion);
  assert(MigrateCode(Json::Value(Json::arrayValue), FormatVersion::kUnsupported) ==
         pv::errors::backup::kUnsupportedVersion);
}

}  // namespace

int main() {
  TestCycleColors();
  TestWellFormedV14();
  TestPartialTolerance();
  TestRepairs();
  TestV12Shapes();
  TestOutOfRangeNumbers();
  TestMixedPrecisionTimestamps();
  TestFailures();
  std::cout << "version migrator tests ok\n";
  return 0;
}
