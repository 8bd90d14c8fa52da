#include "pv/core/version_migrator.h"

#include <optional>
#include <string>
#include <utility>

#include "pv/error.h"
#include "pv/errors.h"

namespace pv::core {
namespace {

// Legacy cycle order; differs from model::kAllColors.
constexpr model::ColorTag kCycleOrder[] = {model::ColorTag::kBlue, model::ColorTag::kRed,
                                           model::ColorTag::kGreen, model::ColorTag::kYellow};

struct Entry {
  std::string key;  // member name when the container is an object, else empty
  const Json::Value* value{nullptr};
};

std::vector<Entry> CollectEntries(const Json::Value& payload) {
  std::vector<Entry> entries;
  if (payload.isNull()) {
    return entries;
  }
  if (payload.isObject() && payload.isMember("grids") &&
      (payload["grids"].isArray() || payload["grids"].isObject())) {
    return CollectEntries(payload["grids"]);
  }
  if (payload.isArray()) {
    for (const auto& item : payload) {
      entries.push_back(Entry{{}, &item});
    }
    return entries;
  }
  if (payload.isObject()) {
    for (auto it = payload.begin(); it != payload.end(); ++it) {
      entries.push_back(Entry{it.name(), &(*it)});
    }
    return entries;
  }
  throw Error(ErrorDomain::Format, errors::backup::kInvalidBackupOrPassword,
              std::string(errors::msg::kInvalidBackupOrPassword) +
                  ": payload is not a record collection");
}

std::optional<std::string> IdOf(const Json::Value& record) {
  const Json::Value& id = record["id"];
  if (id.isString() && !id.asString().empty()) {
    return id.asString();
  }
  // isIntegral() also admits values outside int64, which asInt64() rejects.
  if (id.isInt64()) {
    return std::to_string(id.asInt64());
  }
  if (id.isUInt64()) {
    return std::to_string(id.asUInt64());
  }
  return std::nullopt;
}

std::optional<std::string> ResolveId(const Entry& entry) {
  if (auto id = IdOf(*entry.value)) {
    return id;
  }
  if (!entry.key.empty() && !entry.value->isMember("id")) {
    return entry.key;
  }
  return std::nullopt;
}

std::string Describe(const std::optional<std::string>& id, std::size_t position) {
  if (id) {
    return "Grid '" + *id + "'";
  }
  return "Entry " + std::to_string(position);
}

void FlattenGrid(const Json::Value& grid, Json::Value& flat) {
  for (const auto& item : grid) {
    if (item.isArray()) {
      FlattenGrid(item, flat);
    } else {
      flat.append(item);
    }
  }
}

Json::Value MakeLegacyCell(std::size_t index, const Json::Value& value) {
  Json::Value cell(Json::objectValue);
  cell["id"] = Json::UInt64(index);
  cell["value"] = value;
  cell["color"] = std::string(model::ColorTagToString(CycleColor(index)));
  cell["isPinDigit"] = false;
  return cell;
}

// Returns false when |item| could not be read as a digit or an empty slot.
bool ConvertNumericCell(std::size_t index, const Json::Value& item, Json::Value& out) {
  if (item.isObject()) {
    out = item;
    return true;
  }
  if (item.isNull() || (item.isString() && item.asString().empty())) {
    out = MakeLegacyCell(index, Json::Value(Json::nullValue));
    return true;
  }
  if (item.isNumeric()) {
    out = MakeLegacyCell(index, item);
    return true;
  }
  if (item.isString() && item.asString().size() == 1 && item.asString()[0] >= '0' &&
      item.asString()[0] <= '9') {
    out = MakeLegacyCell(index, Json::Value(item.asString()[0] - '0'));
    return true;
  }
  out = MakeLegacyCell(index, Json::Value(Json::nullValue));
  return false;
}

std::optional<uint8_t> ReadDigit(const Json::Value& value, bool& invalid) {
  invalid = false;
  if (value.isNull() || (value.isString() && value.asString().empty())) {
    return std::nullopt;
  }
  if (value.isInt64() && value.asInt64() >= 0 && value.asInt64() <= model::kMaxDigit) {
    return static_cast<uint8_t>(value.asInt64());
  }
  invalid = true;
  return std::nullopt;
}

std::string ReadTimestamp(const Json::Value& record, const char* primary, const char* fallback,
                          const std::string& default_value, bool& replaced_invalid) {
  replaced_invalid = false;
  const Json::Value* value = nullptr;
  if (record.isMember(primary)) {
    value = &record[primary];
  } else if (fallback && record.isMember(fallback)) {
    value = &record[fallback];
  }
  if (value == nullptr || value->isNull()) {
    return default_value;
  }
  if (value->isString() && model::IsIsoTimestamp(value->asString())) {
    return value->asString();
  }
  replaced_invalid = true;
  return default_value;
}

std::vector<model::Cell> ReadCells(const Json::Value& record, const std::string& label,
                                   std::vector<std::string>& warnings) {
  const Json::Value& grid = record.isMember("grid") ? record["grid"] : record["gridData"];
  std::vector<model::Cell> cells;
  cells.reserve(model::kCellCount);

  std::size_t total = grid.isArray() ? grid.size() : 0;
  if (!grid.isArray()) {
    warnings.push_back(label + ": grid missing, created an empty grid");
  } else if (total > model::kCellCount) {
    warnings.push_back(label + ": grid had " + std::to_string(total) + " cells, kept the first " +
                       std::to_string(model::kCellCount));
  } else if (total < model::kCellCount) {
    warnings.push_back(label + ": grid had " + std::to_string(total) + " cells, padded to " +
                       std::to_string(model::kCellCount));
  }

  bool bad_color = false;
  bool bad_digit = false;
  bool orphan_secret = false;
  bool bad_cell = false;
  for (std::size_t i = 0; i < model::kCellCount; ++i) {
    model::Cell cell;
    cell.index = static_cast<uint8_t>(i);
    cell.color = CycleColor(i);
    if (i < total) {
      const Json::Value& source = grid[static_cast<Json::ArrayIndex>(i)];
      if (!source.isObject()) {
        bad_cell = true;
      } else {
        const Json::Value& color = source["color"];
        auto parsed = color.isString() ? model::ColorTagFromString(color.asString()) : std::nullopt;
        if (parsed) {
          cell.color = *parsed;
        } else {
          bad_color = true;
        }
        bool invalid = false;
        cell.digit = ReadDigit(source["value"], invalid);
        bad_digit = bad_digit || invalid;
        if (source["isPinDigit"].isBool() && source["isPinDigit"].asBool()) {
          if (cell.digit) {
            cell.is_secret_digit = true;
          } else {
            orphan_secret = true;
          }
        }
      }
    }
    cells.push_back(cell);
  }
  if (bad_cell) {
    warnings.push_back(label + ": unreadable cells were reset to empty");
  }
  if (bad_color) {
    warnings.push_back(label + ": unknown cell colors were replaced");
  }
  if (bad_digit) {
    warnings.push_back(label + ": out-of-range digits were cleared");
  }
  if (orphan_secret) {
    warnings.push_back(label + ": PIN markers without a digit were cleared");
  }
  return cells;
}

[[noreturn]] void ThrowUnsupported(FormatVersion source) {
  std::string label(FormatLabel(source));
  throw Error(ErrorDomain::Format, errors::backup::kUnsupportedVersion,
              std::string(errors::msg::kUnsupportedVersion) +
                  (label.empty() ? std::string() : ": " + label));
}

}  // namespace

std::size_t CountPayloadEntries(const Json::Value& payload) {
  return CollectEntries(payload).size();
}

model::ColorTag CycleColor(std::size_t index) noexcept {
  return kCycleOrder[index % 4];
}

Json::Value MigrateV12ToV13(const Json::Value& payload, std::vector<std::string>& warnings) {
  Json::Value out(Json::arrayValue);
  std::size_t position = 0;
  for (const auto& entry : CollectEntries(payload)) {
    ++position;
    if (!entry.value->isObject()) {
      out.append(*entry.value);
      continue;
    }
    Json::Value record = *entry.value;
    if (!IdOf(record) && !entry.key.empty() && !record.isMember("id")) {
      record["id"] = entry.key;
    }
    const std::string label = Describe(IdOf(record), position);

    const Json::Value grid = record.isMember("grid") ? record["grid"] : record["gridData"];
    record.removeMember("gridData");
    if (grid.isArray()) {
      Json::Value flat(Json::arrayValue);
      FlattenGrid(grid, flat);
      Json::Value cells(Json::arrayValue);
      bool unreadable = false;
      for (Json::ArrayIndex i = 0; i < flat.size(); ++i) {
        Json::Value cell;
        if (!ConvertNumericCell(i, flat[i], cell)) {
          unreadable = true;
        }
        cells.append(cell);
      }
      if (unreadable) {
        warnings.push_back(label + ": non-numeric grid values were cleared");
      }
      record["grid"] = cells;
    }

    if (!record.isMember("createdAt") && record.isMember("dateCreated")) {
      record["createdAt"] = record["dateCreated"];
    }
    record.removeMember("dateCreated");
    out.append(record);
  }
  return out;
}

Json::Value MigrateV13ToV14(const Json::Value& payload, std::vector<std::string>& warnings) {
  Json::Value out(Json::objectValue);
  std::size_t position = 0;
  for (const auto& entry : CollectEntries(payload)) {
    ++position;
    if (!entry.value->isObject()) {
      warnings.push_back(Describe(std::nullopt, position) + ": not a grid record, skipped");
      continue;
    }
    auto id = ResolveId(entry);
    if (!id) {
      warnings.push_back(Describe(std::nullopt, position) + ": grid has no id, skipped");
      continue;
    }
    if (out.isMember(*id)) {
      warnings.push_back(Describe(id, position) + ": duplicate id, kept the later copy");
    }
    Json::Value record = *entry.value;
    record["id"] = *id;
    out[*id] = record;
  }
  return out;
}

std::vector<model::Record> MigrateV14ToRecords(const Json::Value& payload,
                                               std::string_view backup_timestamp,
                                               std::vector<std::string>& warnings) {
  const std::string fallback_time = model::IsIsoTimestamp(backup_timestamp)
                                        ? std::string(backup_timestamp)
                                        : model::CurrentIsoTimestamp();
  std::vector<model::Record> records;
  std::size_t position = 0;
  for (const auto& entry : CollectEntries(payload)) {
    ++position;
    if (!entry.value->isObject()) {
      warnings.push_back(Describe(std::nullopt, position) + ": not a grid record, skipped");
      continue;
    }
    const Json::Value& source = *entry.value;
    auto id = ResolveId(entry);
    if (!id) {
      warnings.push_back(Describe(std::nullopt, position) + ": grid has no id, skipped");
      continue;
    }
    const std::string label = Describe(id, position);

    // A value jsoncpp refuses to convert costs this record only.
    try {
      model::Record record;
      record.id = *id;

      if (source["name"].isString() && !source["name"].asString().empty()) {
        record.name = source["name"].asString();
      } else if (source["title"].isString() && !source["title"].asString().empty()) {
        record.name = source["title"].asString();
      } else {
        record.name = "Grid " + *id;
        warnings.push_back(label + ": name missing, using \"" + record.name + "\"");
      }
      if (model::Utf8Length(record.name) > model::kMaxNameLength) {
        record.name = model::Utf8Truncate(record.name, model::kMaxNameLength);
        warnings.push_back(label + ": name shortened to " + std::to_string(model::kMaxNameLength) +
                           " characters");
      }

      record.cells = ReadCells(source, label, warnings);

      bool bad_created = false;
      bool bad_updated = false;
      record.created_at =
          ReadTimestamp(source, "createdAt", "dateCreated", fallback_time, bad_created);
      record.updated_at = ReadTimestamp(source, "updatedAt", nullptr, fallback_time, bad_updated);
      if (bad_created || bad_updated) {
        warnings.push_back(label + ": unreadable timestamps replaced with the backup time");
      }
      if (model::CompareIsoTimestamps(record.updated_at, record.created_at) < 0) {
        record.updated_at = record.created_at;
      }

      try {
        model::ValidateRecord(record);
      } catch (const Error& err) {
        warnings.push_back(label + ": skipped, " + err.what());
        continue;
      }
      records.push_back(std::move(record));
    } catch (const Json::Exception& err) {
      warnings.push_back(label + ": unreadable record skipped, " + err.what());
    }
  }
  return records;
}

MigrationResult Migrate(const Json::Value& raw_payload, FormatVersion source,
                        std::string_view backup_timestamp) {
  if (!IsLegacyFormat(source)) {
    ThrowUnsupported(source);
  }

  MigrationResult result;
  const bool had_entries = CountPayloadEntries(raw_payload) > 0;

  Json::Value current = raw_payload;
  if (source == FormatVersion::kV1_2) {
    current = MigrateV12ToV13(current, result.warnings);
    source = FormatVersion::kV1_3;
  }
  if (source == FormatVersion::kV1_3) {
    current = MigrateV13ToV14(current, result.warnings);
    source = FormatVersion::kV1_4;
  }
  result.records = MigrateV14ToRecords(current, backup_timestamp, result.warnings);

  if (had_entries && result.records.empty()) {
    throw Error(ErrorDomain::Format, errors::backup::kNoRecoverableRecords,
                std::string(errors::msg::kNoRecoverableRecords), std::nullopt, result.warnings);
  }
  return result;
}

}  // namespace pv::core
