#include "pv/model/record.h"

#include <ctime>
#include <cstdio>
#include <string>
#include <utility>

#include "pv/crypto/random.h"
#include "pv/error.h"

namespace pv::model {

namespace {

[[noreturn]] void Invalid(const Record& record, const std::string& what) {
  throw Error(ErrorDomain::Validation, errors::backup::kInvalidRecord,
              "Invalid record: " + what, std::nullopt, {record.id});
}

bool IsDigitChar(char c) noexcept { return c >= '0' && c <= '9'; }

}  // namespace

std::string_view ColorTagToString(ColorTag color) noexcept {
  switch (color) {
  case ColorTag::kRed:
    return "red";
  case ColorTag::kBlue:
    return "blue";
  case ColorTag::kGreen:
    return "green";
  case ColorTag::kYellow:
    return "yellow";
  }
  return "red";
}

std::optional<ColorTag> ColorTagFromString(std::string_view name) noexcept {
  for (ColorTag color : kAllColors) {
    if (ColorTagToString(color) == name) {
      return color;
    }
  }
  return std::nullopt;
}

std::optional<ColorTag> ColorTagFromWire(uint8_t value) noexcept {
  if (value > static_cast<uint8_t>(ColorTag::kYellow)) {
    return std::nullopt;
  }
  return static_cast<ColorTag>(value);
}

void ValidateRecord(const Record& record) {
  if (record.id.empty()) {
    Invalid(record, "id is empty");
  }
  if (record.id.size() > kMaxIdBytes) {
    Invalid(record, "id exceeds " + std::to_string(kMaxIdBytes) + " bytes");
  }
  const std::size_t name_length = Utf8Length(record.name);
  if (name_length == 0 || name_length > kMaxNameLength) {
    Invalid(record, "name must be 1 to " + std::to_string(kMaxNameLength) + " characters");
  }
  if (record.cells.size() != kCellCount) {
    Invalid(record, "expected " + std::to_string(kCellCount) + " cells, found " +
                        std::to_string(record.cells.size()));
  }
  for (std::size_t i = 0; i < record.cells.size(); ++i) {
    const Cell& cell = record.cells[i];
    if (cell.index != i) {
      Invalid(record, "cell " + std::to_string(i) + " has index " + std::to_string(cell.index));
    }
    if (!ColorTagFromWire(static_cast<uint8_t>(cell.color))) {
      Invalid(record, "cell " + std::to_string(i) + " has an unknown color");
    }
    if (cell.digit && *cell.digit > kMaxDigit) {
      Invalid(record, "cell " + std::to_string(i) + " digit out of range");
    }
    if (cell.is_secret_digit && !cell.digit) {
      Invalid(record, "cell " + std::to_string(i) + " marked secret without a digit");
    }
  }
  if (!IsIsoTimestamp(record.created_at) || !IsIsoTimestamp(record.updated_at)) {
    Invalid(record, "timestamps must be ISO-8601 UTC");
  }
  if (CompareIsoTimestamps(record.updated_at, record.created_at) < 0) {
    Invalid(record, "updated_at precedes created_at");
  }
}

std::vector<ColorTag> GenerateColorLayout() {
  std::vector<ColorTag> layout;
  layout.reserve(kCellCount);
  for (std::size_t i = 0; i < kCellCount; ++i) {
    layout.push_back(kAllColors[i % kAllColors.size()]);
  }
  // Fisher-Yates
  for (std::size_t i = layout.size() - 1; i > 0; --i) {
    const auto j = static_cast<std::size_t>(crypto::RandomUniform(static_cast<uint32_t>(i + 1)));
    std::swap(layout[i], layout[j]);
  }
  return layout;
}

Record MakeEmptyRecord(std::string id, std::string name, const std::string& now) {
  Record record;
  record.id = std::move(id);
  record.name = std::move(name);
  record.created_at = now;
  record.updated_at = now;
  const auto layout = GenerateColorLayout();
  record.cells.reserve(kCellCount);
  for (std::size_t i = 0; i < kCellCount; ++i) {
    record.cells.push_back(Cell{static_cast<uint8_t>(i), layout[i], std::nullopt, false});
  }
  return record;
}

void FillEmptyCells(Record& record) {
  for (auto& cell : record.cells) {
    if (!cell.digit) {
      cell.digit = static_cast<uint8_t>(crypto::RandomUniform(kMaxDigit + 1));
      cell.is_secret_digit = false;
    }
  }
}

bool CellsEqual(const Cell& a, const Cell& b) noexcept {
  return a.index == b.index && a.color == b.color && a.digit == b.digit &&
         a.is_secret_digit == b.is_secret_digit;
}

bool RecordsEqual(const Record& a, const Record& b) noexcept {
  if (a.id != b.id || a.name != b.name || a.created_at != b.created_at ||
      a.updated_at != b.updated_at || a.cells.size() != b.cells.size()) {
    return false;
  }
  for (std::size_t i = 0; i < a.cells.size(); ++i) {
    if (!CellsEqual(a.cells[i], b.cells[i])) {
      return false;
    }
  }
  return true;
}

std::size_t Utf8Length(std::string_view text) noexcept {
  std::size_t count = 0;
  for (unsigned char c : text) {
    if ((c & 0xC0) != 0x80) {
      ++count;
    }
  }
  return count;
}

std::string Utf8Truncate(std::string_view text, std::size_t max_chars) {
  std::size_t chars = 0;
  for (std::size_t i = 0; i < text.size(); ++i) {
    const auto c = static_cast<unsigned char>(text[i]);
    if ((c & 0xC0) != 0x80) {
      if (chars == max_chars) {
        return std::string(text.substr(0, i));
      }
      ++chars;
    }
  }
  return std::string(text);
}

std::string FormatIsoTimestamp(std::chrono::system_clock::time_point when) {
  const auto since_epoch = when.time_since_epoch();
  const auto seconds = std::chrono::duration_cast<std::chrono::seconds>(since_epoch);
  const auto millis =
      std::chrono::duration_cast<std::chrono::milliseconds>(since_epoch - seconds).count();
  const std::time_t raw = static_cast<std::time_t>(seconds.count());
  std::tm utc{};
#if defined(_WIN32)
  gmtime_s(&utc, &raw);
#else
  gmtime_r(&raw, &utc);
#endif
  char buffer[32];
  std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                utc.tm_year + 1900, utc.tm_mon + 1, utc.tm_mday, utc.tm_hour, utc.tm_min,
                utc.tm_sec, static_cast<int>(millis));
  return buffer;
}

std::string CurrentIsoTimestamp() {
  return FormatIsoTimestamp(std::chrono::system_clock::now());
}

// Accepts YYYY-MM-DDTHH:MM:SS[.fraction]Z.
bool IsIsoTimestamp(std::string_view text) noexcept {
  if (text.size() < 20 || text.back() != 'Z') {
    return false;
  }
  static constexpr std::string_view kPattern = "dddd-dd-ddTdd:dd:dd";
  for (std::size_t i = 0; i < kPattern.size(); ++i) {
    if (kPattern[i] == 'd' ? !IsDigitChar(text[i]) : text[i] != kPattern[i]) {
      return false;
    }
  }
  const std::string_view rest = text.substr(kPattern.size(), text.size() - kPattern.size() - 1);
  if (rest.empty()) {
    return true;
  }
  if (rest.front() != '.' || rest.size() < 2) {
    return false;
  }
  for (char c : rest.substr(1)) {
    if (!IsDigitChar(c)) {
      return false;
    }
  }
  return true;
}

int CompareIsoTimestamps(std::string_view a, std::string_view b) noexcept {
  if (!IsIsoTimestamp(a) || !IsIsoTimestamp(b)) {
    return a.compare(b);
  }
  // Date and time fields are fixed width.
  static constexpr std::size_t kSecondsWidth = 19;
  if (int order = a.substr(0, kSecondsWidth).compare(b.substr(0, kSecondsWidth)); order != 0) {
    return order;
  }
  auto fraction = [](std::string_view text) {
    const std::string_view rest = text.substr(kSecondsWidth, text.size() - kSecondsWidth - 1);
    return rest.empty() ? rest : rest.substr(1);
  };
  const std::string_view fa = fraction(a);
  const std::string_view fb = fraction(b);
  for (std::size_t i = 0; i < fa.size() || i < fb.size(); ++i) {
    const char ca = i < fa.size() ? fa[i] : '0';
    const char cb = i < fb.size() ? fb[i] : '0';
    if (ca != cb) {
      return ca < cb ? -1 : 1;
    }
  }
  return 0;
}

}  // namespace pv::model
