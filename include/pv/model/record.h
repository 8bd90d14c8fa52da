#pragma once

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pv::model {

inline constexpr std::size_t kGridColumns = 8;
inline constexpr std::size_t kGridRows = 5;
inline constexpr std::size_t kCellCount = kGridColumns * kGridRows;
inline constexpr std::size_t kCellsPerColor = 10;
inline constexpr std::size_t kMaxNameLength = 50;   // characters
inline constexpr std::size_t kMaxIdBytes = 128;
inline constexpr uint8_t kMaxDigit = 9;

enum class ColorTag : uint8_t {
  kRed = 0,
  kBlue = 1,
  kGreen = 2,
  kYellow = 3,
};

inline constexpr std::array<ColorTag, 4> kAllColors{ColorTag::kRed, ColorTag::kBlue,
                                                    ColorTag::kGreen, ColorTag::kYellow};

std::string_view ColorTagToString(ColorTag color) noexcept;
std::optional<ColorTag> ColorTagFromString(std::string_view name) noexcept;
std::optional<ColorTag> ColorTagFromWire(uint8_t value) noexcept;

struct Cell {
  uint8_t index{0};
  ColorTag color{ColorTag::kRed};
  std::optional<uint8_t> digit{};
  bool is_secret_digit{false};
};

struct Record {
  std::string id;
  std::string name;
  std::vector<Cell> cells;
  std::string created_at;
  std::string updated_at;
};

// Throws Validation/kInvalidRecord naming the first violated invariant.
void ValidateRecord(const Record& record);

// 40 colors, 10 of each, shuffled with system randomness.
std::vector<ColorTag> GenerateColorLayout();

Record MakeEmptyRecord(std::string id, std::string name, const std::string& now);

// Puts a random decoy digit in every empty cell. Secret digits stay as they are.
void FillEmptyCells(Record& record);

bool CellsEqual(const Cell& a, const Cell& b) noexcept;
bool RecordsEqual(const Record& a, const Record& b) noexcept;

// UTF-8 helpers used for the name length limit.
std::size_t Utf8Length(std::string_view text) noexcept;
std::string Utf8Truncate(std::string_view text, std::size_t max_chars);

// ISO-8601 UTC with milliseconds, e.g. 2025-03-01T12:00:00.000Z.
std::string FormatIsoTimestamp(std::chrono::system_clock::time_point when);
std::string CurrentIsoTimestamp();
bool IsIsoTimestamp(std::string_view text) noexcept;
// Orders two timestamps accepted by IsIsoTimestamp by instant, whatever their
// fraction precision. Negative, zero or positive like strcmp.
int CompareIsoTimestamps(std::string_view a, std::string_view b) noexcept;

}  // namespace pv::model
