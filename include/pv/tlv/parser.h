#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace pv::tlv {

// Wire layout per entry: u16 type, u32 length (both little-endian), value.
inline constexpr std::size_t kHeaderBytes = sizeof(uint16_t) + sizeof(uint32_t);

struct Record {
  uint16_t type{0};
  std::span<const uint8_t> value{};
};

// Non-owning view over a TLV stream. The buffer must outlive the parser.
// valid() is false on truncation, trailing bytes, or when a limit is exceeded.
class Parser {
 public:
  Parser(std::span<const uint8_t> buffer, std::size_t max_records = 64,
         std::size_t max_payload = 16 * 1024 * 1024);

  [[nodiscard]] bool valid() const noexcept { return valid_; }
  [[nodiscard]] std::size_t consumed() const noexcept { return consumed_; }
  [[nodiscard]] std::size_t size() const noexcept { return records_.size(); }

  [[nodiscard]] auto begin() const noexcept { return records_.begin(); }
  [[nodiscard]] auto end() const noexcept { return records_.end(); }

 private:
  bool valid_{false};
  std::size_t consumed_{0};
  std::vector<Record> records_{};
};

// Fixed-width accessors for values; return false on a size mismatch.
bool ReadU32(const Record& record, uint32_t& out) noexcept;

}  // namespace pv::tlv
