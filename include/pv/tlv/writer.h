#pragma once

#include <cstdint>
#include <span>
#include <string_view>
#include <utility>
#include <vector>

namespace pv::tlv {

class Writer {
 public:
  Writer& Append(uint16_t type, std::span<const uint8_t> value);
  Writer& AppendString(uint16_t type, std::string_view value);
  Writer& AppendU32(uint16_t type, uint32_t value);

  [[nodiscard]] const std::vector<uint8_t>& bytes() const noexcept { return buffer_; }
  std::vector<uint8_t> Release() noexcept { return std::move(buffer_); }

 private:
  std::vector<uint8_t> buffer_{};
};

}  // namespace pv::tlv
