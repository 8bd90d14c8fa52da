#include "pv/tlv/parser.h"

#include <cstring>

#include "pv/common.h"

namespace pv::tlv {

Parser::Parser(std::span<const uint8_t> buffer, std::size_t max_records, std::size_t max_payload) {
  std::size_t offset = 0;
  std::size_t count = 0;
  while ((buffer.size() - offset) >= kHeaderBytes) {
    if (count >= max_records) {
      valid_ = false;
      return;
    }

    uint16_t type_le = 0;
    uint32_t length_le = 0;
    std::memcpy(&type_le, buffer.data() + offset, sizeof(type_le));
    std::memcpy(&length_le, buffer.data() + offset + sizeof(type_le), sizeof(length_le));

    const uint16_t type = pv::FromLittleEndian16(type_le);
    const std::size_t length = static_cast<std::size_t>(pv::FromLittleEndian32(length_le));

    if (length > max_payload) {
      valid_ = false;
      return;
    }

    offset += kHeaderBytes;
    if ((buffer.size() - offset) < length) {
      valid_ = false;
      return;
    }

    records_.push_back(Record{type, buffer.subspan(offset, length)});

    offset += length;
    ++count;
  }

  valid_ = offset == buffer.size();
  consumed_ = offset;
}

bool ReadU32(const Record& record, uint32_t& out) noexcept {
  if (record.value.size() != sizeof(uint32_t)) {
    return false;
  }
  uint32_t le = 0;
  std::memcpy(&le, record.value.data(), sizeof(le));
  out = pv::FromLittleEndian32(le);
  return true;
}

}  // namespace pv::tlv
