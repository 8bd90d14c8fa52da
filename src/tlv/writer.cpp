#include "pv/tlv/writer.h"

#include <limits>

#include "pv/common.h"
#include "pv/error.h"

namespace pv::tlv {

namespace {

void AppendRaw(std::vector<uint8_t>& out, std::span<const uint8_t> bytes) {
  out.insert(out.end(), bytes.begin(), bytes.end());
}

}  // namespace

Writer& Writer::Append(uint16_t type, std::span<const uint8_t> value) {
  if (value.size() > std::numeric_limits<uint32_t>::max()) {
    throw Error(ErrorDomain::Validation, errors::backup::kInvalidArgument,
                "TLV value exceeds 32-bit length");
  }
  const uint16_t type_le = pv::ToLittleEndian16(type);
  const uint32_t length_le = pv::ToLittleEndian32(static_cast<uint32_t>(value.size()));
  AppendRaw(buffer_, pv::AsBytesConst(type_le));
  AppendRaw(buffer_, pv::AsBytesConst(length_le));
  AppendRaw(buffer_, value);
  return *this;
}

Writer& Writer::AppendString(uint16_t type, std::string_view value) {
  return Append(type, pv::AsBytes(value));
}

Writer& Writer::AppendU32(uint16_t type, uint32_t value) {
  const uint32_t le = pv::ToLittleEndian32(value);
  return Append(type, pv::AsBytesConst(le));
}

}  // namespace pv::tlv
