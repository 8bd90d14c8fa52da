#include "pv/tlv/parser.h"
#include "pv/tlv/writer.h"

#include <cassert>
#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

#include "pv/common.h"

int main() {
  pv::tlv::Writer writer;
  writer.AppendString(0x0101, "1.5.0").AppendU32(0x0104, 7).Append(0x01F0, std::vector<uint8_t>{});
  const auto bytes = writer.bytes();
  assert(bytes.size() == 3 * pv::tlv::kHeaderBytes + 5 + 4);
  // Little-endian type and length.
  assert(bytes[0] == 0x01 && bytes[1] == 0x01);
  assert(bytes[2] == 5 && bytes[3] == 0 && bytes[4] == 0 && bytes[5] == 0);

  pv::tlv::Parser parser(bytes);
  assert(parser.valid());
  assert(parser.size() == 3);
  assert(parser.consumed() == bytes.size());
  auto it = parser.begin();
  assert(it->type == 0x0101);
  assert(pv::BytesToString(it->value) == "1.5.0");
  ++it;
  uint32_t count = 0;
  assert(pv::tlv::ReadU32(*it, count));
  assert(count == 7);
  ++it;
  assert(it->type == 0x01F0 && it->value.empty());
  assert(!pv::tlv::ReadU32(*parser.begin(), count));

  // Truncated value.
  std::vector<uint8_t> truncated(bytes.begin(), bytes.end() - 1);
  truncated.resize(pv::tlv::kHeaderBytes + 3);
  assert(!pv::tlv::Parser(truncated).valid());

  // Trailing partial header.
  std::vector<uint8_t> trailing = bytes;
  trailing.push_back(0x01);
  assert(!pv::tlv::Parser(trailing).valid());

  // Record limit.
  assert(!pv::tlv::Parser(bytes, 2).valid());
  assert(pv::tlv::Parser(bytes, 3).valid());

  // Payload limit.
  assert(!pv::tlv::Parser(bytes, 64, 4).valid());

  // Empty stream is a valid empty sequence.
  pv::tlv::Parser empty(std::span<const uint8_t>{});
  assert(empty.valid() && empty.size() == 0);

  std::cout << "tlv tests ok\n";
  return 0;
}
