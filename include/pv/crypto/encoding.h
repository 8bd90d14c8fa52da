#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace pv::crypto {

// Standard alphabet with '=' padding, no line breaks.
std::string Base64Encode(std::span<const uint8_t> data);

// Returns nullopt for anything that is not canonical padded base64.
// Surrounding ASCII whitespace is ignored.
std::optional<std::vector<uint8_t>> Base64Decode(std::string_view text);

std::string HexEncode(std::span<const uint8_t> data);
std::optional<std::vector<uint8_t>> HexDecode(std::string_view text);

}  // namespace pv::crypto
