#include "pv/crypto/encoding.h"

#include <openssl/evp.h>

#include <limits>

#include "pv/error.h"

namespace pv::crypto {

namespace {

bool IsAsciiSpace(char c) {
  return c == ' ' || c == '\t' || c == '\r' || c == '\n';
}

std::string_view Trim(std::string_view text) {
  while (!text.empty() && IsAsciiSpace(text.front())) {
    text.remove_prefix(1);
  }
  while (!text.empty() && IsAsciiSpace(text.back())) {
    text.remove_suffix(1);
  }
  return text;
}

int HexValue(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

}  // namespace

std::string Base64Encode(std::span<const uint8_t> data) {
  if (data.empty()) {
    return {};
  }
  if (data.size() > static_cast<std::size_t>(std::numeric_limits<int>::max() / 4 * 3)) {
    throw Error(ErrorDomain::Validation, errors::backup::kInvalidArgument,
                "Base64 input too large");
  }
  std::string out(4 * ((data.size() + 2) / 3), '\0');
  const int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()),
                                      data.data(), static_cast<int>(data.size()));
  if (written < 0) {
    throw Error(ErrorDomain::Crypto, errors::backup::kCryptoUnavailable,
                "EVP_EncodeBlock failed");
  }
  out.resize(static_cast<std::size_t>(written));
  return out;
}

std::optional<std::vector<uint8_t>> Base64Decode(std::string_view text) {
  text = Trim(text);
  if (text.empty()) {
    return std::vector<uint8_t>{};
  }
  if (text.size() % 4 != 0 ||
      text.size() > static_cast<std::size_t>(std::numeric_limits<int>::max())) {
    return std::nullopt;
  }
  for (char c : text) {
    // EVP_DecodeBlock skips embedded whitespace; we do not accept it.
    if (IsAsciiSpace(c)) {
      return std::nullopt;
    }
  }
  std::size_t padding = 0;
  if (text.back() == '=') {
    ++padding;
    if (text[text.size() - 2] == '=') {
      ++padding;
    }
  }
  std::vector<uint8_t> out(text.size() / 4 * 3);
  const int written = EVP_DecodeBlock(out.data(),
                                      reinterpret_cast<const unsigned char*>(text.data()),
                                      static_cast<int>(text.size()));
  if (written < 0 || static_cast<std::size_t>(written) != out.size()) {
    return std::nullopt;
  }
  out.resize(out.size() - padding);
  return out;
}

std::string HexEncode(std::span<const uint8_t> data) {
  static constexpr char kDigits[] = "0123456789abcdef";
  std::string out;
  out.reserve(data.size() * 2);
  for (uint8_t byte : data) {
    out.push_back(kDigits[byte >> 4]);
    out.push_back(kDigits[byte & 0x0F]);
  }
  return out;
}

std::optional<std::vector<uint8_t>> HexDecode(std::string_view text) {
  if (text.size() % 2 != 0) {
    return std::nullopt;
  }
  std::vector<uint8_t> out;
  out.reserve(text.size() / 2);
  for (std::size_t i = 0; i < text.size(); i += 2) {
    const int hi = HexValue(text[i]);
    const int lo = HexValue(text[i + 1]);
    if (hi < 0 || lo < 0) {
      return std::nullopt;
    }
    out.push_back(static_cast<uint8_t>((hi << 4) | lo));
  }
  return out;
}

}  // namespace pv::crypto
