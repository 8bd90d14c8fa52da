#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace pv::core {

// Known backup file generations. Anything else parses to kUnsupported and is
// rejected before key derivation.
enum class FormatVersion : uint8_t {
  kV1_2,
  kV1_3,
  kV1_4,
  kV1_5,
  kUnsupported,
};

inline constexpr FormatVersion kCurrentFormat = FormatVersion::kV1_5;

// The version as written in the file header plus the label it was parsed
// from, so an unsupported label can still be reported.
struct FormatTag {
  FormatVersion version{FormatVersion::kUnsupported};
  std::string label;
};

FormatTag ParseFormatLabel(std::string_view label);
FormatTag MakeFormatTag(FormatVersion version);

// "1.5" for kV1_5; empty for kUnsupported.
std::string_view FormatLabel(FormatVersion version) noexcept;
// "1.5.0" for kV1_5; empty for kUnsupported.
std::string_view FormatSemanticVersion(FormatVersion version) noexcept;

[[nodiscard]] inline constexpr bool IsLegacyFormat(FormatVersion version) noexcept {
  return version == FormatVersion::kV1_2 || version == FormatVersion::kV1_3 ||
         version == FormatVersion::kV1_4;
}

}  // namespace pv::core
