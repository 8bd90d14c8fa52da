#include "pv/core/format_version.h"

#include <array>

namespace pv::core {

namespace {

struct KnownFormat {
  FormatVersion version;
  std::string_view label;
  std::string_view semantic;
};

constexpr std::array<KnownFormat, 4> kKnownFormats{{
    {FormatVersion::kV1_2, "1.2", "1.2.0"},
    {FormatVersion::kV1_3, "1.3", "1.3.0"},
    {FormatVersion::kV1_4, "1.4", "1.4.0"},
    {FormatVersion::kV1_5, "1.5", "1.5.0"},
}};

}  // namespace

FormatTag ParseFormatLabel(std::string_view label) {
  for (const auto& known : kKnownFormats) {
    if (known.label == label) {
      return FormatTag{known.version, std::string(label)};
    }
  }
  return FormatTag{FormatVersion::kUnsupported, std::string(label)};
}

FormatTag MakeFormatTag(FormatVersion version) {
  return FormatTag{version, std::string(FormatLabel(version))};
}

std::string_view FormatLabel(FormatVersion version) noexcept {
  for (const auto& known : kKnownFormats) {
    if (known.version == version) {
      return known.label;
    }
  }
  return {};
}

std::string_view FormatSemanticVersion(FormatVersion version) noexcept {
  for (const auto& known : kKnownFormats) {
    if (known.version == version) {
      return known.semantic;
    }
  }
  return {};
}

}  // namespace pv::core
