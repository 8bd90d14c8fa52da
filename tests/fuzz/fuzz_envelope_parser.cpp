#include <cstddef>
#include <cstdint>
#include <string_view>

#include "pv/core/envelope.h"
#include "pv/error.h"

// Any input must either parse or fail with pv::Error; parsed envelopes of a
// known format must serialize again.
extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
  if (data == nullptr) {
    return 0;
  }
  std::string_view text(reinterpret_cast<const char*>(data), size);
  try {
    auto envelope = pv::core::ParseEnvelope(text);
    if (envelope.format.version != pv::core::FormatVersion::kUnsupported) {
      (void)pv::core::SerializeEnvelope(envelope);
    }
  } catch (const pv::Error&) {
  }
  return 0;
}
