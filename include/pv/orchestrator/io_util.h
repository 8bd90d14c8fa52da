#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <span>
#include <vector>

#include "pv/error.h"

namespace pv::orchestrator {

struct AtomicReplaceHooks {  // test seam for crash simulation
  std::function<void(const std::filesystem::path&, const std::filesystem::path&)> before_rename;
};

// Performs an atomic replace of the target file by writing the payload to a
// temporary file on the same filesystem, syncing it to disk, then renaming it
// into place. A failure at any step leaves the target untouched and removes
// the temporary file. Throws IO/kStorageFailure.
void AtomicReplace(const std::filesystem::path& target, std::span<const uint8_t> payload,
                   const AtomicReplaceHooks& hooks = {});

// Reads a whole file. Throws IO/kStorageFailure when it cannot be read and
// Format/kBackupTooLarge when it is larger than |max_bytes|; the size is
// checked before the contents are loaded.
std::vector<uint8_t> ReadFileLimited(const std::filesystem::path& path, std::size_t max_bytes);

}  // namespace pv::orchestrator
