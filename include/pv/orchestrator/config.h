#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>

#include "pv/core/backup_codec.h"

namespace pv::orchestrator {

struct BackupConfig {
  uint32_t kdf_iterations{10'000};
  uint32_t legacy_kdf_iterations{10'000};
  uint32_t max_kdf_iterations{1'000'000};
  std::size_t salt_bytes{16};
  std::size_t max_backup_bytes{10u * 1024u * 1024u};
  std::size_t max_password_length{128};
  std::string file_prefix{"pinvault-backup-"};
  std::string file_extension{".pvb"};
  std::filesystem::path log_path;  // empty disables file logging
  std::size_t log_max_bytes{1024u * 1024u};

  core::CodecSettings CodecSettings() const {
    return core::CodecSettings{kdf_iterations, legacy_kdf_iterations, salt_bytes,
                               max_kdf_iterations};
  }
};

// Reads a YAML document of the form
//
//   backup:
//     kdf_iterations: 10000
//     legacy_kdf_iterations: 10000
//     max_kdf_iterations: 1000000
//     salt_bytes: 16
//     max_backup_bytes: 10485760
//     max_password_length: 128
//     file_prefix: pinvault-backup-
//     file_extension: .pvb
//   logging:
//     path: /var/log/pinvault/backup.jsonl
//     max_bytes: 1048576
//
// Missing keys keep their defaults. Throws Config-domain pv::Error:
// kUnreadable (file missing or not YAML), kUnknownKey, kInvalidValue.
BackupConfig LoadBackupConfig(const std::filesystem::path& path);

// Same rules, from YAML text already in memory.
BackupConfig ParseBackupConfig(const std::string& yaml_text);

// Throws Config/kInvalidValue when a numeric setting is zero, an iteration
// count exceeds max_kdf_iterations, or a file naming setting is empty.
void ValidateBackupConfig(const BackupConfig& config);

}  // namespace pv::orchestrator
