#include "pv/orchestrator/config.h"

#include <yaml-cpp/yaml.h>

#include <limits>
#include <string>
#include <utility>

#include "pv/common.h"
#include "pv/error.h"

namespace pv::orchestrator {
namespace {

[[noreturn]] void ThrowConfig(int code, std::string message) {
  throw Error(ErrorDomain::Config, code, std::move(message));
}

template <typename T>
T ReadUnsigned(const YAML::Node& node, const std::string& key) {
  if (!node.IsScalar()) {
    ThrowConfig(errors::config::kInvalidValue, "Config value must be a number: " + key);
  }
  uint64_t value = 0;
  try {
    value = node.as<uint64_t>();
  } catch (const YAML::Exception&) {
    ThrowConfig(errors::config::kInvalidValue, "Config value must be a number: " + key);
  }
  if (value == 0 || value > std::numeric_limits<T>::max()) {
    ThrowConfig(errors::config::kInvalidValue, "Config value out of range: " + key);
  }
  return static_cast<T>(value);
}

std::string ReadString(const YAML::Node& node, const std::string& key) {
  if (!node.IsScalar()) {
    ThrowConfig(errors::config::kInvalidValue, "Config value must be a string: " + key);
  }
  return node.Scalar();
}

void ApplyBackupSection(const YAML::Node& section, BackupConfig& config) {
  if (section.IsNull()) {
    return;
  }
  if (!section.IsMap()) {
    ThrowConfig(errors::config::kInvalidValue, "Config section must be a mapping: backup");
  }
  for (const auto& entry : section) {
    const auto key = entry.first.as<std::string>();
    const auto& value = entry.second;
    if (key == "kdf_iterations") {
      config.kdf_iterations = ReadUnsigned<uint32_t>(value, key);
    } else if (key == "legacy_kdf_iterations") {
      config.legacy_kdf_iterations = ReadUnsigned<uint32_t>(value, key);
    } else if (key == "max_kdf_iterations") {
      config.max_kdf_iterations = ReadUnsigned<uint32_t>(value, key);
    } else if (key == "salt_bytes") {
      config.salt_bytes = ReadUnsigned<std::size_t>(value, key);
    } else if (key == "max_backup_bytes") {
      config.max_backup_bytes = ReadUnsigned<std::size_t>(value, key);
    } else if (key == "max_password_length") {
      config.max_password_length = ReadUnsigned<std::size_t>(value, key);
    } else if (key == "file_prefix") {
      config.file_prefix = ReadString(value, key);
    } else if (key == "file_extension") {
      config.file_extension = ReadString(value, key);
    } else {
      ThrowConfig(errors::config::kUnknownKey, "Unknown config key: backup." + key);
    }
  }
}

void ApplyLoggingSection(const YAML::Node& section, BackupConfig& config) {
  if (section.IsNull()) {
    return;
  }
  if (!section.IsMap()) {
    ThrowConfig(errors::config::kInvalidValue, "Config section must be a mapping: logging");
  }
  for (const auto& entry : section) {
    const auto key = entry.first.as<std::string>();
    if (key == "path") {
      config.log_path = ReadString(entry.second, key);
    } else if (key == "max_bytes") {
      config.log_max_bytes = ReadUnsigned<std::size_t>(entry.second, key);
    } else {
      ThrowConfig(errors::config::kUnknownKey, "Unknown config key: logging." + key);
    }
  }
}

BackupConfig FromDocument(const YAML::Node& root) {
  BackupConfig config;
  if (root.IsNull()) {
    return config;
  }
  if (!root.IsMap()) {
    ThrowConfig(errors::config::kInvalidValue, "Config document must be a mapping");
  }
  for (const auto& entry : root) {
    const auto key = entry.first.as<std::string>();
    if (key == "backup") {
      ApplyBackupSection(entry.second, config);
    } else if (key == "logging") {
      ApplyLoggingSection(entry.second, config);
    } else {
      ThrowConfig(errors::config::kUnknownKey, "Unknown config section: " + key);
    }
  }
  ValidateBackupConfig(config);
  return config;
}

}  // namespace

BackupConfig LoadBackupConfig(const std::filesystem::path& path) {
  YAML::Node root;
  try {
    root = YAML::LoadFile(PathToUtf8String(path));
  } catch (const YAML::Exception& e) {
    ThrowConfig(errors::config::kUnreadable,
                "Failed to load YAML config " + PathToUtf8String(path) + ": " + e.what());
  }
  return FromDocument(root);
}

BackupConfig ParseBackupConfig(const std::string& yaml_text) {
  YAML::Node root;
  try {
    root = YAML::Load(yaml_text);
  } catch (const YAML::Exception& e) {
    ThrowConfig(errors::config::kUnreadable, std::string("Failed to parse YAML config: ") + e.what());
  }
  return FromDocument(root);
}

void ValidateBackupConfig(const BackupConfig& config) {
  if (config.kdf_iterations == 0 || config.legacy_kdf_iterations == 0) {
    ThrowConfig(errors::config::kInvalidValue, "KDF iterations must be at least 1");
  }
  if (config.kdf_iterations > config.max_kdf_iterations ||
      config.legacy_kdf_iterations > config.max_kdf_iterations) {
    ThrowConfig(errors::config::kInvalidValue, "KDF iterations exceed max_kdf_iterations");
  }
  if (config.salt_bytes == 0 || config.max_backup_bytes == 0 || config.max_password_length == 0 ||
      config.log_max_bytes == 0) {
    ThrowConfig(errors::config::kInvalidValue, "Size limits must be non-zero");
  }
  if (config.file_prefix.empty() || config.file_extension.empty()) {
    ThrowConfig(errors::config::kInvalidValue, "Backup file naming must not be empty");
  }
}

}  // namespace pv::orchestrator
