#include "pv/orchestrator/config.h"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

#include "pv/error.h"

namespace {

int ParseCode(const std::string& yaml) {
  try {
    (void)pv::orchestrator::ParseBackupConfig(yaml);
  } catch (const pv::Error& err) {
    assert(err.domain == pv::ErrorDomain::Config);
    return err.code;
  }
  return 0;
}

}  // namespace

int main() {
  using pv::orchestrator::BackupConfig;

  const BackupConfig defaults;
  assert(defaults.kdf_iterations == 10000);
  assert(defaults.legacy_kdf_iterations == 10000);
  assert(defaults.max_kdf_iterations == 1000000);
  assert(defaults.salt_bytes == 16);
  assert(defaults.max_backup_bytes == 10u * 1024u * 1024u);
  assert(defaults.max_password_length == 128);
  assert(defaults.file_prefix == "pinvault-backup-");
  assert(defaults.file_extension == ".pvb");
  assert(defaults.log_path.empty());
  assert(defaults.log_max_bytes == 1024u * 1024u);

  auto empty = pv::orchestrator::ParseBackupConfig("");
  assert(empty.kdf_iterations == defaults.kdf_iterations);

  const auto path = std::filesystem::temp_directory_path() / "pv_config_test.yaml";
  {
    std::ofstream out(path, std::ios::trunc);
    out << "backup:\n"
           "  kdf_iterations: 200000\n"
           "  salt_bytes: 32\n"
           "  file_prefix: vault-\n"
           "logging:\n"
           "  path: /tmp/pv-backup.jsonl\n"
           "  max_bytes: 4096\n";
  }
  auto loaded = pv::orchestrator::LoadBackupConfig(path);
  assert(loaded.kdf_iterations == 200000);
  assert(loaded.legacy_kdf_iterations == 10000);
  assert(loaded.salt_bytes == 32);
  assert(loaded.file_prefix == "vault-");
  assert(loaded.file_extension == ".pvb");
  assert(loaded.log_path == std::filesystem::path("/tmp/pv-backup.jsonl"));
  assert(loaded.log_max_bytes == 4096);
  const auto settings = loaded.CodecSettings();
  assert(settings.kdf_iterations == 200000 && settings.salt_bytes == 32);
  std::filesystem::remove(path);

  namespace cfg = pv::errors::config;
  assert(ParseCode("backup:\n  kdf_rounds: 5\n") == cfg::kUnknownKey);
  assert(ParseCode("telemetry:\n  enabled: true\n") == cfg::kUnknownKey);
  assert(ParseCode("logging:\n  level: debug\n") == cfg::kUnknownKey);
  assert(ParseCode("backup:\n  kdf_iterations: 0\n") == cfg::kInvalidValue);
  assert(ParseCode("backup:\n  salt_bytes: lots\n") == cfg::kInvalidValue);
  assert(ParseCode("backup:\n  kdf_iterations: 2000000\n") == cfg::kInvalidValue);
  assert(ParseCode("backup:\n  max_kdf_iterations: 5000\n") == cfg::kInvalidValue);
  assert(pv::orchestrator::ParseBackupConfig("backup:\n  max_kdf_iterations: 20000\n")
             .CodecSettings()
             .max_kdf_iterations == 20000);
  assert(ParseCode("backup:\n  max_backup_bytes: -1\n") == cfg::kInvalidValue);
  assert(ParseCode("backup:\n  file_extension: \"\"\n") == cfg::kInvalidValue);
  assert(ParseCode("backup: [1, 2]\n") == cfg::kInvalidValue);
  assert(ParseCode("backup: {kdf_iterations: [\n") == cfg::kUnreadable);

  bool threw = false;
  try {
    (void)pv::orchestrator::LoadBackupConfig(std::filesystem::temp_directory_path() /
                                            "pv_config_missing.yaml");
  } catch (const pv::Error& err) {
    threw = err.code == cfg::kUnreadable;
  }
  assert(threw);

  std::cout << "config tests ok\n";
  return 0;
}
