#pragma once

#include <cstddef>
#include <filesystem>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "pv/cancellation.h"
#include "pv/core/backup_codec.h"
#include "pv/core/envelope.h"
#include "pv/error.h"
#include "pv/orchestrator/authorization_gate.h"
#include "pv/orchestrator/config.h"
#include "pv/orchestrator/file_sink.h"
#include "pv/orchestrator/record_store.h"

namespace pv::orchestrator {

inline constexpr std::string_view kBackupReason = "Back up your grids";
inline constexpr std::string_view kRestoreReason = "Restore your grids";

// Error value returned across the service boundary. |code| is one of
// pv::errors::backup::k*.
struct BackupFailure {
  int code{errors::backup::kInternal};
  ErrorDomain domain{ErrorDomain::Internal};
  std::string message;
};

template <typename T>
class Outcome {
public:
  Outcome(T value) : state_(std::move(value)) {}
  Outcome(BackupFailure failure) : state_(std::move(failure)) {}

  [[nodiscard]] bool ok() const noexcept { return std::holds_alternative<T>(state_); }
  explicit operator bool() const noexcept { return ok(); }

  T& value() { return std::get<T>(state_); }
  const T& value() const { return std::get<T>(state_); }
  const BackupFailure& failure() const { return std::get<BackupFailure>(state_); }

private:
  std::variant<T, BackupFailure> state_;
};

// replace_all implies overwrite semantics regardless of overwrite_existing.
struct RestorePolicy {
  bool replace_all{false};
  bool overwrite_existing{false};
};

struct RecordFailure {
  std::string id;
  std::string reason;
};

struct RestoreResult {
  std::size_t restored_count{0};
  std::size_t skipped_count{0};
  std::size_t total_in_backup{0};
  std::vector<std::string> warnings;
  std::vector<RecordFailure> failures;
  std::string backup_version;
  std::string backup_timestamp;
};

struct ExportResult {
  std::filesystem::path path;
  std::string file_name;
  std::string timestamp;
  std::size_t record_count{0};
};

struct InspectResult {
  std::size_t record_count{0};
  std::string backup_version;
  std::string backup_timestamp;
  std::vector<std::string> record_names;
  std::vector<std::string> warnings;
};

// Orchestrates backup and restore against the host's record store. Every
// public operation returns an Outcome; pv::Error never escapes. The service
// holds references only, so the store, gate and sink must outlive it and any
// future returned by the async variants.
class BackupService {
public:
  BackupService(RecordStore& store, AuthorizationGate& gate, BackupConfig config = {},
                FileSink* sink = nullptr);

  Outcome<core::BackupEnvelope> CreateBackup(std::string_view password,
                                             const CancellationToken* cancel = nullptr);
  Outcome<RestoreResult> RestoreBackup(const core::BackupEnvelope& envelope,
                                       std::string_view password, RestorePolicy policy,
                                       const CancellationToken* cancel = nullptr);

  Outcome<ExportResult> ExportBackup(std::string_view password,
                                     const CancellationToken* cancel = nullptr);
  std::optional<BackupFailure> ShareBackup(const std::filesystem::path& path);
  Outcome<std::filesystem::path> PickBackupFile();
  Outcome<core::BackupEnvelope> ReadBackupFile(const std::filesystem::path& path);
  Outcome<InspectResult> InspectBackup(const core::BackupEnvelope& envelope,
                                       std::string_view password,
                                       const CancellationToken* cancel = nullptr);

  // Run the operation on a separate thread. The task refers to this service,
  // its store and its gate, so all three must outlive the returned future.
  std::future<Outcome<core::BackupEnvelope>>
  CreateBackupAsync(std::string password, std::shared_ptr<CancellationToken> cancel = nullptr);
  std::future<Outcome<RestoreResult>>
  RestoreBackupAsync(core::BackupEnvelope envelope, std::string password, RestorePolicy policy,
                     std::shared_ptr<CancellationToken> cancel = nullptr);

  const BackupConfig& config() const noexcept { return config_; }

  // "pinvault-backup-2025-01-02T03-04-05-678Z.pvb" for the given timestamp.
  std::string BackupFileName(std::string_view timestamp) const;

private:
  void RequireAuthorization(std::string_view reason);
  void RequirePassword(std::string_view password) const;
  core::BackupEnvelope BuildEnvelope(std::string_view password, const CancellationToken* cancel);

  RecordStore& store_;
  AuthorizationGate& gate_;
  BackupConfig config_;
  FileSink* sink_;
  core::BackupCodec codec_;
};

BackupFailure ToFailure(const Error& error);

// Text the host shows for a failure code. InvalidBackupOrPassword asks for the
// password again; UnsupportedVersion points at an incompatible app version.
std::string_view UserMessageFor(int code) noexcept;

}  // namespace pv::orchestrator
