#include "pv/orchestrator/backup_service.h"

#include <algorithm>
#include <cctype>
#include <exception>
#include <map>
#include <new>
#include <string>
#include <utility>

#include "pv/common.h"
#include "pv/errors.h"
#include "pv/model/record.h"
#include "pv/orchestrator/event_bus.h"

namespace pv::orchestrator {
namespace {

void PublishEvent(EventCategory category, EventSeverity severity, std::string_view event_id,
                  std::string message, std::vector<EventField> fields = {}) {
  Event event;
  event.category = category;
  event.severity = severity;
  event.event_id = std::string(event_id);
  event.message = std::move(message);
  event.fields = std::move(fields);
  EventBus::Instance().Publish(event);
}

EventField Number(std::string key, std::size_t value) {
  return EventField(std::move(key), std::to_string(value), FieldPrivacy::kPublic, true);
}

void PublishRejected(std::string_view operation, const BackupFailure& failure) {
  PublishEvent(EventCategory::kSecurity, EventSeverity::kWarning, events::kRejected,
               "Backup operation rejected",
               {EventField("operation", std::string(operation)), Number("code", failure.code),
                EventField("reason", failure.message)});
}

void PublishDecodeFailed(const BackupFailure& failure, std::string_view version) {
  PublishEvent(EventCategory::kDiagnostics, EventSeverity::kWarning, events::kDecodeFailed,
               "Backup could not be decoded",
               {EventField("format", std::string(version)), Number("code", failure.code),
                EventField("reason", failure.message)});
}

void PublishWarnings(const std::vector<std::string>& warnings) {
  for (std::size_t i = 0; i < warnings.size(); ++i) {
    PublishEvent(EventCategory::kDiagnostics, EventSeverity::kWarning, events::kMigrationWarning,
                 "Legacy backup migrated with loss",
                 {Number("index", i), EventField("warning", warnings[i], FieldPrivacy::kHash)});
  }
}

bool IsDecodeFailure(int code) {
  return code == errors::backup::kInvalidBackupOrPassword ||
         code == errors::backup::kCorruptBackup || code == errors::backup::kUnsupportedVersion ||
         code == errors::backup::kNoRecoverableRecords;
}

// Runs |fn| and converts anything thrown into a BackupFailure. Allocation
// failure is not recoverable here and keeps propagating.
template <typename T, typename Func>
Outcome<T> Guard(std::string_view operation, Func&& fn) {
  BackupFailure failure;
  try {
    return Outcome<T>(fn());
  } catch (const Error& error) {
    failure = ToFailure(error);
  } catch (const std::bad_alloc&) {
    throw;
  } catch (const std::exception& ex) {
    failure = BackupFailure{errors::backup::kInternal, ErrorDomain::Internal,
                            std::string(errors::msg::kInternal) + ": " + ex.what()};
  }
  if (!IsDecodeFailure(failure.code)) {
    PublishRejected(operation, failure);
  }
  return Outcome<T>(std::move(failure));
}

bool IsBlank(std::string_view text) {
  return std::all_of(text.begin(), text.end(),
                     [](unsigned char c) { return std::isspace(c) != 0; });
}

std::string TrimTrailing(std::string text, char c) {
  while (!text.empty() && text.back() == c) {
    text.pop_back();
  }
  return text;
}

}  // namespace

BackupFailure ToFailure(const Error& error) {
  return BackupFailure{error.code, error.domain, error.what()};
}

std::string_view UserMessageFor(int code) noexcept {
  namespace b = errors::backup;
  namespace m = errors::msg;
  switch (code) {
  case b::kPasswordRequired:
    return m::kPasswordRequired;
  case b::kPasswordTooLong:
    return m::kPasswordTooLong;
  case b::kNoRecordsToBackup:
    return m::kNoRecordsToBackup;
  case b::kInvalidBackupOrPassword:
    return m::kReenterPasswordPrompt;
  case b::kCorruptBackup:
    return m::kCorruptBackup;
  case b::kUnsupportedVersion:
    return m::kIncompatibleVersionNotice;
  case b::kNoRecoverableRecords:
    return m::kNoRecoverableRecords;
  case b::kBackupTooLarge:
    return m::kBackupTooLarge;
  case b::kCryptoUnavailable:
    return m::kCryptoUnavailable;
  case b::kStorageFailure:
    return m::kStorageFailure;
  case b::kCancelled:
    return m::kCancelled;
  case b::kNotAuthorized:
    return m::kNotAuthorized;
  default:
    return m::kInternal;
  }
}

BackupService::BackupService(RecordStore& store, AuthorizationGate& gate, BackupConfig config,
                             FileSink* sink)
    : store_(store), gate_(gate), config_(std::move(config)), sink_(sink),
      codec_(config_.CodecSettings()) {
  ValidateBackupConfig(config_);
  if (!config_.log_path.empty()) {
    EventBus::Instance().ConfigureFileLog(config_.log_path, config_.log_max_bytes);
  }
}

void BackupService::RequireAuthorization(std::string_view reason) {
  if (!gate_.Authorize(std::string(reason))) {
    throw Error(ErrorDomain::Security, errors::backup::kNotAuthorized,
                std::string(errors::msg::kNotAuthorized));
  }
}

void BackupService::RequirePassword(std::string_view password) const {
  if (password.empty() || IsBlank(password)) {
    throw Error(ErrorDomain::Validation, errors::backup::kPasswordRequired,
                std::string(errors::msg::kPasswordRequired));
  }
  if (model::Utf8Length(password) > config_.max_password_length) {
    throw Error(ErrorDomain::Validation, errors::backup::kPasswordTooLong,
                std::string(errors::msg::kPasswordTooLong));
  }
}

core::BackupEnvelope BackupService::BuildEnvelope(std::string_view password,
                                                  const CancellationToken* cancel) {
  RequireAuthorization(kBackupReason);
  RequirePassword(password);

  auto stored = store_.GetAll();
  if (stored.empty()) {
    throw Error(ErrorDomain::Validation, errors::backup::kNoRecordsToBackup,
                std::string(errors::msg::kNoRecordsToBackup));
  }
  std::vector<model::Record> records;
  records.reserve(stored.size());
  for (auto& [id, record] : stored) {
    records.push_back(std::move(record));
  }

  auto envelope = codec_.Encode(records, password, cancel);
  PublishEvent(EventCategory::kLifecycle, EventSeverity::kInfo, events::kBackupCreated,
               "Backup created",
               {Number("records", records.size()), EventField("format", envelope.format_version)});
  return envelope;
}

Outcome<core::BackupEnvelope> BackupService::CreateBackup(std::string_view password,
                                                          const CancellationToken* cancel) {
  return Guard<core::BackupEnvelope>("create", [&] { return BuildEnvelope(password, cancel); });
}

Outcome<RestoreResult> BackupService::RestoreBackup(const core::BackupEnvelope& envelope,
                                                    std::string_view password,
                                                    RestorePolicy policy,
                                                    const CancellationToken* cancel) {
  return Guard<RestoreResult>("restore", [&] {
    RequireAuthorization(kRestoreReason);
    RequirePassword(password);

    core::DecodedBackup decoded;
    try {
      decoded = codec_.Decode(envelope, password, cancel);
    } catch (const Error& error) {
      if (IsDecodeFailure(error.code)) {
        PublishDecodeFailed(ToFailure(error), envelope.format.label);
      }
      throw;
    }
    PublishWarnings(decoded.warnings);

    RestoreResult result;
    result.total_in_backup = decoded.records.size();
    result.warnings = std::move(decoded.warnings);
    result.backup_version = decoded.format_version;
    result.backup_timestamp = decoded.timestamp;

    const bool overwrite = policy.replace_all || policy.overwrite_existing;
    const auto existing = overwrite ? std::map<std::string, model::Record>{} : store_.GetAll();

    for (const auto& record : decoded.records) {
      if (!overwrite && existing.count(record.id) != 0) {
        ++result.skipped_count;
        continue;
      }
      std::string reason;
      try {
        if (store_.Put(record)) {
          ++result.restored_count;
          continue;
        }
        reason = std::string(errors::msg::kStoreRejectedRecord);
      } catch (const Error& error) {
        reason = error.what();
      } catch (const std::bad_alloc&) {
        throw;
      } catch (const std::exception& error) {
        reason = error.what();
      }
      PublishEvent(EventCategory::kDiagnostics, EventSeverity::kError,
                   events::kRestoreRecordFailed, "Record could not be restored",
                   {EventField("record", record.id, FieldPrivacy::kHash),
                    EventField("reason", reason)});
      result.failures.push_back(RecordFailure{record.id, std::move(reason)});
    }

    PublishEvent(EventCategory::kLifecycle, EventSeverity::kInfo, events::kRestoreCompleted,
                 "Restore completed",
                 {Number("restored", result.restored_count),
                  Number("skipped", result.skipped_count),
                  Number("failed", result.failures.size()),
                  Number("total", result.total_in_backup),
                  EventField("format", result.backup_version)});
    return result;
  });
}

std::string BackupService::BackupFileName(std::string_view timestamp) const {
  std::string stamp(timestamp);
  std::replace(stamp.begin(), stamp.end(), ':', '-');
  std::replace(stamp.begin(), stamp.end(), '.', '-');
  return config_.file_prefix + stamp + config_.file_extension;
}

Outcome<ExportResult> BackupService::ExportBackup(std::string_view password,
                                                  const CancellationToken* cancel) {
  return Guard<ExportResult>("export", [&] {
    if (sink_ == nullptr) {
      throw Error(ErrorDomain::IO, errors::backup::kStorageFailure,
                  std::string(errors::msg::kStorageFailure) + ": no file sink configured");
    }
    auto envelope = BuildEnvelope(password, cancel);
    const auto text = core::SerializeEnvelope(envelope);

    ExportResult result;
    result.file_name = BackupFileName(envelope.timestamp);
    result.timestamp = envelope.timestamp;
    result.record_count = envelope.record_count.value_or(0);
    result.path = sink_->Write(pv::AsBytes(text), result.file_name);

    PublishEvent(EventCategory::kLifecycle, EventSeverity::kInfo, events::kBackupExported,
                 "Backup exported",
                 {Number("records", result.record_count), Number("bytes", text.size()),
                  EventField("file", result.file_name)});
    return result;
  });
}

std::optional<BackupFailure> BackupService::ShareBackup(const std::filesystem::path& path) {
  auto outcome = Guard<bool>("share", [&] {
    if (sink_ == nullptr) {
      throw Error(ErrorDomain::IO, errors::backup::kStorageFailure,
                  std::string(errors::msg::kSharingUnavailable));
    }
    sink_->Share(path);
    return true;
  });
  if (outcome.ok()) {
    return std::nullopt;
  }
  return outcome.failure();
}

Outcome<std::filesystem::path> BackupService::PickBackupFile() {
  return Guard<std::filesystem::path>("pick", [&] {
    if (sink_ == nullptr) {
      throw Error(ErrorDomain::IO, errors::backup::kStorageFailure,
                  std::string(errors::msg::kStorageFailure) + ": no file sink configured");
    }
    auto picked = sink_->Pick();
    if (!picked) {
      throw Error(ErrorDomain::State, errors::backup::kCancelled,
                  std::string(errors::msg::kCancelled));
    }
    const auto name = PathToUtf8String(picked->filename());
    const auto marker = TrimTrailing(config_.file_prefix, '-');
    const bool has_marker = !marker.empty() && name.find(marker) != std::string::npos;
    const bool has_extension = name.size() >= config_.file_extension.size() &&
                               name.compare(name.size() - config_.file_extension.size(),
                                            config_.file_extension.size(),
                                            config_.file_extension) == 0;
    if (!has_marker && !has_extension) {
      throw Error(ErrorDomain::Format, errors::backup::kCorruptBackup,
                  std::string(errors::msg::kNotABackupFile));
    }
    return *picked;
  });
}

Outcome<core::BackupEnvelope> BackupService::ReadBackupFile(const std::filesystem::path& path) {
  return Guard<core::BackupEnvelope>("read", [&] {
    if (sink_ == nullptr) {
      throw Error(ErrorDomain::IO, errors::backup::kStorageFailure,
                  std::string(errors::msg::kStorageFailure) + ": no file sink configured");
    }
    const auto bytes = sink_->Read(path);
    if (bytes.size() > config_.max_backup_bytes) {
      throw Error(ErrorDomain::Format, errors::backup::kBackupTooLarge,
                  std::string(errors::msg::kBackupTooLarge));
    }
    return core::ParseEnvelope(
        std::string_view(reinterpret_cast<const char*>(bytes.data()), bytes.size()));
  });
}

Outcome<InspectResult> BackupService::InspectBackup(const core::BackupEnvelope& envelope,
                                                    std::string_view password,
                                                    const CancellationToken* cancel) {
  return Guard<InspectResult>("inspect", [&] {
    RequirePassword(password);
    core::DecodedBackup decoded;
    try {
      decoded = codec_.Decode(envelope, password, cancel);
    } catch (const Error& error) {
      if (IsDecodeFailure(error.code)) {
        PublishDecodeFailed(ToFailure(error), envelope.format.label);
      }
      throw;
    }
    InspectResult result;
    result.record_count = decoded.records.size();
    result.backup_version = decoded.format_version;
    result.backup_timestamp = decoded.timestamp;
    result.warnings = std::move(decoded.warnings);
    for (const auto& record : decoded.records) {
      result.record_names.push_back(record.name);
    }
    return result;
  });
}

std::future<Outcome<core::BackupEnvelope>>
BackupService::CreateBackupAsync(std::string password, std::shared_ptr<CancellationToken> cancel) {
  return std::async(std::launch::async,
                    [this, password = std::move(password), cancel = std::move(cancel)] {
                      return CreateBackup(password, cancel.get());
                    });
}

std::future<Outcome<RestoreResult>>
BackupService::RestoreBackupAsync(core::BackupEnvelope envelope, std::string password,
                                  RestorePolicy policy, std::shared_ptr<CancellationToken> cancel) {
  return std::async(std::launch::async,
                    [this, envelope = std::move(envelope), password = std::move(password), policy,
                     cancel = std::move(cancel)] {
                      return RestoreBackup(envelope, password, policy, cancel.get());
                    });
}

}  // namespace pv::orchestrator
