#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "pv/crypto/sha256.h"

namespace pv::orchestrator {

  // Structured logging primitives
  enum class EventSeverity { kDebug, kInfo, kWarning, kError, kCritical };

  enum class EventCategory { kTelemetry, kLifecycle, kSecurity, kDiagnostics };

  enum class FieldPrivacy { kPublic, kRedact, kHash };

  struct EventField {
    std::string key;
    std::string value;
    FieldPrivacy privacy{FieldPrivacy::kPublic};
    bool numeric{false};

    EventField(std::string k, std::string v, FieldPrivacy p = FieldPrivacy::kPublic,
               bool is_numeric = false)
        : key(std::move(k)), value(std::move(v)), privacy(p), numeric(is_numeric) {}
  };

  struct Event {
    EventCategory category{EventCategory::kDiagnostics};
    EventSeverity severity{EventSeverity::kInfo};
    std::string event_id;
    std::string message;
    std::vector<EventField> fields;
  };

  // Event ids published by the backup service.
  namespace events {
    inline constexpr std::string_view kBackupCreated = "backup.created";
    inline constexpr std::string_view kBackupExported = "backup.exported";
    inline constexpr std::string_view kRestoreCompleted = "backup.restore.completed";
    inline constexpr std::string_view kRestoreRecordFailed = "backup.restore.record_failed";
    inline constexpr std::string_view kMigrationWarning = "backup.migration.warning";
    inline constexpr std::string_view kDecodeFailed = "backup.decode.failed";
    inline constexpr std::string_view kRejected = "backup.rejected";
  }  // namespace events

  inline std::string HashForTelemetry(std::string_view input) {
    if (input.empty()) {
      return "";
    }
    return pv::crypto::SHA256_HexDigest(input);
  }

  // Renders one event as a single-line JSON object. Redacted fields become
  // "[REDACTED]", hashed fields their SHA-256 hex digest.
  std::string BuildEventJson(const Event& event, const std::string& timestamp);

  // Appends one JSON object per line; rotates to <path>.1 .. <path>.3 when
  // the next line would push the file past |max_bytes|.
  class JsonLineLogger {
  public:
    JsonLineLogger(std::filesystem::path log_path, std::size_t max_bytes);
    void Log(const Event& event);

    const std::filesystem::path& path() const noexcept { return log_path_; }

  private:
    std::string FormatTimestamp(std::chrono::system_clock::time_point tp);
    void EnsureOpen();
    void RotateIfNeeded(size_t incoming_bytes);

    std::mutex mutex_;
    std::ofstream stream_;
    std::filesystem::path log_path_;
    size_t max_bytes_;
    const size_t max_files_ = 3;
  };

  class EventBus {
  public:
    using Subscriber = std::function<void(const Event&)>;

    static EventBus& Instance();

    void Publish(const Event& event);
    void Subscribe(Subscriber fn);

    // Routes every published event to a JSON-lines file. Replaces any file
    // logger configured earlier; an empty path turns file logging off.
    void ConfigureFileLog(const std::filesystem::path& path, std::size_t max_bytes);

    EventBus() = default;

  private:
    using SubscriberList = std::vector<Subscriber>;

    std::shared_ptr<const SubscriberList> subscribers_snapshot_;
    std::mutex subscribers_mutex_;
    std::mutex file_log_mutex_;
    std::shared_ptr<JsonLineLogger> file_logger_;
  };

  void ResetEventBusForTesting();

} // namespace pv::orchestrator
