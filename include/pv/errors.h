#pragma once

#include <string_view>

namespace pv::errors::msg {
// Central message catalog.
inline constexpr std::string_view kPasswordRequired{"Password is required for backup encryption"};
inline constexpr std::string_view kPasswordTooLong{"Password exceeds the maximum backup password length"};
inline constexpr std::string_view kNoRecordsToBackup{"No grids found to backup"};
inline constexpr std::string_view kNotAuthorized{"Authentication is required to proceed"};
inline constexpr std::string_view kInvalidBackupOrPassword{"Invalid password or corrupted backup file"};
inline constexpr std::string_view kCorruptBackup{"Backup file is damaged or not a PIN Vault backup"};
inline constexpr std::string_view kNotABackupFile{"Selected file does not appear to be a PIN Vault backup"};
inline constexpr std::string_view kUnsupportedVersion{"Unsupported backup version"};
inline constexpr std::string_view kNoRecoverableRecords{"No grids could be recovered from the backup"};
inline constexpr std::string_view kBackupTooLarge{"File is too large to process"};
inline constexpr std::string_view kCryptoUnavailable{"Platform cryptography is unavailable"};
inline constexpr std::string_view kInvalidKey{"Cipher key must not be empty"};
inline constexpr std::string_view kStorageFailure{"Unable to save data"};
inline constexpr std::string_view kCancelled{"File selection cancelled"};
inline constexpr std::string_view kSharingUnavailable{"Sharing is not available on this device"};
inline constexpr std::string_view kRecordCountMismatch{"Backup record count does not match its contents"};
inline constexpr std::string_view kIntegrityTagMismatch{"Backup integrity check failed"};
inline constexpr std::string_view kEnvelopeTruncated{"Backup envelope truncated"};
inline constexpr std::string_view kRequiredTlvMissing{"Required backup field missing"};
inline constexpr std::string_view kUnexpectedTlv{"Unexpected field in backup envelope"};
inline constexpr std::string_view kMissingHeader{"Not a valid PIN Vault backup file"};
inline constexpr std::string_view kInvalidBase64{"Backup body is not valid base64"};
inline constexpr std::string_view kInternal{"Unexpected backup failure"};
inline constexpr std::string_view kStoreRejectedRecord{"Record store rejected the record"};
inline constexpr std::string_view kKdfRoundsInvalid{"Key derivation rounds must be at least 1"};
inline constexpr std::string_view kKdfRoundsTooHigh{"Key derivation rounds exceed the configured ceiling"};

// User-facing guidance shown by the host UI.
inline constexpr std::string_view kReenterPasswordPrompt{
    "The backup could not be opened. Please re-enter the password and try again."};
inline constexpr std::string_view kIncompatibleVersionNotice{
    "This backup was created by an incompatible, probably newer, version of PIN Vault. "
    "Update the app and try again."};
}  // namespace pv::errors::msg
