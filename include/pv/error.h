#pragma once
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace pv {
  enum class ErrorDomain : std::uint16_t {
    Security = 0x01,
    IO = 0x02,
    Crypto = 0x03,
    Validation = 0x04,
    Config = 0x05,
    Format = 0x06,
    State = 0x07,
    Internal = 0x7F
  };

  // Each domain reserves a span of codes so propagated errno values never
  // collide with framework codes. Codes inside a span are stable across
  // releases.
  inline constexpr int kErrorDomainSpan = 0x0100;

  inline constexpr int ErrorDomainBase(ErrorDomain domain) {
    switch (domain) {
    case ErrorDomain::Security:
      return 0x0100;
    case ErrorDomain::IO:
      return 0x0200;
    case ErrorDomain::Crypto:
      return 0x0300;
    case ErrorDomain::Validation:
      return 0x0400;
    case ErrorDomain::Config:
      return 0x0500;
    case ErrorDomain::Format:
      return 0x0600;
    case ErrorDomain::State:
      return 0x0700;
    case ErrorDomain::Internal:
      return 0x7F00;
    }
    return 0; // unreachable but placates compilers without warnings enabled
  }

  inline constexpr int ErrorDomainMax(ErrorDomain domain) {
    return ErrorDomainBase(domain) + kErrorDomainSpan - 1;
  }

  inline constexpr bool IsFrameworkErrorCode(ErrorDomain domain, int code) {
    return code >= ErrorDomainBase(domain) && code <= ErrorDomainMax(domain);
  }

  namespace errors {
    inline constexpr int Make(ErrorDomain domain, int offset) {
      return ErrorDomainBase(domain) + offset;
    }

    namespace backup {
      inline constexpr int kPasswordRequired = Make(ErrorDomain::Validation, 0x01);
      inline constexpr int kPasswordTooLong = Make(ErrorDomain::Validation, 0x02);
      inline constexpr int kNoRecordsToBackup = Make(ErrorDomain::Validation, 0x03);
      inline constexpr int kInvalidRecord = Make(ErrorDomain::Validation, 0x04);
      inline constexpr int kInvalidArgument = Make(ErrorDomain::Validation, 0x05);

      inline constexpr int kInvalidBackupOrPassword = Make(ErrorDomain::Format, 0x01);
      inline constexpr int kCorruptBackup = Make(ErrorDomain::Format, 0x02);
      inline constexpr int kUnsupportedVersion = Make(ErrorDomain::Format, 0x03);
      inline constexpr int kNoRecoverableRecords = Make(ErrorDomain::Format, 0x04);
      inline constexpr int kBackupTooLarge = Make(ErrorDomain::Format, 0x05);

      inline constexpr int kCryptoUnavailable = Make(ErrorDomain::Crypto, 0x01);
      inline constexpr int kInvalidKey = Make(ErrorDomain::Crypto, 0x02);

      inline constexpr int kStorageFailure = Make(ErrorDomain::IO, 0x01);
      inline constexpr int kCancelled = Make(ErrorDomain::State, 0x01);
      inline constexpr int kNotAuthorized = Make(ErrorDomain::Security, 0x01);
      inline constexpr int kInternal = Make(ErrorDomain::Internal, 0x01);
    } // namespace backup

    namespace config {
      inline constexpr int kUnreadable = Make(ErrorDomain::Config, 0x01);
      inline constexpr int kUnknownKey = Make(ErrorDomain::Config, 0x02);
      inline constexpr int kInvalidValue = Make(ErrorDomain::Config, 0x03);
    } // namespace config

  } // namespace errors

  struct Error : public std::runtime_error {
    ErrorDomain domain;
    int code;
    std::optional<int> native_code;
    std::vector<std::string> context;
    explicit Error(ErrorDomain d, int c, std::string msg,
                   std::optional<int> native = std::nullopt,
                   std::vector<std::string> ctx = {})
        : std::runtime_error(std::move(msg)),
          domain(d),
          code(c),
          native_code(native),
          context(std::move(ctx)) {}
  };
} // namespace pv
