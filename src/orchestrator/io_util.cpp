#include "pv/orchestrator/io_util.h"

#include "pv/common.h"
#include "pv/crypto/encoding.h"
#include "pv/crypto/random.h"
#include "pv/errors.h"

#include <array>
#include <cerrno>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <span>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>
#include <type_traits>
#include <vector>

#ifndef _WIN32
#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>
#else
#ifndef NOMINMAX
#define NOMINMAX
#endif
#define WIN32_LEAN_AND_MEAN
#include <Windows.h>
#include <fcntl.h>
#include <io.h>
#include <sys/stat.h>
#endif

namespace pv::orchestrator {
namespace {

constexpr const char* kAtomicReplaceErrorMessage = "Atomic file replace failed";

class ErrorContext {  // accumulate nested call context
 public:
  void Push(std::string context) { context_stack_.push_back(std::move(context)); }
  void Pop() {
    if (!context_stack_.empty()) {
      context_stack_.pop_back();
    }
  }
  [[nodiscard]] std::vector<std::string> Stack() const { return context_stack_; }
  [[nodiscard]] std::string Format(std::string_view message) const {
    std::ostringstream oss;
    oss << message;
    for (auto it = context_stack_.rbegin(); it != context_stack_.rend(); ++it) {
      oss << "\n  while: " << *it;
    }
    return oss.str();
  }

 private:
  std::vector<std::string> context_stack_;
};

class ScopedErrorContext {
 public:
  ScopedErrorContext(ErrorContext& ctx, std::string description) : ctx_(ctx) {
    ctx_.Push(std::move(description));
  }
  ScopedErrorContext(const ScopedErrorContext&) = delete;
  ScopedErrorContext& operator=(const ScopedErrorContext&) = delete;
  ~ScopedErrorContext() { ctx_.Pop(); }

 private:
  ErrorContext& ctx_;
};

[[noreturn]] void ThrowIoError(const ErrorContext& ctx, std::string message,
                               std::optional<int> native = std::nullopt) {
  throw Error{ErrorDomain::IO, errors::backup::kStorageFailure, ctx.Format(std::move(message)),
              native, ctx.Stack()};
}

[[noreturn]] void RethrowSystemError(const std::system_error& sys_err, const ErrorContext& ctx) {
  throw Error{ErrorDomain::IO, errors::backup::kStorageFailure, ctx.Format(sys_err.what()),
              sys_err.code().value(), ctx.Stack()};
}

template <typename Func>
auto WithContext(ErrorContext& ctx, std::string description, Func&& fn)
    -> std::invoke_result_t<Func&> {
  ScopedErrorContext scoped(ctx, std::move(description));
  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Func&>>) {
      fn();
      return;
    } else {
      return fn();
    }
  } catch (const std::filesystem::filesystem_error& fs_err) {
    throw Error{ErrorDomain::IO, errors::backup::kStorageFailure, ctx.Format(fs_err.what()),
                fs_err.code().value(), ctx.Stack()};
  } catch (const std::system_error& sys_err) {
    RethrowSystemError(sys_err, ctx);
  }
}

#ifdef _WIN32
int NativeOpen(const std::filesystem::path& path) {
  return _wopen(path.wstring().c_str(),
                _O_CREAT | _O_WRONLY | _O_TRUNC | _O_BINARY | _O_SEQUENTIAL,
                _S_IREAD | _S_IWRITE);
}

int NativeClose(int fd) { return _close(fd); }

// _commit flushes file contents; metadata durability relies on the rename.
int NativeFsync(int fd) { return _commit(fd); }

int NativeWrite(int fd, const uint8_t* data, size_t size) {
  return _write(fd, data, static_cast<unsigned int>(size));
}

bool NativeRename(const std::filesystem::path& from, const std::filesystem::path& to) {
  return ::MoveFileExW(from.wstring().c_str(), to.wstring().c_str(),
                       MOVEFILE_REPLACE_EXISTING | MOVEFILE_WRITE_THROUGH) != 0;
}

void SyncDirectory(const std::filesystem::path&, ErrorContext&) {}

#else

int NativeOpen(const std::filesystem::path& path) {
  return ::open(path.c_str(), O_CREAT | O_WRONLY | O_TRUNC | O_CLOEXEC, 0600);
}

int NativeClose(int fd) { return ::close(fd); }

int NativeFsync(int fd) { return ::fsync(fd); }

ssize_t NativeWrite(int fd, const uint8_t* data, size_t size) {
  return ::write(fd, data, size);
}

bool NativeRename(const std::filesystem::path& from, const std::filesystem::path& to) {
  return ::rename(from.c_str(), to.c_str()) == 0;
}

void SyncDirectory(const std::filesystem::path& dir, ErrorContext& ctx) {
  int dir_fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY);
  if (dir_fd < 0) {
    const int saved_errno = errno;
    ThrowIoError(ctx, std::string(kAtomicReplaceErrorMessage) + ": open directory failed",
                 saved_errno);
  }
  if (::fsync(dir_fd) != 0) {
    const int err = errno;
    ::close(dir_fd);
    ThrowIoError(ctx, std::string(kAtomicReplaceErrorMessage) + ": directory flush failed", err);
  }
  ::close(dir_fd);
}

#endif

bool IsTransientFsyncError(int err) {
  return err == EINTR || err == EAGAIN
#ifdef EBUSY
         || err == EBUSY
#endif
      ;
}

void SyncFileWithRetry(int fd, ErrorContext& ctx) {
  constexpr int kMaxRetries = 4;
  std::chrono::milliseconds backoff{5};
  for (int attempt = 0;; ++attempt) {
    if (NativeFsync(fd) == 0) {
      return;
    }
    const int saved_errno = errno;
    if (saved_errno == EINTR) {
      continue;
    }
    if (attempt >= kMaxRetries || !IsTransientFsyncError(saved_errno)) {
      ThrowIoError(ctx, std::string(kAtomicReplaceErrorMessage) + ": fsync failed", saved_errno);
    }
    std::this_thread::sleep_for(backoff);
    backoff *= 2;
  }
}

void WriteAll(int fd, std::span<const uint8_t> payload, ErrorContext& ctx) {
  size_t written = 0;
  while (written < payload.size()) {
    auto chunk = NativeWrite(fd, payload.data() + written, payload.size() - written);
    if (chunk < 0) {
      const int saved_errno = errno;
      if (saved_errno == EINTR) {
        continue;
      }
      ThrowIoError(ctx, std::string(kAtomicReplaceErrorMessage) + ": write failed", saved_errno);
    }
    if (chunk == 0) {
      ThrowIoError(ctx, std::string(kAtomicReplaceErrorMessage) + ": short write");
    }
    written += static_cast<size_t>(chunk);
  }
}

class TempFileGuard {  // removes the temporary file unless released
 public:
  explicit TempFileGuard(std::filesystem::path path) noexcept : path_(std::move(path)) {}
  TempFileGuard(const TempFileGuard&) = delete;
  TempFileGuard& operator=(const TempFileGuard&) = delete;
  ~TempFileGuard() noexcept {
    if (!path_.empty()) {
      std::error_code ec;
      if (!std::filesystem::remove(path_, ec) && ec) {
        std::cerr << "TempFileGuard cleanup failed for " << path_ << ": " << ec.message()
                  << '\n';
      }
    }
  }

  void Release() noexcept { path_.clear(); }

 private:
  std::filesystem::path path_;
};

std::filesystem::path MakeTempPath(const std::filesystem::path& dir,
                                   const std::filesystem::path& base) {
  std::array<uint8_t, 16> random{};
  pv::crypto::SystemRandomBytes(std::span<uint8_t>(random.data(), random.size()));
  std::filesystem::path temp_name = base.filename();
  temp_name += ".tmp.";
  temp_name += pv::crypto::HexEncode(std::span<const uint8_t>(random.data(), random.size()));
  return dir / temp_name;
}

}  // namespace

void AtomicReplace(const std::filesystem::path& target, std::span<const uint8_t> payload,
                   const AtomicReplaceHooks& hooks) {
  ErrorContext ctx;
  const std::string target_utf8 = target.empty() ? std::string("<empty>") : pv::PathToUtf8String(target);
  ScopedErrorContext root(ctx, "atomic replace target=" + target_utf8);

  if (target.empty()) {
    throw Error{ErrorDomain::Validation, errors::backup::kInvalidArgument,
                ctx.Format("Target path required"), std::nullopt, ctx.Stack()};
  }

  auto dir = target.parent_path();
  if (dir.empty()) {
    dir = WithContext(ctx, "resolving current working directory", [] {
      return std::filesystem::current_path();
    });
  }

  auto temp_path = MakeTempPath(dir, target);
  TempFileGuard cleanup(temp_path);

  int fd = WithContext(ctx, "opening temporary payload file", [&]() {
    int handle = NativeOpen(temp_path);
    if (handle < 0) {
      const int saved_errno = errno;
      ThrowIoError(ctx, std::string(kAtomicReplaceErrorMessage) + ": open failed", saved_errno);
    }
    return handle;
  });

  try {
    WithContext(ctx, "writing payload", [&] { WriteAll(fd, payload, ctx); });
    WithContext(ctx, "syncing payload", [&] { SyncFileWithRetry(fd, ctx); });
  } catch (const Error&) {
    NativeClose(fd);
    throw;
  }

  WithContext(ctx, "closing temporary payload file", [&] {
    if (NativeClose(fd) != 0) {
      const int saved_errno = errno;
      ThrowIoError(ctx, std::string(kAtomicReplaceErrorMessage) + ": close failed", saved_errno);
    }
  });

  if (hooks.before_rename) {
    WithContext(ctx, "executing before_rename hook", [&] { hooks.before_rename(temp_path, target); });
  }

  WithContext(ctx, "renaming temporary file into place", [&] {
    if (!NativeRename(temp_path, target)) {
      const int err = errno;
      ThrowIoError(ctx, std::string(kAtomicReplaceErrorMessage) + ": rename failed", err);
    }
  });
  cleanup.Release();

  WithContext(ctx, "syncing directory metadata", [&] { SyncDirectory(dir, ctx); });
}

std::vector<uint8_t> ReadFileLimited(const std::filesystem::path& path, std::size_t max_bytes) {
  ErrorContext ctx;
  ScopedErrorContext root(ctx, "read file " + pv::PathToUtf8String(path));

  std::error_code ec;
  const auto size = std::filesystem::file_size(path, ec);
  if (ec) {
    ThrowIoError(ctx, "Unable to stat file: " + ec.message(), ec.value());
  }
  if (size > max_bytes) {
    throw Error{ErrorDomain::Format, errors::backup::kBackupTooLarge,
                std::string(errors::msg::kBackupTooLarge), std::nullopt, ctx.Stack()};
  }

  std::ifstream in(path, std::ios::binary);
  if (!in) {
    ThrowIoError(ctx, "Unable to open file", errno);
  }
  std::vector<uint8_t> data(static_cast<std::size_t>(size));
  if (!data.empty()) {
    in.read(reinterpret_cast<char*>(data.data()), static_cast<std::streamsize>(data.size()));
    if (in.gcount() != static_cast<std::streamsize>(data.size())) {
      ThrowIoError(ctx, "Short read");
    }
  }
  return data;
}

}  // namespace pv::orchestrator
