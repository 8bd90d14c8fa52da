#include "pv/orchestrator/file_sink.h"

#include <string>
#include <system_error>
#include <utility>

#include "pv/common.h"
#include "pv/error.h"
#include "pv/errors.h"
#include "pv/orchestrator/io_util.h"

namespace pv::orchestrator {
namespace {

[[noreturn]] void ThrowStorage(std::string message, std::optional<int> native = std::nullopt) {
  throw Error(ErrorDomain::IO, errors::backup::kStorageFailure, std::move(message), native);
}

}  // namespace

LocalDirectorySink::LocalDirectorySink(std::filesystem::path directory, Chooser chooser,
                                       std::size_t max_read_bytes)
    : directory_(std::move(directory)), chooser_(std::move(chooser)),
      max_read_bytes_(max_read_bytes) {}

std::filesystem::path LocalDirectorySink::Write(std::span<const uint8_t> bytes,
                                                const std::string& file_name) {
  const std::filesystem::path name(file_name);
  if (file_name.empty() || name.has_parent_path() || name.filename() != name) {
    throw Error(ErrorDomain::Validation, errors::backup::kInvalidArgument,
                "Backup file name must not contain a directory");
  }
  std::error_code ec;
  std::filesystem::create_directories(directory_, ec);
  if (ec) {
    ThrowStorage(std::string(errors::msg::kStorageFailure) + ": " + ec.message(), ec.value());
  }
  auto target = directory_ / name;
  AtomicReplace(target, bytes);
  return target;
}

std::vector<uint8_t> LocalDirectorySink::Read(const std::filesystem::path& path) {
  return ReadFileLimited(path, max_read_bytes_);
}

void LocalDirectorySink::Share(const std::filesystem::path& path) {
  ThrowStorage(std::string(errors::msg::kSharingUnavailable) + ": " + PathToUtf8String(path));
}

std::optional<std::filesystem::path> LocalDirectorySink::Pick() {
  if (!chooser_) {
    return std::nullopt;
  }
  return chooser_();
}

}  // namespace pv::orchestrator
