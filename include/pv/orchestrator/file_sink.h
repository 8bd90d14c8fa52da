#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace pv::orchestrator {

// Where backup files go and come from. Failures are thrown as IO-domain
// pv::Error.
class FileSink {
public:
  virtual ~FileSink() = default;

  virtual std::filesystem::path Write(std::span<const uint8_t> bytes,
                                      const std::string& file_name) = 0;
  virtual std::vector<uint8_t> Read(const std::filesystem::path& path) = 0;
  virtual void Share(const std::filesystem::path& path) = 0;
  // nullopt when the user dismissed the picker.
  virtual std::optional<std::filesystem::path> Pick() = 0;
};

// Writes backups atomically into one directory. Picking is delegated to a
// chooser supplied by the host; sharing is not available.
class LocalDirectorySink : public FileSink {
public:
  using Chooser = std::function<std::optional<std::filesystem::path>()>;

  explicit LocalDirectorySink(std::filesystem::path directory, Chooser chooser = {},
                              std::size_t max_read_bytes = 10u * 1024u * 1024u);

  std::filesystem::path Write(std::span<const uint8_t> bytes,
                              const std::string& file_name) override;
  std::vector<uint8_t> Read(const std::filesystem::path& path) override;
  void Share(const std::filesystem::path& path) override;
  std::optional<std::filesystem::path> Pick() override;

  const std::filesystem::path& directory() const noexcept { return directory_; }

private:
  std::filesystem::path directory_;
  Chooser chooser_;
  std::size_t max_read_bytes_;
};

}  // namespace pv::orchestrator
