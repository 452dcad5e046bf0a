#pragma once

#include <cstdint>
#include <filesystem>
#include <span>
#include <string>

namespace lpakx {

// RAII wrapper for a read-only memory-mapped file
class MappedFile {
public:
  MappedFile();
  ~MappedFile();

  // Delete copy, enable move
  MappedFile(const MappedFile &) = delete;
  MappedFile &operator=(const MappedFile &) = delete;
  MappedFile(MappedFile &&other) noexcept;
  MappedFile &operator=(MappedFile &&other) noexcept;

  // Open file for reading (memory-mapped)
  // An empty file opens successfully with an empty view
  bool openRead(const std::filesystem::path &path, std::string *outError = nullptr);

  std::span<const uint8_t> data() const {
    return std::span<const uint8_t>(static_cast<const uint8_t *>(data_), size_);
  }

  // Close mapping and file handle
  void close();

  bool isOpen() const;

  size_t size() const { return size_; }

private:
  void cleanup() noexcept;

#ifdef _WIN32
  void *fileHandle_ = nullptr;    // HANDLE on Windows
  void *mappingHandle_ = nullptr; // HANDLE on Windows
#else
  int fd_ = -1; // File descriptor on POSIX
#endif
  void *data_ = nullptr;
  size_t size_ = 0;
};

} // namespace lpakx
