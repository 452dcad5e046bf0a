#include <cstring>
#include <format>

#include <lpakx/mmap.hpp>

#ifdef _WIN32
#include <windows.h>
#else
#include <cerrno>

#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>
#endif

namespace lpakx {

MappedFile::MappedFile() = default;

MappedFile::~MappedFile() {
  close();
}

MappedFile::MappedFile(MappedFile &&other) noexcept
    :
#ifdef _WIN32
      fileHandle_(other.fileHandle_), mappingHandle_(other.mappingHandle_),
#else
      fd_(other.fd_),
#endif
      data_(other.data_), size_(other.size_) {
#ifdef _WIN32
  other.fileHandle_ = nullptr;
  other.mappingHandle_ = nullptr;
#else
  other.fd_ = -1;
#endif
  other.data_ = nullptr;
  other.size_ = 0;
}

MappedFile &MappedFile::operator=(MappedFile &&other) noexcept {
  if (this != &other) {
    close();

#ifdef _WIN32
    fileHandle_ = other.fileHandle_;
    mappingHandle_ = other.mappingHandle_;
    other.fileHandle_ = nullptr;
    other.mappingHandle_ = nullptr;
#else
    fd_ = other.fd_;
    other.fd_ = -1;
#endif
    data_ = other.data_;
    size_ = other.size_;
    other.data_ = nullptr;
    other.size_ = 0;
  }
  return *this;
}

bool MappedFile::openRead(const std::filesystem::path &path, std::string *outError) {
  close();

#ifdef _WIN32
  fileHandle_ = CreateFileW(path.c_str(), GENERIC_READ, FILE_SHARE_READ, nullptr, OPEN_EXISTING,
                            FILE_ATTRIBUTE_NORMAL, nullptr);

  if (fileHandle_ == INVALID_HANDLE_VALUE) {
    fileHandle_ = nullptr;
    if (outError) {
      *outError = std::format("Failed to open file for reading: {} (error: {})", path.string(),
                              GetLastError());
    }
    return false;
  }

  LARGE_INTEGER fileSize;
  if (!GetFileSizeEx(static_cast<HANDLE>(fileHandle_), &fileSize)) {
    if (outError) {
      *outError = std::format("Failed to get file size: {}", path.string());
    }
    close();
    return false;
  }

  size_ = static_cast<size_t>(fileSize.QuadPart);
  if (size_ == 0) {
    // Zero-length files cannot be mapped
    return true;
  }

  mappingHandle_ =
      CreateFileMappingW(static_cast<HANDLE>(fileHandle_), nullptr, PAGE_READONLY, 0, 0, nullptr);

  if (!mappingHandle_) {
    if (outError) {
      *outError = std::format("Failed to create file mapping: {}", path.string());
    }
    close();
    return false;
  }

  data_ = MapViewOfFile(static_cast<HANDLE>(mappingHandle_), FILE_MAP_READ, 0, 0, 0);

  if (!data_) {
    if (outError) {
      *outError = std::format("Failed to map view of file: {}", path.string());
    }
    close();
    return false;
  }

  return true;

#else
  // POSIX implementation (Linux, macOS)
  fd_ = ::open(path.string().c_str(), O_RDONLY);
  if (fd_ < 0) {
    if (outError) {
      *outError =
          std::format("Failed to open file for reading: {} ({})", path.string(), std::strerror(errno));
    }
    return false;
  }

  struct stat st;
  if (fstat(fd_, &st) < 0) {
    if (outError) {
      *outError =
          std::format("Failed to get file size: {} ({})", path.string(), std::strerror(errno));
    }
    close();
    return false;
  }

  if (!S_ISREG(st.st_mode)) {
    if (outError) {
      *outError = std::format("Not a regular file: {}", path.string());
    }
    close();
    return false;
  }

  size_ = static_cast<size_t>(st.st_size);
  if (size_ == 0) {
    // mmap rejects zero-length mappings
    return true;
  }

  data_ = mmap(nullptr, size_, PROT_READ, MAP_PRIVATE, fd_, 0);
  if (data_ == MAP_FAILED) {
    data_ = nullptr;
    if (outError) {
      *outError = std::format("Failed to map file: {} ({})", path.string(), std::strerror(errno));
    }
    close();
    return false;
  }

  return true;
#endif
}

void MappedFile::close() {
  cleanup();
}

bool MappedFile::isOpen() const {
#ifdef _WIN32
  return fileHandle_ != nullptr;
#else
  return fd_ >= 0;
#endif
}

void MappedFile::cleanup() noexcept {
  if (data_) {
#ifdef _WIN32
    UnmapViewOfFile(data_);
#else
    munmap(data_, size_);
#endif
    data_ = nullptr;
  }

#ifdef _WIN32
  if (mappingHandle_) {
    CloseHandle(static_cast<HANDLE>(mappingHandle_));
    mappingHandle_ = nullptr;
  }
  if (fileHandle_) {
    CloseHandle(static_cast<HANDLE>(fileHandle_));
    fileHandle_ = nullptr;
  }
#else
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
#endif

  size_ = 0;
}

} // namespace lpakx
