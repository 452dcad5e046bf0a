#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace lpakx {

enum class ByteOrder { Little, Big };

// Bundle layouts, decided once from the header version
enum class Variant {
  Primary,           // Day of the Tentacle era (version < 1.5)
  UnsupportedSibling // Full Throttle and later
};

// Bundle header (40 bytes for the primary variant)
struct DirectoryHeader {
  ByteOrder byteOrder = ByteOrder::Little;
  float version = 0.0f;
  Variant variant = Variant::Primary;
  uint32_t indexOffset = 0;   // Unused by the reader
  uint32_t entriesOffset = 0; // Absolute
  uint32_t namesOffset = 0;   // Absolute
  uint32_t dataOffset = 0;    // Absolute, base for entry offsets
  uint32_t indexSize = 0;
  uint32_t entriesSize = 0;   // Bytes, entryRecordSize per entry
  uint32_t namesSize = 0;
  uint32_t dataSize = 0;

  static constexpr size_t headerSize = 40;
  static constexpr size_t entryRecordSize = 20;
  static constexpr size_t maxNameLength = 255;
  // High 16 bits of the version word; 0x3FC0 is 1.5f. Compared unsigned so that
  // negative and NaN versions also select the sibling layout
  static constexpr uint16_t firstSiblingVersionBits = 0x3FC0;

  size_t entryCount() const { return entriesSize / entryRecordSize; }
};

// File entry in the bundle
struct Entry {
  std::string path;            // Normalized to forward slashes
  uint64_t offset = 0;         // Absolute offset within the bundle
  uint32_t size = 0;           // Uncompressed size
  uint32_t compressedSize = 0;
  bool compressed = false;

  // Number of bytes the entry occupies inside the bundle
  uint64_t storedSize() const { return compressed ? compressedSize : size; }
};

using EntryTable = std::vector<Entry>;

// Filter and destination for one extraction run
struct ExtractionRequest {
  std::optional<std::string> pattern; // Absent matches everything
  std::filesystem::path destRoot = ".";
};

struct SkippedEntry {
  enum class Reason { UnsafePath, Compressed };

  std::string path;
  Reason reason = Reason::UnsafePath;
  std::string message;
};

struct ExtractionReport {
  size_t written = 0;
  std::vector<std::string> writtenPaths;
  std::vector<SkippedEntry> skipped;
};

// Exception for malformed or unsupported bundles
class FormatError : public std::runtime_error {
public:
  enum class Kind { BadSignature, UnsupportedVariant, Truncated };

  FormatError(Kind kind, const std::string &msg) : std::runtime_error(msg), kind_(kind) {}

  Kind kind() const noexcept { return kind_; }

private:
  Kind kind_;
};

// Exception for failures while materializing entries
class IoError : public std::runtime_error {
public:
  enum class Kind { UnsafePath, Write, Read };

  IoError(Kind kind, std::string entryPath, const std::string &msg, size_t written = 0)
      : std::runtime_error(msg), kind_(kind), entryPath_(std::move(entryPath)),
        written_(written) {}

  Kind kind() const noexcept { return kind_; }

  // Stored path of the entry being processed, empty for bundle-level failures
  const std::string &entryPath() const noexcept { return entryPath_; }

  // Files completely written before the failure
  size_t written() const noexcept { return written_; }

private:
  Kind kind_;
  std::string entryPath_;
  size_t written_;
};

const char *toString(FormatError::Kind kind) noexcept;
const char *toString(IoError::Kind kind) noexcept;

} // namespace lpakx
