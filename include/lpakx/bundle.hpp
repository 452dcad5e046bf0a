#pragma once

#include <filesystem>
#include <span>
#include <string>

#include "mmap.hpp"
#include "types.hpp"

namespace lpakx {

// An opened bundle: read-only bytes of the whole container
// Owns no entries; IndexReader and Extractor read through it
class Bundle {
public:
  Bundle() = default;
  ~Bundle() = default;

  // Delete copy, enable move
  Bundle(const Bundle &) = delete;
  Bundle &operator=(const Bundle &) = delete;
  Bundle(Bundle &&) noexcept = default;
  Bundle &operator=(Bundle &&) noexcept = default;

  // Open bundle from file (memory-mapped)
  // Throws IoError (Kind::Read) if the file cannot be opened or mapped
  static Bundle open(const std::filesystem::path &path);

  std::span<const uint8_t> bytes() const { return mappedFile_.data(); }

  size_t size() const { return mappedFile_.size(); }

  const std::filesystem::path &path() const { return path_; }

  // Bytes of an entry's payload
  // Returns empty span if the entry's range lies outside the bundle
  std::span<const uint8_t> view(const Entry &entry) const;

  // Whether the entry's range lies inside the bundle
  bool contains(const Entry &entry) const;

  bool isOpen() const { return mappedFile_.isOpen(); }

  void close();

private:
  MappedFile mappedFile_;
  std::filesystem::path path_;
};

} // namespace lpakx
