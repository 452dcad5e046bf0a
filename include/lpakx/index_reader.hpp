#pragma once

#include <span>
#include <string>
#include <string_view>

#include "bundle.hpp"
#include "types.hpp"

namespace lpakx {

// Decodes the header and directory of an LPAK bundle
//
// Layout (all integers in the byte order chosen by the signature):
//   0   signature, "LPAK" (big-endian) or "KAPL" (little-endian)
//   4   version (float)
//   8   index start, entries start, names start, data start
//   24  index size, entries size, names size, data size
// Entry records are 20 bytes: data offset (relative to data start), name offset,
// size, compressed size, compressed flag. Names are NUL-terminated and stored in
// entry order.
class IndexReader {
public:
  // Read and validate the fixed header
  // Throws FormatError (BadSignature, Truncated)
  // A sibling-variant header is returned as-is with only the version decoded
  static DirectoryHeader readHeader(std::span<const uint8_t> data);

  // Parse the whole directory into an entry table
  // Throws FormatError; never returns a partial table
  static EntryTable parse(std::span<const uint8_t> data);

  static EntryTable parse(const Bundle &bundle) { return parse(bundle.bytes()); }

  // Convert backslashes to forward slashes
  static std::string normalizePath(std::string_view path);
};

} // namespace lpakx
