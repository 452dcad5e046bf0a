#pragma once

#include <filesystem>
#include <optional>
#include <ranges>
#include <string>

#include "bundle.hpp"
#include "glob.hpp"
#include "types.hpp"

namespace lpakx {

// Whether an entry is selected by an optional glob pattern (absent selects everything)
inline bool matches(const Entry &entry, const std::optional<std::string> &pattern) {
  return !pattern || globMatch(*pattern, entry.path);
}

// Lazy view of the entries selected by pattern, in table order
// The table must outlive the returned view
inline auto selectEntries(const EntryTable &table,
                          std::optional<std::string> pattern = std::nullopt) {
  return table | std::views::filter([pattern = std::move(pattern)](const Entry &entry) {
           return matches(entry, pattern);
         });
}

// Lazy view of the relative paths of the entries selected by pattern, in table order
inline auto listPaths(const EntryTable &table, std::optional<std::string> pattern = std::nullopt) {
  return selectEntries(table, std::move(pattern)) |
         std::views::transform([](const Entry &entry) -> const std::string & {
           return entry.path;
         });
}

// Copies selected entries out of a bundle into a destination directory
class Extractor {
public:
  explicit Extractor(const Bundle &bundle) : bundle_(bundle) {}

  // Extract every entry matching request.pattern under request.destRoot, in table order
  // Unsafe paths and compressed entries are skipped and listed in the report.
  // Throws IoError (Write, Read) on the first I/O failure; written() holds the
  // number of files completed before it.
  ExtractionReport extract(const EntryTable &table, const ExtractionRequest &request) const;

  // Copy one entry's bytes to destPath, creating parent directories and
  // overwriting an existing file
  // Throws IoError (Write, Read)
  void extractEntry(const Entry &entry, const std::filesystem::path &destPath) const;

  // Join a stored entry path under root
  // Throws IoError (UnsafePath) if the result would not name a file inside root
  static std::filesystem::path resolveDestination(const std::filesystem::path &root,
                                                  const std::string &path);

private:
  const Bundle &bundle_;
};

} // namespace lpakx
