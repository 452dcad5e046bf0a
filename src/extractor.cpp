#include <cerrno>
#include <cstring>
#include <format>
#include <fstream>

#include <lpakx/extractor.hpp>

namespace lpakx {

ExtractionReport Extractor::extract(const EntryTable &table,
                                    const ExtractionRequest &request) const {
  ExtractionReport report;

  std::error_code ec;
  std::filesystem::create_directories(request.destRoot, ec);
  if (ec) {
    throw IoError(IoError::Kind::Write, "",
                  std::format("Failed to create destination directory: {} ({})",
                              request.destRoot.string(), ec.message()));
  }

  for (const Entry &entry : selectEntries(table, request.pattern)) {
    std::filesystem::path destPath;
    try {
      destPath = resolveDestination(request.destRoot, entry.path);
    } catch (const IoError &e) {
      report.skipped.push_back({entry.path, SkippedEntry::Reason::UnsafePath, e.what()});
      continue;
    }

    if (entry.compressed) {
      report.skipped.push_back({entry.path, SkippedEntry::Reason::Compressed,
                                "compressed file not supported, skipping"});
      continue;
    }

    try {
      extractEntry(entry, destPath);
    } catch (const IoError &e) {
      throw IoError(e.kind(), e.entryPath(), e.what(), report.written);
    }

    ++report.written;
    report.writtenPaths.push_back(entry.path);
  }

  return report;
}

void Extractor::extractEntry(const Entry &entry, const std::filesystem::path &destPath) const {
  if (!bundle_.contains(entry)) {
    throw IoError(IoError::Kind::Read, entry.path,
                  std::format("Invalid file bounds for: {} (offset={}, size={}, bundleSize={})",
                              entry.path, entry.offset, entry.storedSize(), bundle_.size()));
  }
  auto fileData = bundle_.view(entry);

  // Create parent directories if needed
  if (destPath.has_parent_path()) {
    std::error_code ec;
    std::filesystem::create_directories(destPath.parent_path(), ec);
    if (ec) {
      throw IoError(IoError::Kind::Write, entry.path,
                    std::format("Failed to create directory for {}: {} ({})", entry.path,
                                destPath.parent_path().string(), ec.message()));
    }
  }

  std::ofstream out(destPath, std::ios::binary | std::ios::trunc);
  if (!out) {
    throw IoError(IoError::Kind::Write, entry.path,
                  std::format("Failed to create output file for {}: {} ({})", entry.path,
                              destPath.string(), std::strerror(errno)));
  }

  out.write(reinterpret_cast<const char *>(fileData.data()),
            static_cast<std::streamsize>(fileData.size()));
  out.close();
  if (!out) {
    throw IoError(IoError::Kind::Write, entry.path,
                  std::format("Failed to write to output file for {}: {} ({})", entry.path,
                              destPath.string(), std::strerror(errno)));
  }
}

std::filesystem::path Extractor::resolveDestination(const std::filesystem::path &root,
                                                    const std::string &path) {
  if (path.empty()) {
    throw IoError(IoError::Kind::UnsafePath, path, "Refusing to extract entry with empty path");
  }

  std::filesystem::path relative(path, std::filesystem::path::generic_format);
  if (relative.has_root_name() || relative.has_root_directory()) {
    throw IoError(IoError::Kind::UnsafePath, path,
                  std::format("Refusing to extract absolute path: {}", path));
  }

  std::filesystem::path normal = relative.lexically_normal();
  if (!normal.empty() && *normal.begin() == "..") {
    throw IoError(IoError::Kind::UnsafePath, path,
                  std::format("Refusing to extract path outside destination: {}", path));
  }
  if (normal.empty() || normal == "." || !normal.has_filename()) {
    throw IoError(IoError::Kind::UnsafePath, path,
                  std::format("Entry path does not name a file: {}", path));
  }

  return root / normal;
}

} // namespace lpakx
