#include <lpakx/bundle.hpp>

namespace lpakx {

Bundle Bundle::open(const std::filesystem::path &path) {
  Bundle bundle;
  std::string error;
  if (!bundle.mappedFile_.openRead(path, &error)) {
    throw IoError(IoError::Kind::Read, "", error);
  }
  bundle.path_ = path;
  return bundle;
}

bool Bundle::contains(const Entry &entry) const {
  uint64_t total = mappedFile_.size();
  return entry.offset <= total && entry.storedSize() <= total - entry.offset;
}

std::span<const uint8_t> Bundle::view(const Entry &entry) const {
  if (!contains(entry)) {
    return {};
  }
  return bytes().subspan(static_cast<size_t>(entry.offset),
                         static_cast<size_t>(entry.storedSize()));
}

void Bundle::close() {
  mappedFile_.close();
  path_.clear();
}

} // namespace lpakx
