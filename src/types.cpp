#include <lpakx/types.hpp>

namespace lpakx {

const char *toString(FormatError::Kind kind) noexcept {
  switch (kind) {
  case FormatError::Kind::BadSignature:
    return "bad signature";
  case FormatError::Kind::UnsupportedVariant:
    return "unsupported variant";
  case FormatError::Kind::Truncated:
    return "truncated";
  }
  return "unknown";
}

const char *toString(IoError::Kind kind) noexcept {
  switch (kind) {
  case IoError::Kind::UnsafePath:
    return "unsafe path";
  case IoError::Kind::Write:
    return "write error";
  case IoError::Kind::Read:
    return "read error";
  }
  return "unknown";
}

} // namespace lpakx
