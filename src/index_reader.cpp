#include <algorithm>
#include <bit>
#include <cstring>
#include <format>

#include <lpakx/endian.hpp>
#include <lpakx/index_reader.hpp>

namespace lpakx {

namespace {

constexpr size_t signatureSize = 4;
constexpr size_t versionEnd = 8;

// Header field positions
constexpr size_t indexOffsetPos = 8;
constexpr size_t entriesOffsetPos = 12;
constexpr size_t namesOffsetPos = 16;
constexpr size_t dataOffsetPos = 20;
constexpr size_t indexSizePos = 24;
constexpr size_t entriesSizePos = 28;
constexpr size_t namesSizePos = 32;
constexpr size_t dataSizePos = 36;

// Entry record field positions
constexpr size_t recordOffsetPos = 0;
constexpr size_t recordSizePos = 8;
constexpr size_t recordCompressedSizePos = 12;
constexpr size_t recordCompressedPos = 16;

std::string printableSignature(std::span<const uint8_t> data) {
  std::string result;
  for (size_t i = 0; i < signatureSize && i < data.size(); ++i) {
    char c = static_cast<char>(data[i]);
    if (c >= 0x20 && c < 0x7f) {
      result += c;
    } else {
      result += std::format("\\x{:02x}", data[i]);
    }
  }
  return result;
}

} // namespace

DirectoryHeader IndexReader::readHeader(std::span<const uint8_t> data) {
  if (data.size() < signatureSize) {
    throw FormatError(FormatError::Kind::BadSignature,
                      std::format("File too small to be an LPAK bundle (size: {})", data.size()));
  }

  DirectoryHeader header;
  if (std::memcmp(data.data(), "LPAK", signatureSize) == 0) {
    header.byteOrder = ByteOrder::Big;
  } else if (std::memcmp(data.data(), "KAPL", signatureSize) == 0) {
    header.byteOrder = ByteOrder::Little;
  } else {
    throw FormatError(FormatError::Kind::BadSignature,
                      std::format("Invalid bundle signature (expected 'LPAK' or 'KAPL', got '{}')",
                                  printableSignature(data)));
  }

  if (data.size() < versionEnd) {
    throw FormatError(FormatError::Kind::Truncated,
                      std::format("Header truncated before version field (size: {})", data.size()));
  }

  const uint32_t versionBits = loadU32(data.data() + signatureSize, header.byteOrder);
  header.version = std::bit_cast<float>(versionBits);
  if ((versionBits >> 16) >= DirectoryHeader::firstSiblingVersionBits) {
    header.variant = Variant::UnsupportedSibling;
    return header;
  }

  if (data.size() < DirectoryHeader::headerSize) {
    throw FormatError(FormatError::Kind::Truncated,
                      std::format("Header truncated (size: {}, expected at least {})", data.size(),
                                  DirectoryHeader::headerSize));
  }

  const uint8_t *base = data.data();
  header.indexOffset = loadU32(base + indexOffsetPos, header.byteOrder);
  header.entriesOffset = loadU32(base + entriesOffsetPos, header.byteOrder);
  header.namesOffset = loadU32(base + namesOffsetPos, header.byteOrder);
  header.dataOffset = loadU32(base + dataOffsetPos, header.byteOrder);
  header.indexSize = loadU32(base + indexSizePos, header.byteOrder);
  header.entriesSize = loadU32(base + entriesSizePos, header.byteOrder);
  header.namesSize = loadU32(base + namesSizePos, header.byteOrder);
  header.dataSize = loadU32(base + dataSizePos, header.byteOrder);

  return header;
}

EntryTable IndexReader::parse(std::span<const uint8_t> data) {
  DirectoryHeader header = readHeader(data);

  if (header.variant == Variant::UnsupportedSibling) {
    throw FormatError(FormatError::Kind::UnsupportedVariant,
                      std::format("Bundle version {} (Full Throttle or later format) is not "
                                  "supported",
                                  header.version));
  }

  const uint64_t total = data.size();
  const uint64_t entriesEnd = uint64_t{header.entriesOffset} + header.entriesSize;
  if (entriesEnd > total) {
    throw FormatError(
        FormatError::Kind::Truncated,
        std::format("File entry table extends beyond file bounds (start={}, size={}, fileSize={})",
                    header.entriesOffset, header.entriesSize, total));
  }

  const uint64_t namesEnd = uint64_t{header.namesOffset} + header.namesSize;
  if (namesEnd > total) {
    throw FormatError(
        FormatError::Kind::Truncated,
        std::format("File name table extends beyond file bounds (start={}, size={}, fileSize={})",
                    header.namesOffset, header.namesSize, total));
  }

  const size_t count = header.entryCount();
  EntryTable table;
  table.reserve(count);

  uint64_t namePos = header.namesOffset;
  for (size_t i = 0; i < count; ++i) {
    const uint8_t *record = data.data() + header.entriesOffset + i * DirectoryHeader::entryRecordSize;

    // Names are packed in entry order; the record's own name offset is not trusted
    if (namePos >= namesEnd) {
      throw FormatError(FormatError::Kind::Truncated,
                        std::format("File entry {} name starts beyond name table (offset={}, "
                                    "tableEnd={})",
                                    i, namePos, namesEnd));
    }
    const char *nameStart = reinterpret_cast<const char *>(data.data() + namePos);
    const size_t available = static_cast<size_t>(namesEnd - namePos);
    const size_t limit = std::min(available, DirectoryHeader::maxNameLength + 1);
    const void *terminator = std::memchr(nameStart, '\0', limit);
    if (!terminator) {
      throw FormatError(FormatError::Kind::Truncated,
                        std::format("File entry {} has name unterminated within name table or longer than {} "
                                    "bytes (offset={})",
                                    i, DirectoryHeader::maxNameLength, namePos));
    }
    const auto nameLen = static_cast<size_t>(static_cast<const char *>(terminator) - nameStart);
    namePos += nameLen + 1;

    Entry entry;
    entry.path = normalizePath(std::string_view(nameStart, nameLen));
    entry.offset = uint64_t{header.dataOffset} + loadU32(record + recordOffsetPos, header.byteOrder);
    entry.size = loadU32(record + recordSizePos, header.byteOrder);
    entry.compressedSize = loadU32(record + recordCompressedSizePos, header.byteOrder);
    entry.compressed = loadU32(record + recordCompressedPos, header.byteOrder) != 0;

    if (entry.offset > total || entry.storedSize() > total - entry.offset) {
      throw FormatError(
          FormatError::Kind::Truncated,
          std::format("File entry {} ({}) has invalid offset/size (offset={}, size={}, fileSize={})",
                      i, entry.path, entry.offset, entry.storedSize(), total));
    }

    table.push_back(std::move(entry));
  }

  return table;
}

std::string IndexReader::normalizePath(std::string_view path) {
  std::string result(path);
  for (char &c : result) {
    if (c == '\\') {
      c = '/';
    }
  }
  return result;
}

} // namespace lpakx
