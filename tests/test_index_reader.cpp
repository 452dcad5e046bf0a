#include <filesystem>
#include <limits>
#include <string>
#include <vector>

#include <lpakx/bundle.hpp>
#include <lpakx/index_reader.hpp>

#include "test_bundle.hpp"

#include <gtest/gtest.h>

using lpakx::ByteOrder;
using lpakx::DirectoryHeader;
using lpakx::FormatError;
using lpakx::IndexReader;
using lpakx::test::BundleBuilder;

namespace {

// Run parse and return the kind of the FormatError it throws
FormatError::Kind parseFailure(const std::vector<uint8_t> &bytes) {
  try {
    IndexReader::parse(bytes);
  } catch (const FormatError &e) {
    return e.kind();
  }
  ADD_FAILURE() << "parse did not throw";
  return FormatError::Kind::Truncated;
}

std::vector<uint8_t> threeFileBundle(ByteOrder order) {
  return BundleBuilder(order)
      .add("test/file1.txt", std::string("Hello"))
      .add("test/file2.dat", std::vector<uint8_t>{0, 1, 2, 3, 4, 5})
      .add("test/subdir/file3.bin", std::string("ABC"))
      .build();
}

} // namespace

TEST(IndexReaderTest, ReadHeaderLittleEndian) {
  auto bytes = threeFileBundle(ByteOrder::Little);
  DirectoryHeader header = IndexReader::readHeader(bytes);

  EXPECT_EQ(header.byteOrder, ByteOrder::Little);
  EXPECT_FLOAT_EQ(header.version, 1.0f);
  EXPECT_EQ(header.variant, lpakx::Variant::Primary);
  EXPECT_EQ(header.entriesOffset, DirectoryHeader::headerSize);
  EXPECT_EQ(header.entriesSize, 3 * DirectoryHeader::entryRecordSize);
  EXPECT_EQ(header.entryCount(), 3u);
  EXPECT_EQ(header.namesOffset, header.entriesOffset + header.entriesSize);
  EXPECT_EQ(header.dataSize, 14u);
}

TEST(IndexReaderTest, ReadHeaderBigEndian) {
  auto bytes = threeFileBundle(ByteOrder::Big);
  DirectoryHeader header = IndexReader::readHeader(bytes);

  EXPECT_EQ(header.byteOrder, ByteOrder::Big);
  EXPECT_FLOAT_EQ(header.version, 1.0f);
  EXPECT_EQ(header.entryCount(), 3u);
}

TEST(IndexReaderTest, ParseListsEntriesInDirectoryOrder) {
  auto bytes = threeFileBundle(ByteOrder::Little);
  auto table = IndexReader::parse(bytes);

  ASSERT_EQ(table.size(), 3u);
  EXPECT_EQ(table[0].path, "test/file1.txt");
  EXPECT_EQ(table[1].path, "test/file2.dat");
  EXPECT_EQ(table[2].path, "test/subdir/file3.bin");

  EXPECT_EQ(table[0].size, 5u);
  EXPECT_EQ(table[1].size, 6u);
  EXPECT_EQ(table[2].size, 3u);
  EXPECT_FALSE(table[0].compressed);

  // Offsets are absolute and point at the payloads
  EXPECT_EQ(std::string(bytes.begin() + table[0].offset, bytes.begin() + table[0].offset + 5),
            "Hello");
  EXPECT_EQ(table[1].offset, table[0].offset + 5);
  EXPECT_EQ(table[2].offset, table[1].offset + 6);
}

TEST(IndexReaderTest, ByteOrdersDecodeToSameTable) {
  auto little = IndexReader::parse(threeFileBundle(ByteOrder::Little));
  auto big = IndexReader::parse(threeFileBundle(ByteOrder::Big));

  ASSERT_EQ(little.size(), big.size());
  for (size_t i = 0; i < little.size(); ++i) {
    EXPECT_EQ(little[i].path, big[i].path);
    EXPECT_EQ(little[i].offset, big[i].offset);
    EXPECT_EQ(little[i].size, big[i].size);
  }
}

TEST(IndexReaderTest, ManiacBundle) {
  auto table = IndexReader::parse(lpakx::test::maniacBundle());

  ASSERT_EQ(table.size(), 2u);
  EXPECT_EQ(table[0].path, "maniac/a.bin");
  EXPECT_EQ(table[0].offset, 64u);
  EXPECT_EQ(table[0].size, 10u);
  EXPECT_EQ(table[1].path, "maniac/b.bin");
  EXPECT_EQ(table[1].offset, 74u);
  EXPECT_EQ(table[1].size, 0u);
}

TEST(IndexReaderTest, EmptyDirectory) {
  auto table = IndexReader::parse(BundleBuilder().build());
  EXPECT_TRUE(table.empty());
}

TEST(IndexReaderTest, BackslashesAreNormalized) {
  auto bytes = BundleBuilder().add("audio\\voice\\line01.ogg", std::string("ogg")).build();
  auto table = IndexReader::parse(bytes);

  ASSERT_EQ(table.size(), 1u);
  EXPECT_EQ(table[0].path, "audio/voice/line01.ogg");
}

TEST(IndexReaderTest, CompressedEntry) {
  auto bytes = BundleBuilder().addCompressed("packed.dat", {9, 8, 7, 6}).build();
  auto table = IndexReader::parse(bytes);

  ASSERT_EQ(table.size(), 1u);
  EXPECT_TRUE(table[0].compressed);
  EXPECT_EQ(table[0].size, 8u);
  EXPECT_EQ(table[0].compressedSize, 4u);
  EXPECT_EQ(table[0].storedSize(), 4u);
}

TEST(IndexReaderTest, BadSignature) {
  std::vector<uint8_t> bytes = threeFileBundle(ByteOrder::Little);
  bytes[0] = 'B';
  bytes[1] = 'I';
  bytes[2] = 'G';
  bytes[3] = 'F';

  try {
    IndexReader::parse(bytes);
    FAIL() << "parse accepted a bad signature";
  } catch (const FormatError &e) {
    EXPECT_EQ(e.kind(), FormatError::Kind::BadSignature);
    EXPECT_NE(std::string(e.what()).find("BIGF"), std::string::npos);
  }
}

TEST(IndexReaderTest, TooSmallForSignature) {
  EXPECT_EQ(parseFailure({}), FormatError::Kind::BadSignature);
  EXPECT_EQ(parseFailure({'K', 'A', 'P'}), FormatError::Kind::BadSignature);
}

TEST(IndexReaderTest, TruncatedHeader) {
  std::vector<uint8_t> bytes = threeFileBundle(ByteOrder::Little);

  bytes.resize(6);
  EXPECT_EQ(parseFailure(bytes), FormatError::Kind::Truncated);

  bytes = threeFileBundle(ByteOrder::Little);
  bytes.resize(DirectoryHeader::headerSize - 1);
  EXPECT_EQ(parseFailure(bytes), FormatError::Kind::Truncated);
}

TEST(IndexReaderTest, SiblingVariantIsRejectedDistinctly) {
  for (ByteOrder order : {ByteOrder::Little, ByteOrder::Big}) {
    auto bytes = BundleBuilder(order, 1.5f).add("a.txt", std::string("a")).build();

    DirectoryHeader header = IndexReader::readHeader(bytes);
    EXPECT_EQ(header.variant, lpakx::Variant::UnsupportedSibling);
    EXPECT_EQ(parseFailure(bytes), FormatError::Kind::UnsupportedVariant);
  }
}

TEST(IndexReaderTest, SiblingVariantNeedsOnlyVersion) {
  std::vector<uint8_t> bytes;
  lpakx::test::putBytes(bytes, 0, "KAPL");
  lpakx::test::putF32(bytes, 4, 2.0f, ByteOrder::Little);

  EXPECT_EQ(parseFailure(bytes), FormatError::Kind::UnsupportedVariant);
}

TEST(IndexReaderTest, EntryTableBeyondEnd) {
  auto bytes = threeFileBundle(ByteOrder::Little);
  DirectoryHeader header = IndexReader::readHeader(bytes);
  header.entriesSize = static_cast<uint32_t>(bytes.size());
  lpakx::test::putHeader(bytes, header);

  EXPECT_EQ(parseFailure(bytes), FormatError::Kind::Truncated);
}

TEST(IndexReaderTest, EntryDataBeyondEnd) {
  auto bytes = threeFileBundle(ByteOrder::Big);
  DirectoryHeader header = IndexReader::readHeader(bytes);

  // Grow the last entry's size by one byte past the end of the file
  size_t record = header.entriesOffset + 2 * DirectoryHeader::entryRecordSize;
  lpakx::test::putU32(bytes, record + 8, 4, ByteOrder::Big);
  lpakx::test::putU32(bytes, record + 12, 4, ByteOrder::Big);

  try {
    IndexReader::parse(bytes);
    FAIL() << "parse accepted an entry past the end of the bundle";
  } catch (const FormatError &e) {
    EXPECT_EQ(e.kind(), FormatError::Kind::Truncated);
    EXPECT_NE(std::string(e.what()).find("test/subdir/file3.bin"), std::string::npos);
  }
}

TEST(IndexReaderTest, EntryOffsetOverflow) {
  auto bytes = threeFileBundle(ByteOrder::Little);
  DirectoryHeader header = IndexReader::readHeader(bytes);

  lpakx::test::putU32(bytes, header.entriesOffset, 0xFFFFFFFFu, ByteOrder::Little);

  EXPECT_EQ(parseFailure(bytes), FormatError::Kind::Truncated);
}

TEST(IndexReaderTest, UnterminatedName) {
  auto bytes = BundleBuilder().add("name.txt", std::vector<uint8_t>{}).build();

  // Overwrite the name terminator, which is the last byte of a bundle with no payload
  ASSERT_EQ(bytes.back(), 0);
  bytes.back() = 'x';

  EXPECT_EQ(parseFailure(bytes), FormatError::Kind::Truncated);
}

TEST(IndexReaderTest, NamesTableBeyondEnd) {
  auto bytes = BundleBuilder().add("a.txt", std::string("a")).build();
  DirectoryHeader header = IndexReader::readHeader(bytes);
  header.namesSize = 0x10000000;
  lpakx::test::putHeader(bytes, header);

  EXPECT_EQ(parseFailure(bytes), FormatError::Kind::Truncated);
}

TEST(IndexReaderTest, NameRunsPastNamesTable) {
  auto bytes = BundleBuilder()
                   .add("first.txt", std::string("1"))
                   .add("second.txt", std::string("2"))
                   .build();
  DirectoryHeader header = IndexReader::readHeader(bytes);

  // Terminator of the last name falls one byte outside the declared table
  header.namesSize -= 1;
  lpakx::test::putHeader(bytes, header);
  EXPECT_EQ(parseFailure(bytes), FormatError::Kind::Truncated);

  // Table too short to hold the second name at all
  header.namesSize = static_cast<uint32_t>(std::string("first.txt").size() + 1);
  lpakx::test::putHeader(bytes, header);
  EXPECT_EQ(parseFailure(bytes), FormatError::Kind::Truncated);
}

TEST(IndexReaderTest, NanAndNegativeVersionsAreSibling) {
  for (float version : {std::numeric_limits<float>::quiet_NaN(), -1.0f, 2.0f}) {
    auto bytes = BundleBuilder(ByteOrder::Little, version).add("a.txt", std::string("a")).build();

    EXPECT_EQ(IndexReader::readHeader(bytes).variant, lpakx::Variant::UnsupportedSibling)
        << version;
    EXPECT_EQ(parseFailure(bytes), FormatError::Kind::UnsupportedVariant) << version;
  }

  auto bytes = BundleBuilder(ByteOrder::Big, 1.49f).add("a.txt", std::string("a")).build();
  EXPECT_EQ(IndexReader::readHeader(bytes).variant, lpakx::Variant::Primary);
}

TEST(IndexReaderTest, NameLongerThanLimit) {
  std::string longName(DirectoryHeader::maxNameLength + 1, 'n');
  auto bytes = BundleBuilder().add(longName, std::string("x")).build();

  EXPECT_EQ(parseFailure(bytes), FormatError::Kind::Truncated);

  std::string maxName(DirectoryHeader::maxNameLength, 'n');
  auto table = IndexReader::parse(BundleBuilder().add(maxName, std::string("x")).build());
  ASSERT_EQ(table.size(), 1u);
  EXPECT_EQ(table[0].path, maxName);
}

class IndexReaderFileTest : public lpakx::test::TempDirTest {};

TEST_F(IndexReaderFileTest, ParseOpenedBundle) {
  auto path = createBundle("test.cle", threeFileBundle(ByteOrder::Little));

  lpakx::Bundle bundle = lpakx::Bundle::open(path);
  EXPECT_TRUE(bundle.isOpen());
  EXPECT_EQ(bundle.path().string(), path.string());

  auto table = IndexReader::parse(bundle);
  ASSERT_EQ(table.size(), 3u);

  auto view = bundle.view(table[0]);
  EXPECT_EQ(std::string(view.begin(), view.end()), "Hello");
}

TEST_F(IndexReaderFileTest, SeveralBundlesOpenAtOnce) {
  auto first = lpakx::Bundle::open(createBundle("first.cle", threeFileBundle(ByteOrder::Little)));
  auto second = lpakx::Bundle::open(createBundle("second.cle", lpakx::test::maniacBundle()));

  EXPECT_EQ(IndexReader::parse(first).size(), 3u);
  EXPECT_EQ(IndexReader::parse(second).size(), 2u);
}

TEST_F(IndexReaderFileTest, EmptyFileHasBadSignature) {
  auto bundle = lpakx::Bundle::open(createBundle("empty.cle", {}));

  try {
    IndexReader::parse(bundle);
    FAIL() << "parse accepted an empty file";
  } catch (const FormatError &e) {
    EXPECT_EQ(e.kind(), FormatError::Kind::BadSignature);
  }
}

TEST_F(IndexReaderFileTest, OpenMissingBundle) {
  try {
    lpakx::Bundle::open(tempDir_ / "missing.cle");
    FAIL() << "open succeeded on a missing file";
  } catch (const lpakx::IoError &e) {
    EXPECT_EQ(e.kind(), lpakx::IoError::Kind::Read);
  }
}

TEST_F(IndexReaderFileTest, CloseReleasesBundle) {
  auto bundle = lpakx::Bundle::open(createBundle("close.cle", lpakx::test::maniacBundle()));
  EXPECT_TRUE(bundle.isOpen());
  EXPECT_GT(bundle.size(), 0u);

  bundle.close();
  EXPECT_FALSE(bundle.isOpen());
  EXPECT_EQ(bundle.size(), 0u);
  EXPECT_TRUE(bundle.path().empty());
}
