#include <string>
#include <vector>

#include <nres/codec.hpp>
#include <nres/endian.hpp>

#include <gtest/gtest.h>

namespace {

std::vector<uint8_t> headerBytes(uint32_t signature, uint32_t reserved, uint32_t fileCount,
                                 uint32_t archiveSize) {
  std::vector<uint8_t> bytes(16);
  nres::storeLE32(bytes.data(), signature);
  nres::storeLE32(bytes.data() + 4, reserved);
  nres::storeLE32(bytes.data() + 8, fileCount);
  nres::storeLE32(bytes.data() + 12, archiveSize);
  return bytes;
}

nres::ArchiveEntry makeEntry(std::string name, uint32_t size, uint32_t offset, uint32_t id) {
  nres::ArchiveEntry entry;
  entry.fileType = "TEXM";
  entry.fileSize = size;
  entry.fileName = std::move(name);
  entry.fileOffset = offset;
  entry.fileId = id;
  return entry;
}

} // namespace

// The header is "NRes", 0x0100, count, size, all little-endian
TEST(CodecTest, EncodeHeaderLayout) {
  nres::ArchiveHeader header;
  header.fileCount = 2;
  header.archiveSize = 156;

  auto bytes = nres::encodeHeader(header);
  std::vector<uint8_t> expected = {'N', 'R', 'e', 's', 0x00, 0x01, 0x00, 0x00,
                                   2,   0,   0,   0,   156,  0,    0,    0};
  EXPECT_EQ(std::vector<uint8_t>(bytes.begin(), bytes.end()), expected);
}

TEST(CodecTest, DecodeHeader) {
  auto bytes = headerBytes(0x7365524E, 0x0100, 3, 1000);

  nres::Error error;
  auto header = nres::decodeHeader(bytes, &error);
  ASSERT_TRUE(header.has_value()) << error.message;
  EXPECT_EQ(header->fileCount, 3u);
  EXPECT_EQ(header->archiveSize, 1000u);
}

// Any signature other than the magic is rejected, whatever the other fields hold
TEST(CodecTest, DecodeHeaderRejectsBadSignature) {
  const uint32_t signatures[] = {0, 0x4E526573, 0x7365524F, 0xFFFFFFFF, 0x5365524E};
  struct Fields {
    uint32_t reserved;
    uint32_t fileCount;
    uint32_t archiveSize;
  };
  const Fields fields[] = {
      {0x0100, 2, 156},               // A valid two-file header
      {0x0100, 0, 16},                // A valid empty archive
      {0, 0, 0},
      {0xFFFFFFFF, 0xFFFFFFFF, 0xFFFFFFFF},
      {0xDEADBEEF, 1000, 12},         // TOC could not fit
      {0x0200, 1, 0x7365524E},
  };

  for (uint32_t signature : signatures) {
    for (const auto &f : fields) {
      auto bytes = headerBytes(signature, f.reserved, f.fileCount, f.archiveSize);

      nres::Error error;
      EXPECT_FALSE(nres::decodeHeader(bytes, &error).has_value());
      EXPECT_EQ(error.code, nres::ErrorCode::BadSignature)
          << std::hex << signature << " " << f.reserved << " " << f.fileCount << " "
          << f.archiveSize;
      EXPECT_EQ(error.category(), nres::ErrorCategory::Format);
    }
  }

  // The same fields behind the right signature decode
  EXPECT_TRUE(nres::decodeHeader(headerBytes(0x7365524E, 0x0100, 2, 156)).has_value());
}

TEST(CodecTest, DecodeHeaderRejectsWrongBufferSize) {
  auto bytes = headerBytes(0x7365524E, 0x0100, 0, 16);

  nres::Error error;
  EXPECT_FALSE(nres::decodeHeader(std::span(bytes).first(15), &error).has_value());
  EXPECT_EQ(error.code, nres::ErrorCode::BadSize);

  bytes.push_back(0);
  error = {};
  EXPECT_FALSE(nres::decodeHeader(bytes, &error).has_value());
  EXPECT_EQ(error.code, nres::ErrorCode::BadSize);
}

// Re-encoding always restores the canonical reserved word
TEST(CodecTest, EncodeHeaderIsCanonical) {
  auto bytes = headerBytes(0x7365524E, 0xDEADBEEF, 4, 272);
  auto header = nres::decodeHeader(bytes);
  ASSERT_TRUE(header.has_value());

  auto encoded = nres::encodeHeader(*header);
  EXPECT_EQ(nres::loadLE32(encoded.data()), 0x7365524Eu);
  EXPECT_EQ(nres::loadLE32(encoded.data() + 4), 0x0100u);
  EXPECT_EQ(nres::loadLE32(encoded.data() + 8), 4u);
  EXPECT_EQ(nres::loadLE32(encoded.data() + 12), 272u);
}

TEST(CodecTest, EncodeEntryLayout) {
  auto entry = makeEntry("ground.tex", 0x1234, 0x10, 7);

  nres::Error error;
  auto bytes = nres::encodeEntry(entry, &error);
  ASSERT_TRUE(bytes.has_value()) << error.message;

  EXPECT_EQ(std::string(reinterpret_cast<const char *>(bytes->data()), 4), "TEXM");
  for (size_t i = 4; i < 12; ++i) {
    EXPECT_EQ((*bytes)[i], 0) << "type padding at " << i;
  }
  EXPECT_EQ(nres::loadLE32(bytes->data() + 12), 0x1234u);
  EXPECT_EQ(nres::loadLE32(bytes->data() + 16), 0u);
  EXPECT_EQ(std::string(reinterpret_cast<const char *>(bytes->data() + 20)), "ground.tex");
  for (size_t i = 20 + 10; i < 56; ++i) {
    EXPECT_EQ((*bytes)[i], 0) << "name padding at " << i;
  }
  EXPECT_EQ(nres::loadLE32(bytes->data() + 56), 0x10u);
  EXPECT_EQ(nres::loadLE32(bytes->data() + 60), 7u);
}

TEST(CodecTest, DecodeEntryTrimsPadding) {
  auto bytes = nres::encodeEntry(makeEntry("a.txt", 8, 16, 0));
  ASSERT_TRUE(bytes.has_value());

  nres::Error error;
  auto entry = nres::decodeEntry(*bytes, &error);
  ASSERT_TRUE(entry.has_value()) << error.message;
  EXPECT_EQ(entry->fileType, "TEXM");
  EXPECT_EQ(entry->fileName, "a.txt");
  EXPECT_EQ(entry->fileSize, 8u);
  EXPECT_EQ(entry->fileOffset, 16u);
  EXPECT_EQ(entry->fileId, 0u);
}

TEST(CodecTest, DecodeEntryAcceptsUtf8Names) {
  auto bytes = nres::encodeEntry(makeEntry("карта.msh", 8, 16, 0));
  ASSERT_TRUE(bytes.has_value());

  auto entry = nres::decodeEntry(*bytes);
  ASSERT_TRUE(entry.has_value());
  EXPECT_EQ(entry->fileName, "карта.msh");
}

TEST(CodecTest, DecodeEntryRejectsInvalidText) {
  auto bytes = nres::encodeEntry(makeEntry("name.bin", 8, 16, 0));
  ASSERT_TRUE(bytes.has_value());

  // Lone continuation byte in the name
  auto broken = *bytes;
  broken[20] = 0x80;
  nres::Error error;
  EXPECT_FALSE(nres::decodeEntry(broken, &error).has_value());
  EXPECT_EQ(error.code, nres::ErrorCode::InvalidText);

  // Overlong encoding of '/' in the type
  broken = *bytes;
  broken[0] = 0xC0;
  broken[1] = 0xAF;
  error = {};
  EXPECT_FALSE(nres::decodeEntry(broken, &error).has_value());
  EXPECT_EQ(error.code, nres::ErrorCode::InvalidText);

  // Truncated multi-byte sequence at the end of the name
  broken = *bytes;
  broken[20] = 'x';
  broken[21] = 0xD0;
  std::fill(broken.begin() + 22, broken.begin() + 56, 0);
  error = {};
  EXPECT_FALSE(nres::decodeEntry(broken, &error).has_value());
  EXPECT_EQ(error.code, nres::ErrorCode::InvalidText);
}

TEST(CodecTest, DecodeEntryRejectsWrongBufferSize) {
  std::vector<uint8_t> bytes(63);
  nres::Error error;
  EXPECT_FALSE(nres::decodeEntry(bytes, &error).has_value());
  EXPECT_EQ(error.code, nres::ErrorCode::BadSize);
}

// A 36-byte name fills its field exactly, one more byte is refused
TEST(CodecTest, EncodeEntryNameLimit) {
  std::string name(36, 'n');
  auto bytes = nres::encodeEntry(makeEntry(name, 4, 16, 0));
  ASSERT_TRUE(bytes.has_value());
  auto entry = nres::decodeEntry(*bytes);
  ASSERT_TRUE(entry.has_value());
  EXPECT_EQ(entry->fileName, name);

  nres::Error error;
  EXPECT_FALSE(nres::encodeEntry(makeEntry(name + "n", 4, 16, 0), &error).has_value());
  EXPECT_EQ(error.code, nres::ErrorCode::FieldTooLong);
}

TEST(CodecTest, EncodeEntryTypeLimit) {
  auto entry = makeEntry("x", 4, 16, 0);
  entry.fileType = std::string(12, 't');
  EXPECT_TRUE(nres::encodeEntry(entry).has_value());

  entry.fileType = std::string(13, 't');
  nres::Error error;
  EXPECT_FALSE(nres::encodeEntry(entry, &error).has_value());
  EXPECT_EQ(error.code, nres::ErrorCode::FieldTooLong);
}

// Fields the decoder would refuse are never encoded
TEST(CodecTest, EncodeEntryRejectsNonText) {
  auto entry = makeEntry("image.png", 8, 16, 0);
  entry.fileType = std::string("\x89PNG", 4);

  nres::Error error;
  EXPECT_FALSE(nres::encodeEntry(entry, &error).has_value());
  EXPECT_EQ(error.code, nres::ErrorCode::UnencodableText);
  EXPECT_EQ(error.category(), nres::ErrorCategory::Write);

  entry = makeEntry(std::string("bad\xC0\xAF.bin"), 8, 16, 0);
  error = {};
  EXPECT_FALSE(nres::encodeEntry(entry, &error).has_value());
  EXPECT_EQ(error.code, nres::ErrorCode::UnencodableText);

  // Every encodable entry decodes again
  entry = makeEntry("карта.msh", 8, 16, 0);
  entry.fileType = "MSH\x01";
  auto bytes = nres::encodeEntry(entry);
  ASSERT_TRUE(bytes.has_value());
  EXPECT_TRUE(nres::decodeEntry(*bytes).has_value());
}

TEST(CodecTest, TocOffset) {
  nres::ArchiveHeader header;
  header.fileCount = 2;
  header.archiveSize = 156;

  auto offset = nres::tocOffset(header);
  ASSERT_TRUE(offset.has_value());
  EXPECT_EQ(*offset, 28u);

  // Empty archive: the TOC starts (and ends) right after the header
  header.fileCount = 0;
  header.archiveSize = 16;
  offset = nres::tocOffset(header);
  ASSERT_TRUE(offset.has_value());
  EXPECT_EQ(*offset, 16u);
}

TEST(CodecTest, TocOffsetRejectsInconsistentHeader) {
  nres::ArchiveHeader header;
  nres::Error error;

  // TOC larger than the archive
  header.fileCount = 3;
  header.archiveSize = 100;
  EXPECT_FALSE(nres::tocOffset(header, &error).has_value());
  EXPECT_EQ(error.code, nres::ErrorCode::InvalidHeader);

  // TOC overlapping the header
  header.fileCount = 1;
  header.archiveSize = 79;
  error = {};
  EXPECT_FALSE(nres::tocOffset(header, &error).has_value());
  EXPECT_EQ(error.code, nres::ErrorCode::InvalidHeader);

  // Archive smaller than a header
  header.fileCount = 0;
  header.archiveSize = 8;
  error = {};
  EXPECT_FALSE(nres::tocOffset(header, &error).has_value());
  EXPECT_EQ(error.code, nres::ErrorCode::InvalidHeader);

  // Count large enough to overflow 32-bit arithmetic
  header.fileCount = 0xFFFFFFFF;
  header.archiveSize = 0xFFFFFFFF;
  error = {};
  EXPECT_FALSE(nres::tocOffset(header, &error).has_value());
  EXPECT_EQ(error.code, nres::ErrorCode::InvalidHeader);
}

TEST(CodecTest, TocKeepsOrder) {
  std::vector<nres::ArchiveEntry> entries = {
      makeEntry("zeta.bin", 10, 16, 0),
      makeEntry("alpha.bin", 20, 26, 1),
      makeEntry("mid.bin", 30, 46, 2),
  };

  auto bytes = nres::encodeToc(entries);
  ASSERT_TRUE(bytes.has_value());
  ASSERT_EQ(bytes->size(), 3u * 64);

  nres::Error error;
  auto decoded = nres::decodeToc(*bytes, 3, &error);
  ASSERT_TRUE(decoded.has_value()) << error.message;
  EXPECT_EQ(*decoded, entries);
}

TEST(CodecTest, DecodeTocRequiresExactSize) {
  auto bytes = nres::encodeToc(std::vector<nres::ArchiveEntry>{makeEntry("a", 4, 16, 0)});
  ASSERT_TRUE(bytes.has_value());

  nres::Error error;
  EXPECT_FALSE(nres::decodeToc(*bytes, 2, &error).has_value());
  EXPECT_EQ(error.code, nres::ErrorCode::BadSize);

  error = {};
  EXPECT_FALSE(nres::decodeToc(std::span(*bytes).first(63), 1, &error).has_value());
  EXPECT_EQ(error.code, nres::ErrorCode::BadSize);

  auto empty = nres::decodeToc({}, 0);
  ASSERT_TRUE(empty.has_value());
  EXPECT_TRUE(empty->empty());
}

TEST(CodecTest, EncodeTocFailsOnOversizedEntry) {
  std::vector<nres::ArchiveEntry> entries = {makeEntry("ok", 4, 16, 0),
                                             makeEntry(std::string(40, 'x'), 4, 20, 1)};
  nres::Error error;
  EXPECT_FALSE(nres::encodeToc(entries, &error).has_value());
  EXPECT_EQ(error.code, nres::ErrorCode::FieldTooLong);
}
