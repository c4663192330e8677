#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <vector>

#include <nres/fileio.hpp>
#include <nres/mmap.hpp>

#include <gtest/gtest.h>

namespace fs = std::filesystem;

class MappedFileTest : public ::testing::Test {
protected:
  void SetUp() override {
    tempDir_ = fs::temp_directory_path() /
               (std::string("nres_test_mmap_") +
                ::testing::UnitTest::GetInstance()->current_test_info()->name());
    fs::create_directories(tempDir_);
  }

  void TearDown() override { fs::remove_all(tempDir_); }

  std::vector<uint8_t> readFile(const fs::path &path) {
    std::ifstream file(path, std::ios::binary);
    return std::vector<uint8_t>((std::istreambuf_iterator<char>(file)),
                                std::istreambuf_iterator<char>());
  }

  fs::path tempDir_;
};

// Bytes written through the mapping land in the destination on commit
TEST_F(MappedFileTest, CreateFillCommit) {
  fs::path dest = tempDir_ / "out.bin";
  size_t fileSize = 1024;

  nres::Error error;
  auto mappedFile = nres::MappedFile::create(dest, fileSize, &error);
  ASSERT_TRUE(mappedFile.has_value()) << error.message;
  EXPECT_TRUE(mappedFile->isMapped());
  EXPECT_EQ(mappedFile->size(), fileSize);
  EXPECT_EQ(mappedFile->destination(), dest);

  // Nothing at the destination until commit
  EXPECT_FALSE(fs::exists(dest));
  EXPECT_TRUE(fs::exists(nres::temporaryPathFor(dest)));

  auto data = mappedFile->data();
  for (size_t i = 0; i < fileSize; ++i) {
    data[i] = static_cast<uint8_t>(i & 0xFF);
  }

  ASSERT_TRUE(mappedFile->commit(&error)) << error.message;
  EXPECT_FALSE(mappedFile->isMapped());
  EXPECT_FALSE(fs::exists(nres::temporaryPathFor(dest)));

  auto written = readFile(dest);
  ASSERT_EQ(written.size(), fileSize);
  for (size_t i = 0; i < fileSize; ++i) {
    EXPECT_EQ(written[i], static_cast<uint8_t>(i & 0xFF)) << "Mismatch at index " << i;
  }
}

TEST_F(MappedFileTest, StartsZeroFilled) {
  auto mappedFile = nres::MappedFile::create(tempDir_ / "zero.bin", 64);
  ASSERT_TRUE(mappedFile.has_value());
  for (uint8_t byte : mappedFile->data()) {
    EXPECT_EQ(byte, 0);
  }
}

TEST_F(MappedFileTest, CommitReplacesExisting) {
  fs::path dest = tempDir_ / "existing.bin";
  {
    std::ofstream file(dest, std::ios::binary);
    file << "previous contents that are longer than the new file";
  }

  auto mappedFile = nres::MappedFile::create(dest, 4);
  ASSERT_TRUE(mappedFile.has_value());
  std::copy_n("NRes", 4, mappedFile->data().begin());

  // Old contents stay readable while the new file is being filled
  EXPECT_EQ(fs::file_size(dest), 51u);

  ASSERT_TRUE(mappedFile->commit());
  EXPECT_EQ(readFile(dest), (std::vector<uint8_t>{'N', 'R', 'e', 's'}));
}

// Dropping an uncommitted file leaves the destination as it was
TEST_F(MappedFileTest, DestructorDiscards) {
  fs::path dest = tempDir_ / "kept.bin";
  {
    std::ofstream file(dest, std::ios::binary);
    file << "keep";
  }

  {
    auto mappedFile = nres::MappedFile::create(dest, 16);
    ASSERT_TRUE(mappedFile.has_value());
    mappedFile->data()[0] = 'X';
  }

  EXPECT_FALSE(fs::exists(nres::temporaryPathFor(dest)));
  EXPECT_EQ(readFile(dest), (std::vector<uint8_t>{'k', 'e', 'e', 'p'}));
}

TEST_F(MappedFileTest, DiscardThenCommit) {
  fs::path dest = tempDir_ / "never.bin";
  auto mappedFile = nres::MappedFile::create(dest, 8);
  ASSERT_TRUE(mappedFile.has_value());

  mappedFile->discard();
  EXPECT_FALSE(mappedFile->isMapped());
  EXPECT_FALSE(fs::exists(nres::temporaryPathFor(dest)));

  nres::Error error;
  EXPECT_FALSE(mappedFile->commit(&error));
  EXPECT_EQ(error.code, nres::ErrorCode::InvalidState);
  EXPECT_FALSE(fs::exists(dest));
}

TEST_F(MappedFileTest, CreateZeroSize) {
  nres::Error error;
  EXPECT_FALSE(nres::MappedFile::create(tempDir_ / "zero_size.bin", 0, &error).has_value());
  EXPECT_EQ(error.code, nres::ErrorCode::IoError);
  EXPECT_FALSE(fs::exists(nres::temporaryPathFor(tempDir_ / "zero_size.bin")));
}

TEST_F(MappedFileTest, CreateInMissingDirectory) {
  nres::Error error;
  EXPECT_FALSE(
      nres::MappedFile::create(tempDir_ / "no" / "such" / "dir.bin", 16, &error).has_value());
  EXPECT_EQ(error.code, nres::ErrorCode::IoError);
  EXPECT_FALSE(fs::exists(tempDir_ / "no"));
}

TEST_F(MappedFileTest, MoveConstruction) {
  fs::path dest = tempDir_ / "move.bin";
  auto mappedFile1 = nres::MappedFile::create(dest, 5);
  ASSERT_TRUE(mappedFile1.has_value());
  mappedFile1->data()[0] = 42;

  nres::MappedFile mappedFile2(std::move(*mappedFile1));

  EXPECT_FALSE(mappedFile1->isMapped());
  EXPECT_TRUE(mappedFile2.isMapped());
  ASSERT_EQ(mappedFile2.size(), 5u);
  EXPECT_EQ(mappedFile2.data()[0], 42);

  // The moved-from object no longer owns the temporary file
  mappedFile1.reset();
  EXPECT_TRUE(fs::exists(nres::temporaryPathFor(dest)));

  ASSERT_TRUE(mappedFile2.commit());
  EXPECT_EQ(readFile(dest)[0], 42);
}

TEST_F(MappedFileTest, MoveAssignment) {
  auto mappedFile1 = nres::MappedFile::create(tempDir_ / "move1.bin", 3);
  auto mappedFile2 = nres::MappedFile::create(tempDir_ / "move2.bin", 6);
  ASSERT_TRUE(mappedFile1.has_value());
  ASSERT_TRUE(mappedFile2.has_value());
  mappedFile2->data()[5] = 7;

  *mappedFile1 = std::move(*mappedFile2);

  // The file previously held by mappedFile1 was discarded
  EXPECT_FALSE(fs::exists(nres::temporaryPathFor(tempDir_ / "move1.bin")));
  EXPECT_TRUE(mappedFile1->isMapped());
  EXPECT_FALSE(mappedFile2->isMapped());
  ASSERT_EQ(mappedFile1->size(), 6u);
  EXPECT_EQ(mappedFile1->destination(), tempDir_ / "move2.bin");

  ASSERT_TRUE(mappedFile1->commit());
  EXPECT_FALSE(fs::exists(tempDir_ / "move1.bin"));
  EXPECT_EQ(readFile(tempDir_ / "move2.bin")[5], 7);
}
