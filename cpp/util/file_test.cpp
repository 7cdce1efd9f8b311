#include "util/file.hpp"
#include <dirent.h>
#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>
#include <cstdio>
#include <fstream>
#include <vector>
#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace {

using ::testing::IsEmpty;
using ::testing::UnorderedElementsAreArray;

const std::string test_tmpdir = "/tmp/examiner_testdir";

void writeFile(const std::string& path, const std::string& content) {
  std::ofstream of(path);
  of << content;
}

std::string readFile(const std::string& path) {
  std::ifstream t(path);
  std::string str((std::istreambuf_iterator<char>(t)),
                  std::istreambuf_iterator<char>());
  return str;
}

bool dirExists(const std::string& path) {
  auto dir = opendir(path.c_str());
  if (!dir) return false;
  closedir(dir);
  return true;
}

/*
 * ListFiles
 */

// NOLINTNEXTLINE
TEST(File, ListFiles) {
  util::TempDir tmp(test_tmpdir);
  std::vector<std::string> files;
  for (auto name : {"file42", "file12", "sub/file68"}) {
    files.push_back(tmp.Path() + "/" + name);
  }
  util::File::MakeDirs(tmp.Path() + "/sub");
  for (const auto& file : files) {
    writeFile(file, "fooo");
  }
  EXPECT_THAT(util::File::ListFiles(tmp.Path()),
              UnorderedElementsAreArray(files));
}

// NOLINTNEXTLINE
TEST(File, ListFilesEmpty) {
  util::TempDir tmp(test_tmpdir);
  EXPECT_THAT(util::File::ListFiles(tmp.Path()), IsEmpty());
}

/*
 * Read / Write
 */

// NOLINTNEXTLINE
TEST(File, ReadAll) {
  util::TempDir tmp(test_tmpdir);
  std::string path = tmp.Path() + "/file";
  writeFile(path, "lallabalalla\n");
  EXPECT_EQ(util::File::ReadAll(path), "lallabalalla\n");
}

// NOLINTNEXTLINE
TEST(File, ReadAllLimit) {
  util::TempDir tmp(test_tmpdir);
  std::string path = tmp.Path() + "/file";
  writeFile(path, "0123456789");
  EXPECT_EQ(util::File::ReadAll(path, 4), "0123");
}

// NOLINTNEXTLINE
TEST(File, ReadBigFile) {
  util::TempDir tmp(test_tmpdir);
  std::string path = tmp.Path() + "/bigfile";
  std::string content(util::kChunkSize * 2 + 1, 'x');
  writeFile(path, content);
  EXPECT_EQ(util::File::ReadAll(path), content);
}

// NOLINTNEXTLINE
TEST(File, ReadMissing) {
  EXPECT_THROW(util::File::ReadAll(test_tmpdir + "/nope/nope"),  // NOLINT
               std::system_error);
}

// NOLINTNEXTLINE
TEST(File, WriteAllCreatesDirs) {
  util::TempDir tmp(test_tmpdir);
  std::string path = tmp.Path() + "/a/b/c";
  util::File::WriteAll(path, "content");
  EXPECT_EQ(readFile(path), "content");
}

// NOLINTNEXTLINE
TEST(File, WriteAllOverwrites) {
  util::TempDir tmp(test_tmpdir);
  std::string path = tmp.Path() + "/file";
  util::File::WriteAll(path, "first version");
  util::File::WriteAll(path, "second");
  EXPECT_EQ(readFile(path), "second");
  // No temporary file is left around.
  EXPECT_EQ(util::File::ListFiles(tmp.Path()).size(), 1);
}

// NOLINTNEXTLINE
TEST(File, UnfinishedWriteIsInvisible) {
  util::TempDir tmp(test_tmpdir);
  std::string path = tmp.Path() + "/file";
  util::File::WriteAll(path, "old");
  {
    auto receiver = util::File::Write(path, /*overwrite=*/true);
    std::string data = "new";
    receiver(util::File::Chunk(
        reinterpret_cast<const kj::byte*>(data.data()),  // NOLINT
        data.size()));
    EXPECT_EQ(readFile(path), "old");
  }
  EXPECT_EQ(readFile(path), "old");
  EXPECT_EQ(util::File::ListFiles(tmp.Path()).size(), 1);
}

// NOLINTNEXTLINE
TEST(File, WriteNoOverwrite) {
  util::TempDir tmp(test_tmpdir);
  std::string path = tmp.Path() + "/file";
  writeFile(path, "old");
  EXPECT_THROW(util::File::Write(path, false, false),  // NOLINT
               std::system_error);
}

/*
 * Copy
 */

// NOLINTNEXTLINE
TEST(File, HardCopy) {
  util::TempDir tmp(test_tmpdir);
  writeFile(tmp.Path() + "/from", "data");
  util::File::HardCopy(tmp.Path() + "/from", tmp.Path() + "/to");
  EXPECT_EQ(readFile(tmp.Path() + "/to"), "data");
}

/*
 * Paths
 */

// NOLINTNEXTLINE
TEST(File, JoinPath) {
  EXPECT_EQ(util::File::JoinPath("a/b", "c"), "a/b/c");
  EXPECT_EQ(util::File::JoinPath("a/b", "/c"), "/c");
}

// NOLINTNEXTLINE
TEST(File, BaseDirAndName) {
  EXPECT_EQ(util::File::BaseDir("/a/b/c"), "/a/b");
  EXPECT_EQ(util::File::BaseName("/a/b/c"), "c");
  EXPECT_EQ(util::File::BaseDir("c"), "");
}

// NOLINTNEXTLINE
TEST(File, Size) {
  util::TempDir tmp(test_tmpdir);
  writeFile(tmp.Path() + "/file", "12345");
  EXPECT_EQ(util::File::Size(tmp.Path() + "/file"), 5);
  EXPECT_LT(util::File::Size(tmp.Path() + "/nope"), 0);
  EXPECT_TRUE(util::File::Exists(tmp.Path() + "/file"));
}

/*
 * TempDir
 */

// NOLINTNEXTLINE
TEST(TempDir, RemovedOnDestruction) {
  std::string path;
  {
    util::TempDir tmp(test_tmpdir);
    path = tmp.Path();
    util::File::MakeDirs(path + "/x/y");
    writeFile(path + "/x/y/z", "data");
    EXPECT_TRUE(dirExists(path));
  }
  EXPECT_FALSE(dirExists(path));
}

// NOLINTNEXTLINE
TEST(TempDir, Keep) {
  std::string path;
  {
    util::TempDir tmp(test_tmpdir);
    tmp.Keep();
    path = tmp.Path();
  }
  EXPECT_TRUE(dirExists(path));
  util::File::RemoveTree(path);
}

// NOLINTNEXTLINE
TEST(TempDir, Move) {
  std::string path;
  {
    util::TempDir tmp(test_tmpdir);
    path = tmp.Path();
    util::TempDir moved(std::move(tmp));
    EXPECT_EQ(moved.Path(), path);
    EXPECT_TRUE(dirExists(path));
  }
  EXPECT_FALSE(dirExists(path));
}

}  // namespace
