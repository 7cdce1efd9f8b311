#include "util/which.hpp"
#include <sys/stat.h>
#include <cstdlib>
#include <fstream>
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "util/file.hpp"

namespace {

const std::string test_tmpdir = "/tmp/examiner_testdir";

void createExecutable(const std::string& path) {
  { std::ofstream os(path); }
  chmod(path.c_str(), S_IRWXU);
}

class WhichTest : public ::testing::Test {
 protected:
  void SetUp() override {
    const char* path = std::getenv("PATH");
    if (path != nullptr) old_path_ = path;
  }
  void TearDown() override { setenv("PATH", old_path_.c_str(), 1); }

 private:
  std::string old_path_;
};

// NOLINTNEXTLINE
TEST_F(WhichTest, Which) {
  util::TempDir tmpdir1(test_tmpdir + "/which");
  util::TempDir tmpdir2(test_tmpdir + "/which");
  createExecutable(tmpdir1.Path() + "/cmd");
  createExecutable(tmpdir2.Path() + "/cmd");
  createExecutable(tmpdir2.Path() + "/cmd2");
  std::string path = tmpdir1.Path() + ":" + tmpdir2.Path();
  setenv("PATH", path.c_str(), 1);

  EXPECT_EQ(util::which("cmd", false), tmpdir1.Path() + "/cmd");
  EXPECT_EQ(util::which("cmd2", false), tmpdir2.Path() + "/cmd2");
}

// NOLINTNEXTLINE
TEST_F(WhichTest, SkipsNonExecutable) {
  util::TempDir tmpdir(test_tmpdir + "/which");
  { std::ofstream os(tmpdir.Path() + "/plain"); }
  setenv("PATH", tmpdir.Path().c_str(), 1);
  EXPECT_EQ(util::which("plain", false), "");
}

// NOLINTNEXTLINE
TEST_F(WhichTest, WhichEmptyPath) {
  unsetenv("PATH");
  EXPECT_EQ(util::which("examiner_no_such_cmd", false), "");
}

// NOLINTNEXTLINE
TEST_F(WhichTest, DropsStaleCacheEntries) {
  std::string path;
  {
    util::TempDir tmpdir(test_tmpdir + "/which");
    createExecutable(tmpdir.Path() + "/cmd3");
    setenv("PATH", tmpdir.Path().c_str(), 1);
    path = util::which("cmd3");
    EXPECT_EQ(path, tmpdir.Path() + "/cmd3");
    EXPECT_EQ(util::which("cmd3"), path);
  }
  EXPECT_EQ(util::which("cmd3"), "");
}

// NOLINTNEXTLINE
TEST_F(WhichTest, AbsolutePath) {
  util::TempDir tmpdir(test_tmpdir + "/which");
  createExecutable(tmpdir.Path() + "/abs");
  EXPECT_EQ(util::which(tmpdir.Path() + "/abs"), tmpdir.Path() + "/abs");
  EXPECT_EQ(util::which(tmpdir.Path() + "/missing"), "");
}

}  // namespace
