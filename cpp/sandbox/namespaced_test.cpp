#include "sandbox/namespaced.hpp"

#include <csignal>
#include <memory>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "util/file.hpp"

namespace {

using ::testing::HasSubstr;

using namespace sandbox;  // NOLINT

class NamespacedTest : public ::testing::Test {
 protected:
  void SetUp() override {
    if (Namespaced::Score() < 0) {
      GTEST_SKIP() << "user namespaces are not available";
    }
    sandbox_.reset(Namespaced::Create());
  }

  // Runs a helper program from sandbox/test and returns its exit code.
  int Run(const char* program, std::initializer_list<const char*> args,
          int64_t wall_limit_millis = 0) {
    ExecutionOptions options("sandbox/test", program);
    options.SetArgs(args);
    options.wall_limit_millis = wall_limit_millis;
    info_ = ExecutionInfo();
    std::string error_msg;
    EXPECT_TRUE(sandbox_->Execute(options, &info_, &error_msg)) << error_msg;
    return info_.status_code;
  }

  std::unique_ptr<Sandbox> sandbox_;
  ExecutionInfo info_;
};

// NOLINTNEXTLINE
TEST_F(NamespacedTest, TestIsolated) { EXPECT_TRUE(sandbox_->Isolated()); }

// NOLINTNEXTLINE
TEST_F(NamespacedTest, TestReturnArg1) {
  EXPECT_EQ(Run("return_arg1", {"7"}), 7);
  EXPECT_EQ(info_.signal, 0);
}

// NOLINTNEXTLINE
TEST_F(NamespacedTest, TestHostFilesAreHidden) {
  EXPECT_EQ(Run("read_file", {"/etc/passwd"}), 1);
  EXPECT_EQ(Run("read_file", {"/root"}), 1);
}

// NOLINTNEXTLINE
TEST_F(NamespacedTest, TestSystemFilesAreVisible) {
  EXPECT_EQ(Run("read_file", {"/dev/null"}), 0);
  EXPECT_EQ(Run("read_file", {"return_arg1"}), 0);
}

// NOLINTNEXTLINE
TEST_F(NamespacedTest, TestBoxIsReadOnly) {
  EXPECT_EQ(Run("write_file", {"output.txt"}), 1);
  EXPECT_EQ(Run("write_file", {"/usr/examiner_output.txt"}), 1);
  EXPECT_EQ(Run("write_file", {"/tmp/output.txt"}), 0);
}

// NOLINTNEXTLINE
TEST_F(NamespacedTest, TestWritableRoot) {
  util::TempDir box("temp");
  util::File::HardCopy("sandbox/test/write_file", box.Path() + "/write_file");
  util::File::MakeExecutable(box.Path() + "/write_file");
  ExecutionOptions options(box.Path(), "write_file");
  options.SetArgs({"output.txt"});
  options.writable_root = true;
  std::string error_msg;
  EXPECT_TRUE(sandbox_->Execute(options, &info_, &error_msg)) << error_msg;
  EXPECT_EQ(info_.status_code, 0);
  EXPECT_EQ(util::File::ReadAll(box.Path() + "/output.txt"), "data\n");
}

// NOLINTNEXTLINE
TEST_F(NamespacedTest, TestNetworkIsRefused) {
  EXPECT_EQ(Run("open_socket", {}), 1);
}

// NOLINTNEXTLINE
TEST_F(NamespacedTest, TestForkIsRefused) {
  EXPECT_EQ(Run("spawn_child", {}), 1);
}

// NOLINTNEXTLINE
TEST_F(NamespacedTest, TestForkAllowed) {
  ExecutionOptions options("sandbox/test", "spawn_child");
  options.allow_fork = true;
  std::string error_msg;
  EXPECT_TRUE(sandbox_->Execute(options, &info_, &error_msg)) << error_msg;
  EXPECT_EQ(info_.status_code, 0);
}

// NOLINTNEXTLINE
TEST_F(NamespacedTest, TestWallLimitNotOk) {
  Run("wait_arg1", {"5"}, 300);
  EXPECT_EQ(info_.signal, SIGKILL);
  EXPECT_TRUE(info_.killed);
  EXPECT_LE(info_.wall_time_millis, 2000);
}

// NOLINTNEXTLINE
TEST_F(NamespacedTest, TestMissingExecutable) {
  ExecutionOptions options("sandbox/test", "does_not_exist");
  std::string error_msg;
  EXPECT_FALSE(sandbox_->Execute(options, &info_, &error_msg));
  EXPECT_THAT(error_msg, HasSubstr("exec"));
}

}  // namespace
