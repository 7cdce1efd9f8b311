#include "sandbox/unix.hpp"

#include <sys/stat.h>
#include <sys/types.h>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <memory>
#include <string>
#include <vector>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "util/file.hpp"

namespace {

const char* test_tmpdir = "/tmp/examiner_testdir";

using ::testing::AnyOf;
using ::testing::Eq;
using ::testing::StartsWith;

using namespace sandbox;  // NOLINT

class UnixTest : public ::testing::Test {
 protected:
  void SetUp() override { sandbox_.reset(Unix::Create()); }

  bool Run(const ExecutionOptions& options) {
    error_msg_.clear();
    info_ = ExecutionInfo();
    return sandbox_->Execute(options, &info_, &error_msg_);
  }

  std::unique_ptr<Sandbox> sandbox_;
  ExecutionInfo info_;
  std::string error_msg_;
};

// NOLINTNEXTLINE
TEST_F(UnixTest, TestNotIsolated) { EXPECT_FALSE(sandbox_->Isolated()); }

// NOLINTNEXTLINE
TEST_F(UnixTest, TestNoDir) {
  ExecutionOptions options("foo", "bar");
  EXPECT_FALSE(Run(options));
  EXPECT_THAT(error_msg_, StartsWith("chdir:"));
}

// NOLINTNEXTLINE
TEST_F(UnixTest, TestNoFile) {
  ExecutionOptions options("sandbox/test", "foo");
  EXPECT_FALSE(Run(options));
  EXPECT_THAT(error_msg_, StartsWith("exec:"));
}

// NOLINTNEXTLINE
TEST_F(UnixTest, TestReturnArg1) {
  ExecutionOptions options("sandbox/test", "return_arg1");
  options.SetArgs({"15"});
  EXPECT_TRUE(Run(options));
  EXPECT_EQ(error_msg_, "");
  EXPECT_EQ(info_.status_code, 15);
  EXPECT_EQ(info_.signal, 0);
  EXPECT_FALSE(info_.killed);
  EXPECT_STREQ(info_.message, "Non-zero return code");
}

// NOLINTNEXTLINE
TEST_F(UnixTest, TestSignalArg1) {
  ExecutionOptions options("sandbox/test", "signal_arg1");
  options.SetArgs({"6"});
  EXPECT_TRUE(Run(options));
  EXPECT_EQ(error_msg_, "");
  EXPECT_EQ(info_.signal, 6);
  EXPECT_EQ(info_.status_code, 0);
  EXPECT_FALSE(info_.killed);
}

// NOLINTNEXTLINE
TEST_F(UnixTest, TestWaitArg1) {
  ExecutionOptions options("sandbox/test", "wait_arg1");
  options.SetArgs({"1"});
  EXPECT_TRUE(Run(options));
  EXPECT_EQ(error_msg_, "");
  EXPECT_EQ(info_.signal, 0);
  EXPECT_EQ(info_.status_code, 0);
  EXPECT_GE(info_.wall_time_millis, 900);
  EXPECT_LE(info_.wall_time_millis, 2000);
  EXPECT_LE(info_.cpu_time_millis, 300);
}

// NOLINTNEXTLINE
TEST_F(UnixTest, TestBusyWaitArg1) {
  ExecutionOptions options("sandbox/test", "busywait_arg1");
  options.SetArgs({"1"});
  EXPECT_TRUE(Run(options));
  EXPECT_EQ(error_msg_, "");
  EXPECT_EQ(info_.signal, 0);
  EXPECT_GE(info_.cpu_time_millis + info_.sys_time_millis, 900);
  EXPECT_LE(info_.cpu_time_millis + info_.sys_time_millis, 1500);
  EXPECT_GE(info_.wall_time_millis, 900);
}

// NOLINTNEXTLINE
TEST_F(UnixTest, TestMallocArg1) {
  ExecutionOptions options("sandbox/test", "malloc_arg1");
  options.SetArgs({"40"});
  EXPECT_TRUE(Run(options));
  EXPECT_EQ(error_msg_, "");
  EXPECT_EQ(info_.status_code, 0);
  EXPECT_GE(info_.memory_usage_kb, 40 * 1024);
  EXPECT_LE(info_.memory_usage_kb, 60 * 1024);
}

// NOLINTNEXTLINE
TEST_F(UnixTest, TestMemoryLimitOk) {
  ExecutionOptions options("sandbox/test", "malloc_arg1");
  options.SetArgs({"20"});
  options.memory_limit_kb = 128 * 1024;
  EXPECT_TRUE(Run(options));
  EXPECT_EQ(error_msg_, "");
  EXPECT_EQ(info_.signal, 0);
  EXPECT_EQ(info_.status_code, 0);
}

// NOLINTNEXTLINE
TEST_F(UnixTest, TestMemoryLimitNotOk) {
  ExecutionOptions options("sandbox/test", "malloc_arg1");
  options.SetArgs({"200"});
  options.memory_limit_kb = 64 * 1024;
  EXPECT_TRUE(Run(options));
  EXPECT_EQ(error_msg_, "");
  // malloc fails, or the program dies touching memory it could not get.
  EXPECT_TRUE(info_.status_code != 0 || info_.signal == SIGSEGV ||
              info_.signal == SIGKILL);
}

// NOLINTNEXTLINE
TEST_F(UnixTest, TestDataLimitNotOk) {
  ExecutionOptions options("sandbox/test", "malloc_arg1");
  options.SetArgs({"200"});
  options.data_limit_kb = 64 * 1024;
  EXPECT_TRUE(Run(options));
  EXPECT_TRUE(info_.status_code != 0 || info_.signal != 0);
}

// NOLINTNEXTLINE
TEST_F(UnixTest, TestWallLimitOk) {
  ExecutionOptions options("sandbox/test", "wait_arg1");
  options.SetArgs({"1"});
  options.wall_limit_millis = 2000;
  EXPECT_TRUE(Run(options));
  EXPECT_EQ(error_msg_, "");
  EXPECT_EQ(info_.signal, 0);
  EXPECT_FALSE(info_.killed);
  EXPECT_GE(info_.wall_time_millis, 900);
  EXPECT_LE(info_.wall_time_millis, 1900);
}

// NOLINTNEXTLINE
TEST_F(UnixTest, TestWallLimitNotOk) {
  ExecutionOptions options("sandbox/test", "wait_arg1");
  options.SetArgs({"1"});
  options.wall_limit_millis = 200;
  EXPECT_TRUE(Run(options));
  EXPECT_EQ(error_msg_, "");
  EXPECT_EQ(info_.signal, SIGKILL);
  EXPECT_TRUE(info_.killed);
  EXPECT_GE(info_.wall_time_millis, 100);
  EXPECT_LE(info_.wall_time_millis, 800);
}

// NOLINTNEXTLINE
TEST_F(UnixTest, TestCpuLimitNotOk) {
  ExecutionOptions options("sandbox/test", "busywait_arg1");
  options.SetArgs({"10"});
  options.cpu_limit_millis = 1000;
  EXPECT_TRUE(Run(options));
  EXPECT_EQ(error_msg_, "");
  EXPECT_THAT(info_.signal, AnyOf(Eq(SIGKILL), Eq(SIGXCPU)));
  EXPECT_TRUE(info_.killed);
  EXPECT_GE(info_.cpu_time_millis + info_.sys_time_millis, 900);
  EXPECT_LE(info_.cpu_time_millis + info_.sys_time_millis, 2500);
}

// NOLINTNEXTLINE
TEST_F(UnixTest, TestIORedirect) {
  util::File::MakeDirs(test_tmpdir);
  std::string dir = test_tmpdir;
  util::File::WriteAll(dir + "/in", "10");
  ExecutionOptions options("sandbox/test", "copy_int");
  ExecutionOptions::stringcpy(options.stdin_file, dir + "/in");
  ExecutionOptions::stringcpy(options.stdout_file, dir + "/out");
  ExecutionOptions::stringcpy(options.stderr_file, dir + "/err");
  EXPECT_TRUE(Run(options));
  EXPECT_EQ(error_msg_, "");
  EXPECT_EQ(info_.status_code, 0);
  EXPECT_EQ(util::File::ReadAll(dir + "/out"), "10\n");
  EXPECT_EQ(util::File::ReadAll(dir + "/err"), "10\n");
}

// NOLINTNEXTLINE
TEST_F(UnixTest, TestStdinDefaultsToDevNull) {
  ExecutionOptions options("sandbox/test", "copy_int");
  EXPECT_TRUE(Run(options));
  EXPECT_EQ(error_msg_, "");
  EXPECT_EQ(info_.status_code, 1);
}

// NOLINTNEXTLINE
TEST_F(UnixTest, TestEnvironmentIsExplicit) {
  setenv("EXAMINER_SECRET", "1", 1);
  ExecutionOptions options("/", "/bin/sh");
  options.SetArgs({"-c", "test -z \"$EXAMINER_SECRET\" && test \"$A\" = b"});
  options.SetEnv(std::vector<std::string>{"A=b"});
  EXPECT_TRUE(Run(options));
  EXPECT_EQ(error_msg_, "");
  EXPECT_EQ(info_.status_code, 0);
  unsetenv("EXAMINER_SECRET");
}

}  // namespace
