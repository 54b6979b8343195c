#include <gtest/gtest.h>

#include <chrono>
#include <string>

#include "ffmpeg_mcp/ffmpeg_executor.hpp"
#include "ffmpeg_mcp/system.hpp"
#include "test_helpers.hpp"

using namespace ffmpeg_mcp;
using namespace std::chrono_literals;

// **---- Outcomes with a stand-in shell command ----**

TEST(FFmpegExecutor, SuccessfulRun) {
  auto r = execute_ffmpeg_command("echo hello", "/");
  EXPECT_TRUE(r.succeeded);
  EXPECT_EQ(r.exit_code, 0);
  EXPECT_EQ(r.stdout_text, "hello\n");
  EXPECT_EQ(r.stderr_text, "");
  EXPECT_FALSE(r.error_message.has_value());
  EXPECT_EQ(r.status, ExecutionStatus::Completed);
  EXPECT_FALSE(r.failure().has_value());
}

TEST(FFmpegExecutor, NonZeroExitKeepsLogs) {
  auto r = execute_ffmpeg_command("echo partial; echo broken 1>&2; exit 3", "/");
  EXPECT_FALSE(r.succeeded);
  EXPECT_EQ(r.exit_code, 3);
  EXPECT_EQ(r.stdout_text, "partial\n");
  EXPECT_EQ(r.stderr_text, "broken\n");
  ASSERT_TRUE(r.error_message.has_value());
  EXPECT_EQ(*r.error_message, "FFmpeg command failed with exit code 3");
  EXPECT_EQ(r.failure(), ErrorKind::NonZeroExit);
}

TEST(FFmpegExecutor, TimeoutKillsAndReports) {
  auto start = std::chrono::steady_clock::now();
  auto r = execute_ffmpeg_command("sleep 30", "/", 1);
  auto elapsed = std::chrono::steady_clock::now() - start;

  EXPECT_GE(elapsed, 900ms);
  EXPECT_LT(elapsed, 10s);
  EXPECT_FALSE(r.succeeded);
  EXPECT_EQ(r.exit_code, NO_EXIT_CODE);
  EXPECT_EQ(r.stdout_text, "");
  EXPECT_EQ(r.stderr_text, "Command timed out after 1 seconds");
  EXPECT_EQ(r.error_message.value_or(""), "Command timed out after 1 seconds");
  EXPECT_EQ(r.status, ExecutionStatus::TimedOut);
  EXPECT_EQ(r.failure(), ErrorKind::ExecutionTimeout);
}

TEST(FFmpegExecutor, TimeoutIsNotHitByFastCommand) {
  auto r = execute_ffmpeg_command("echo quick", "/", 5);
  EXPECT_TRUE(r.succeeded);
  EXPECT_EQ(r.stdout_text, "quick\n");
}

TEST(FFmpegExecutor, SpawnFailureIsAFault) {
  test::TempDir dir;
  std::string missing = (dir.path() / "removed").string();
  auto r = execute_ffmpeg_command("echo never", missing);
  EXPECT_FALSE(r.succeeded);
  EXPECT_EQ(r.exit_code, NO_EXIT_CODE);
  ASSERT_TRUE(r.error_message.has_value());
  EXPECT_EQ(r.error_message->rfind("Execution error: ", 0), 0u)
      << *r.error_message;
  EXPECT_EQ(r.stderr_text, *r.error_message);
  EXPECT_EQ(r.failure(), ErrorKind::ExecutionFault);
}

TEST(FFmpegExecutor, RunsInRequestedDirectory) {
  test::TempDir dir;
  dir.write_file("input.txt", "frame data");
  auto r = execute_ffmpeg_command("cat input.txt", dir.str());
  EXPECT_TRUE(r.succeeded);
  EXPECT_EQ(r.stdout_text, "frame data");
}

// **---- Real ffmpeg (skipped when not installed) ----**

class RealFFmpeg : public ::testing::Test {
protected:
  void SetUp() override {
    if (find_executable("ffmpeg").empty())
      GTEST_SKIP() << "ffmpeg not on PATH";
  }
};

TEST_F(RealFFmpeg, VersionSucceeds) {
  auto r = execute_ffmpeg_command("ffmpeg -version", "/", 30);
  EXPECT_TRUE(r.succeeded);
  EXPECT_EQ(r.exit_code, 0);
  EXPECT_NE(r.stdout_text.find("ffmpeg version"), std::string::npos);
}

TEST_F(RealFFmpeg, UnknownOptionFails) {
  auto r = execute_ffmpeg_command("ffmpeg -no_such_option_xyz", "/", 30);
  EXPECT_FALSE(r.succeeded);
  EXPECT_NE(r.exit_code, 0);
  EXPECT_FALSE(r.stderr_text.empty());
}

TEST_F(RealFFmpeg, GeneratesOutputInWorkingDirectory) {
  test::TempDir dir;
  auto r = execute_ffmpeg_command(
      "ffmpeg -hide_banner -f lavfi -i testsrc=duration=1:size=64x64:rate=5 "
      "-y out.mkv",
      dir.str(), 60);
  EXPECT_TRUE(r.succeeded) << r.stderr_text;
  EXPECT_TRUE(std::filesystem::exists(dir.path() / "out.mkv"));
}
