#include <gtest/gtest.h>

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "ffmpeg_mcp/tool_service.hpp"
#include "test_helpers.hpp"

using namespace ffmpeg_mcp;
using json = nlohmann::json;

namespace {

/// Records the last call instead of spawning anything
struct RecordingExecutor {
  int calls = 0;
  std::string command;
  std::string working_dir;
  std::optional<int> timeout;
  int in_flight_during_call = -1;
  ExecutionLimiter *limiter = nullptr;
  ExecutionResult reply = ExecutionResult::completed(0, "ok", "");

  ToolService::Executor bind() {
    return [this](const std::string &cmd, const std::string &dir,
                  std::optional<int> t) {
      ++calls;
      command = cmd;
      working_dir = dir;
      timeout = t;
      if (limiter)
        in_flight_during_call = limiter->in_flight();
      return reply;
    };
  }
};

class ToolServiceTest : public ::testing::Test {
protected:
  ToolServiceTest() : limiter(2), service(limiter, fake.bind()) {
    fake.limiter = &limiter;
  }

  std::string parse_error(const json &args) {
    CommandRequest req;
    auto err = ToolService::parse_request(args, req);
    return err ? err->message : std::string();
  }

  ExecutionLimiter limiter;
  RecordingExecutor fake;
  ToolService service;
};

} // anonymous namespace

// **---- Argument parsing ----**

TEST_F(ToolServiceTest, ParsesAllFields) {
  test::TempDir dir;
  CommandRequest req;
  auto err = ToolService::parse_request(
      {{"command", "ffmpeg -version"}, {"workingDir", dir.str()},
       {"timeout", 30}},
      req);
  ASSERT_FALSE(err.has_value());
  EXPECT_EQ(req.command, "ffmpeg -version");
  EXPECT_EQ(req.working_dir, dir.str());
  EXPECT_EQ(req.timeout_seconds, 30);
}

TEST_F(ToolServiceTest, AcceptsLongFormAliases) {
  CommandRequest req;
  auto err = ToolService::parse_request({{"command", "ffmpeg -version"},
                                         {"workingDirectory", "/"},
                                         {"timeoutSeconds", 5}},
                                        req);
  ASSERT_FALSE(err.has_value());
  EXPECT_EQ(req.working_dir, "/");
  EXPECT_EQ(req.timeout_seconds, 5);
}

TEST_F(ToolServiceTest, NullOptionalFieldsMeanAbsent) {
  CommandRequest req;
  auto err = ToolService::parse_request(
      {{"command", "ffmpeg -version"}, {"workingDir", nullptr},
       {"timeout", nullptr}},
      req);
  ASSERT_FALSE(err.has_value());
  EXPECT_FALSE(req.working_dir.has_value());
  EXPECT_FALSE(req.timeout_seconds.has_value());
}

TEST_F(ToolServiceTest, RejectsMalformedArguments) {
  EXPECT_EQ(parse_error(json::array()),
            "Invalid parameters: arguments must be an object");
  EXPECT_EQ(parse_error(json::object()),
            "Invalid parameters: command is required");
  EXPECT_EQ(parse_error({{"command", 42}}),
            "Invalid parameters: command must be a string");
  EXPECT_EQ(parse_error({{"command", "ffmpeg -version"}, {"workingDir", 7}}),
            "Invalid parameters: workingDir must be a string");
  EXPECT_EQ(parse_error({{"command", "ffmpeg -version"}, {"timeout", "10"}}),
            "Invalid parameters: timeout must be an integer");
  EXPECT_EQ(parse_error({{"command", "ffmpeg -version"}, {"timeout", 2.5}}),
            "Invalid parameters: timeout must be an integer");
}

TEST_F(ToolServiceTest, EnforcesTimeoutBounds) {
  const std::string range =
      "Invalid parameters: timeout must be between 1 and 21600 seconds";
  EXPECT_EQ(parse_error({{"command", "ffmpeg -version"}, {"timeout", 0}}),
            range);
  EXPECT_EQ(parse_error({{"command", "ffmpeg -version"}, {"timeout", -1}}),
            range);
  EXPECT_EQ(parse_error({{"command", "ffmpeg -version"}, {"timeout", 21601}}),
            range);
  EXPECT_EQ(parse_error({{"command", "ffmpeg -version"},
                         {"timeout", 4294967297LL}}),
            range);
  EXPECT_EQ(parse_error({{"command", "ffmpeg -version"}, {"timeout", 1}}), "");
  EXPECT_EQ(parse_error({{"command", "ffmpeg -version"}, {"timeout", 21600}}),
            "");
}

// **---- Invocation ----**

TEST_F(ToolServiceTest, InvalidCommandNeverExecutes) {
  auto outcome = service.invoke(json{{"command", "ffmpeg -i a.mp4; rm x"}});
  ASSERT_FALSE(outcome.executed());
  EXPECT_EQ(outcome.error->kind, ErrorKind::InvalidCommand);
  EXPECT_EQ(outcome.error->message, "Blocked shell operator detected: ;");
  EXPECT_EQ(fake.calls, 0);
}

TEST_F(ToolServiceTest, InvalidDirectoryNeverExecutes) {
  test::TempDir dir;
  std::string missing = (dir.path() / "missing").string();
  auto outcome = service.invoke(
      json{{"command", "ffmpeg -version"}, {"workingDir", missing}});
  ASSERT_FALSE(outcome.executed());
  EXPECT_EQ(outcome.error->kind, ErrorKind::InvalidWorkingDirectory);
  EXPECT_EQ(outcome.error->message,
            "Working directory does not exist: " + missing);
  EXPECT_EQ(fake.calls, 0);
}

TEST_F(ToolServiceTest, CommandIsCheckedBeforeDirectory) {
  auto outcome = service.invoke(
      json{{"command", "ls"}, {"workingDir", "/no/such/dir/at/all"}});
  ASSERT_FALSE(outcome.executed());
  EXPECT_EQ(outcome.error->kind, ErrorKind::InvalidCommand);
}

TEST_F(ToolServiceTest, BadParametersNeverExecute) {
  auto outcome = service.invoke(json{{"timeout", 5}});
  ASSERT_FALSE(outcome.executed());
  EXPECT_EQ(outcome.error->kind, ErrorKind::InvalidParameters);
  EXPECT_EQ(fake.calls, 0);
}

TEST_F(ToolServiceTest, PassesCanonicalValuesToExecutor) {
  test::TempDir dir;
  auto outcome = service.invoke(json{{"command", "  ffmpeg -version  "},
                                     {"workingDir", dir.str() + "/"},
                                     {"timeout", 12}});
  ASSERT_TRUE(outcome.executed());
  EXPECT_EQ(fake.calls, 1);
  EXPECT_EQ(fake.command, "ffmpeg -version");
  EXPECT_EQ(fake.working_dir, dir.str());
  EXPECT_EQ(fake.timeout, 12);
  EXPECT_TRUE(outcome.result.succeeded);
  EXPECT_EQ(outcome.result.stdout_text, "ok");
}

TEST_F(ToolServiceTest, AbsentTimeoutIsUnlimited) {
  auto outcome = service.invoke(json{{"command", "ffmpeg -version"}});
  ASSERT_TRUE(outcome.executed());
  EXPECT_FALSE(fake.timeout.has_value());
}

TEST_F(ToolServiceTest, HoldsSlotOnlyWhileExecuting) {
  auto outcome = service.invoke(json{{"command", "ffmpeg -version"}});
  ASSERT_TRUE(outcome.executed());
  EXPECT_EQ(fake.in_flight_during_call, 1);
  EXPECT_EQ(limiter.in_flight(), 0);
}

TEST_F(ToolServiceTest, ExecutionFailureIsAResultNotAnError) {
  fake.reply = ExecutionResult::completed(1, "", "Invalid argument");
  auto outcome = service.invoke(json{{"command", "ffmpeg -i missing.mp4"}});
  ASSERT_TRUE(outcome.executed());
  EXPECT_FALSE(outcome.result.succeeded);
  EXPECT_EQ(outcome.result.exit_code, 1);
  EXPECT_EQ(outcome.result.stderr_text, "Invalid argument");
}

TEST_F(ToolServiceTest, InvokeWithParsedRequest) {
  CommandRequest req;
  req.command = "ffmpeg -formats";
  auto outcome = service.invoke(req);
  ASSERT_TRUE(outcome.executed());
  EXPECT_EQ(fake.command, "ffmpeg -formats");
}

// **---- Schema ----**

TEST(ToolServiceSchema, DescribesArguments) {
  json schema = ToolService::input_schema();
  EXPECT_EQ(schema["type"], "object");
  EXPECT_EQ(schema["required"], json::array({"command"}));
  EXPECT_EQ(schema["properties"]["command"]["type"], "string");
  EXPECT_EQ(schema["properties"]["workingDir"]["type"], "string");
  EXPECT_EQ(schema["properties"]["timeout"]["type"], "integer");
  EXPECT_EQ(schema["properties"]["timeout"]["minimum"], 1);
  EXPECT_EQ(schema["properties"]["timeout"]["maximum"], 21600);
}
