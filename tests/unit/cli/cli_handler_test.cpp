#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "rag_cli/cli_handler.hpp"

namespace rag_tests {

using rag_cli::CliError;
using rag_cli::CliHandler;
using rag_cli::CliOptions;
using rag_cli::Command;

namespace {

CliOptions parse(std::vector<std::string> args) {
  std::vector<char*> argv;
  for (auto& arg : args) {
    argv.push_back(arg.data());
  }
  CliHandler handler;
  return handler.parse_arguments(static_cast<int>(argv.size()), argv.data());
}

}  // namespace

TEST(CliHandlerTest, NoArgumentsShowsHelp) {
  EXPECT_EQ(parse({"rag_cli"}).command, Command::Help);
  EXPECT_EQ(parse({"rag_cli", "--help"}).command, Command::Help);
}

TEST(CliHandlerTest, ParsesAskCommand) {
  CliOptions options = parse({"rag_cli", "ask", "--video", "dQw4w9WgXcQ", "-q", "What is said?",
                              "-t", "/data/transcripts", "--timeout-ms", "1500", "--sequential"});
  EXPECT_EQ(options.command, Command::Ask);
  EXPECT_EQ(options.video_id, "dQw4w9WgXcQ");
  EXPECT_EQ(options.question, "What is said?");
  EXPECT_EQ(options.transcripts_dir, "/data/transcripts");
  EXPECT_EQ(options.timeout_ms, 1500);
  EXPECT_TRUE(options.sequential);
  EXPECT_TRUE(options.config_path.empty());
}

TEST(CliHandlerTest, AskDefaults) {
  CliOptions options = parse({"rag_cli", "a", "-v", "vid", "-q", "why?"});
  EXPECT_EQ(options.transcripts_dir, "./transcripts");
  EXPECT_EQ(options.timeout_ms, 0);
  EXPECT_FALSE(options.sequential);
}

TEST(CliHandlerTest, AskRequiresVideoAndQuestion) {
  EXPECT_THROW(parse({"rag_cli", "ask", "--video", "vid"}), CliError);
  EXPECT_THROW(parse({"rag_cli", "ask", "--question", "why?"}), CliError);
}

TEST(CliHandlerTest, AskRejectsBadFlags) {
  EXPECT_THROW(parse({"rag_cli", "ask", "-v", "vid", "-q", "why?", "--bogus", "1"}), CliError);
  EXPECT_THROW(parse({"rag_cli", "ask", "-v", "vid", "-q"}), CliError);
  EXPECT_THROW(parse({"rag_cli", "ask", "-v", "vid", "-q", "why?", "--timeout-ms", "soon"}),
               CliError);
  EXPECT_THROW(parse({"rag_cli", "ask", "-v", "vid", "-q", "why?", "--timeout-ms", "-5"}),
               CliError);
}

TEST(CliHandlerTest, ParsesGraphCommand) {
  CliOptions options = parse({"rag_cli", "graph", "--config", "custom.json"});
  EXPECT_EQ(options.command, Command::Graph);
  EXPECT_EQ(options.config_path, "custom.json");
}

TEST(CliHandlerTest, UnknownCommandThrows) {
  EXPECT_THROW(parse({"rag_cli", "index"}), CliError);
}

TEST(CliHandlerTest, HelpListsCommands) {
  CliHandler handler;
  CliOptions options;
  options.command = Command::Help;

  testing::internal::CaptureStdout();
  handler.execute_command(options);
  const std::string output = testing::internal::GetCapturedStdout();

  EXPECT_NE(output.find("ask"), std::string::npos);
  EXPECT_NE(output.find("graph"), std::string::npos);
  EXPECT_NE(output.find("--video"), std::string::npos);
}

}  // namespace rag_tests
