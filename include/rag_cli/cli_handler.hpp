#pragma once

#include <string>

#include "rag_core/config.hpp"

namespace rag_cli
{

  enum class Command
  {
    Ask,
    Graph,
    Help
  };

  struct CliOptions
  {
    Command command = Command::Help;
    std::string video_id;
    std::string question;
    std::string transcripts_dir = "./transcripts";
    std::string config_path;
    int timeout_ms = 0;
    bool sequential = false;
  };

  class CliError : public std::exception
  {
  public:
    explicit CliError(const std::string &message) : message_(message) {}

    const char *what() const noexcept override
    {
      return message_.c_str();
    }

  private:
    std::string message_;
  };

  class CliHandler
  {
  public:
    CliHandler() = default;

    // Parse command line arguments
    CliOptions parse_arguments(int argc, char *argv[]);

    // Execute command
    void execute_command(const CliOptions &options);

  private:
    // Command handlers
    void handle_ask_command(const CliOptions &options);
    void handle_graph_command(const CliOptions &options);
    void handle_help_command();

    // Explicit --config, else ./ragrc.json when present, else built-in defaults
    rag_core::Config load_config(const CliOptions &options) const;
  };

} // namespace rag_cli
