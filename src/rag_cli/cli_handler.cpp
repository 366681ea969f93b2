#include "rag_cli/cli_handler.hpp"

#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>

#include "rag_core/index/flat_vector_index.hpp"
#include "rag_core/llm/ollama_client.hpp"
#include "rag_core/services/transcript_qa_service.hpp"
#include "rag_core/sources/file_transcript_source.hpp"

namespace rag_cli {

namespace {

constexpr const char *DEFAULT_CONFIG_FILE = "ragrc.json";

int parse_int(const std::string& flag, const std::string& value) {
    try {
        return std::stoi(value);
    } catch (const std::exception&) {
        throw CliError("Expected a number for " + flag + ", got '" + value + "'");
    }
}

}  // namespace

CliOptions CliHandler::parse_arguments(int argc, char* argv[]) {
    CliOptions options;

    if (argc < 2) {
        options.command = Command::Help;
        return options;
    }

    std::string command = argv[1];

    if (command == "ask" || command == "a") {
        options.command = Command::Ask;
        for (int i = 2; i < argc; ++i) {
            std::string flag = argv[i];
            if (flag == "--sequential") {
                options.sequential = true;
                continue;
            }
            if (i + 1 >= argc) {
                throw CliError("Missing value for " + flag);
            }
            std::string value = argv[++i];

            if (flag == "--video" || flag == "-v") {
                options.video_id = value;
            } else if (flag == "--question" || flag == "-q") {
                options.question = value;
            } else if (flag == "--transcripts" || flag == "-t") {
                options.transcripts_dir = value;
            } else if (flag == "--config" || flag == "-c") {
                options.config_path = value;
            } else if (flag == "--timeout-ms") {
                options.timeout_ms = parse_int(flag, value);
            } else {
                throw CliError("Unknown flag for ask: " + flag);
            }
        }
        if (options.video_id.empty() || options.question.empty()) {
            throw CliError(
                "Ask command requires a video and a question. Usage: ask --video <id> --question <text>");
        }
        if (options.timeout_ms < 0) {
            throw CliError("--timeout-ms cannot be negative");
        }
    } else if (command == "graph" || command == "g") {
        options.command = Command::Graph;
        for (int i = 2; i < argc; i += 2) {
            if (i + 1 >= argc) break;
            std::string flag = argv[i];
            std::string value = argv[i + 1];

            if (flag == "--config" || flag == "-c") {
                options.config_path = value;
            }
        }
    } else if (command == "help" || command == "h" || command == "--help" || command == "-h") {
        options.command = Command::Help;
    } else {
        throw CliError("Unknown command: " + command);
    }

    return options;
}

void CliHandler::execute_command(const CliOptions& options) {
    switch (options.command) {
        case Command::Ask:
            handle_ask_command(options);
            break;
        case Command::Graph:
            handle_graph_command(options);
            break;
        case Command::Help:
            handle_help_command();
            break;
    }
}

rag_core::Config CliHandler::load_config(const CliOptions& options) const {
    if (!options.config_path.empty()) {
        return rag_core::Config::from_file(options.config_path);
    }
    if (std::filesystem::exists(DEFAULT_CONFIG_FILE)) {
        return rag_core::Config::from_file(DEFAULT_CONFIG_FILE);
    }
    return rag_core::Config::from_json(nlohmann::json::object());
}

void CliHandler::handle_ask_command(const CliOptions& options) {
    const rag_core::Config config = load_config(options);

    auto ollama_client = std::make_shared<rag_core::OllamaClient>(config.ollama, config.temperature);
    auto source = std::make_shared<rag_core::FileTranscriptSource>(options.transcripts_dir);
    auto index = std::make_shared<rag_core::FlatVectorIndex>();
    const rag_core::JoinMode join_mode =
        options.sequential ? rag_core::JoinMode::Sequential : rag_core::JoinMode::Concurrent;

    rag_core::TranscriptQaService service(config, source, ollama_client, ollama_client, index,
                                          join_mode);

    rag_core::RunContext context;
    if (options.timeout_ms > 0) {
        context = rag_core::RunContext::with_timeout(std::chrono::milliseconds(options.timeout_ms));
    }

    rag_core::AnswerResult result = service.answer(options.video_id, options.question, context);
    if (result.status == rag_core::AnswerStatus::NoTranscript) {
        std::cout << "No transcript available for video " << options.video_id << "." << std::endl;
        return;
    }

    std::cout << "\nQuestion: " << options.question << std::endl;
    std::cout << "Answer: " << result.answer << std::endl;
}

void CliHandler::handle_graph_command(const CliOptions& options) {
    const rag_core::Config config = load_config(options);

    auto ollama_client = std::make_shared<rag_core::OllamaClient>(config.ollama, config.temperature);
    auto index = std::make_shared<rag_core::FlatVectorIndex>();
    rag_core::RunnablePtr chain =
        rag_core::build_qa_chain(ollama_client, index, ollama_client, config.retrieval_k);

    std::cout << chain->graph().to_ascii();
}

void CliHandler::handle_help_command() {
    std::cout << "Transcript Q&A CLI\n"
              << "==================\n\n"
              << "Usage: rag_cli <command> [options]\n\n"
              << "Commands:\n"
              << "  ask, a      Answer a question about a video transcript\n"
              << "              --video, -v <id>          Video id (required)\n"
              << "              --question, -q <text>     Question (required)\n"
              << "              --transcripts, -t <dir>   Transcript directory (default: ./transcripts)\n"
              << "              --config, -c <file>       Configuration file (default: ./ragrc.json)\n"
              << "              --timeout-ms <ms>         Cancel the answer after this long\n"
              << "              --sequential              Run parallel branches one after another\n"
              << "  graph, g    Print the question-answering pipeline as a diagram\n"
              << "              --config, -c <file>       Configuration file\n"
              << "  help, h     Show this help message\n\n"
              << "Transcripts are read from <dir>/<video id>.json.\n";
}

}  // namespace rag_cli
