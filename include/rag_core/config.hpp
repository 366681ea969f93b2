#pragma once

#include <fstream>
#include <string>

#include <nlohmann/json.hpp>

#include "rag_core/errors.hpp"

namespace rag_core {

// Connection settings of the external model server. They configure the collaborator,
// not the pipeline itself.
struct OllamaSettings {
  std::string ollama_url = "http://localhost:11434";
  std::string embedding_model = "mxbai-embed-large";
  std::string generation_model = "llama3.2";
  int embed_batch_size = 32;
};

class Config {
 public:
  static constexpr int DEFAULT_CHUNK_SIZE = 1000;
  static constexpr int DEFAULT_CHUNK_OVERLAP = 200;
  static constexpr int DEFAULT_RETRIEVAL_K = 4;
  static constexpr double DEFAULT_TEMPERATURE = 0.2;

  int chunk_size = DEFAULT_CHUNK_SIZE;
  int chunk_overlap = DEFAULT_CHUNK_OVERLAP;
  int retrieval_k = DEFAULT_RETRIEVAL_K;
  double temperature = DEFAULT_TEMPERATURE;

  OllamaSettings ollama;

  // Load configuration from a JSON file at the given path
  static Config from_file(const std::string &filename) {
    std::ifstream file_stream(filename);
    if (!file_stream.is_open()) {
      throw InvalidConfig("Failed to open config file: " + filename);
    }

    nlohmann::json json_config;
    try {
      file_stream >> json_config;
    } catch (const nlohmann::json::exception &e) {
      throw InvalidConfig(std::string("Failed to parse JSON in config file '") + filename +
                          "': " + e.what());
    }

    return from_json(json_config);
  }

  // Construct configuration from a JSON object (useful for tests)
  static Config from_json(const nlohmann::json &json_config) {
    if (!json_config.is_object()) {
      throw InvalidConfig("Configuration must be a JSON object");
    }

    Config config;
    try {
      // Apply defaults when keys are missing
      config.chunk_size = json_config.value("chunk_size", DEFAULT_CHUNK_SIZE);
      config.chunk_overlap = json_config.value("chunk_overlap", DEFAULT_CHUNK_OVERLAP);
      config.retrieval_k = json_config.value("retrieval_k", DEFAULT_RETRIEVAL_K);
      config.temperature = json_config.value("temperature", DEFAULT_TEMPERATURE);

      const OllamaSettings defaults;
      config.ollama.ollama_url = json_config.value("ollama_url", defaults.ollama_url);
      config.ollama.embedding_model =
          json_config.value("embedding_model", defaults.embedding_model);
      config.ollama.generation_model =
          json_config.value("generation_model", defaults.generation_model);
      config.ollama.embed_batch_size =
          json_config.value("embed_batch_size", defaults.embed_batch_size);
    } catch (const nlohmann::json::type_error &e) {
      throw InvalidConfig(std::string("Wrong value type in configuration: ") + e.what());
    }

    config.validate();
    return config;
  }

  void validate() const {
    if (chunk_size <= 0) {
      throw InvalidConfig("chunk_size must be greater than 0");
    }
    if (chunk_overlap < 0 || chunk_overlap >= chunk_size) {
      throw InvalidConfig("chunk_overlap must be in [0, chunk_size)");
    }
    if (retrieval_k <= 0) {
      throw InvalidConfig("retrieval_k must be greater than 0");
    }
    if (temperature < 0.0) {
      throw InvalidConfig("temperature cannot be negative");
    }
    if (ollama.ollama_url.empty()) {
      throw InvalidConfig("ollama_url cannot be empty");
    }
    if (ollama.embedding_model.empty()) {
      throw InvalidConfig("embedding_model cannot be empty");
    }
    if (ollama.generation_model.empty()) {
      throw InvalidConfig("generation_model cannot be empty");
    }
    if (ollama.embed_batch_size <= 0) {
      throw InvalidConfig("embed_batch_size must be greater than 0");
    }
  }
};

}  // namespace rag_core
