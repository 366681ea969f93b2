#include "rag_core/llm/ollama_client.hpp"

#include <iostream>

#include "ollama.hpp"
#include "rag_core/errors.hpp"

namespace rag_core {

namespace {

Vector to_vector(const nlohmann::json &embedding) {
  if (!embedding.is_array()) {
    throw EmbeddingServiceError("Embedding is not an array");
  }
  return embedding.get<Vector>();
}

}  // namespace

OllamaClient::OllamaClient(const OllamaSettings &settings, double temperature)
    : ollama_url_(settings.ollama_url),
      embedding_model_(settings.embedding_model),
      generation_model_(settings.generation_model),
      temperature_(temperature) {
  setup_server_connection();
}

OllamaClient::~OllamaClient() = default;

void OllamaClient::setup_server_connection() {
  // Set the server URL for ollama-hpp
  ollama::setServerURL(ollama_url_);
  std::cout << "[OllamaClient] Using server " << ollama_url_ << " (embedding: "
            << embedding_model_ << ", generation: " << generation_model_ << ")" << std::endl;
}

Vector OllamaClient::embed(const std::string &text) {
  std::lock_guard<std::mutex> lock(client_mutex_);
  try {
    ollama::response response = ollama::generate_embeddings(embedding_model_, text);
    auto json_response = response.as_json();

    if (!json_response.contains("embeddings")) {
      throw EmbeddingServiceError("Response does not contain embeddings field");
    }

    // Handle different embedding response formats
    const auto &embeddings = json_response["embeddings"];
    if (embeddings.is_array() && !embeddings.empty() && embeddings[0].is_array()) {
      // Array of arrays - take the first embedding vector
      return to_vector(embeddings[0]);
    }
    return to_vector(embeddings);
  } catch (const ollama::exception &e) {
    throw EmbeddingServiceError("Embedding generation failed: " + std::string(e.what()));
  } catch (const nlohmann::json::exception &e) {
    throw EmbeddingServiceError("Unreadable embedding response: " + std::string(e.what()));
  }
}

std::vector<Vector> OllamaClient::embed_many(const std::vector<std::string> &texts) {
  if (texts.empty()) {
    return {};
  }

  std::lock_guard<std::mutex> lock(client_mutex_);
  try {
    // The /api/embed endpoint accepts an array input and answers with one vector per entry
    ollama::request request = ollama::request::from_embedding(embedding_model_, texts.front());
    request["input"] = texts;
    ollama::response response = ollama::generate_embeddings(request);
    auto json_response = response.as_json();

    if (!json_response.contains("embeddings") || !json_response["embeddings"].is_array()) {
      throw EmbeddingServiceError("Response does not contain embeddings array");
    }

    const auto &embeddings = json_response["embeddings"];
    if (embeddings.size() != texts.size()) {
      throw EmbeddingServiceError("Expected " + std::to_string(texts.size()) +
                                  " embeddings, got " + std::to_string(embeddings.size()));
    }

    std::vector<Vector> vectors;
    vectors.reserve(embeddings.size());
    for (const auto &embedding : embeddings) {
      vectors.push_back(to_vector(embedding));
    }
    return vectors;
  } catch (const ollama::exception &e) {
    throw EmbeddingServiceError("Batch embedding generation failed: " + std::string(e.what()));
  } catch (const nlohmann::json::exception &e) {
    throw EmbeddingServiceError("Unreadable embedding response: " + std::string(e.what()));
  }
}

RawResponse OllamaClient::generate(const std::string &prompt) {
  std::lock_guard<std::mutex> lock(client_mutex_);
  try {
    ollama::options options;
    options["temperature"] = temperature_;

    ollama::response response = ollama::generate(generation_model_, prompt, options);
    return response.as_json();
  } catch (const ollama::exception &e) {
    throw GenerationServiceError("Generation failed: " + std::string(e.what()));
  }
}

}  // namespace rag_core
