#pragma once

#include <mutex>
#include <string>
#include <vector>

#include "rag_core/config.hpp"
#include "rag_core/llm/embedding_port.hpp"
#include "rag_core/llm/generation_port.hpp"

namespace rag_core {

/**
 * @class OllamaClient
 * @brief Embedding and generation collaborator backed by an Ollama server.
 *
 * Calls are serialised because ollama-hpp shares one HTTP client per process. A call that is
 * already on the wire cannot be interrupted; its result is dropped if nobody waits for it.
 */
class OllamaClient : public EmbeddingPort, public GenerationPort {
 public:
  OllamaClient(const OllamaSettings &settings, double temperature);
  ~OllamaClient() override;

  // Disable copy constructor and assignment
  OllamaClient(const OllamaClient &) = delete;
  OllamaClient &operator=(const OllamaClient &) = delete;

  Vector embed(const std::string &text) override;
  // One request per call, the server embeds the whole batch
  std::vector<Vector> embed_many(const std::vector<std::string> &texts) override;

  RawResponse generate(const std::string &prompt) override;

 private:
  std::string ollama_url_;
  std::string embedding_model_;
  std::string generation_model_;
  double temperature_;
  std::mutex client_mutex_;

  void setup_server_connection();
};

}  // namespace rag_core
