#pragma once

#include <memory>
#include <string>

#include "rag_core/config.hpp"
#include "rag_core/index/vector_index.hpp"
#include "rag_core/llm/embedding_port.hpp"
#include "rag_core/llm/generation_port.hpp"
#include "rag_core/pipeline/combinators.hpp"
#include "rag_core/services/indexing_service.hpp"
#include "rag_core/sources/transcript_source.hpp"

namespace rag_core {

enum class IndexStatus { Indexed, NoTranscript };

struct IndexOutcome {
  IndexStatus status;
  IndexingStats stats;
};

enum class AnswerStatus { Answered, NoTranscript };

struct AnswerResult {
  AnswerStatus status;
  std::string answer;
};

/**
 * @class TranscriptQaService
 * @brief Question answering over one video transcript.
 *
 * The chain is built once:
 *   Parallel{context: Retriever | FormatDocuments, question: Passthrough}
 *     | PromptBuilder | Generator | OutputParser
 *
 * load_transcript() rebuilds the index and must not overlap with invoke(); any number of
 * invoke() calls may run concurrently between loads.
 */
class TranscriptQaService {
 public:
  TranscriptQaService(const Config &config, std::shared_ptr<TranscriptSource> source,
                      std::shared_ptr<EmbeddingPort> embedder,
                      std::shared_ptr<GenerationPort> generator,
                      std::shared_ptr<VectorIndex> index,
                      JoinMode join_mode = JoinMode::Concurrent);

  // Clears the index and fills it from the video's transcript. A disabled transcript
  // yields IndexStatus::NoTranscript without touching the embedder.
  IndexOutcome load_transcript(const std::string &video_id);

  std::string invoke(const std::string &question,
                     const RunContext &context = RunContext()) const;

  // load_transcript + invoke, short-circuiting to AnswerStatus::NoTranscript
  AnswerResult answer(const std::string &video_id, const std::string &question,
                      const RunContext &context = RunContext());

  const RunnablePtr &chain() const { return chain_; }
  PipelineGraph graph() const { return chain_->graph(); }

 private:
  std::shared_ptr<TranscriptSource> source_;
  std::shared_ptr<VectorIndex> index_;
  IndexingService indexing_service_;
  RunnablePtr chain_;
};

// The question-answering chain on its own, for callers that manage the index themselves
RunnablePtr build_qa_chain(std::shared_ptr<EmbeddingPort> embedder,
                           std::shared_ptr<const VectorIndex> index,
                           std::shared_ptr<GenerationPort> generator, int retrieval_k,
                           JoinMode join_mode = JoinMode::Concurrent);

}  // namespace rag_core
