#include "rag_core/services/transcript_qa_service.hpp"

#include <iostream>
#include <stdexcept>
#include <utility>

#include "rag_core/pipeline/generator.hpp"
#include "rag_core/pipeline/output_parser.hpp"
#include "rag_core/pipeline/prompt_builder.hpp"
#include "rag_core/services/retriever.hpp"

namespace rag_core {

RunnablePtr build_qa_chain(std::shared_ptr<EmbeddingPort> embedder,
                           std::shared_ptr<const VectorIndex> index,
                           std::shared_ptr<GenerationPort> generator, int retrieval_k,
                           JoinMode join_mode) {
  auto retriever = std::make_shared<const Retriever>(std::move(embedder), std::move(index),
                                                     retrieval_k);
  RunnablePtr inputs = parallel({{"context", pipe(retriever, make_document_formatter())},
                                 {"question", make_identity()}},
                                join_mode);

  return pipe({inputs, std::make_shared<const PromptBuilder>(),
               std::make_shared<const Generator>(std::move(generator)),
               std::make_shared<const OutputParser>()});
}

TranscriptQaService::TranscriptQaService(const Config &config,
                                         std::shared_ptr<TranscriptSource> source,
                                         std::shared_ptr<EmbeddingPort> embedder,
                                         std::shared_ptr<GenerationPort> generator,
                                         std::shared_ptr<VectorIndex> index, JoinMode join_mode)
    : source_(std::move(source)),
      index_(std::move(index)),
      indexing_service_(embedder, index_, config),
      chain_(build_qa_chain(embedder, index_, std::move(generator), config.retrieval_k,
                            join_mode)) {
  if (!source_) {
    throw std::invalid_argument("TranscriptQaService requires a transcript source");
  }
}

IndexOutcome TranscriptQaService::load_transcript(const std::string &video_id) {
  std::optional<std::string> transcript = source_->fetch(video_id);
  if (!transcript) {
    std::cout << "[TranscriptQaService] No transcript available for video " << video_id
              << std::endl;
    return {.status = IndexStatus::NoTranscript, .stats = {}};
  }

  IndexingStats stats = indexing_service_.replace_document(*transcript);
  return {.status = IndexStatus::Indexed, .stats = stats};
}

std::string TranscriptQaService::invoke(const std::string &question,
                                        const RunContext &context) const {
  return chain_->invoke(question, context).get<std::string>();
}

AnswerResult TranscriptQaService::answer(const std::string &video_id,
                                         const std::string &question,
                                         const RunContext &context) {
  const IndexOutcome outcome = load_transcript(video_id);
  if (outcome.status == IndexStatus::NoTranscript) {
    return {.status = AnswerStatus::NoTranscript, .answer = ""};
  }
  return {.status = AnswerStatus::Answered, .answer = invoke(question, context)};
}

}  // namespace rag_core
