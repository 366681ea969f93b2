#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include "rag_core/sources/transcript_source.hpp"

namespace rag_core {

/**
 * @class FileTranscriptSource
 * @brief Reads transcripts saved as `<directory>/<video_id>.json`.
 *
 * A file holds either an array of caption segments `{"text", "start", "duration"}`, whose
 * texts are joined with single spaces in order, or `{"transcripts_disabled": true}`.
 */
class FileTranscriptSource : public TranscriptSource {
 public:
  explicit FileTranscriptSource(std::filesystem::path directory);

  std::optional<std::string> fetch(const std::string &video_id) override;

  static bool is_valid_video_id(const std::string &video_id);

 private:
  std::filesystem::path directory_;
};

}  // namespace rag_core
