#pragma once

#include <optional>
#include <string>

namespace rag_core {

class TranscriptSource {
 public:
  virtual ~TranscriptSource() = default;

  /**
   * @brief Full transcript text of a video.
   * @return std::nullopt when transcripts are disabled for the video. An empty string is a
   *         real, empty transcript.
   * @throws TranscriptSourceError if the source cannot be read.
   */
  virtual std::optional<std::string> fetch(const std::string &video_id) = 0;
};

}  // namespace rag_core
