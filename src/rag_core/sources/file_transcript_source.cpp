#include "rag_core/sources/file_transcript_source.hpp"

#include <fstream>
#include <iostream>
#include <utility>

#include <nlohmann/json.hpp>

#include "rag_core/errors.hpp"

namespace rag_core {

FileTranscriptSource::FileTranscriptSource(std::filesystem::path directory)
    : directory_(std::move(directory)) {}

bool FileTranscriptSource::is_valid_video_id(const std::string &video_id) {
  if (video_id.empty()) {
    return false;
  }
  for (char c : video_id) {
    const bool allowed = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                         (c >= '0' && c <= '9') || c == '_' || c == '-';
    if (!allowed) {
      return false;
    }
  }
  return true;
}

std::optional<std::string> FileTranscriptSource::fetch(const std::string &video_id) {
  if (!is_valid_video_id(video_id)) {
    throw TranscriptSourceError("Invalid video id: '" + video_id + "'");
  }

  const std::filesystem::path file_path = directory_ / (video_id + ".json");
  std::ifstream file_stream(file_path);
  if (!file_stream.is_open()) {
    throw TranscriptSourceError("Could not open transcript file: " + file_path.string());
  }

  nlohmann::json document;
  try {
    file_stream >> document;
  } catch (const nlohmann::json::exception &e) {
    throw TranscriptSourceError("Failed to parse transcript file '" + file_path.string() +
                                "': " + e.what());
  }

  if (document.is_object() && document.contains("transcripts_disabled") &&
      document["transcripts_disabled"] == true) {
    std::cout << "[FileTranscriptSource] Transcripts are disabled for video " << video_id
              << std::endl;
    return std::nullopt;
  }

  if (!document.is_array()) {
    throw TranscriptSourceError("Transcript file must hold an array of segments: " +
                                file_path.string());
  }

  std::string transcript;
  bool first_segment = true;
  for (const auto &segment : document) {
    if (!segment.is_object() || !segment.contains("text") || !segment["text"].is_string()) {
      throw TranscriptSourceError("Transcript segment without text in " + file_path.string());
    }
    if (!first_segment) {
      transcript += ' ';
    }
    first_segment = false;
    transcript += segment["text"].get<std::string>();
  }
  return transcript;
}

}  // namespace rag_core
