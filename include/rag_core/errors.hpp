#pragma once

#include <exception>
#include <string>

namespace rag_core {

class RagError : public std::exception {
 public:
  explicit RagError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

// Bad chunking or pipeline parameters, raised at construction time
class InvalidConfig : public RagError {
 public:
  using RagError::RagError;
};

// A vector whose length disagrees with the index dimensionality
class DimensionMismatch : public RagError {
 public:
  using RagError::RagError;
};

// Failure inside the similarity backend itself
class VectorIndexError : public RagError {
 public:
  using RagError::RagError;
};

// Network, quota or model failure of the embedding collaborator
class EmbeddingServiceError : public RagError {
 public:
  using RagError::RagError;
};

// Network, quota or model failure of the generation collaborator
class GenerationServiceError : public RagError {
 public:
  using RagError::RagError;
};

// A prompt placeholder had no matching key in the bundle
class MissingVariable : public RagError {
 public:
  using RagError::RagError;
};

// The raw model response lacked the expected payload field
class MalformedResponse : public RagError {
 public:
  using RagError::RagError;
};

// Transcript storage could not be read. A disabled transcript is not an error.
class TranscriptSourceError : public RagError {
 public:
  using RagError::RagError;
};

class CancelledError : public RagError {
 public:
  using RagError::RagError;
};

}  // namespace rag_core
