#pragma once
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

// Base of every error the engine raises. what() is the user-facing message.
class CkError : public std::runtime_error {
public:
  explicit CkError(const std::string& msg) : std::runtime_error(msg) {}
};

class IndexingFailed : public CkError {
public:
  IndexingFailed(std::string path, std::string reason,
                 std::optional<std::string> suggestion = std::nullopt);

  const std::string& path() const { return path_; }
  const std::string& reason() const { return reason_; }
  const std::optional<std::string>& suggestion() const { return suggestion_; }

private:
  std::string path_;
  std::string reason_;
  std::optional<std::string> suggestion_;
};

// Embedding could not be produced. Indexing degrades to structure-only.
class EmbeddingUnavailable : public CkError {
public:
  explicit EmbeddingUnavailable(std::string reason, bool transient = false);

  const std::string& reason() const { return reason_; }
  bool transient() const { return transient_; }

private:
  std::string reason_;
  bool transient_;
};

class ModelNotFound : public CkError {
public:
  ModelNotFound(std::string model, std::vector<std::string> available);

  const std::string& model() const { return model_; }
  const std::vector<std::string>& available() const { return available_; }

private:
  std::string model_;
  std::vector<std::string> available_;
};

class FileAccessError : public CkError {
public:
  FileAccessError(std::string path, std::string operation, std::string reason);

  const std::string& path() const { return path_; }
  const std::string& operation() const { return operation_; }
  const std::string& reason() const { return reason_; }

private:
  std::string path_;
  std::string operation_;
  std::string reason_;
};

class NetworkError : public CkError {
public:
  NetworkError(std::string operation, bool retry_possible);

  const std::string& operation() const { return operation_; }
  bool retry_possible() const { return retry_possible_; }

private:
  std::string operation_;
  bool retry_possible_;
};

// Irrecoverable decode problem while chunking (never "no structure found").
class ChunkError : public CkError {
public:
  ChunkError(std::string path, std::string reason);

  const std::string& path() const { return path_; }

private:
  std::string path_;
};

class InvalidConfiguration : public CkError {
public:
  InvalidConfiguration(std::string setting, std::string value, std::string expected);

  const std::string& setting() const { return setting_; }

private:
  std::string setting_;
};

// Semantic/hybrid search over a tree that has no index yet, or whose index
// holds no embeddings from the model in use.
class NotIndexed : public CkError {
public:
  explicit NotIndexed(std::string path);
  NotIndexed(std::string path, const std::string& model);

  const std::string& path() const { return path_; }

private:
  std::string path_;
};

class Cancelled : public CkError {
public:
  Cancelled() : CkError("operation cancelled") {}
};
