#include "errors.hpp"
#include <sstream>

namespace {
std::string indexing_message(const std::string& path, const std::string& reason,
                             const std::optional<std::string>& suggestion) {
  std::string m = "indexing failed for " + path + ": " + reason;
  if (suggestion) m += "\nsuggestion: " + *suggestion;
  return m;
}

std::string model_message(const std::string& model, const std::vector<std::string>& available) {
  std::ostringstream ss;
  ss << "model '" << model << "' not found";
  if (!available.empty()) {
    ss << "\navailable models:";
    for (auto& m : available) ss << "\n  " << m;
  }
  return ss.str();
}
}

IndexingFailed::IndexingFailed(std::string path, std::string reason,
                               std::optional<std::string> suggestion)
  : CkError(indexing_message(path, reason, suggestion)),
    path_(std::move(path)), reason_(std::move(reason)), suggestion_(std::move(suggestion)) {}

EmbeddingUnavailable::EmbeddingUnavailable(std::string reason, bool transient)
  : CkError("embedding unavailable: " + reason),
    reason_(std::move(reason)), transient_(transient) {}

ModelNotFound::ModelNotFound(std::string model, std::vector<std::string> available)
  : CkError(model_message(model, available)),
    model_(std::move(model)), available_(std::move(available)) {}

FileAccessError::FileAccessError(std::string path, std::string operation, std::string reason)
  : CkError("cannot " + operation + " " + path + ": " + reason),
    path_(std::move(path)), operation_(std::move(operation)), reason_(std::move(reason)) {}

NetworkError::NetworkError(std::string operation, bool retry_possible)
  : CkError("network error during " + operation + (retry_possible ? " (retryable)" : "")),
    operation_(std::move(operation)), retry_possible_(retry_possible) {}

ChunkError::ChunkError(std::string path, std::string reason)
  : CkError("cannot chunk " + path + ": " + reason), path_(std::move(path)) {}

InvalidConfiguration::InvalidConfiguration(std::string setting, std::string value,
                                           std::string expected)
  : CkError("invalid configuration: " + setting + " = '" + value + "', expected " + expected),
    setting_(std::move(setting)) {}

NotIndexed::NotIndexed(std::string path)
  : CkError("no index found for " + path + " (run ck --index first)"),
    path_(std::move(path)) {}

NotIndexed::NotIndexed(std::string path, const std::string& model)
  : CkError("no current '" + model + "' embeddings under " + path + " (run ck --index first)"),
    path_(std::move(path)) {}
