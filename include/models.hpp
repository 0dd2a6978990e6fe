#pragma once
#include "chunker.hpp"
#include <memory>
#include <string>
#include <vector>

struct Config;
class EmbeddingProvider;
class Reranker;

struct ModelInfo {
  std::string name;
  std::string file;        // GGUF file name inside the models directory
  int max_tokens;
  int overlap_tokens;

  ChunkConfig chunk_config() const { return ChunkConfig{max_tokens, overlap_tokens}; }
};

const std::vector<ModelInfo>& embedding_models();
const std::vector<ModelInfo>& reranker_models();

std::vector<std::string> model_names(const std::vector<ModelInfo>& models);

// Throws ModelNotFound listing the known names.
const ModelInfo& find_embedding_model(const std::string& name);
const ModelInfo& find_reranker_model(const std::string& name);

// Location of the model's GGUF file. Throws FileAccessError when the model is
// known but not present in models_dir (fetching it is the downloader's job).
std::string resolve_model_path(const ModelInfo& info, const std::string& models_dir);

std::unique_ptr<EmbeddingProvider> load_embedder(const std::string& name, const Config& config);
std::unique_ptr<Reranker> load_reranker(const std::string& name, const Config& config);
