#include "models.hpp"
#include "config.hpp"
#include "embedder.hpp"
#include "errors.hpp"
#include "reranker.hpp"
#include <filesystem>

namespace fs = std::filesystem;

const std::vector<ModelInfo>& embedding_models() {
  static const std::vector<ModelInfo> models = {
    {"BAAI/bge-small-en-v1.5", "bge-small-en-v1.5-f16.gguf", 512, 64},
    {"nomic-embed-text-v1.5", "nomic-embed-text-v1.5.f16.gguf", 1024, 128},
    {"jina-embeddings-v2-base-code", "jina-embeddings-v2-base-code-f16.gguf", 1024, 128},
    {"sentence-transformers/all-MiniLM-L6-v2", "all-MiniLM-L6-v2-f16.gguf", 256, 32},
    {"BAAI/bge-base-en-v1.5", "bge-base-en-v1.5-f16.gguf", 512, 64},
    {"BAAI/bge-large-en-v1.5", "bge-large-en-v1.5-f16.gguf", 512, 64},
  };
  return models;
}

const std::vector<ModelInfo>& reranker_models() {
  static const std::vector<ModelInfo> models = {
    {"jina-reranker-v1-turbo-en", "jina-reranker-v1-turbo-en-f16.gguf", 512, 0},
    {"BAAI/bge-reranker-base", "bge-reranker-base-f16.gguf", 512, 0},
  };
  return models;
}

std::vector<std::string> model_names(const std::vector<ModelInfo>& models) {
  std::vector<std::string> out;
  for (auto& m : models) out.push_back(m.name);
  return out;
}

static const ModelInfo& find_in(const std::vector<ModelInfo>& models, const std::string& name) {
  for (auto& m : models) if (m.name == name) return m;
  throw ModelNotFound(name, model_names(models));
}

const ModelInfo& find_embedding_model(const std::string& name) {
  return find_in(embedding_models(), name);
}

const ModelInfo& find_reranker_model(const std::string& name) {
  return find_in(reranker_models(), name);
}

std::string resolve_model_path(const ModelInfo& info, const std::string& models_dir) {
  fs::path p = fs::path(models_dir) / info.file;
  if (!fs::exists(p))
    throw FileAccessError(p.string(), "load model",
                          "model '" + info.name + "' is not in the model cache");
  return p.string();
}

std::unique_ptr<EmbeddingProvider> load_embedder(const std::string& name, const Config& config) {
  const ModelInfo& info = find_embedding_model(name);
  auto path = resolve_model_path(info, config.models_dir);
  return std::make_unique<LlamaEmbedder>(path, info.name, info.chunk_config());
}

std::unique_ptr<Reranker> load_reranker(const std::string& name, const Config& config) {
  const ModelInfo& info = find_reranker_model(name);
  auto path = resolve_model_path(info, config.models_dir);
  return std::make_unique<LlamaReranker>(path, info.name);
}
