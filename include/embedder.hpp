#pragma once
#include "chunker.hpp"
#include <atomic>
#include <chrono>
#include <string>
#include <vector>

// Cheap, model-independent token estimate (~4 UTF-8 characters per token).
// Used for chunk sizing and inspection without loading a model.
int estimate_tokens(const std::string& text);

// Cooperative cancellation flag shared between a caller and long operations.
class CancelToken {
public:
  void cancel() { flag_.store(true); }
  bool cancelled() const { return flag_.load(); }

private:
  std::atomic<bool> flag_{false};
};

// Bounds a single provider call.
struct CallLimits {
  std::chrono::steady_clock::time_point deadline = std::chrono::steady_clock::time_point::max();
  const CancelToken* cancel = nullptr;

  bool expired() const { return std::chrono::steady_clock::now() >= deadline; }
  bool cancelled() const { return cancel && cancel->cancelled(); }
};

// The embedding capability consumed by the indexer and the search engine.
// Vectors are L2-normalized. Failures raise EmbeddingUnavailable.
class EmbeddingProvider {
public:
  virtual ~EmbeddingProvider() = default;

  virtual std::vector<std::vector<float>> embed_batch(const std::vector<std::string>& texts,
                                                      const CallLimits& limits) = 0;
  std::vector<float> embed(const std::string& text, const CallLimits& limits = {});

  virtual int estimate_tokens(const std::string& text) const { return ::estimate_tokens(text); }
  virtual int dim() const = 0;
  virtual const std::string& model_id() const = 0;
  virtual ChunkConfig chunk_config() const = 0;
};

// llama.cpp-backed provider for GGUF embedding models.
class LlamaEmbedder : public EmbeddingProvider {
public:
  LlamaEmbedder(const std::string& model_path, std::string model_id, ChunkConfig chunk_config);
  ~LlamaEmbedder() override;

  LlamaEmbedder(const LlamaEmbedder&) = delete;
  LlamaEmbedder& operator=(const LlamaEmbedder&) = delete;

  std::vector<std::vector<float>> embed_batch(const std::vector<std::string>& texts,
                                              const CallLimits& limits) override;
  int dim() const override { return dim_; }
  const std::string& model_id() const override { return model_id_; }
  ChunkConfig chunk_config() const override { return chunk_config_; }

private:
  struct Impl;
  Impl* impl_;
  std::string model_id_;
  ChunkConfig chunk_config_;
  int dim_;
};

void l2_normalize(std::vector<float>& v);
