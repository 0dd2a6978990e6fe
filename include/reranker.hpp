#pragma once
#include "embedder.hpp"
#include <string>
#include <vector>

// Secondary scorer for (query, candidate) pairs. Higher is more relevant.
class Reranker {
public:
  virtual ~Reranker() = default;
  virtual std::vector<float> score(const std::string& query, const std::vector<std::string>& docs,
                                   const CallLimits& limits) = 0;
  virtual const std::string& model_id() const = 0;
};

// llama.cpp cross-encoder (pooling type RANK).
class LlamaReranker : public Reranker {
public:
  LlamaReranker(const std::string& model_path, std::string model_id);
  ~LlamaReranker() override;

  LlamaReranker(const LlamaReranker&) = delete;
  LlamaReranker& operator=(const LlamaReranker&) = delete;

  std::vector<float> score(const std::string& query, const std::vector<std::string>& docs,
                           const CallLimits& limits) override;
  const std::string& model_id() const override { return model_id_; }

private:
  struct Impl;
  Impl* impl_;
  std::string model_id_;
};
