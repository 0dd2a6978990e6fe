#pragma once
#include "embedder.hpp"
#include "retry.hpp"
#include <chrono>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

// The single embedding resource of one index run or query. Workers submit
// chunk batches here; calls are serialized, bounded by a timeout and retried
// with backoff when the failure is transient.
class EmbeddingSession {
public:
  EmbeddingSession(EmbeddingProvider& provider, RetryPolicy retry,
                   std::chrono::milliseconds timeout, const CancelToken* cancel = nullptr);

  // One vector per text, in order, submitted in groups of batch_size.
  // on_batch(done, total) is called after each group.
  std::vector<std::vector<float>> embed(const std::vector<std::string>& texts, int batch_size,
                                        const std::function<void(size_t, size_t)>& on_batch = {});
  std::vector<float> embed_one(const std::string& text);

  EmbeddingProvider& provider() { return provider_; }
  const std::string& model_id() const { return provider_.model_id(); }

private:
  std::vector<std::vector<float>> call(const std::vector<std::string>& texts);

  EmbeddingProvider& provider_;
  RetryPolicy retry_;
  std::chrono::milliseconds timeout_;
  const CancelToken* cancel_;
  std::mutex mu_;
};

// Retry predicate shared by network/model boundaries.
bool is_transient(const std::exception& e);
