#include "embedding_session.hpp"
#include "errors.hpp"
#include <algorithm>

bool is_transient(const std::exception& e) {
  if (auto* eu = dynamic_cast<const EmbeddingUnavailable*>(&e)) return eu->transient();
  if (auto* ne = dynamic_cast<const NetworkError*>(&e)) return ne->retry_possible();
  return false;
}

EmbeddingSession::EmbeddingSession(EmbeddingProvider& provider, RetryPolicy retry,
                                   std::chrono::milliseconds timeout, const CancelToken* cancel)
  : provider_(provider), retry_(retry), timeout_(timeout), cancel_(cancel) {}

std::vector<std::vector<float>> EmbeddingSession::call(const std::vector<std::string>& texts) {
  std::lock_guard<std::mutex> lock(mu_);
  return retry_.execute_with_retry([&] {
    if (cancel_ && cancel_->cancelled()) throw Cancelled();
    CallLimits limits;
    limits.deadline = std::chrono::steady_clock::now() + timeout_;
    limits.cancel = cancel_;
    auto out = provider_.embed_batch(texts, limits);
    if (out.size() != texts.size())
      throw EmbeddingUnavailable("provider returned " + std::to_string(out.size()) +
                                 " vectors for " + std::to_string(texts.size()) + " inputs");
    return out;
  }, is_transient);
}

std::vector<std::vector<float>> EmbeddingSession::embed(const std::vector<std::string>& texts,
                                                        int batch_size,
                                                        const std::function<void(size_t, size_t)>& on_batch) {
  std::vector<std::vector<float>> out;
  out.reserve(texts.size());
  size_t step = (size_t)std::max(1, batch_size);
  for (size_t i = 0; i < texts.size(); i += step) {
    std::vector<std::string> group(texts.begin() + i,
                                   texts.begin() + std::min(texts.size(), i + step));
    auto vecs = call(group);
    for (auto& v : vecs) out.push_back(std::move(v));
    if (on_batch) on_batch(out.size(), texts.size());
  }
  return out;
}

std::vector<float> EmbeddingSession::embed_one(const std::string& text) {
  auto out = call({text});
  return std::move(out.front());
}
