// src/reranker.cpp
#include "reranker.hpp"
#include "errors.hpp"
#include <llama.h>
#include <spdlog/spdlog.h>
#include <string>
#include <vector>

struct LlamaReranker::Impl {
  llama_model* model = nullptr;
  llama_context* ctx = nullptr;
  const llama_vocab* vocab = nullptr;
  int n_ctx = 1024;
  const CallLimits* limits = nullptr;

  static bool abort_cb(void* data) {
    auto* self = static_cast<Impl*>(data);
    return self->limits && (self->limits->expired() || self->limits->cancelled());
  }

  explicit Impl(const std::string& model_path) {
    llama_backend_init();

    llama_model_params mp = llama_model_default_params();
    mp.n_gpu_layers = 0;
    model = llama_model_load_from_file(model_path.c_str(), mp);
    if (!model) fail("reranker: failed to load model " + model_path);

    llama_context_params cp = llama_context_default_params();
    cp.n_ctx = n_ctx;
    cp.n_batch = n_ctx;
    cp.n_ubatch = n_ctx;
    cp.embeddings = true;
    cp.pooling_type = LLAMA_POOLING_TYPE_RANK;
    cp.abort_callback = &Impl::abort_cb;
    cp.abort_callback_data = this;
    ctx = llama_init_from_model(model, cp);
    if (!ctx) fail("reranker: failed to create context");

    vocab = llama_model_get_vocab(model);
  }

  ~Impl() { release(); }

  [[noreturn]] void fail(const std::string& msg) {
    release();
    throw EmbeddingUnavailable(msg);
  }

  void release() {
    if (ctx) llama_free(ctx);
    if (model) llama_model_free(model);
    ctx = nullptr;
    model = nullptr;
    llama_backend_free();
  }

  std::vector<llama_token> tokenize(const std::string& s) {
    int32_t need = -llama_tokenize(vocab, s.c_str(), (int32_t)s.size(), nullptr, 0,
                                   /*add_special=*/false, /*parse_special=*/false);
    if (need <= 0) return {};
    std::vector<llama_token> t(need);
    int32_t n = llama_tokenize(vocab, s.c_str(), (int32_t)s.size(), t.data(), (int32_t)t.size(),
                               false, false);
    if (n != need) throw EmbeddingUnavailable("reranker: tokenize failed");
    return t;
  }

  // [BOS] query [EOS] [SEP] doc [EOS], skipping specials the vocab lacks
  std::vector<llama_token> pair_tokens(const std::vector<llama_token>& q, const std::string& doc) {
    std::vector<llama_token> out;
    auto push_special = [&](llama_token t) { if (t != LLAMA_TOKEN_NULL) out.push_back(t); };
    push_special(llama_vocab_bos(vocab));
    out.insert(out.end(), q.begin(), q.end());
    push_special(llama_vocab_eos(vocab));
    push_special(llama_vocab_sep(vocab));
    auto d = tokenize(doc);
    size_t room = (size_t)n_ctx > out.size() + 1 ? n_ctx - out.size() - 1 : 0;
    if (d.size() > room) d.resize(room);
    out.insert(out.end(), d.begin(), d.end());
    push_special(llama_vocab_eos(vocab));
    if ((int)out.size() > n_ctx) out.resize(n_ctx);
    return out;
  }

  float score_pair(const std::vector<llama_token>& toks) {
    if (limits && limits->cancelled()) throw Cancelled();
    llama_batch batch = llama_batch_init((int)toks.size(), 0, 1);
    for (size_t i = 0; i < toks.size(); ++i) {
      batch.token[i] = toks[i];
      batch.pos[i] = (llama_pos)i;
      batch.n_seq_id[i] = 1;
      batch.seq_id[i][0] = 0;
      batch.logits[i] = true;
    }
    batch.n_tokens = (int32_t)toks.size();

    llama_memory_clear(llama_get_memory(ctx), true);
    int rc = llama_encode(ctx, batch);
    llama_batch_free(batch);
    if (rc != 0) {
      if (limits && limits->cancelled()) throw Cancelled();
      if (limits && limits->expired()) throw EmbeddingUnavailable("rerank timed out", true);
      throw EmbeddingUnavailable("reranker: encode failed (" + std::to_string(rc) + ")");
    }
    const float* s = llama_get_embeddings_seq(ctx, 0);
    if (!s) throw EmbeddingUnavailable("reranker: no rank output");
    return s[0];
  }
};

LlamaReranker::LlamaReranker(const std::string& model_path, std::string model_id)
  : impl_(new Impl(model_path)), model_id_(std::move(model_id)) {
  spdlog::debug("loaded reranker {}", model_id_);
}

LlamaReranker::~LlamaReranker() { delete impl_; }

std::vector<float> LlamaReranker::score(const std::string& query,
                                        const std::vector<std::string>& docs,
                                        const CallLimits& limits) {
  impl_->limits = &limits;
  std::vector<float> out;
  out.reserve(docs.size());
  try {
    auto q = impl_->tokenize(query);
    for (auto& d : docs) out.push_back(impl_->score_pair(impl_->pair_tokens(q, d)));
  } catch (...) {
    impl_->limits = nullptr;
    throw;
  }
  impl_->limits = nullptr;
  return out;
}
