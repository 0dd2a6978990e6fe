// src/embedder.cpp
#include "embedder.hpp"
#include "errors.hpp"
#include <llama.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <string>
#include <vector>

int estimate_tokens(const std::string& text) {
  if (text.empty()) return 0;
  size_t chars = 0;
  for (unsigned char c : text) {
    if ((c & 0xC0) != 0x80) ++chars;   // count UTF-8 lead bytes only
  }
  return (int)((chars + 3) / 4);
}

void l2_normalize(std::vector<float>& v) {
  double s = 0.0; for (float x : v) s += (double)x * (double)x;
  float norm = (float)std::sqrt(std::max(s, 1e-12));
  for (auto& x : v) x /= norm;
}

std::vector<float> EmbeddingProvider::embed(const std::string& text, const CallLimits& limits) {
  auto out = embed_batch({text}, limits);
  if (out.size() != 1) throw EmbeddingUnavailable("provider returned no vector");
  return std::move(out.front());
}

struct LlamaEmbedder::Impl {
  llama_model* model = nullptr;
  llama_context* ctx = nullptr;
  const llama_vocab* vocab = nullptr;
  int n_ctx = 2048;
  int n_seq = 16;
  int dim = 0;
  bool pooled = true;
  const CallLimits* limits = nullptr;   // set for the duration of one call

  static bool abort_cb(void* data) {
    auto* self = static_cast<Impl*>(data);
    return self->limits && (self->limits->expired() || self->limits->cancelled());
  }

  explicit Impl(const std::string& model_path) {
    llama_backend_init();

    llama_model_params mp = llama_model_default_params();
    mp.n_gpu_layers = 0; // CPU
    model = llama_model_load_from_file(model_path.c_str(), mp);
    if (!model) fail("failed to load model " + model_path);

    llama_context_params cp = llama_context_default_params();
    cp.n_ctx = n_ctx;
    cp.n_batch = n_ctx;
    cp.n_ubatch = n_ctx;                 // non-causal models need the whole input in one ubatch
    cp.n_seq_max = n_seq;
    cp.embeddings = true;
    cp.abort_callback = &Impl::abort_cb;
    cp.abort_callback_data = this;
    ctx = llama_init_from_model(model, cp);
    if (!ctx) fail("failed to create llama context");

    vocab = llama_model_get_vocab(model);
    dim = llama_model_n_embd(model);
    if (dim <= 0) fail("invalid embedding dim");
    pooled = llama_pooling_type(ctx) != LLAMA_POOLING_TYPE_NONE;
  }

  ~Impl() { release(); }

  // The destructor never runs for a throwing constructor.
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

  std::vector<llama_token> tokenize(const std::string& text) {
    // first pass for length (returned negated when the buffer is too small)
    int32_t needed = -llama_tokenize(vocab, text.c_str(), (int32_t)text.size(),
                                     nullptr, 0, /*add_special=*/true, /*parse_special=*/false);
    if (needed <= 0) throw EmbeddingUnavailable("tokenize failed (len)");
    std::vector<llama_token> toks(needed);
    int32_t n = llama_tokenize(vocab, text.c_str(), (int32_t)text.size(),
                               toks.data(), (int32_t)toks.size(),
                               /*add_special=*/true, /*parse_special=*/false);
    if (n != needed) throw EmbeddingUnavailable("tokenize failed");
    if ((int)toks.size() > n_ctx) toks.resize(n_ctx);
    return toks;
  }

  void run(llama_batch& batch) {
    llama_memory_clear(llama_get_memory(ctx), true);
    int rc = (llama_model_has_encoder(model) && !llama_model_has_decoder(model))
               ? llama_encode(ctx, batch)
               : llama_decode(ctx, batch);
    if (rc == 0) return;
    if (limits && limits->cancelled()) throw Cancelled();
    if (limits && limits->expired()) throw EmbeddingUnavailable("embedding timed out", /*transient=*/true);
    throw EmbeddingUnavailable("llama decode failed (" + std::to_string(rc) + ")");
  }

  static void add_token(llama_batch& batch, llama_token tok, llama_pos pos, llama_seq_id seq) {
    int i = batch.n_tokens;
    batch.token[i] = tok;
    batch.pos[i] = pos;
    batch.n_seq_id[i] = 1;
    batch.seq_id[i][0] = seq;
    batch.logits[i] = true;
    batch.n_tokens++;
  }

  std::vector<float> read_embedding(llama_seq_id seq, int last_index) {
    const float* emb = pooled ? llama_get_embeddings_seq(ctx, seq)
                              : llama_get_embeddings_ith(ctx, last_index);
    if (!emb) throw EmbeddingUnavailable("embeddings null");
    std::vector<float> v(emb, emb + dim);
    l2_normalize(v);
    return v;
  }

  // Packs several inputs into one batch, one sequence each, while they fit.
  std::vector<std::vector<float>> encode(const std::vector<std::string>& texts) {
    std::vector<std::vector<float>> out;
    out.reserve(texts.size());

    size_t next = 0;
    while (next < texts.size()) {
      if (limits && limits->cancelled()) throw Cancelled();

      std::vector<std::vector<llama_token>> group;
      int used = 0;
      while (next < texts.size() && (int)group.size() < (pooled ? n_seq : 1)) {
        auto toks = tokenize(texts[next]);
        if (!group.empty() && used + (int)toks.size() > n_ctx) break;
        used += (int)toks.size();
        group.push_back(std::move(toks));
        ++next;
      }

      llama_batch batch = llama_batch_init(used, /*embd*/ 0, /*n_seq*/ 1);
      std::vector<int> last_index;
      for (size_t s = 0; s < group.size(); ++s) {
        for (size_t p = 0; p < group[s].size(); ++p)
          add_token(batch, group[s][p], (llama_pos)p, (llama_seq_id)s);
        last_index.push_back(batch.n_tokens - 1);
      }
      try {
        run(batch);
        for (size_t s = 0; s < group.size(); ++s)
          out.push_back(read_embedding((llama_seq_id)s, last_index[s]));
      } catch (...) {
        llama_batch_free(batch);
        throw;
      }
      llama_batch_free(batch);
    }
    return out;
  }
};

LlamaEmbedder::LlamaEmbedder(const std::string& model_path, std::string model_id,
                             ChunkConfig chunk_config)
  : impl_(new Impl(model_path)), model_id_(std::move(model_id)), chunk_config_(chunk_config) {
  dim_ = impl_->dim;
  spdlog::debug("loaded embedding model {} (dim {})", model_id_, dim_);
}

LlamaEmbedder::~LlamaEmbedder() { delete impl_; }

std::vector<std::vector<float>> LlamaEmbedder::embed_batch(const std::vector<std::string>& texts,
                                                           const CallLimits& limits) {
  impl_->limits = &limits;
  try {
    auto out = impl_->encode(texts);
    impl_->limits = nullptr;
    return out;
  } catch (...) {
    impl_->limits = nullptr;
    throw;
  }
}
