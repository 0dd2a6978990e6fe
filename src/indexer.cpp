#include "indexer.hpp"
#include "embedding_session.hpp"
#include "errors.hpp"
#include "walker.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <atomic>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <sstream>
#include <thread>

namespace fs = std::filesystem;

namespace {
std::string read_all(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) throw FileAccessError(path, "read", "cannot open file");
  std::ostringstream ss; ss << in.rdbuf();
  if (in.bad()) throw FileAccessError(path, "read", "I/O error");
  return ss.str();
}
}

// Shared by the workers of one run.
struct Indexer::Context {
  const SidecarStore& store;
  const UpdateOptions& options;
  std::string model_id;
  ChunkConfig chunk_config;
  IndexObserver* observer;
  const CancelToken* cancel;

  std::mutex observer_mu;

  void chunk_progress(const std::string& file, size_t done, size_t total) {
    if (!observer) return;
    std::lock_guard<std::mutex> lock(observer_mu);
    observer->on_chunk_progress(ChunkProgress{file, done, total});
  }
};

Indexer::Indexer(EmbeddingSession* session, ChunkConfig fallback)
  : session_(session), fallback_(fallback) {}

ChunkConfig Indexer::chunk_config() const {
  return session_ ? session_->provider().chunk_config() : fallback_;
}

Indexer::Outcome Indexer::process(Context& ctx, const std::string& file, size_t& chunks) {
  if (ctx.cancel && ctx.cancel->cancelled()) throw Cancelled();

  if (!ctx.options.force_rebuild) {
    if (auto existing = ctx.store.read(file)) {
      // without a model nothing gets embedded, so stored embeddings stay
      // valid for whichever model built them
      const std::string& model = session_ ? ctx.model_id : existing->fingerprint.model_id;
      switch (check_freshness(existing->fingerprint, file, model, ctx.options.verify_content)) {
        case Freshness::Fresh:
          return Outcome::Skipped;
        case Freshness::Touched: {
          auto st = stat_file(file);
          existing->fingerprint.size = st.size;
          existing->fingerprint.mtime_ns = st.mtime_ns;
          ctx.store.write(file, *existing);
          spdlog::debug("{}: metadata changed, content identical", file);
          return Outcome::Skipped;
        }
        case Freshness::Stale:
          break;
      }
    }
  }

  // stat before reading: a concurrent edit leaves a fingerprint that is stale next run
  auto st = stat_file(file);
  std::string content = read_all(file);

  SidecarEntry entry;
  entry.fingerprint.content_hash = sha256_hex(content);
  entry.fingerprint.size = st.size;
  entry.fingerprint.mtime_ns = st.mtime_ns;
  entry.chunks = chunk_text(content, file, ctx.chunk_config);

  Outcome outcome = Outcome::Rebuilt;
  if (session_ && !ctx.model_id.empty() && !entry.chunks.empty()) {
    std::vector<std::string> texts;
    texts.reserve(entry.chunks.size());
    for (size_t i = 0; i < entry.chunks.size(); ++i)
      texts.push_back(embedding_text(entry.chunks, i, ctx.chunk_config));
    try {
      entry.embeddings = session_->embed(texts, ctx.options.batch_size,
        [&](size_t done, size_t total) { ctx.chunk_progress(file, done, total); });
      entry.fingerprint.model_id = ctx.model_id;
    } catch (const EmbeddingUnavailable& e) {
      spdlog::warn("{}: {}; indexed without embeddings", file, e.what());
      entry.embeddings.clear();
      outcome = Outcome::Degraded;
    }
  } else if (!ctx.model_id.empty() && entry.chunks.empty()) {
    // nothing to embed; the entry is still valid for this model
    entry.fingerprint.model_id = ctx.model_id;
  }

  if (ctx.cancel && ctx.cancel->cancelled()) throw Cancelled();
  ctx.store.write(file, entry);
  chunks = entry.chunks.size();
  return outcome;
}

UpdateResult Indexer::update(const std::string& root, const UpdateOptions& options,
                             IndexObserver* observer, const CancelToken* cancel) {
  std::error_code ec;
  if (!fs::is_directory(root, ec))
    throw IndexingFailed(root, "not a directory", std::string("pass the project root to index"));

  std::string model_id = session_ ? session_->model_id() : std::string();
  if (!options.model.empty() && options.model != model_id)
    throw IndexingFailed(root, "requested model '" + options.model + "' but the loaded model is '" +
                               (model_id.empty() ? std::string("none") : model_id) + "'");

  SidecarStore store(root);
  WalkOptions walk;
  walk.excludes = options.excludes;
  walk.respect_ignore = options.respect_ignore;
  auto files = walk_files(store.root(), walk);
  spdlog::info("indexing {} files under {} (model: {})", files.size(), store.root(),
               model_id.empty() ? "none" : model_id);

  fs::create_directories(store.index_dir(), ec);
  if (ec) throw FileAccessError(store.index_dir(), "create", ec.message());

  Context ctx{store, options, model_id, chunk_config(), observer, cancel};

  UpdateResult result;
  std::mutex result_mu;
  std::atomic<size_t> next{0};
  std::atomic<size_t> done{0};
  std::atomic<size_t> indexed{0};
  std::atomic<size_t> skipped{0};
  std::atomic<size_t> chunks_created{0};
  std::atomic<bool> stop{false};

  auto worker = [&] {
    while (!stop.load()) {
      size_t i = next.fetch_add(1);
      if (i >= files.size()) return;
      const std::string& file = files[i];
      bool rebuilt = false;
      size_t chunks = 0;
      try {
        switch (process(ctx, file, chunks)) {
          case Outcome::Skipped:
            skipped++;
            break;
          case Outcome::Degraded: {
            std::lock_guard<std::mutex> lock(result_mu);
            result.degraded.push_back(file);
          }
            [[fallthrough]];
          case Outcome::Rebuilt:
            indexed++;
            rebuilt = true;
            chunks_created += chunks;
            break;
        }
      } catch (const Cancelled&) {
        stop = true;
        return;
      } catch (const std::exception& e) {
        spdlog::warn("failed to index {}: {}", file, e.what());
        std::lock_guard<std::mutex> lock(result_mu);
        result.failures.push_back(IndexFailure{file, e.what()});
      }
      size_t n = ++done;
      if (observer) {
        std::lock_guard<std::mutex> lock(ctx.observer_mu);
        observer->on_file_progress(FileProgress{file, n, files.size(), rebuilt});
      }
    }
  };

  int n_workers = options.workers > 0 ? options.workers
                                      : (int)std::max(1u, std::thread::hardware_concurrency());
  n_workers = std::max(1, std::min<int>(n_workers, (int)std::max<size_t>(1, files.size())));
  std::vector<std::thread> pool;
  for (int i = 1; i < n_workers; ++i) pool.emplace_back(worker);
  worker();
  for (auto& t : pool) t.join();

  if (stop.load() || (cancel && cancel->cancelled())) throw Cancelled();

  std::sort(result.failures.begin(), result.failures.end(),
            [](const IndexFailure& a, const IndexFailure& b) { return a.path < b.path; });
  std::sort(result.degraded.begin(), result.degraded.end());

  if (!files.empty() && result.failures.size() == files.size()) {
    throw IndexingFailed(store.root(), "no file could be indexed",
                         "first failure: " + result.failures.front().path + ": " +
                         result.failures.front().reason);
  }

  result.stats = store.stats();
  result.stats.files_indexed = indexed.load();
  result.stats.files_skipped = skipped.load();
  result.stats.chunks_created = chunks_created.load();
  spdlog::info("indexed {} files, {} up to date, {} failed", result.stats.files_indexed,
               result.stats.files_skipped, result.failures.size());
  return result;
}

bool Indexer::add_file(const std::string& root, const std::string& file, const UpdateOptions& options) {
  std::error_code ec;
  if (!fs::is_regular_file(file, ec)) throw FileAccessError(file, "index", "not a regular file");
  if (is_binary_file(file)) throw IndexingFailed(file, "binary files are not indexed");

  std::string model_id = session_ ? session_->model_id() : std::string();
  if (!options.model.empty() && options.model != model_id)
    throw IndexingFailed(file, "requested model '" + options.model + "' is not the loaded model");

  SidecarStore store(root);
  Context ctx{store, options, model_id, chunk_config(), nullptr, nullptr};
  size_t chunks = 0;
  return process(ctx, file, chunks) != Outcome::Skipped;
}

FileInspection inspect_file(const std::string& path, const ChunkConfig& config) {
  FileInspection out;
  std::string content = read_all(path);
  out.path = path;
  out.language = detect_language(path);
  out.bytes = content.size();
  out.lines = split_lines(content).size();
  out.tokens = estimate_tokens(content);
  out.chunks = chunk_text(content, path, config);
  for (auto& c : out.chunks) out.chunk_tokens.push_back(estimate_tokens(c.text));
  return out;
}
