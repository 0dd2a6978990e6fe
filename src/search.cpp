#include "search.hpp"
#include "embedding_session.hpp"
#include "errors.hpp"
#include "fingerprint.hpp"
#include "lexical.hpp"
#include "reranker.hpp"
#include "store.hpp"
#include "vector_index.hpp"
#include "walker.hpp"
#include <re2/re2.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <memory>
#include <set>
#include <sstream>

namespace fs = std::filesystem;
using std::string;

namespace {

constexpr size_t kMaxLinePreview = 500;
constexpr size_t kMaxChunkPreview = 2000;

// Cuts at a UTF-8 character boundary.
string clip(const string& s, size_t max_bytes) {
  if (s.size() <= max_bytes) return s;
  size_t n = max_bytes;
  while (n > 0 && ((unsigned char)s[n] & 0xC0) == 0x80) --n;
  return s.substr(0, n);
}

WalkOptions walk_options(const SearchOptions& o) {
  WalkOptions w;
  w.recursive = o.recursive;
  w.respect_ignore = o.respect_ignore;
  w.excludes = o.excludes;
  return w;
}

// Counts, then applies the -l / -L views. Near misses are computed before this.
void finish(SearchOutput& out, const std::vector<string>& files, const SearchOptions& o) {
  std::set<string> matched;
  for (auto& r : out.results) matched.insert(r.file);
  out.summary.total_matches = out.results.size();
  out.summary.files_with_matches = matched.size();
  out.summary.files_searched = files.size();

  if (o.files_without_matches) {
    for (auto& f : files) if (!matched.count(f)) out.files_without_matches.push_back(f);
    out.results.clear();
  } else if (o.files_with_matches) {
    std::set<string> seen;
    std::vector<SearchResult> firsts;
    for (auto& r : out.results)
      if (seen.insert(r.file).second) firsts.push_back(r);
    out.results = std::move(firsts);
  }
}

std::unique_ptr<RE2> compile_pattern(const SearchOptions& o) {
  string pattern = o.fixed_string ? RE2::QuoteMeta(o.query) : o.query;
  if (o.word_regexp) pattern = "\\b(?:" + pattern + ")\\b";
  RE2::Options opts;
  opts.set_case_sensitive(!o.case_insensitive);
  opts.set_log_errors(false);
  auto re = std::make_unique<RE2>(pattern, opts);
  if (!re->ok())
    throw InvalidConfiguration("pattern", o.query, "a valid RE2 regular expression (" + re->error() + ")");
  return re;
}

SearchOutput regex_search(const RE2& re, const string& path, const SearchOptions& o) {
  SearchOutput out;
  auto files = walk_files(path, walk_options(o));
  int before = std::max(0, o.before_context);
  int after = std::max(0, o.after_context);

  for (auto& file : files) {
    std::ifstream in(file, std::ios::binary);
    if (!in) {
      spdlog::warn("cannot read {}", file);
      continue;
    }
    std::ostringstream ss; ss << in.rdbuf();
    auto lines = split_lines(ss.str());

    for (size_t i = 0; i < lines.size(); ++i) {
      if (!RE2::PartialMatch(lines[i], re)) continue;
      size_t first = i >= (size_t)before ? i - before : 0;
      size_t last = std::min(lines.size() - 1, i + after);
      string preview;
      for (size_t j = first; j <= last; ++j) {
        if (j > first) preview += '\n';
        preview += clip(lines[j], kMaxLinePreview);
      }
      out.results.push_back(SearchResult{file, (int)i + 1, (int)i + 1, preview, 1.0f});
    }
  }
  finish(out, files, o);
  return out;
}

struct LexicalDoc {
  const string* file;
  Chunk chunk;
};

SearchOutput lexical_search(const string& path, const SearchOptions& o, const ChunkConfig& config,
                            size_t topk) {
  SearchOutput out;
  auto files = walk_files(path, walk_options(o));

  std::optional<SidecarStore> store;
  if (auto root = find_index_root(path)) store.emplace(*root);

  std::vector<LexicalDoc> docs;
  std::vector<string> searched;
  size_t from_index = 0;
  for (auto& file : files) {
    std::vector<Chunk> chunks;
    bool cached = false;
    if (store) {
      if (auto entry = store->read(file)) {
        try {
          if (metadata_matches(entry->fingerprint, stat_file(file))) {
            chunks = std::move(entry->chunks);
            cached = true;
          }
        } catch (const FileAccessError&) {
        }
      }
    }
    if (!cached) {
      try {
        chunks = chunk_file(file, config);
      } catch (const CkError& e) {
        spdlog::warn("skipping {}: {}", file, e.what());
        continue;
      }
    } else {
      ++from_index;
    }
    searched.push_back(file);
    for (auto& c : chunks) docs.push_back(LexicalDoc{&file, std::move(c)});
  }
  spdlog::debug("lexical: {} chunks from {} files ({} from the index)", docs.size(), searched.size(),
                from_index);

  Bm25Index bm25;
  for (auto& d : docs) bm25.add(d.chunk.text);
  auto scores = bm25.score(o.query);

  for (size_t i = 0; i < docs.size(); ++i) {
    if (scores[i] <= 0) continue;
    if (o.threshold && scores[i] < *o.threshold) continue;
    auto& c = docs[i].chunk;
    out.results.push_back(SearchResult{*docs[i].file, c.span.line_start, c.span.line_end,
                                       clip(c.text, kMaxChunkPreview), scores[i]});
  }
  std::sort(out.results.begin(), out.results.end(), result_order);
  if (out.results.size() > topk) out.results.resize(topk);
  finish(out, searched, o);
  return out;
}

}

const char* mode_name(SearchMode mode) {
  switch (mode) {
    case SearchMode::Regex: return "regex";
    case SearchMode::Lexical: return "lexical";
    case SearchMode::Semantic: return "semantic";
    case SearchMode::Hybrid: return "hybrid";
  }
  return "unknown";
}

SearchSummary& SearchSummary::operator+=(const SearchSummary& o) {
  total_matches += o.total_matches;
  files_with_matches += o.files_with_matches;
  files_searched += o.files_searched;
  duration += o.duration;
  return *this;
}

bool result_order(const SearchResult& a, const SearchResult& b) {
  if (a.score != b.score) return a.score > b.score;
  if (a.file != b.file) return a.file < b.file;
  if (a.line_start != b.line_start) return a.line_start < b.line_start;
  return a.line_end < b.line_end;
}

std::vector<SearchResult> fuse_scores(const std::vector<FusionCandidate>& candidates,
                                      float lexical_weight, float semantic_weight) {
  float max_lexical = 0;
  for (auto& c : candidates) max_lexical = std::max(max_lexical, c.lexical);

  std::vector<SearchResult> out;
  out.reserve(candidates.size());
  for (auto& c : candidates) {
    float lex = max_lexical > 0 ? std::max(0.0f, c.lexical) / max_lexical : 0.0f;
    float sem = std::min(1.0f, std::max(0.0f, c.semantic));
    out.push_back(SearchResult{c.file, c.span.line_start, c.span.line_end,
                               clip(c.text, kMaxChunkPreview),
                               lexical_weight * lex + semantic_weight * sem});
  }
  std::sort(out.begin(), out.end(), result_order);
  return out;
}

SearchEngine::SearchEngine(EmbeddingSession* session, Reranker* reranker, Config config)
  : session_(session), reranker_(reranker), config_(std::move(config)) {}

ChunkConfig SearchEngine::chunk_config() const {
  return session_ ? session_->provider().chunk_config() : ChunkConfig{};
}

SearchOutput SearchEngine::search(const SearchOptions& options) const {
  std::vector<string> paths = options.paths;
  if (paths.empty()) paths.push_back(".");
  size_t topk = (size_t)std::max(1, options.topk.value_or(config_.topk));

  std::unique_ptr<RE2> re;
  if (options.mode == SearchMode::Regex) re = compile_pattern(options);

  SearchOutput merged;
  for (auto& path : paths) {
    std::error_code ec;
    if (!fs::exists(path, ec)) throw FileAccessError(path, "search", "no such file or directory");

    auto start = std::chrono::steady_clock::now();
    SearchOutput one;
    switch (options.mode) {
      case SearchMode::Regex:
        one = regex_search(*re, path, options);
        break;
      case SearchMode::Lexical:
        one = lexical_search(path, options, chunk_config(), topk);
        break;
      case SearchMode::Semantic:
      case SearchMode::Hybrid:
        one = ranked_search(path, options);
        break;
    }
    one.summary.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);

    merged.summary += one.summary;
    for (auto& r : one.results) merged.results.push_back(std::move(r));
    for (auto& f : one.files_without_matches) merged.files_without_matches.push_back(std::move(f));
    if (one.near_miss && (!merged.near_miss || one.near_miss->score > merged.near_miss->score))
      merged.near_miss = std::move(one.near_miss);
  }
  if (!merged.results.empty()) merged.near_miss.reset();
  return merged;
}

SearchOutput SearchEngine::ranked_search(const string& path, const SearchOptions& o) const {
  auto root = find_index_root(path);
  if (!root) throw NotIndexed(path);
  if (!session_) throw EmbeddingUnavailable("no embedding model is loaded");

  SidecarStore store(*root);
  const string& model = session_->model_id();
  auto files = walk_files(path, walk_options(o));

  std::vector<FusionCandidate> candidates;
  std::vector<std::vector<float>> vectors;
  std::vector<string> searched;
  size_t unusable = 0;
  for (auto& file : files) {
    auto entry = store.read(file);
    if (!entry) { ++unusable; continue; }
    try {
      if (!metadata_matches(entry->fingerprint, stat_file(file))) {
        spdlog::debug("{}: sidecar is stale", file);
        ++unusable;
        continue;
      }
    } catch (const FileAccessError&) {
      continue;
    }
    if (entry->fingerprint.model_id != model || !entry->has_embeddings()) {
      spdlog::debug("{}: indexed for model '{}', not '{}'", file, entry->fingerprint.model_id, model);
      ++unusable;
      continue;
    }
    searched.push_back(file);
    for (size_t i = 0; i < entry->chunks.size(); ++i) {
      auto& c = entry->chunks[i];
      candidates.push_back(FusionCandidate{file, c.span, std::move(c.text), 0.0f, 0.0f});
      vectors.push_back(std::move(entry->embeddings[i]));
    }
  }
  if (searched.empty() && !files.empty()) throw NotIndexed(path, model);
  if (unusable > 0)
    spdlog::warn("{} of {} files have no current '{}' embeddings; run ck --index to include them",
                 unusable, files.size(), model);

  SearchOutput out;
  if (!candidates.empty()) {
    auto query = session_->embed_one(o.query);
    VectorIndex index((int)query.size(), vectors.size());
    for (size_t i = 0; i < vectors.size(); ++i) {
      if (vectors[i].size() != query.size()) continue;
      index.add(vectors[i], i);
    }
    for (auto& hit : index.search(query, index.size())) candidates[hit.first].semantic = hit.second;
  }

  std::vector<SearchResult> ranked;
  float threshold;
  if (o.mode == SearchMode::Semantic) {
    threshold = o.threshold.value_or(config_.threshold);
    for (auto& c : candidates)
      ranked.push_back(SearchResult{c.file, c.span.line_start, c.span.line_end,
                                    clip(c.text, kMaxChunkPreview), c.semantic});
    std::sort(ranked.begin(), ranked.end(), result_order);
  } else {
    threshold = o.threshold.value_or(config_.hybrid_threshold);
    Bm25Index bm25;
    for (auto& c : candidates) bm25.add(c.text);
    auto lexical = bm25.score(o.query);
    for (size_t i = 0; i < candidates.size(); ++i) candidates[i].lexical = lexical[i];
    ranked = fuse_scores(candidates, config_.lexical_weight, config_.semantic_weight);
  }

  auto cut = std::find_if(ranked.begin(), ranked.end(),
                          [&](const SearchResult& r) { return r.score < threshold; });
  if (cut == ranked.begin() && cut != ranked.end()) out.near_miss = *cut;
  ranked.erase(cut, ranked.end());

  size_t topk = (size_t)std::max(1, o.topk.value_or(config_.topk));
  if (ranked.size() > topk) ranked.resize(topk);
  if (o.rerank) rerank(o.query, ranked);

  out.results = std::move(ranked);
  finish(out, searched, o);
  return out;
}

void SearchEngine::rerank(const string& query, std::vector<SearchResult>& results) const {
  if (!reranker_) {
    spdlog::warn("rerank requested but no reranker is loaded; keeping the fused order");
    return;
  }
  size_t window = results.size();
  if (config_.rerank_window > 0) window = std::min(window, (size_t)config_.rerank_window);
  if (window == 0) return;

  std::vector<string> docs;
  docs.reserve(window);
  for (size_t i = 0; i < window; ++i) docs.push_back(results[i].preview);

  CallLimits limits;
  limits.deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(config_.embed_timeout_ms);
  std::vector<float> scores;
  try {
    scores = reranker_->score(query, docs, limits);
  } catch (const EmbeddingUnavailable& e) {
    spdlog::warn("rerank failed: {}; keeping the fused order", e.what());
    return;
  }
  if (scores.size() != window) {
    spdlog::warn("reranker returned {} scores for {} candidates; keeping the fused order",
                 scores.size(), window);
    return;
  }
  for (size_t i = 0; i < window; ++i) results[i].score = scores[i];
  std::sort(results.begin(), results.begin() + (std::ptrdiff_t)window, result_order);
}
