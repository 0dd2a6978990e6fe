#pragma once
#include "chunker.hpp"
#include "config.hpp"
#include <chrono>
#include <optional>
#include <string>
#include <vector>

class EmbeddingSession;
class Reranker;

enum class SearchMode { Regex, Lexical, Semantic, Hybrid };

const char* mode_name(SearchMode mode);

struct SearchOptions {
  SearchMode mode = SearchMode::Regex;
  std::string query;                    // pattern in regex mode
  std::vector<std::string> paths;       // empty -> "."

  bool case_insensitive = false;
  bool fixed_string = false;
  bool word_regexp = false;
  bool recursive = true;
  std::vector<std::string> excludes;
  bool respect_ignore = true;

  std::optional<int> topk;              // ranked modes; Config::topk when unset
  std::optional<float> threshold;       // semantic/hybrid/lexical; Config thresholds when unset
  bool rerank = false;
  std::string rerank_model;

  int before_context = 0;
  int after_context = 0;

  // output shaping, consumed by the front end
  bool show_scores = false;
  bool files_with_matches = false;
  bool files_without_matches = false;
  bool line_numbers = false;
  bool show_filenames = true;
};

struct SearchResult {
  std::string file;
  int line_start;
  int line_end;
  std::string preview;
  float score;
};

struct SearchSummary {
  size_t total_matches = 0;
  size_t files_with_matches = 0;
  size_t files_searched = 0;
  std::chrono::milliseconds duration{0};

  SearchSummary& operator+=(const SearchSummary& o);
};

struct SearchOutput {
  std::vector<SearchResult> results;
  SearchSummary summary;
  // Best result under the threshold, reported when a semantic or hybrid
  // query found nothing.
  std::optional<SearchResult> near_miss;
  std::vector<std::string> files_without_matches;
};

// One chunk competing in hybrid fusion with its raw scores.
struct FusionCandidate {
  std::string file;
  Span span;
  std::string text;
  float lexical;    // BM25, any non-negative scale
  float semantic;   // cosine similarity
};

// Lexical scores are normalized by the set's maximum and semantic scores
// clamped to [0, 1]; the fused score is their weighted sum. The output is
// sorted by score, then file, then line, whatever the input order.
std::vector<SearchResult> fuse_scores(const std::vector<FusionCandidate>& candidates,
                                      float lexical_weight, float semantic_weight);

// Descending score, ascending file, ascending line.
bool result_order(const SearchResult& a, const SearchResult& b);

class SearchEngine {
public:
  // session and reranker may be null; semantic and hybrid queries then
  // raise EmbeddingUnavailable and rerank requests are ignored.
  SearchEngine(EmbeddingSession* session, Reranker* reranker, Config config);

  // Runs one query over every path in options.paths and merges the results.
  SearchOutput search(const SearchOptions& options) const;

private:
  ChunkConfig chunk_config() const;
  SearchOutput ranked_search(const std::string& path, const SearchOptions& options) const;
  void rerank(const std::string& query, std::vector<SearchResult>& results) const;

  EmbeddingSession* session_;
  Reranker* reranker_;
  Config config_;
};
