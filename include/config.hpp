#pragma once
#include "retry.hpp"
#include <string>

struct Config {
  std::string model = "nomic-embed-text-v1.5";
  std::string models_dir;               // empty -> default_models_dir()
  int topk = 10;
  float threshold = 0.6f;               // semantic mode
  float hybrid_threshold = 0.0f;        // hybrid mode, applied to the fused score
  float lexical_weight = 0.5f;
  float semantic_weight = 0.5f;
  std::string rerank_model = "jina-reranker-v1-turbo-en";
  int rerank_window = 0;                // 0 -> topk
  int workers = 0;                      // 0 -> hardware concurrency
  int batch_size = 16;
  int embed_timeout_ms = 60000;
  RetryPolicy retry;
  std::string log_level = "warn";
};

// $XDG_CACHE_HOME/ck/models, ~/.cache/ck/models, or ./.ck_models as last resort.
// CK_MODELS_DIR wins over all of them.
std::string default_models_dir();

// Path of the per-user config file, whether or not it exists.
std::string default_config_path();

// Loads `path` (or the per-user file when `path` is empty). A missing
// per-user file yields defaults; a missing explicit file is an error.
Config load_config(const std::string& path = "");

// Parses a JSON document into a Config on top of the defaults.
Config parse_config(const std::string& json_text);
