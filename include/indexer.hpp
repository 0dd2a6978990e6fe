#pragma once
#include "chunker.hpp"
#include "embedder.hpp"
#include "language.hpp"
#include "store.hpp"
#include <string>
#include <vector>

class EmbeddingSession;

struct UpdateOptions {
  bool force_rebuild = false;
  std::vector<std::string> excludes;
  std::string model;            // must name the session's model; empty = no embeddings
  bool respect_ignore = true;
  bool verify_content = false;  // hash even when size+mtime match
  int workers = 0;              // 0 -> hardware concurrency
  int batch_size = 16;
};

struct FileProgress {
  std::string file;
  size_t files_done;
  size_t files_total;
  bool rebuilt;
};

struct ChunkProgress {
  std::string file;
  size_t chunks_done;
  size_t chunks_total;
};

// Receives progress from update(). Calls are serialized, never concurrent.
class IndexObserver {
public:
  virtual ~IndexObserver() = default;
  virtual void on_file_progress(const FileProgress& progress) = 0;
  virtual void on_chunk_progress(const ChunkProgress& progress) = 0;
};

struct IndexFailure {
  std::string path;
  std::string reason;
};

struct UpdateResult {
  IndexStats stats;
  std::vector<IndexFailure> failures;
  std::vector<std::string> degraded;   // indexed without embeddings
};

struct FileInspection {
  std::string path;
  Language language = Language::Text;
  size_t bytes = 0;
  size_t lines = 0;
  int tokens = 0;
  std::vector<Chunk> chunks;
  std::vector<int> chunk_tokens;
};

class Indexer {
public:
  // session may be null, in which case rebuilt sidecars carry chunks only
  // and unchanged files keep what they have.
  explicit Indexer(EmbeddingSession* session, ChunkConfig fallback = ChunkConfig{});

  // Walks root and rebuilds every file whose fingerprint or model changed.
  // Per-file failures are collected; throws IndexingFailed only when no file
  // could be processed, Cancelled when the token fires.
  UpdateResult update(const std::string& root, const UpdateOptions& options,
                      IndexObserver* observer = nullptr, const CancelToken* cancel = nullptr);

  // Indexes or refreshes one file of the index at root. Returns true when rebuilt.
  bool add_file(const std::string& root, const std::string& file, const UpdateOptions& options);

  ChunkConfig chunk_config() const;

private:
  enum class Outcome { Skipped, Rebuilt, Degraded };

  struct Context;
  Outcome process(Context& ctx, const std::string& file, size_t& chunks);

  EmbeddingSession* session_;
  ChunkConfig fallback_;
};

// Chunks one file for inspection without touching any index.
FileInspection inspect_file(const std::string& path, const ChunkConfig& config);
