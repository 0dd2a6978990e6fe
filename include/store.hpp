#pragma once
#include "chunker.hpp"
#include "fingerprint.hpp"
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

// Bumped whenever the on-disk layout changes; older or newer entries read as absent.
constexpr int kSchemaVersion = 1;

// Sidecars live under <root>/.ck/ mirroring the source tree, one
// "<relative path>.ck" SQLite file per source file.
constexpr const char* kIndexDirName = ".ck";
constexpr const char* kSidecarSuffix = ".ck";

struct SidecarEntry {
  Fingerprint fingerprint;
  std::vector<Chunk> chunks;
  std::vector<std::vector<float>> embeddings;   // parallel to chunks, or empty
  int schema_version = kSchemaVersion;

  bool has_embeddings() const { return !embeddings.empty(); }
};

struct IndexStats {
  size_t files_indexed = 0;
  size_t files_skipped = 0;
  size_t chunks_created = 0;
  size_t total_files = 0;
  size_t total_chunks = 0;
  uint64_t index_size_bytes = 0;
  std::optional<std::filesystem::file_time_type> last_modified;
  std::vector<std::string> orphaned_files;   // sidecar paths whose source is gone
};

class SidecarStore {
public:
  explicit SidecarStore(const std::string& root);

  const std::string& root() const { return root_; }
  std::string index_dir() const;
  bool exists() const;

  std::string sidecar_path(const std::string& file) const;
  std::string source_path(const std::string& sidecar) const;

  // A complete, valid entry or nothing. Corrupt, partial or
  // other-schema sidecars read as absent.
  std::optional<SidecarEntry> read(const std::string& file) const;

  // Builds the sidecar in a temporary file next to its final location and
  // publishes it with one rename. Throws FileAccessError.
  void write(const std::string& file, const SidecarEntry& entry) const;

  bool remove(const std::string& file) const;

  // The maintenance calls below take an optional `under`: a file or
  // directory inside root. Empty means the whole index. Throws
  // FileAccessError when `under` lies outside root.

  // Where the sidecars for `under` live inside the index directory.
  std::string scope_dir(const std::string& under = std::string()) const;

  // Published sidecars, sorted.
  std::vector<std::string> sidecars(const std::string& under = std::string()) const;

  // Only sidecars that read back with the current schema count as files.
  IndexStats stats(const std::string& under = std::string()) const;

  // Removes the whole index directory, or only the sidecars for `under`.
  void clean(const std::string& under = std::string()) const;

  // Removes sidecars whose source file no longer exists (plus abandoned
  // temporaries) and returns how many sidecars went.
  size_t clean_orphans(const std::string& under = std::string()) const;

private:
  std::filesystem::path scope_relative(const std::string& under) const;

  std::string root_;
};

// Nearest directory at or above `path` that holds an index.
std::optional<std::string> find_index_root(const std::string& path);
