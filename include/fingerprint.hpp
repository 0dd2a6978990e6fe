#pragma once
#include <cstdint>
#include <string>

// Identifies the exact state a sidecar was built from.
struct Fingerprint {
  std::string content_hash;   // hex SHA-256 of the file bytes
  uint64_t size = 0;
  int64_t mtime_ns = 0;       // local filesystem clock, not portable across machines
  std::string model_id;       // empty when the entry carries no embeddings

  bool operator==(const Fingerprint& o) const {
    return content_hash == o.content_hash && size == o.size && mtime_ns == o.mtime_ns &&
           model_id == o.model_id;
  }
  bool operator!=(const Fingerprint& o) const { return !(*this == o); }
};

struct FileState {
  uint64_t size = 0;
  int64_t mtime_ns = 0;
};

// Throws FileAccessError.
FileState stat_file(const std::string& path);
std::string sha256_hex(const std::string& bytes);
std::string hash_file(const std::string& path);

enum class Freshness {
  Fresh,      // reusable as is
  Touched,    // size/mtime moved but the bytes hash the same; refresh the fingerprint only
  Stale       // rebuild
};

// The staleness oracle. size+mtime decide first; the content hash is only
// computed when they differ (or always with verify_content). A different
// model always means Stale.
Freshness check_freshness(const Fingerprint& stored, const std::string& path,
                          const std::string& model_id, bool verify_content = false);

// Cheap variant for the read path: size+mtime only, no hashing.
bool metadata_matches(const Fingerprint& stored, const FileState& current);
