#pragma once
#include <optional>
#include <string>
#include <vector>

struct Span {
  int line_start;   // 1-based, inclusive
  int line_end;     // 1-based, inclusive
};

struct Symbol {
  std::string kind;
  std::string name;
};

struct Chunk {
  std::string text;             // exactly the lines of `span`
  Span span;
  std::optional<Symbol> symbol;
};

// Limits come from the embedding model (see ModelInfo).
struct ChunkConfig {
  int max_tokens = 512;
  int overlap_tokens = 64;
};

// Splits `content` into chunks aligned to function/class-like symbols where
// the language is recognized, and into token-bounded line windows elsewhere.
// Spans never overlap, increase monotonically and cover every non-blank line.
// Throws ChunkError only when the content cannot be decoded as text.
std::vector<Chunk> chunk_text(const std::string& content, const std::string& path,
                              const ChunkConfig& config);

// Reads and chunks a file. Throws FileAccessError / ChunkError.
std::vector<Chunk> chunk_file(const std::string& path, const ChunkConfig& config);

// Text handed to the embedder for chunks[i]: the chunk itself, prefixed with
// trailing lines of an adjacent predecessor up to config.overlap_tokens.
std::string embedding_text(const std::vector<Chunk>& chunks, size_t i, const ChunkConfig& config);

// Splits on '\n', dropping a trailing '\r' per line. A final newline does not
// start an extra empty line.
std::vector<std::string> split_lines(const std::string& content);
