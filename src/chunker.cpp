#include "chunker.hpp"
#include "embedder.hpp"
#include "errors.hpp"
#include "language.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>

using std::string;

namespace {

bool is_blank(const string& s) {
  return std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
}

// Comment, decorator and attribute lines that belong to the definition below them.
bool is_leading_annotation(const string& line) {
  size_t p = line.find_first_not_of(" \t");
  if (p == string::npos) return false;
  auto starts = [&](const char* s) { return line.compare(p, std::char_traits<char>::length(s), s) == 0; };
  // "*" only as the body or end of a block comment, not a dereference
  bool comment_star = starts("*") && (line.size() == p + 1 || line[p + 1] == ' ' || line[p + 1] == '/');
  return starts("//") || starts("/*") || comment_star || starts("#[") || starts("@") ||
         starts("# ") || (line.size() == p + 1 && line[p] == '#');
}

class Packer {
public:
  Packer(const std::vector<string>& lines, const ChunkConfig& config, std::vector<Chunk>& out)
    : lines_(lines), config_(config), out_(out) {}

  // Emits [first, last] (0-based) as one or more chunks within the token budget.
  void emit(int first, int last, const std::optional<Symbol>& symbol) {
    while (first <= last && is_blank(lines_[first])) ++first;
    while (last >= first && is_blank(lines_[last])) --last;
    if (first > last) return;

    int start = first;
    int tokens = 0;
    int last_blank = -1;
    for (int i = first; i <= last; ++i) {
      if (i < start) continue;
      int t = estimate_tokens(lines_[i]) + 1;
      while (i > start && tokens + t > config_.max_tokens) {
        // prefer breaking after a blank line in the second half of the piece
        int cut = (last_blank > start + (i - start) / 2) ? last_blank : i - 1;
        push(start, cut, symbol);
        start = cut + 1;
        while (start <= last && is_blank(lines_[start])) ++start;
        tokens = 0;
        last_blank = -1;
        for (int k = start; k < i; ++k) {
          tokens += estimate_tokens(lines_[k]) + 1;
          if (is_blank(lines_[k])) last_blank = k;
        }
      }
      if (i < start) continue;
      tokens += t;
      if (is_blank(lines_[i])) last_blank = i;
    }
    if (start <= last) push(start, last, symbol);
  }

private:
  void push(int first, int last, const std::optional<Symbol>& symbol) {
    while (last > first && is_blank(lines_[last])) --last;
    string text;
    for (int i = first; i <= last; ++i) {
      text += lines_[i];
      if (i < last) text += '\n';
    }
    out_.push_back(Chunk{std::move(text), Span{first + 1, last + 1}, symbol});
  }

  const std::vector<string>& lines_;
  const ChunkConfig& config_;
  std::vector<Chunk>& out_;
};

}

std::vector<string> split_lines(const string& content) {
  std::vector<string> lines;
  size_t pos = 0;
  while (pos < content.size()) {
    size_t nl = content.find('\n', pos);
    size_t end = nl == string::npos ? content.size() : nl;
    string line = content.substr(pos, end - pos);
    if (!line.empty() && line.back() == '\r') line.pop_back();
    lines.push_back(std::move(line));
    if (nl == string::npos) break;
    pos = nl + 1;
  }
  return lines;
}

std::vector<Chunk> chunk_text(const string& content, const string& path, const ChunkConfig& config) {
  if (content.find('\0') != string::npos) throw ChunkError(path, "content is not text (NUL byte)");
  if (config.max_tokens <= 0) throw ChunkError(path, "max_tokens must be positive");

  auto lines = split_lines(content);
  std::vector<Chunk> chunks;
  Packer packer(lines, config, chunks);

  auto symbols = find_symbols(detect_language(path), lines);

  int cursor = 0;
  for (auto& s : symbols) {
    int first = s.first_line;
    while (first > cursor && is_leading_annotation(lines[first - 1])) --first;
    if (cursor < first) packer.emit(cursor, first - 1, std::nullopt);
    packer.emit(first, s.last_line, Symbol{s.kind, s.name});
    cursor = s.last_line + 1;
  }
  if (cursor < (int)lines.size()) packer.emit(cursor, (int)lines.size() - 1, std::nullopt);
  return chunks;
}

std::vector<Chunk> chunk_file(const string& path, const ChunkConfig& config) {
  std::ifstream in(path, std::ios::binary);
  if (!in) throw FileAccessError(path, "read", "cannot open file");
  std::ostringstream ss; ss << in.rdbuf();
  return chunk_text(ss.str(), path, config);
}

string embedding_text(const std::vector<Chunk>& chunks, size_t i, const ChunkConfig& config) {
  const Chunk& cur = chunks[i];
  if (i == 0 || config.overlap_tokens <= 0) return cur.text;

  const Chunk& prev = chunks[i - 1];
  bool same_region = prev.symbol.has_value() == cur.symbol.has_value() &&
                     (!cur.symbol || (prev.symbol->kind == cur.symbol->kind &&
                                      prev.symbol->name == cur.symbol->name));
  if (!same_region || prev.span.line_end + 1 != cur.span.line_start) return cur.text;

  auto prev_lines = split_lines(prev.text);
  int budget = config.overlap_tokens;
  size_t take = 0;
  for (size_t k = prev_lines.size(); k > 0; --k) {
    int t = estimate_tokens(prev_lines[k - 1]) + 1;
    if (t > budget) break;
    budget -= t;
    ++take;
  }
  if (take == 0) return cur.text;

  string out;
  for (size_t k = prev_lines.size() - take; k < prev_lines.size(); ++k) {
    out += prev_lines[k];
    out += '\n';
  }
  return out + cur.text;
}
