#include "output.hpp"
#include "language.hpp"
#include <chrono>
#include <iomanip>
#include <set>
#include <sstream>

using nlohmann::json;

namespace {

// File contents are raw bytes; invalid UTF-8 becomes U+FFFD instead of throwing.
std::string dump(const json& j, int indent = -1) {
  return j.dump(indent, ' ', false, json::error_handler_t::replace);
}

std::string format_score(float score) {
  std::ostringstream ss;
  ss << std::fixed << std::setprecision(3) << score;
  return ss.str();
}

std::string human_bytes(uint64_t n) {
  const char* units[] = {"B", "KiB", "MiB", "GiB"};
  double v = (double)n;
  int u = 0;
  while (v >= 1024 && u < 3) { v /= 1024; ++u; }
  std::ostringstream ss;
  if (u == 0) ss << n << " B";
  else ss << std::fixed << std::setprecision(1) << v << " " << units[u];
  return ss.str();
}

void print_text_result(std::ostream& out, const SearchResult& r, const SearchOptions& o) {
  std::string prefix;
  if (o.show_filenames) prefix += r.file + ":";
  if (o.line_numbers) {
    prefix += std::to_string(r.line_start);
    if (r.line_end != r.line_start) prefix += "-" + std::to_string(r.line_end);
    prefix += ":";
  }
  if (o.show_scores) prefix += "[" + format_score(r.score) + "] ";

  std::istringstream lines(r.preview);
  std::string line;
  bool first = true;
  while (std::getline(lines, line)) {
    if (first) out << prefix << line << "\n";
    else out << line << "\n";
    first = false;
  }
  if (first) out << prefix << "\n";
  if (r.preview.find('\n') != std::string::npos) out << "--\n";
}

}

json result_to_json(const SearchResult& r) {
  return json{
    {"file", r.file},
    {"span", {{"line_start", r.line_start}, {"line_end", r.line_end}}},
    {"preview", r.preview},
    {"score", r.score},
  };
}

json stats_to_json(const IndexStats& s) {
  json j{
    {"total_files", s.total_files},
    {"total_chunks", s.total_chunks},
    {"files_indexed", s.files_indexed},
    {"files_skipped", s.files_skipped},
    {"chunks_created", s.chunks_created},
    {"index_size_bytes", s.index_size_bytes},
    {"orphaned_files", s.orphaned_files},
  };
  if (s.last_modified) {
    auto age = std::filesystem::file_time_type::clock::now() - *s.last_modified;
    j["last_modified_seconds_ago"] = std::chrono::duration_cast<std::chrono::seconds>(age).count();
  }
  return j;
}

void print_results(std::ostream& out, const SearchOutput& res, const SearchOptions& o,
                   OutputFormat format) {
  if (o.files_without_matches || o.files_with_matches) {
    std::vector<std::string> files;
    if (o.files_without_matches) {
      files = res.files_without_matches;
    } else {
      std::set<std::string> seen;
      for (auto& r : res.results) if (seen.insert(r.file).second) files.push_back(r.file);
    }
    switch (format) {
      case OutputFormat::Text:
        for (auto& f : files) out << f << "\n";
        break;
      case OutputFormat::Json:
        out << dump(json(files), 2) << "\n";
        break;
      case OutputFormat::Jsonl:
        for (auto& f : files) out << dump(json{{"file", f}}) << "\n";
        break;
    }
    return;
  }

  switch (format) {
    case OutputFormat::Text:
      for (auto& r : res.results) print_text_result(out, r, o);
      break;
    case OutputFormat::Json: {
      json arr = json::array();
      for (auto& r : res.results) arr.push_back(result_to_json(r));
      out << dump(arr, 2) << "\n";
      break;
    }
    case OutputFormat::Jsonl:
      for (auto& r : res.results) out << dump(result_to_json(r)) << "\n";
      break;
  }
}

void print_stats(std::ostream& out, const IndexStats& s, bool verbose, OutputFormat format) {
  if (format != OutputFormat::Text) {
    out << dump(stats_to_json(s), format == OutputFormat::Json ? 2 : -1) << "\n";
    return;
  }
  out << "files:      " << s.total_files << "\n"
      << "chunks:     " << s.total_chunks << "\n"
      << "index size: " << human_bytes(s.index_size_bytes) << "\n"
      << "orphans:    " << s.orphaned_files.size() << "\n";
  if (s.last_modified) {
    auto age = std::chrono::duration_cast<std::chrono::minutes>(
        std::filesystem::file_time_type::clock::now() - *s.last_modified);
    out << "updated:    " << age.count() << " min ago\n";
  }
  if (verbose)
    for (auto& o : s.orphaned_files) out << "  orphan: " << o << "\n";
}

void print_inspection(std::ostream& out, const FileInspection& info, OutputFormat format) {
  if (format != OutputFormat::Text) {
    json chunks = json::array();
    for (size_t i = 0; i < info.chunks.size(); ++i) {
      auto& c = info.chunks[i];
      json jc{{"line_start", c.span.line_start}, {"line_end", c.span.line_end},
              {"tokens", info.chunk_tokens[i]}};
      if (c.symbol) jc["symbol"] = {{"kind", c.symbol->kind}, {"name", c.symbol->name}};
      chunks.push_back(jc);
    }
    json j{{"path", info.path}, {"language", language_name(info.language)}, {"bytes", info.bytes},
           {"lines", info.lines}, {"tokens", info.tokens}, {"chunks", chunks}};
    out << dump(j, format == OutputFormat::Json ? 2 : -1) << "\n";
    return;
  }
  out << info.path << " (" << language_name(info.language) << ", " << info.lines << " lines, ~"
      << info.tokens << " tokens, " << info.chunks.size() << " chunks)\n";
  for (size_t i = 0; i < info.chunks.size(); ++i) {
    auto& c = info.chunks[i];
    out << "  " << std::setw(5) << c.span.line_start << "-" << std::left << std::setw(5)
        << c.span.line_end << std::right << " ~" << info.chunk_tokens[i] << " tokens";
    if (c.symbol) out << "  " << c.symbol->kind << " " << c.symbol->name;
    out << "\n";
  }
}
