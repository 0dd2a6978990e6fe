#pragma once
#include <string>
#include <unordered_map>
#include <vector>

// Lowercased search terms. Identifiers are kept whole and also split into
// their snake_case / camelCase parts, so "parseConfigFile" matches "config".
std::vector<std::string> tokenize(const std::string& text);

struct Bm25Params {
  double k1 = 1.2;
  double b = 0.75;
};

// Okapi BM25 over a small in-memory corpus (the chunks of one query).
// Scores depend only on the set of documents, never on insertion order.
class Bm25Index {
public:
  explicit Bm25Index(Bm25Params params = Bm25Params{});

  // Returns the document id (insertion position).
  size_t add(const std::string& text);

  // One score per document, 0 for documents sharing no term with the query.
  std::vector<float> score(const std::string& query) const;

  size_t size() const { return docs_.size(); }

private:
  struct Doc {
    std::unordered_map<std::string, int> tf;
    size_t length;
  };

  double idf(const std::string& term) const;

  Bm25Params params_;
  std::vector<Doc> docs_;
  std::unordered_map<std::string, size_t> df_;
  size_t total_length_ = 0;
};
