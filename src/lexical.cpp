#include "lexical.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>

namespace {

// Bytes >= 0x80 belong to UTF-8 sequences and stay inside words.
bool is_word_byte(unsigned char c) {
  return std::isalnum(c) || c == '_' || c >= 0x80;
}

std::string lower(std::string s) {
  for (auto& c : s) c = (char)std::tolower((unsigned char)c);
  return s;
}

// snake_case and camelCase parts; "HTTPServer" -> "HTTP", "Server".
std::vector<std::string> split_identifier(const std::string& word) {
  std::vector<std::string> parts;
  std::string cur;
  auto flush = [&] { if (!cur.empty()) { parts.push_back(cur); cur.clear(); } };
  for (size_t i = 0; i < word.size(); ++i) {
    unsigned char c = word[i];
    if (c == '_') { flush(); continue; }
    if (std::isupper(c) && !cur.empty()) {
      unsigned char prev = word[i - 1];
      bool next_lower = i + 1 < word.size() && std::islower((unsigned char)word[i + 1]);
      if (std::islower(prev) || std::isdigit(prev) || (std::isupper(prev) && next_lower)) flush();
    }
    cur += (char)c;
  }
  flush();
  return parts;
}

}

std::vector<std::string> tokenize(const std::string& text) {
  std::vector<std::string> out;
  size_t i = 0;
  while (i < text.size()) {
    while (i < text.size() && !is_word_byte(text[i])) ++i;
    size_t start = i;
    while (i < text.size() && is_word_byte(text[i])) ++i;
    if (start == i) continue;
    std::string word = text.substr(start, i - start);
    auto parts = split_identifier(word);
    if (parts.empty()) continue;   // only underscores
    std::string whole = lower(word);
    out.push_back(whole);
    if (parts.size() > 1)
      for (auto& p : parts) out.push_back(lower(p));
  }
  return out;
}

Bm25Index::Bm25Index(Bm25Params params) : params_(params) {}

size_t Bm25Index::add(const std::string& text) {
  Doc d;
  auto terms = tokenize(text);
  d.length = terms.size();
  for (auto& t : terms) d.tf[t]++;
  for (auto& kv : d.tf) df_[kv.first]++;
  total_length_ += d.length;
  docs_.push_back(std::move(d));
  return docs_.size() - 1;
}

double Bm25Index::idf(const std::string& term) const {
  auto it = df_.find(term);
  double df = it == df_.end() ? 0.0 : (double)it->second;
  double n = (double)docs_.size();
  // the "+1" keeps weights positive for terms present in most documents
  return std::log(1.0 + (n - df + 0.5) / (df + 0.5));
}

std::vector<float> Bm25Index::score(const std::string& query) const {
  std::vector<float> scores(docs_.size(), 0.0f);
  if (docs_.empty()) return scores;

  auto terms = tokenize(query);
  std::sort(terms.begin(), terms.end());
  terms.erase(std::unique(terms.begin(), terms.end()), terms.end());

  double avg_len = (double)total_length_ / (double)docs_.size();
  if (avg_len <= 0) return scores;

  std::vector<double> weights;
  weights.reserve(terms.size());
  for (auto& t : terms) weights.push_back(idf(t));

  for (size_t d = 0; d < docs_.size(); ++d) {
    const Doc& doc = docs_[d];
    double norm = params_.k1 * (1.0 - params_.b + params_.b * (double)doc.length / avg_len);
    double s = 0;
    for (size_t t = 0; t < terms.size(); ++t) {
      auto it = doc.tf.find(terms[t]);
      if (it == doc.tf.end()) continue;
      double tf = it->second;
      s += weights[t] * tf * (params_.k1 + 1.0) / (tf + norm);
    }
    scores[d] = (float)s;
  }
  return scores;
}
