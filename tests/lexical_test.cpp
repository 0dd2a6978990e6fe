#include "lexical.hpp"
#include <gtest/gtest.h>
#include <algorithm>

namespace {
bool has(const std::vector<std::string>& v, const std::string& s) {
  return std::find(v.begin(), v.end(), s) != v.end();
}
}

TEST(Tokenize, SplitsIdentifiers) {
  auto t = tokenize("parseConfigFile(HTTPServer, max_retry_count)");
  EXPECT_TRUE(has(t, "parseconfigfile"));
  EXPECT_TRUE(has(t, "parse"));
  EXPECT_TRUE(has(t, "config"));
  EXPECT_TRUE(has(t, "file"));
  EXPECT_TRUE(has(t, "httpserver"));
  EXPECT_TRUE(has(t, "http"));
  EXPECT_TRUE(has(t, "server"));
  EXPECT_TRUE(has(t, "max_retry_count"));
  EXPECT_TRUE(has(t, "retry"));
}

TEST(Tokenize, PlainWordsAndPunctuation) {
  std::vector<std::string> expected = {"hello", "world", "42"};
  EXPECT_EQ(tokenize("Hello, world! 42"), expected);
  EXPECT_TRUE(tokenize("  ;; -- ").empty());
  EXPECT_TRUE(tokenize("___").empty());
}

TEST(Bm25, RanksByTermWeight) {
  Bm25Index idx;
  idx.add("the parser reads the config file");
  idx.add("network socket code");
  idx.add("config config config loader");
  auto s = idx.score("config");
  ASSERT_EQ(s.size(), 3u);
  EXPECT_EQ(s[1], 0.0f);
  EXPECT_GT(s[0], 0.0f);
  EXPECT_GT(s[2], s[0]);
}

TEST(Bm25, RareTermsWeighMore) {
  Bm25Index idx;
  idx.add("common rare");
  idx.add("common");
  idx.add("common");
  auto s = idx.score("common rare");
  EXPECT_GT(s[0], s[1]);
  EXPECT_FLOAT_EQ(s[1], s[2]);
}

TEST(Bm25, ShorterDocumentWinsOnEqualFrequency) {
  Bm25Index idx;
  idx.add("needle");
  idx.add("needle hay hay hay hay hay hay hay");
  auto s = idx.score("needle");
  EXPECT_GT(s[0], s[1]);
}

TEST(Bm25, InsertionOrderDoesNotMatter) {
  std::vector<std::string> docs = {"alpha beta", "beta gamma gamma", "alpha alpha delta", "epsilon"};
  Bm25Index forward, backward;
  for (auto& d : docs) forward.add(d);
  for (auto it = docs.rbegin(); it != docs.rend(); ++it) backward.add(*it);
  auto f = forward.score("alpha gamma");
  auto b = backward.score("alpha gamma");
  for (size_t i = 0; i < docs.size(); ++i) EXPECT_FLOAT_EQ(f[i], b[docs.size() - 1 - i]);
}

TEST(Bm25, EmptyCorpusAndQuery) {
  Bm25Index idx;
  EXPECT_TRUE(idx.score("x").empty());
  idx.add("something");
  auto s = idx.score("");
  ASSERT_EQ(s.size(), 1u);
  EXPECT_EQ(s[0], 0.0f);
}
