#include "embedding_session.hpp"
#include "indexer.hpp"
#include "search.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>
#include <algorithm>
#include <memory>
#include <random>

namespace {

RetryPolicy no_retry() {
  RetryPolicy p;
  p.max_attempts = 1;
  return p;
}

std::vector<std::string> files_of(const std::vector<SearchResult>& results) {
  std::vector<std::string> out;
  for (auto& r : results) out.push_back(fs::path(r.file).filename().string());
  return out;
}

SearchOptions options_for(SearchMode mode, const std::string& query, const std::string& path) {
  SearchOptions o;
  o.mode = mode;
  o.query = query;
  o.paths = {path};
  o.line_numbers = true;
  return o;
}

class RegexSearchTest : public ::testing::Test {
protected:
  void SetUp() override {
    foo = dir.write("foo.txt", "bar\nfoo here\nbaz\nqux\nfoo again\n");
    dir.write("other.txt", "food for thought\nFOO loud\na.b and axb\n");
    dir.write("none.txt", "nothing to see\n");
  }

  SearchOutput search(SearchOptions o) {
    SearchEngine engine(nullptr, nullptr, Config{});
    return engine.search(o);
  }

  TempDir dir;
  std::string foo;
};

// Four one-chunk files indexed with the fake model; see FakeEmbedder for
// how the cosine scores below come out.
class RankedSearchTest : public ::testing::Test {
protected:
  void SetUp() override {
    dir.write("one.txt", "alpha\n");            // "alpha": 1.0
    dir.write("two.txt", "alpha beta\n");       // "alpha": 0.707
    dir.write("three.txt", "alpha beta gamma\n");  // "alpha": 0.577
    dir.write("four.txt", "delta\n");           // "alpha": 0
    use_model("model-x", FakeEmbedder::default_vocab());
    index();
  }

  void use_model(const std::string& id, std::vector<std::string> vocab) {
    fake = std::make_unique<FakeEmbedder>(id, std::move(vocab));
    session = std::make_unique<EmbeddingSession>(*fake, no_retry(), std::chrono::seconds(5));
  }

  UpdateResult index() {
    Indexer indexer(session.get());
    UpdateOptions options;
    options.model = session->model_id();
    return indexer.update(dir.str(), options);
  }

  SearchOutput search(const SearchOptions& o, Reranker* reranker = nullptr) {
    SearchEngine engine(session.get(), reranker, config);
    return engine.search(o);
  }

  TempDir dir;
  Config config;
  std::unique_ptr<FakeEmbedder> fake;
  std::unique_ptr<EmbeddingSession> session;
};

}

TEST_F(RegexSearchTest, ReportsEachMatchingLine) {
  auto out = search(options_for(SearchMode::Regex, "foo", foo));
  ASSERT_EQ(out.results.size(), 2u);
  EXPECT_EQ(out.results[0].line_start, 2);
  EXPECT_EQ(out.results[1].line_start, 5);
  EXPECT_EQ(out.results[0].line_end, 2);
  EXPECT_EQ(out.results[0].preview, "foo here");
  EXPECT_FLOAT_EQ(out.results[0].score, 1.0f);
  EXPECT_EQ(out.summary.total_matches, 2u);
  EXPECT_EQ(out.summary.files_with_matches, 1u);
  EXPECT_EQ(out.summary.files_searched, 1u);
}

TEST_F(RegexSearchTest, ContextLinesJoinThePreview) {
  auto o = options_for(SearchMode::Regex, "foo", foo);
  o.before_context = 1;
  o.after_context = 1;
  auto out = search(o);
  ASSERT_EQ(out.results.size(), 2u);
  EXPECT_EQ(out.results[0].preview, "bar\nfoo here\nbaz");
  EXPECT_EQ(out.results[1].preview, "qux\nfoo again");
  EXPECT_EQ(out.results[0].line_start, 2);
}

TEST_F(RegexSearchTest, MatchingFlags) {
  auto plain = search(options_for(SearchMode::Regex, "foo", dir.str()));
  EXPECT_EQ(plain.results.size(), 3u);   // foo.txt x2, "food"

  auto word = options_for(SearchMode::Regex, "foo", dir.str());
  word.word_regexp = true;
  EXPECT_EQ(search(word).results.size(), 2u);

  auto ci = options_for(SearchMode::Regex, "foo", dir.str());
  ci.case_insensitive = true;
  EXPECT_EQ(search(ci).results.size(), 4u);

  auto fixed = options_for(SearchMode::Regex, "a.b", dir.str());
  fixed.fixed_string = true;
  auto out = search(fixed);
  ASSERT_EQ(out.results.size(), 1u);
  EXPECT_EQ(out.results[0].line_start, 3);
}

TEST_F(RegexSearchTest, InvalidPattern) {
  EXPECT_THROW(search(options_for(SearchMode::Regex, "(unclosed", dir.str())), InvalidConfiguration);
}

TEST_F(RegexSearchTest, MissingPath) {
  EXPECT_THROW(search(options_for(SearchMode::Regex, "x", dir.file("absent"))), FileAccessError);
}

TEST_F(RegexSearchTest, FileListings) {
  auto with = options_for(SearchMode::Regex, "foo", dir.str());
  with.files_with_matches = true;
  auto out = search(with);
  EXPECT_EQ(files_of(out.results), (std::vector<std::string>{"foo.txt", "other.txt"}));
  EXPECT_EQ(out.summary.total_matches, 3u);

  auto without = options_for(SearchMode::Regex, "foo", dir.str());
  without.files_without_matches = true;
  out = search(without);
  EXPECT_TRUE(out.results.empty());
  ASSERT_EQ(out.files_without_matches.size(), 1u);
  EXPECT_EQ(out.files_without_matches[0], dir.file("none.txt"));
}

TEST_F(RegexSearchTest, MultiplePathsAreSummed) {
  TempDir second;
  second.write("x.txt", "foo\nfoo\n");
  second.write("y.txt", "nope\n");
  auto o = options_for(SearchMode::Regex, "foo", dir.str());
  o.paths.push_back(second.str());
  auto out = search(o);
  EXPECT_EQ(out.summary.total_matches, 5u);
  EXPECT_EQ(out.summary.files_with_matches, 3u);
  EXPECT_EQ(out.summary.files_searched, 5u);
  EXPECT_EQ(out.results.size(), 5u);
}

TEST(LexicalSearch, WorksWithoutAnIndexAndBreaksTies) {
  TempDir dir;
  dir.write("x2.txt", "needle in a haystack\n");
  dir.write("x1.txt", "needle in a haystack\n");
  dir.write("x3.txt", "nothing here\n");
  dir.write("x4.txt", "needle needle\n");
  SearchEngine engine(nullptr, nullptr, Config{});

  auto out = engine.search(options_for(SearchMode::Lexical, "needle", dir.str()));
  EXPECT_EQ(files_of(out.results), (std::vector<std::string>{"x4.txt", "x1.txt", "x2.txt"}));
  EXPECT_FLOAT_EQ(out.results[1].score, out.results[2].score);
  EXPECT_EQ(out.summary.files_searched, 4u);

  auto o = options_for(SearchMode::Lexical, "needle", dir.str());
  o.topk = 2;
  EXPECT_EQ(engine.search(o).results.size(), 2u);
  EXPECT_FALSE(fs::exists(dir.path() / ".ck"));
}

TEST_F(RankedSearchTest, LexicalUsesFreshSidecarsAndRechunksStaleFiles) {
  dir.write("four.txt", "delta and a brand new needle\n");
  auto out = search(options_for(SearchMode::Lexical, "needle", dir.str()));
  ASSERT_EQ(out.results.size(), 1u);
  EXPECT_EQ(files_of(out.results)[0], "four.txt");
}

TEST_F(RankedSearchTest, SemanticOrderThresholdAndTopk) {
  auto o = options_for(SearchMode::Semantic, "alpha", dir.str());
  o.threshold = 0.5f;
  auto out = search(o);
  EXPECT_EQ(files_of(out.results), (std::vector<std::string>{"one.txt", "two.txt", "three.txt"}));
  EXPECT_NEAR(out.results[0].score, 1.0f, 1e-5);
  EXPECT_NEAR(out.results[1].score, 0.70710678f, 1e-5);
  EXPECT_NEAR(out.results[2].score, 0.57735027f, 1e-5);
  for (size_t i = 1; i < out.results.size(); ++i)
    EXPECT_GT(out.results[i - 1].score, out.results[i].score);
  EXPECT_FALSE(out.near_miss);
  EXPECT_EQ(out.summary.files_searched, 4u);

  o.topk = 2;
  EXPECT_EQ(files_of(search(o).results), (std::vector<std::string>{"one.txt", "two.txt"}));

  o.topk.reset();
  o.threshold = 0.9f;
  EXPECT_EQ(files_of(search(o).results), (std::vector<std::string>{"one.txt"}));
}

TEST_F(RankedSearchTest, DefaultThresholdComesFromConfig) {
  config.threshold = 0.65f;
  auto out = search(options_for(SearchMode::Semantic, "alpha", dir.str()));
  EXPECT_EQ(files_of(out.results), (std::vector<std::string>{"one.txt", "two.txt"}));
}

TEST_F(RankedSearchTest, NearMissWhenNothingClearsTheThreshold) {
  auto o = options_for(SearchMode::Semantic, "beta", dir.str());
  o.threshold = 0.95f;
  auto out = search(o);
  EXPECT_TRUE(out.results.empty());
  ASSERT_TRUE(out.near_miss);
  EXPECT_EQ(fs::path(out.near_miss->file).filename().string(), "two.txt");
  EXPECT_NEAR(out.near_miss->score, 0.70710678f, 1e-5);
}

TEST_F(RankedSearchTest, StaleFilesAreExcluded) {
  dir.write("one.txt", "alpha, edited after indexing\n");
  auto o = options_for(SearchMode::Semantic, "alpha", dir.str());
  o.threshold = 0.5f;
  auto out = search(o);
  EXPECT_EQ(files_of(out.results), (std::vector<std::string>{"two.txt", "three.txt"}));
  EXPECT_EQ(out.summary.files_searched, 3u);
}

TEST(SemanticSearch, NotIndexedIsDistinctFromNoMatch) {
  TempDir dir;
  dir.write("a.txt", "alpha\n");
  FakeEmbedder fake;
  EmbeddingSession session(fake, no_retry(), std::chrono::seconds(5));
  SearchEngine engine(&session, nullptr, Config{});
  EXPECT_THROW(engine.search(options_for(SearchMode::Semantic, "alpha", dir.str())), NotIndexed);
  EXPECT_THROW(engine.search(options_for(SearchMode::Hybrid, "alpha", dir.str())), NotIndexed);
  EXPECT_EQ(fake.calls.load(), 0);
}

TEST(SemanticSearch, IndexWithoutEmbeddingsIsNotIndexed) {
  TempDir dir;
  dir.write("a.txt", "alpha\n");
  dir.write("b.txt", "beta\n");
  Indexer(nullptr).update(dir.str(), UpdateOptions{});

  FakeEmbedder fake;
  EmbeddingSession session(fake, no_retry(), std::chrono::seconds(5));
  SearchEngine engine(&session, nullptr, Config{});
  EXPECT_THROW(engine.search(options_for(SearchMode::Semantic, "alpha", dir.str())), NotIndexed);
  EXPECT_THROW(engine.search(options_for(SearchMode::Hybrid, "alpha", dir.str())), NotIndexed);

  // lexical search still works off the same sidecars
  auto out = engine.search(options_for(SearchMode::Lexical, "alpha", dir.str()));
  ASSERT_EQ(out.results.size(), 1u);
}

TEST_F(RankedSearchTest, NoMixedModelLeakage) {
  auto reversed = FakeEmbedder::default_vocab();
  std::reverse(reversed.begin(), reversed.end());
  use_model("model-y", reversed);

  // nothing was embedded with model-y yet
  auto o = options_for(SearchMode::Semantic, "alpha", dir.str());
  o.threshold = 0.5f;
  EXPECT_THROW(search(o), NotIndexed);

  auto r = index();
  EXPECT_EQ(r.stats.files_indexed, 4u);
  auto after = search(o);
  // model-x vectors put "alpha" on another axis and would score 0 here
  EXPECT_EQ(files_of(after.results), (std::vector<std::string>{"one.txt", "two.txt", "three.txt"}));
  EXPECT_NEAR(after.results[0].score, 1.0f, 1e-5);
}

TEST_F(RankedSearchTest, HybridFusesLexicalAndSemantic) {
  auto out = search(options_for(SearchMode::Hybrid, "gamma", dir.str()));
  ASSERT_EQ(out.results.size(), 4u);
  EXPECT_EQ(files_of(out.results)[0], "three.txt");
  // full lexical weight plus half of cos = 1/sqrt(3)
  EXPECT_NEAR(out.results[0].score, 0.5f + 0.5f * 0.57735027f, 1e-5);
  // the rest tie at zero and fall back to path order
  EXPECT_EQ(files_of(out.results), (std::vector<std::string>{"three.txt", "four.txt", "one.txt", "two.txt"}));

  auto o = options_for(SearchMode::Hybrid, "gamma", dir.str());
  o.threshold = 0.1f;
  EXPECT_EQ(search(o).results.size(), 1u);
}

TEST_F(RankedSearchTest, RerankReordersWithoutChangingTheSet) {
  auto o = options_for(SearchMode::Semantic, "beta alpha", dir.str());
  o.threshold = 0.5f;
  auto fused = search(o);
  EXPECT_EQ(files_of(fused.results), (std::vector<std::string>{"two.txt", "three.txt", "one.txt"}));

  FakeReranker reranker;
  o.rerank = true;
  auto reranked = search(o, &reranker);
  // "beta" counts: two 1, three 1, one 0; the tie falls back to path order
  EXPECT_EQ(files_of(reranked.results), (std::vector<std::string>{"three.txt", "two.txt", "one.txt"}));
  EXPECT_FLOAT_EQ(reranked.results[0].score, 1.0f);
  EXPECT_FLOAT_EQ(reranked.results[2].score, 0.0f);

  // without a reranker the fused order stands
  EXPECT_EQ(files_of(search(o).results), files_of(fused.results));
}

TEST(Fusion, IndependentOfCandidateOrder) {
  std::vector<FusionCandidate> candidates = {
    {"b.rs", Span{1, 4}, "fn b()", 3.0f, 0.20f},
    {"a.rs", Span{10, 12}, "fn a()", 1.5f, 0.60f},
    {"a.rs", Span{1, 5}, "fn a0()", 0.0f, 0.90f},
    {"c.rs", Span{7, 9}, "fn c()", 1.5f, 0.60f},
    {"d.rs", Span{1, 1}, "x", 0.0f, -0.3f},
    {"e.rs", Span{2, 3}, "y", 6.0f, 1.2f},
  };
  auto expected = fuse_scores(candidates, 0.5f, 0.5f);
  ASSERT_EQ(expected.size(), candidates.size());
  EXPECT_EQ(expected[0].file, "e.rs");
  EXPECT_FLOAT_EQ(expected[0].score, 1.0f);   // both parts clamp/normalize to 1
  EXPECT_FLOAT_EQ(expected.back().score, 0.0f);

  std::mt19937 rng(42);
  for (int round = 0; round < 20; ++round) {
    std::shuffle(candidates.begin(), candidates.end(), rng);
    auto got = fuse_scores(candidates, 0.5f, 0.5f);
    ASSERT_EQ(got.size(), expected.size());
    for (size_t i = 0; i < got.size(); ++i) {
      EXPECT_EQ(got[i].file, expected[i].file);
      EXPECT_EQ(got[i].line_start, expected[i].line_start);
      EXPECT_FLOAT_EQ(got[i].score, expected[i].score);
    }
  }
}

TEST(Fusion, TiesBreakByFileThenLine) {
  std::vector<FusionCandidate> candidates = {
    {"b.rs", Span{1, 1}, "", 1.0f, 0.5f},
    {"a.rs", Span{9, 9}, "", 1.0f, 0.5f},
    {"a.rs", Span{2, 2}, "", 1.0f, 0.5f},
  };
  auto got = fuse_scores(candidates, 0.5f, 0.5f);
  EXPECT_EQ(got[0].file, "a.rs");
  EXPECT_EQ(got[0].line_start, 2);
  EXPECT_EQ(got[1].line_start, 9);
  EXPECT_EQ(got[2].file, "b.rs");
}
