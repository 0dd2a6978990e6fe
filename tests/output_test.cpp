#include "output.hpp"
#include <gtest/gtest.h>
#include <sstream>

namespace {

SearchOutput one_result(const std::string& preview) {
  SearchOutput out;
  out.results.push_back(SearchResult{"src/a.txt", 3, 3, preview, 0.75f});
  return out;
}

}

TEST(Output, TextPrefixes) {
  SearchOptions o;
  std::ostringstream plain;
  print_results(plain, one_result("foo here"), o, OutputFormat::Text);
  EXPECT_EQ(plain.str(), "src/a.txt:foo here\n");

  o.line_numbers = true;
  o.show_scores = true;
  std::ostringstream numbered;
  print_results(numbered, one_result("foo here"), o, OutputFormat::Text);
  EXPECT_EQ(numbered.str(), "src/a.txt:3:[0.750] foo here\n");

  o.show_filenames = false;
  o.show_scores = false;
  std::ostringstream bare;
  print_results(bare, one_result("bar\nfoo here"), o, OutputFormat::Text);
  EXPECT_EQ(bare.str(), "3:bar\nfoo here\n--\n");
}

TEST(Output, JsonlObjectPerResult) {
  SearchOutput res = one_result("foo");
  res.results.push_back(SearchResult{"b.txt", 1, 4, "x", 0.5f});
  std::ostringstream ss;
  print_results(ss, res, SearchOptions{}, OutputFormat::Jsonl);

  std::istringstream lines(ss.str());
  std::string line;
  std::vector<nlohmann::json> rows;
  while (std::getline(lines, line)) rows.push_back(nlohmann::json::parse(line));
  ASSERT_EQ(rows.size(), 2u);
  EXPECT_EQ(rows[0]["file"], "src/a.txt");
  EXPECT_EQ(rows[1]["span"]["line_start"], 1);
  EXPECT_EQ(rows[1]["span"]["line_end"], 4);
  EXPECT_FLOAT_EQ(rows[1]["score"].get<float>(), 0.5f);
}

TEST(Output, InvalidUtf8IsReplacedNotFatal) {
  auto res = one_result("caf\xe9 foo");
  for (auto format : {OutputFormat::Json, OutputFormat::Jsonl}) {
    std::ostringstream ss;
    ASSERT_NO_THROW(print_results(ss, res, SearchOptions{}, format));
    auto j = nlohmann::json::parse(ss.str());
    auto row = format == OutputFormat::Json ? j.at(0) : j;
    auto preview = row["preview"].get<std::string>();
    EXPECT_EQ(preview.rfind("caf", 0), 0u);
    EXPECT_NE(preview.find("\xEF\xBF\xBD"), std::string::npos);
    EXPECT_NE(preview.find("foo"), std::string::npos);
  }

  SearchOptions listing;
  listing.files_with_matches = true;
  SearchOutput named;
  named.results.push_back(SearchResult{"r\xe9sum\xe9.txt", 1, 1, "x", 1.0f});
  std::ostringstream ss;
  ASSERT_NO_THROW(print_results(ss, named, listing, OutputFormat::Json));
  EXPECT_EQ(nlohmann::json::parse(ss.str()).size(), 1u);
}

TEST(Output, StatsAsJson) {
  IndexStats s;
  s.total_files = 4;
  s.orphaned_files = {"/p/.ck/gone.txt.ck"};
  std::ostringstream ss;
  print_stats(ss, s, false, OutputFormat::Jsonl);
  auto j = nlohmann::json::parse(ss.str());
  EXPECT_EQ(j["total_files"], 4);
  EXPECT_EQ(j["orphaned_files"].size(), 1u);
}
