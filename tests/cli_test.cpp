#include "cli.hpp"
#include <gtest/gtest.h>
#include <string>
#include <vector>

namespace {

Args parse(std::vector<std::string> words) {
  words.insert(words.begin(), "ck");
  std::vector<char*> argv;
  for (auto& w : words) argv.push_back(&w[0]);
  argv.push_back(nullptr);
  return parse_cli((int)words.size(), argv.data());
}

}

TEST(Cli, PlainPatternDefaultsToRegexOverCurrentDir) {
  auto a = parse({"TODO"});
  EXPECT_EQ(a.command, Command::Search);
  EXPECT_EQ(a.search.mode, SearchMode::Regex);
  EXPECT_EQ(a.search.query, "TODO");
  EXPECT_EQ(a.search.paths, std::vector<std::string>{"."});
  EXPECT_TRUE(a.search.recursive);
  EXPECT_FALSE(a.search.topk);
}

TEST(Cli, SemanticSearchWithRanking) {
  auto a = parse({"--sem", "error handling", "src", "lib", "--topk", "5", "--threshold", "0.4",
                  "--rerank", "--scores", "--jsonl"});
  EXPECT_EQ(a.search.mode, SearchMode::Semantic);
  EXPECT_EQ(a.search.query, "error handling");
  EXPECT_EQ(a.search.paths, (std::vector<std::string>{"src", "lib"}));
  ASSERT_TRUE(a.search.topk);
  EXPECT_EQ(*a.search.topk, 5);
  ASSERT_TRUE(a.search.threshold);
  EXPECT_FLOAT_EQ(*a.search.threshold, 0.4f);
  EXPECT_TRUE(a.search.rerank);
  EXPECT_TRUE(a.search.show_scores);
  EXPECT_TRUE(a.jsonl);
}

TEST(Cli, GrepStyleFlags) {
  auto a = parse({"-i", "-w", "-F", "-n", "-C", "2", "-A", "3", "--exclude", "*.log",
                  "--no-ignore", "--no-filename", "-l", "a.b", "x"});
  EXPECT_TRUE(a.search.case_insensitive);
  EXPECT_TRUE(a.search.word_regexp);
  EXPECT_TRUE(a.search.fixed_string);
  EXPECT_TRUE(a.search.line_numbers);
  EXPECT_EQ(a.search.before_context, 2);
  EXPECT_EQ(a.search.after_context, 3);
  EXPECT_EQ(a.search.excludes, std::vector<std::string>{"*.log"});
  EXPECT_FALSE(a.search.respect_ignore);
  EXPECT_FALSE(a.search.show_filenames);
  EXPECT_TRUE(a.search.files_with_matches);
  EXPECT_EQ(a.search.query, "a.b");
}

TEST(Cli, DoubleDashEndsFlags) {
  auto a = parse({"--", "-v", "file"});
  EXPECT_FALSE(a.verbose);
  EXPECT_EQ(a.search.query, "-v");
  EXPECT_EQ(a.search.paths, std::vector<std::string>{"file"});
}

TEST(Cli, MaintenanceCommands) {
  auto idx = parse({"--reindex", "proj", "--workers", "3", "--verify", "--model", "bge-small"});
  EXPECT_EQ(idx.command, Command::Index);
  EXPECT_TRUE(idx.force);
  EXPECT_TRUE(idx.verify);
  EXPECT_EQ(idx.target, "proj");
  EXPECT_EQ(*idx.workers, 3);
  EXPECT_EQ(idx.model, "bge-small");

  EXPECT_EQ(parse({"--status"}).target, ".");
  EXPECT_TRUE(parse({"--status-verbose"}).status_verbose);
  auto clean = parse({"--clean", "-y"});
  EXPECT_EQ(clean.command, Command::Clean);
  EXPECT_TRUE(clean.yes);
  EXPECT_EQ(parse({"--clean-orphans"}).command, Command::CleanOrphans);
  EXPECT_EQ(parse({"--add", "f.py"}).command, Command::Add);
  EXPECT_EQ(parse({"--inspect", "f.py"}).target, "f.py");
}

TEST(CliDeathTest, MalformedInputExitsWithTwo) {
  EXPECT_EXIT(parse({"--bogus", "x"}), ::testing::ExitedWithCode(2), "unknown flag");
  EXPECT_EXIT(parse({}), ::testing::ExitedWithCode(2), "missing pattern");
  EXPECT_EXIT(parse({"--topk", "many", "x"}), ::testing::ExitedWithCode(2), "non-negative integer");
  EXPECT_EXIT(parse({"-l", "-L", "x"}), ::testing::ExitedWithCode(2), "exclusive");
  EXPECT_EXIT(parse({"--index", "--clean"}), ::testing::ExitedWithCode(2), "only one of");
  EXPECT_EXIT(parse({"--add"}), ::testing::ExitedWithCode(2), "missing file");
}
