#include "test_helpers.hpp"
#include "walker.hpp"
#include <gtest/gtest.h>
#include <algorithm>
#include <set>

namespace {

class WalkerTest : public ::testing::Test {
protected:
  // relative, '/'-separated, sorted
  std::vector<std::string> walk(const WalkOptions& options = WalkOptions{}) {
    std::vector<std::string> rel;
    for (auto& f : walk_files(dir.str(), options))
      rel.push_back(fs::path(f).lexically_relative(dir.path()).generic_string());
    std::sort(rel.begin(), rel.end());
    return rel;
  }

  TempDir dir;
};

}

TEST_F(WalkerTest, SkipsVcsIndexAndBinaries) {
  dir.write("main.py", "print(1)\n");
  dir.write(".git/config", "[core]\n");
  dir.write(".ck/main.py.ck", "sidecar");
  dir.write("img.png", "not really a png");
  dir.write("blob.dat", std::string("ab\0cd", 5));
  dir.write("src/lib.rs", "fn x() {}\n");

  std::vector<std::string> expected = {"main.py", "src/lib.rs"};
  EXPECT_EQ(walk(), expected);
}

TEST_F(WalkerTest, HonorsIgnoreFiles) {
  dir.write(".gitignore", "*.log\nbuild/\n!keep.log\n# comment\n");
  dir.write("a.log", "x\n");
  dir.write("keep.log", "x\n");
  dir.write("build/out.txt", "x\n");
  dir.write("src/build.txt", "x\n");
  dir.write("sub/.ckignore", "secret.txt\n");
  dir.write("sub/secret.txt", "x\n");
  dir.write("sub/public.txt", "x\n");
  dir.write("secret.txt", "x\n");

  std::vector<std::string> expected = {".gitignore", "keep.log", "secret.txt", "src/build.txt",
                                       "sub/.ckignore", "sub/public.txt"};
  EXPECT_EQ(walk(), expected);

  WalkOptions no_ignore;
  no_ignore.respect_ignore = false;
  auto all = walk(no_ignore);
  EXPECT_NE(std::find(all.begin(), all.end(), "a.log"), all.end());
  EXPECT_NE(std::find(all.begin(), all.end(), "build/out.txt"), all.end());
  EXPECT_NE(std::find(all.begin(), all.end(), "sub/secret.txt"), all.end());
}

TEST_F(WalkerTest, AnchoredIgnorePattern) {
  dir.write(".gitignore", "/top.txt\n");
  dir.write("top.txt", "x\n");
  dir.write("nested/top.txt", "x\n");
  std::vector<std::string> expected = {".gitignore", "nested/top.txt"};
  EXPECT_EQ(walk(), expected);
}

TEST_F(WalkerTest, ExcludeGlobsAlwaysApply) {
  dir.write("a.md", "x\n");
  dir.write("docs/guide.txt", "x\n");
  dir.write("code.py", "x\n");

  WalkOptions options;
  options.respect_ignore = false;
  options.excludes = {"*.md", "docs/**"};
  std::vector<std::string> expected = {"code.py"};
  EXPECT_EQ(walk(options), expected);
}

TEST_F(WalkerTest, NonRecursive) {
  dir.write("a.txt", "x\n");
  dir.write("sub/b.txt", "x\n");
  WalkOptions options;
  options.recursive = false;
  std::vector<std::string> expected = {"a.txt"};
  EXPECT_EQ(walk(options), expected);
}

TEST_F(WalkerTest, SingleFileAndMissingPath) {
  auto f = dir.write("one.txt", "x\n");
  auto out = walk_files(f, WalkOptions{});
  ASSERT_EQ(out.size(), 1u);
  EXPECT_EQ(out[0], f);
  EXPECT_TRUE(walk_files(dir.file("missing"), WalkOptions{}).empty());
}

TEST(GlobSet, Matching) {
  GlobSet g({"*.rs", "src/*.py", "**/gen/**", "data?.csv", "[ab]*.txt"});
  EXPECT_TRUE(g.matches("a/b/c.rs"));
  EXPECT_TRUE(g.matches("src/x.py"));
  EXPECT_FALSE(g.matches("other/src/x.py"));
  EXPECT_TRUE(g.matches("gen/a.c"));
  EXPECT_TRUE(g.matches("x/gen/y/z.c"));
  EXPECT_TRUE(g.matches("data1.csv"));
  EXPECT_FALSE(g.matches("data10.csv"));
  EXPECT_TRUE(g.matches("deep/apple.txt"));
  EXPECT_FALSE(g.matches("cherry.txt"));
  EXPECT_TRUE(GlobSet().empty());
}
