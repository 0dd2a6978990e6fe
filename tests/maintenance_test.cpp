#include "errors.hpp"
#include "indexer.hpp"
#include "maintenance.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>

namespace {

class FixedAnswer : public CleanConfirmation {
public:
  explicit FixedAnswer(bool answer) : answer_(answer) {}
  bool confirm_clean(const std::string& index_dir, const IndexStats& stats) override {
    ++asked;
    seen_dir = index_dir;
    seen_files = stats.total_files;
    return answer_;
  }

  int asked = 0;
  std::string seen_dir;
  size_t seen_files = 0;

private:
  bool answer_;
};

class MaintenanceTest : public ::testing::Test {
protected:
  void SetUp() override {
    for (int i = 0; i < 5; ++i)
      dir.write("src/f" + std::to_string(i) + ".txt", "file number " + std::to_string(i) + "\n");
    Indexer indexer(nullptr);
    indexer.update(dir.str(), UpdateOptions{});
  }

  TempDir dir;
};

}

TEST_F(MaintenanceTest, StatusReportsTheIndex) {
  auto stats = index_status(dir.str());
  EXPECT_EQ(stats.total_files, 5u);
  EXPECT_GT(stats.total_chunks, 0u);
  EXPECT_GT(stats.index_size_bytes, 0u);
  EXPECT_TRUE(stats.orphaned_files.empty());
  // a subdirectory resolves to the enclosing index
  EXPECT_EQ(index_status(dir.file("src")).total_files, 5u);
}

TEST_F(MaintenanceTest, CleanOrphansRemovesExactlyTheDeletedSources) {
  fs::remove(dir.file("src/f1.txt"));
  fs::remove(dir.file("src/f3.txt"));
  EXPECT_EQ(index_status(dir.str()).orphaned_files.size(), 2u);

  EXPECT_EQ(clean_orphans(dir.str()), 2u);

  SidecarStore store(dir.str());
  EXPECT_EQ(store.sidecars().size(), 3u);
  EXPECT_TRUE(store.read(dir.file("src/f0.txt")));
  EXPECT_TRUE(store.read(dir.file("src/f4.txt")));
  EXPECT_TRUE(index_status(dir.str()).orphaned_files.empty());
  EXPECT_EQ(clean_orphans(dir.str()), 0u);
}

TEST_F(MaintenanceTest, CleanHonoursTheConfirmation) {
  FixedAnswer no(false);
  auto declined = clean_index(dir.str(), no);
  EXPECT_EQ(no.asked, 1);
  EXPECT_EQ(no.seen_files, 5u);
  EXPECT_EQ(no.seen_dir, (dir.path() / ".ck").string());
  EXPECT_FALSE(declined.cleaned);
  EXPECT_TRUE(fs::exists(dir.path() / ".ck"));

  FixedAnswer yes(true);
  auto done = clean_index(dir.str(), yes);
  EXPECT_TRUE(done.cleaned);
  EXPECT_EQ(done.sidecars_removed, 5u);
  EXPECT_GT(done.bytes_freed, 0u);
  EXPECT_FALSE(fs::exists(dir.path() / ".ck"));
  EXPECT_THROW(index_status(dir.str()), NotIndexed);
}

TEST_F(MaintenanceTest, SubdirectoryOperationsStayInsideIt) {
  auto top = dir.write("top.txt", "top level\n");
  dir.write("other/o.txt", "elsewhere\n");
  Indexer(nullptr).update(dir.str(), UpdateOptions{});
  fs::remove(top);

  // the orphan lives outside src
  EXPECT_TRUE(index_status(dir.file("src")).orphaned_files.empty());
  EXPECT_EQ(clean_orphans(dir.file("src")), 0u);

  FixedAnswer yes(true);
  auto done = clean_index(dir.file("src"), yes);
  EXPECT_TRUE(done.cleaned);
  EXPECT_EQ(done.sidecars_removed, 5u);
  EXPECT_EQ(yes.seen_dir, (dir.path() / ".ck" / "src").string());

  SidecarStore store(dir.str());
  EXPECT_TRUE(store.exists());
  EXPECT_TRUE(store.read(dir.file("other/o.txt")));
  EXPECT_FALSE(store.read(dir.file("src/f0.txt")));
  EXPECT_EQ(index_status(dir.str()).orphaned_files.size(), 1u);
  EXPECT_EQ(clean_orphans(dir.str()), 1u);
}

TEST(Maintenance, WithoutAnIndex) {
  TempDir dir;
  dir.write("a.txt", "a\n");
  FixedAnswer yes(true);
  EXPECT_THROW(index_status(dir.str()), NotIndexed);
  EXPECT_THROW(clean_index(dir.str(), yes), NotIndexed);
  EXPECT_EQ(yes.asked, 0);
  EXPECT_EQ(clean_orphans(dir.str()), 0u);
}
