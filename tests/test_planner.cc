#include <algorithm>
#include <atomic>
#include <utility>

#include "config.hh"
#include "planner.hh"
#include "test_util.hh"

using dedupcp::class_t;
using dedupcp::fingerprinter_t;
using dedupcp::target_index_t;

class PlannerTest : public TempDirTest {
 protected:
  fs::path src;
  fs::path dst;
  fingerprinter_t fp;
  RecordingSink sink;
  std::atomic<bool> cancel{false};

  void SetUp() override {
    TempDirTest::SetUp();
    src = test_dir / "src";
    dst = test_dir / "dst";
    fs::create_directories(src);
    fs::create_directories(dst);
  }

  target_index_t index() {
    return std::move(
        target_index_t::build(dst, fp, 2, sink, cancel).index);
  }
};

TEST_F(PlannerTest, ClassifiesAgainstTargetContent) {
  write_file(dst / "orig" / "x.bin", "Z");
  write_file(src / "copy" / "x.bin", "Z");
  write_file(src / "new.txt", "fresh content");

  auto idx = index();
  auto result = dedupcp::plan(src, idx, fp, 4, sink, cancel);

  ASSERT_EQ(result.entries.size(), 2U);
  EXPECT_EQ(result.entries[0].path, fs::path("copy") / "x.bin");
  EXPECT_EQ(result.entries[0].cls, class_t::duplicate);
  EXPECT_EQ(result.entries[1].path, fs::path("new.txt"));
  EXPECT_EQ(result.entries[1].cls, class_t::to_copy);
  EXPECT_EQ(result.entries[1].size, 13U);

  EXPECT_EQ(result.stats.source_files, 2U);
  EXPECT_EQ(result.stats.duplicates, 1U);
  EXPECT_EQ(result.stats.to_copy, 1U);
  EXPECT_EQ(result.stats.bytes_to_copy, 13U);
  EXPECT_EQ(result.stats.errors, 0U);
  EXPECT_EQ(sink.plan_ready_cnt, 1);
}

TEST_F(PlannerTest, PlanningModifiesNothing) {
  write_file(src / "a.txt", "A");
  write_file(src / "b" / "c.txt", "C");

  auto idx = index();
  auto result = dedupcp::plan(src, idx, fp, 2, sink, cancel);
  EXPECT_EQ(result.stats.to_copy, 2U);
  EXPECT_EQ(idx.size(), 0U);
  EXPECT_TRUE(fs::is_empty(dst));
  EXPECT_EQ(count_files(src), 2U);
}

TEST_F(PlannerTest, IdenticalSourceFilesAreAllPlanned) {
  write_file(src / "one.txt", "twin");
  write_file(src / "two.txt", "twin");

  auto idx = index();
  auto result = dedupcp::plan(src, idx, fp, 2, sink, cancel);
  EXPECT_EQ(result.stats.to_copy, 2U);
  EXPECT_EQ(result.stats.bytes_to_copy, 8U);
}

TEST_F(PlannerTest, EmptySourceYieldsZeroCounters) {
  auto idx = index();
  auto result = dedupcp::plan(src, idx, fp, 2, sink, cancel);
  EXPECT_TRUE(result.entries.empty());
  EXPECT_EQ(result.stats.source_files, 0U);
  EXPECT_EQ(result.stats.duplicates, 0U);
  EXPECT_EQ(result.stats.to_copy, 0U);
  EXPECT_FALSE(result.cancelled);
}

TEST_F(PlannerTest, PrunedTargetInsideSourceIsIgnored) {
  write_file(src / "a.txt", "A");
  write_file(src / "backup" / "old.txt", "old");

  target_index_t idx;
  auto result =
      dedupcp::plan(src, idx, fp, 2, sink, cancel, {src / "backup"});
  ASSERT_EQ(result.entries.size(), 1U);
  EXPECT_EQ(result.entries[0].path, fs::path("a.txt"));
}

TEST_F(PlannerTest, UnreadableFileIsCountedAsError) {
  const auto last = write_many(src, dedupcp::scan_progress_interval + 1);
  RemoveOnProgress remover(last);

  target_index_t idx;
  auto result = dedupcp::plan(src, idx, fp, 1, remover, cancel);
  const auto &stats = result.stats;
  EXPECT_FALSE(result.cancelled);
  EXPECT_EQ(stats.source_files, dedupcp::scan_progress_interval + 1);
  EXPECT_EQ(stats.errors, 1U);
  EXPECT_EQ(stats.to_copy, dedupcp::scan_progress_interval);
  EXPECT_EQ(stats.duplicates, 0U);
  EXPECT_EQ(stats.source_files, stats.duplicates + stats.to_copy + stats.errors);
  // neither duplicate nor to_copy
  EXPECT_EQ(result.entries.size(), dedupcp::scan_progress_interval);
  EXPECT_TRUE(std::none_of(
      result.entries.begin(), result.entries.end(),
      [&](const auto &entry) { return src / entry.path == last; }));
  ASSERT_EQ(remover.errors.size(), 1U);
  EXPECT_EQ(remover.errors[0], last);
}
