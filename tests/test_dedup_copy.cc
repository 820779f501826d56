#include <atomic>
#include <iterator>
#include <stdexcept>
#include <vector>

#include "dedup_copy.hh"
#include "space_guard.hh"
#include "test_util.hh"

using dedupcp::confirm_request_t;
using dedupcp::outcome_t;
using dedupcp::run_mode_t;

class DedupCopyTest : public TempDirTest {
 protected:
  fs::path src;
  fs::path dst;
  RecordingSink sink;
  std::atomic<bool> cancel{false};
  std::vector<confirm_request_t::kind_t> asked;

  void SetUp() override {
    TempDirTest::SetUp();
    src = test_dir / "src";
    dst = test_dir / "dst";
    fs::create_directories(src);
  }

  dedupcp::options_t options(const run_mode_t mode) const {
    dedupcp::options_t opts;
    opts.source = src;
    opts.target = dst;
    opts.mode = mode;
    opts.max_thread = 2;
    return opts;
  }

  dedupcp::confirm_gate_t gate(const bool answer) {
    return [this, answer](const confirm_request_t &req) {
      asked.push_back(req.kind);
      return answer;
    };
  }
};

TEST_F(DedupCopyTest, DryRunReportsWithoutTouchingTarget) {
  fs::create_directories(dst);
  write_file(dst / "orig" / "x.bin", "Z");
  write_file(src / "copy" / "x.bin", "Z");
  write_file(src / "new.txt", "N");

  auto result =
      dedupcp::run(options(run_mode_t::dry_run), sink, gate(true), cancel);
  EXPECT_EQ(result.outcome, outcome_t::completed);
  EXPECT_EQ(result.target_files, 1U);
  EXPECT_EQ(result.plan_stats.source_files, 2U);
  EXPECT_EQ(result.plan_stats.duplicates, 1U);
  EXPECT_EQ(result.plan_stats.to_copy, 1U);
  EXPECT_EQ(result.plan.size(), 2U);
  EXPECT_TRUE(asked.empty());
  EXPECT_EQ(count_files(dst), 1U);
  EXPECT_EQ(sink.space_checked_cnt, 1);
  ASSERT_EQ(sink.outcomes.size(), 1U);
  EXPECT_EQ(sink.outcomes[0], outcome_t::completed);
}

TEST_F(DedupCopyTest, DryRunWithMissingTargetCreatesNothing) {
  write_file(src / "a.txt", "A");
  auto result =
      dedupcp::run(options(run_mode_t::dry_run), sink, gate(true), cancel);
  EXPECT_EQ(result.outcome, outcome_t::completed);
  EXPECT_EQ(result.plan_stats.to_copy, 1U);
  EXPECT_FALSE(fs::exists(dst));
}

TEST_F(DedupCopyTest, ExecuteCopiesAfterConfirmation) {
  write_file(src / "a.txt", "A");
  write_file(src / "b" / "c.txt", "C");

  auto result =
      dedupcp::run(options(run_mode_t::execute), sink, gate(true), cancel);
  EXPECT_EQ(result.outcome, outcome_t::completed);
  ASSERT_FALSE(asked.empty());
  EXPECT_EQ(asked[0], confirm_request_t::kind_t::proceed);
  EXPECT_EQ(result.exec_stats.copied, 2U);
  EXPECT_EQ(read_file(dst / "a.txt"), "A");
  EXPECT_EQ(read_file(dst / "b" / "c.txt"), "C");
  EXPECT_EQ(result.target, dedupcp::resolve_root(dst));
}

TEST_F(DedupCopyTest, DeclineLeavesFilesystemUnchanged) {
  write_file(src / "a.txt", "A");

  auto result =
      dedupcp::run(options(run_mode_t::execute), sink, gate(false), cancel);
  EXPECT_EQ(result.outcome, outcome_t::declined);
  EXPECT_EQ(asked.size(), 1U);
  EXPECT_FALSE(fs::exists(dst));
  ASSERT_EQ(sink.outcomes.size(), 1U);
  EXPECT_EQ(sink.outcomes[0], outcome_t::declined);
}

TEST_F(DedupCopyTest, EmptyGateDeclines) {
  write_file(src / "a.txt", "A");
  auto result = dedupcp::run(options(run_mode_t::execute), sink, {}, cancel);
  EXPECT_EQ(result.outcome, outcome_t::declined);
  EXPECT_FALSE(fs::exists(dst));
}

TEST_F(DedupCopyTest, SecondExecuteIsIdempotent) {
  write_file(src / "a.txt", "A");
  write_file(src / "twin1", "T");
  write_file(src / "twin2", "T");

  auto first =
      dedupcp::run(options(run_mode_t::execute), sink, gate(true), cancel);
  EXPECT_EQ(first.exec_stats.copied, 2U);
  EXPECT_EQ(first.exec_stats.duplicates, 1U);

  auto second =
      dedupcp::run(options(run_mode_t::execute), sink, gate(true), cancel);
  EXPECT_EQ(second.outcome, outcome_t::completed);
  EXPECT_EQ(second.plan_stats.to_copy, 0U);
  EXPECT_EQ(second.exec_stats.copied, 0U);
  EXPECT_EQ(second.exec_stats.errors, 0U);
  EXPECT_EQ(second.exec_stats.duplicates, 3U);
  EXPECT_EQ(second.target_files, 2U);
}

TEST_F(DedupCopyTest, EmptySourceSucceeds) {
  auto result =
      dedupcp::run(options(run_mode_t::execute), sink, gate(true), cancel);
  EXPECT_EQ(result.outcome, outcome_t::completed);
  EXPECT_EQ(result.plan_stats.source_files, 0U);
  EXPECT_EQ(result.exec_stats.source_files, 0U);
  EXPECT_EQ(result.exec_stats.copied, 0U);
  EXPECT_EQ(result.exec_stats.duplicates, 0U);
}

TEST_F(DedupCopyTest, TargetInsideSourceIsNotCopiedIntoItself) {
  dst = src / "merged";
  write_file(src / "a.txt", "A");

  auto first =
      dedupcp::run(options(run_mode_t::execute), sink, gate(true), cancel);
  EXPECT_EQ(first.exec_stats.copied, 1U);
  auto second =
      dedupcp::run(options(run_mode_t::execute), sink, gate(true), cancel);
  EXPECT_EQ(second.plan_stats.source_files, 1U);
  EXPECT_EQ(second.exec_stats.copied, 0U);
  EXPECT_FALSE(fs::exists(dst / "merged"));
}

TEST_F(DedupCopyTest, CancelledRunIsReported) {
  write_file(src / "a.txt", "A");
  cancel = true;
  auto result =
      dedupcp::run(options(run_mode_t::execute), sink, gate(true), cancel);
  EXPECT_EQ(result.outcome, outcome_t::cancelled);
  EXPECT_FALSE(fs::exists(dst / "a.txt"));
}

TEST_F(DedupCopyTest, MissingSourceIsFatal) {
  src = test_dir / "missing";
  EXPECT_THROW(
      dedupcp::run(options(run_mode_t::dry_run), sink, gate(true), cancel),
      dedupcp::precondition_error);
  EXPECT_TRUE(sink.phases.empty());
}

TEST_F(DedupCopyTest, TargetThatIsAFileIsFatal) {
  write_file(dst, "file");
  EXPECT_THROW(
      dedupcp::run(options(run_mode_t::execute), sink, gate(true), cancel),
      dedupcp::precondition_error);
}

TEST_F(DedupCopyTest, TargetBelowAFileFailsBeforeScanning) {
  write_file(src / "a.txt", "A");
  write_file(test_dir / "plain", "file");
  dst = test_dir / "plain" / "target";
  EXPECT_THROW(
      dedupcp::run(options(run_mode_t::execute), sink, gate(true), cancel),
      dedupcp::precondition_error);
  EXPECT_TRUE(sink.phases.empty());
  EXPECT_TRUE(asked.empty());
}

TEST_F(DedupCopyTest, UncreatableTargetFailsBeforeScanning) {
  if (!fs::is_directory("/proc/self")) {
    GTEST_SKIP() << "no procfs";
  }
  write_file(src / "a.txt", "A");
  dst = "/proc/dedupcp_no_such_dir/target";
  EXPECT_THROW(
      dedupcp::run(options(run_mode_t::execute), sink, gate(true), cancel),
      dedupcp::precondition_error);
  EXPECT_TRUE(sink.phases.empty());
  EXPECT_TRUE(asked.empty());
}

TEST_F(DedupCopyTest, WritableCheckLeavesNoTrace) {
  write_file(src / "a.txt", "A");
  auto result =
      dedupcp::run(options(run_mode_t::execute), sink, gate(false), cancel);
  EXPECT_EQ(result.outcome, outcome_t::declined);
  EXPECT_EQ(std::distance(fs::directory_iterator(test_dir),
                          fs::directory_iterator()),
            1);
}

TEST_F(DedupCopyTest, LowSpaceDeclineChangesNothing) {
  write_file(src / "a.txt", "AAAA");
  auto opts = options(run_mode_t::execute);
  opts.space_query = [](const fs::path &, uint64_t needed) {
    return dedupcp::evaluate(1, needed);
  };

  // yes to proceed, no once the shortfall is shown
  auto answer = [this](const confirm_request_t &req) {
    asked.push_back(req.kind);
    if (req.kind == confirm_request_t::kind_t::low_space) {
      EXPECT_EQ(req.space.shortfall_bytes, 3U);
      return false;
    }
    return true;
  };
  auto result = dedupcp::run(opts, sink, answer, cancel);
  EXPECT_EQ(result.outcome, outcome_t::space_declined);
  ASSERT_EQ(asked.size(), 2U);
  EXPECT_EQ(asked[0], confirm_request_t::kind_t::proceed);
  EXPECT_EQ(asked[1], confirm_request_t::kind_t::low_space);
  EXPECT_FALSE(result.space.sufficient);
  EXPECT_FALSE(fs::exists(dst));
  ASSERT_EQ(sink.outcomes.size(), 1U);
  EXPECT_EQ(sink.outcomes[0], outcome_t::space_declined);
}

TEST_F(DedupCopyTest, LowSpaceAcceptedStillCopies) {
  write_file(src / "a.txt", "AAAA");
  auto opts = options(run_mode_t::execute);
  opts.space_query = [](const fs::path &, uint64_t needed) {
    return dedupcp::evaluate(0, needed);
  };

  auto result = dedupcp::run(opts, sink, gate(true), cancel);
  EXPECT_EQ(result.outcome, outcome_t::completed);
  ASSERT_EQ(asked.size(), 2U);
  EXPECT_EQ(asked[1], confirm_request_t::kind_t::low_space);
  EXPECT_EQ(result.exec_stats.copied, 1U);
  EXPECT_EQ(read_file(dst / "a.txt"), "AAAA");
}

TEST_F(DedupCopyTest, EnoughSpaceAsksOnce) {
  write_file(src / "a.txt", "AAAA");
  auto opts = options(run_mode_t::execute);
  opts.space_query = [](const fs::path &, uint64_t needed) {
    return dedupcp::evaluate(needed, needed);
  };

  auto result = dedupcp::run(opts, sink, gate(true), cancel);
  EXPECT_EQ(result.outcome, outcome_t::completed);
  EXPECT_EQ(asked.size(), 1U);
}

TEST_F(DedupCopyTest, SameRootsAreFatal) {
  dst = src;
  EXPECT_THROW(
      dedupcp::run(options(run_mode_t::dry_run), sink, gate(true), cancel),
      dedupcp::precondition_error);
}

TEST_F(DedupCopyTest, UnknownHashAlgorithmIsRejected) {
  auto opts = options(run_mode_t::dry_run);
  opts.hash_algo = "bogus";
  EXPECT_THROW(dedupcp::run(opts, sink, gate(true), cancel),
               std::invalid_argument);
}

TEST_F(DedupCopyTest, ResolveRootDropsTrailingSeparator) {
  auto resolved = dedupcp::resolve_root(src / "");
  EXPECT_TRUE(resolved.is_absolute());
  EXPECT_TRUE(resolved.has_filename());
  EXPECT_EQ(resolved, dedupcp::resolve_root(src));
}
