#pragma once

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <vector>

#include "events.hh"
#include "hasher.hh"
#include "plan_entry.hh"
#include "run_stats.hh"
#include "target_index.hh"

namespace dedupcp {

inline namespace detail_v1 {

struct plan_t {
  // ordered by relative path, unreadable files are absent
  std::vector<plan_entry_t> entries;
  run_stats_t stats;
  bool cancelled = false;
};

/**
 * @brief classify every source file against the target index.
 * read-only, used the same way by dry run and execute.
 *
 * @param source_root source tree
 * @param index digests present in the target, not modified
 * @param fp fingerprinter
 * @param max_thread maximum number of threads to use
 * @param sink receives phase, progress and per-file error events
 * @param cancel cancellation flag, observed between files
 * @param prune directories excluded from the walk
 */
plan_t plan(const std::filesystem::path &source_root,
            const target_index_t &index, const fingerprinter_t &fp,
            const uint32_t max_thread, event_sink_t &sink,
            const std::atomic<bool> &cancel,
            const std::vector<std::filesystem::path> &prune = {});

}  // namespace detail_v1

}  // namespace dedupcp
