#pragma once

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <stdexcept>
#include <string>
#include <vector>

#include "config.hh"
#include "events.hh"
#include "plan_entry.hh"
#include "run_stats.hh"
#include "space_guard.hh"

namespace dedupcp {

inline namespace detail_v1 {

enum class run_mode_t { dry_run, execute };

// free space lookup for a target root and the bytes it has to take
using space_query_t =
    std::function<space_report_t(const std::filesystem::path &, uint64_t)>;

struct options_t {
  std::filesystem::path source;
  std::filesystem::path target;
  run_mode_t mode = run_mode_t::dry_run;
  uint32_t max_thread = default_thread;
  std::string hash_algo = default_hash_algo;
  uint64_t chunk_size = chunk_sz;
  // empty means the filesystem query of space_guard.hh
  space_query_t space_query;
};

// bad roots, raised before anything is scanned
class precondition_error : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

struct run_result_t {
  outcome_t outcome = outcome_t::completed;
  std::filesystem::path source;
  std::filesystem::path target;
  uint64_t target_files = 0;
  std::vector<plan_entry_t> plan;
  run_stats_t plan_stats;
  space_report_t space;
  // filled in execute mode once copying started
  run_stats_t exec_stats;
};

/**
 * @brief absolute, symlink resolved form without trailing separator
 */
std::filesystem::path resolve_root(const std::filesystem::path &path);

/**
 * @brief content deduplicating recursive copy of source into target.
 * index target, classify source, stop there in dry run mode; otherwise
 * ask the gate, check free space (asking again when short) and copy.
 *
 * @param opts roots, mode and tuning
 * @param sink receives the event stream of the run
 * @param gate asked before copying, an empty gate declines
 * @param cancel cancellation flag, observed between files
 * @throws precondition_error on unusable roots
 * @throws std::invalid_argument on unknown hash algorithm or chunk size
 */
DEDUPCP_EXPORT run_result_t run(const options_t &opts, event_sink_t &sink,
                                const confirm_gate_t &gate,
                                const std::atomic<bool> &cancel);

}  // namespace detail_v1

}  // namespace dedupcp
