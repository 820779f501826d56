#pragma once

#include <cstdint>

namespace dedupcp {

inline namespace detail_v1 {

/**
 * @brief counters of one phase, returned by value to the caller.
 * after planning: source_files == duplicates + to_copy + errors
 */
struct run_stats_t {
  uint64_t source_files = 0;
  uint64_t target_files = 0;
  uint64_t duplicates = 0;
  uint64_t to_copy = 0;
  uint64_t copied = 0;
  uint64_t errors = 0;
  uint64_t bytes_to_copy = 0;
  uint64_t bytes_copied = 0;
};

}  // namespace detail_v1

}  // namespace dedupcp
