#pragma once

#include <cstddef>
#include <cstdint>

#define DEDUPCP_EXPORT __attribute__((visibility("default")))

namespace dedupcp {

// 8MiB
constexpr auto chunk_sz = 8UL * 1024UL * 1024UL;

constexpr uint32_t default_thread = 4;
constexpr uint32_t max_thread = 256;

constexpr auto default_hash_algo = "md5";

// report every n hashed files during scans
constexpr uint64_t scan_progress_interval = 1000;
// report every n copied files during execution
constexpr uint64_t copy_progress_interval = 100;

// plans with at most this many entries print examples
constexpr std::size_t example_list_lim = 10;
constexpr std::size_t example_cnt = 5;

}  // namespace dedupcp
