#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <span>

#include "file_entry.hh"
#include "hasher.hh"

namespace dedupcp {

inline namespace detail_v1 {

using progress_fn_t = std::function<void(uint64_t done, uint64_t total)>;

/**
 * @brief hash files on a thread pool, results are cached in the entries.
 * workers stop picking new files once cancel is set, entries left behind
 * report hashed() == false.
 *
 * @param files entries to hash, each touched by exactly one worker
 * @param fp fingerprinter shared by all workers
 * @param max_thread maximum number of threads to use
 * @param cancel cancellation flag, observed between files
 * @param progress called every scan_progress_interval files, serialized
 */
void hash_all(std::span<file_entry_t> files, const fingerprinter_t &fp,
              const uint32_t max_thread, const std::atomic<bool> &cancel,
              const progress_fn_t &progress = {});

}  // namespace detail_v1

}  // namespace dedupcp
