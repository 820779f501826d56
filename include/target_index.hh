#pragma once

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <shared_mutex>
#include <unordered_set>

#include "events.hh"
#include "hasher.hh"

namespace dedupcp {

inline namespace detail_v1 {

struct index_build_t;

/**
 * @brief digests of every file present in the target tree.
 * presence only, locations are not kept. grows monotonically during a
 * run, lookups are safe against a concurrent add_hash.
 */
class target_index_t {
  std::unordered_set<digest_t> _digests;
  mutable std::shared_mutex _rw_lck;

 public:
  target_index_t() = default;

  target_index_t(const target_index_t &) = delete;
  target_index_t(target_index_t &&rhs) noexcept;
  target_index_t &operator=(const target_index_t &) = delete;
  target_index_t &operator=(target_index_t &&rhs) noexcept;

  bool contains(const digest_t &digest) const;
  /**
   * @return true if the digest was not present before
   */
  bool add_hash(const digest_t &digest);
  std::size_t size() const;

  /**
   * @brief scan target_root recursively and hash every regular file.
   * unreadable files count toward file_cnt but stay invisible to dedup.
   *
   * @param target_root destination tree, may not exist yet
   * @param fp fingerprinter
   * @param max_thread maximum number of threads to use
   * @param sink receives phase, progress and per-file error events
   * @param cancel cancellation flag, observed between files
   */
  static index_build_t build(const std::filesystem::path &target_root,
                             const fingerprinter_t &fp,
                             const uint32_t max_thread, event_sink_t &sink,
                             const std::atomic<bool> &cancel);
};

struct index_build_t {
  target_index_t index;
  uint64_t file_cnt = 0;
  uint64_t error_cnt = 0;
  bool cancelled = false;
};

}  // namespace detail_v1

}  // namespace dedupcp
