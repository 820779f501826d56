#pragma once

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <system_error>
#include <vector>

#include "events.hh"
#include "hasher.hh"
#include "run_stats.hh"
#include "target_index.hh"

namespace dedupcp {

inline namespace detail_v1 {

struct exec_result_t {
  run_stats_t stats;
  bool cancelled = false;
};

/**
 * @brief first free sibling name of the form stem_N.ext, N starting at 1
 */
std::filesystem::path unique_name(const std::filesystem::path &path);

/**
 * @brief copy content, permissions and timestamps of src to a new file dst.
 * never overwrites, a partially written dst is removed on failure.
 *
 * @param[out] ec reason of failure
 * @param[out] meta_ec reason the metadata could not be preserved, the
 * content is in place when only this one is set
 * @return true if the content was copied
 */
bool copy_new_file(const std::filesystem::path &src,
                   const std::filesystem::path &dst, std::error_code &ec,
                   std::error_code &meta_ec);

/**
 * @brief re-walk source_root and copy every file whose content is not in
 * the index yet. the index grows with every copied file, so identical
 * source files are copied only once. per-file failures are counted in
 * stats.errors and never abort the run. cancellation is observed between
 * files, files copied so far stay in place.
 *
 * @param source_root source tree, never modified
 * @param target_root destination tree, must exist
 * @param index digests present in the target, grown in place
 * @param fp fingerprinter
 * @param max_thread maximum number of threads used for hashing
 * @param sink receives copy, progress and per-file error events
 * @param cancel cancellation flag
 * @param prune directories excluded from the walk
 * @param planned number of files the plan expects to copy, for progress
 */
exec_result_t execute(const std::filesystem::path &source_root,
                      const std::filesystem::path &target_root,
                      target_index_t &index, const fingerprinter_t &fp,
                      const uint32_t max_thread, event_sink_t &sink,
                      const std::atomic<bool> &cancel,
                      const std::vector<std::filesystem::path> &prune = {},
                      const uint64_t planned = 0);

}  // namespace detail_v1

}  // namespace dedupcp
