#pragma once

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "file_entry.hh"

#include <boost/asio/thread_pool.hpp>

namespace dedupcp {

inline namespace detail_v1 {

struct listing_t {
  std::vector<file_entry_t> files;
  // entries that were skipped or could not be read, with the reason
  std::vector<std::pair<std::filesystem::path, std::string>> skipped;
  std::vector<std::pair<std::filesystem::path, std::string>> failed;
};

inline bool is_pruned(const std::filesystem::path &path,
                      const std::vector<std::filesystem::path> &prune) {
  for (const auto &root : prune) {
    if (path == root) {
      return true;
    }
  }
  return false;
}

/**
 * @brief list directory recursively, recursion is posted to the pool.
 * symlinks are never followed, other non regular files are skipped.
 *
 * @param dir directory path
 * @param[out] listing collected files and problems
 * @param mtx mutex for protecting listing
 * @param pool thread pool for recursive calls
 * @param prune directories excluded with their whole subtree
 */
void ls_dir_rec(const std::filesystem::path dir, listing_t &listing,
                std::mutex &mtx, boost::asio::thread_pool &pool,
                const std::vector<std::filesystem::path> &prune);

/**
 * @brief list every regular file below root, sorted by path
 *
 * @param root directory to list, a missing root gives an empty listing
 * @param max_thread maximum number of threads to use
 * @param prune directories excluded with their whole subtree
 */
listing_t list_files(const std::filesystem::path &root,
                     const uint32_t max_thread,
                     const std::vector<std::filesystem::path> &prune = {});

}  // namespace detail_v1

}  // namespace dedupcp
