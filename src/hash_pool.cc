#include "hash_pool.hh"

#include <algorithm>
#include <mutex>

#include <boost/asio.hpp>
#include <boost/asio/thread_pool.hpp>

#include "config.hh"

namespace dedupcp {

inline namespace detail_v1 {

void hash_all(std::span<file_entry_t> files, const fingerprinter_t &fp,
              const uint32_t max_thread, const std::atomic<bool> &cancel,
              const progress_fn_t &progress) {
  if (files.empty()) {
    return;
  }
  const uint64_t total = files.size();
  std::atomic<uint64_t> cursor(0);
  std::atomic<uint64_t> done(0);
  std::mutex progress_mtx;

  auto worker = [&]() {
    while (!cancel.load(std::memory_order_relaxed)) {
      const auto idx = cursor.fetch_add(1, std::memory_order_relaxed);
      if (idx >= total) {
        break;
      }
      files[idx].digest(fp);
      const auto cnt = done.fetch_add(1, std::memory_order_relaxed) + 1;
      if (progress && cnt % scan_progress_interval == 0) {
        std::lock_guard lk(progress_mtx);
        progress(cnt, total);
      }
    }
  };

  const auto worker_cnt =
      (uint32_t)std::min<uint64_t>(std::max(max_thread, 1U), total);
  boost::asio::thread_pool pool(worker_cnt);
  for (auto i = 0U; i < worker_cnt; ++i) {
    boost::asio::post(pool, worker);
  }
  pool.join();
}

}  // namespace detail_v1

}  // namespace dedupcp
