#include "target_index.hh"

#include <mutex>
#include <utility>

#include "hash_pool.hh"
#include "ls_dir_rec.hh"

namespace dedupcp {

inline namespace detail_v1 {

target_index_t::target_index_t(target_index_t &&rhs) noexcept {
  std::unique_lock lck(rhs._rw_lck);
  _digests = std::move(rhs._digests);
}

target_index_t &target_index_t::operator=(target_index_t &&rhs) noexcept {
  if (this != &rhs) {
    std::scoped_lock lck(_rw_lck, rhs._rw_lck);
    _digests = std::move(rhs._digests);
  }
  return *this;
}

bool target_index_t::contains(const digest_t &digest) const {
  std::shared_lock lck(_rw_lck);
  return _digests.contains(digest);
}

bool target_index_t::add_hash(const digest_t &digest) {
  std::unique_lock lck(_rw_lck);
  return _digests.insert(digest).second;
}

std::size_t target_index_t::size() const {
  std::shared_lock lck(_rw_lck);
  return _digests.size();
}

index_build_t target_index_t::build(const std::filesystem::path &target_root,
                                    const fingerprinter_t &fp,
                                    const uint32_t max_thread,
                                    event_sink_t &sink,
                                    const std::atomic<bool> &cancel) {
  sink.phase_started(phase_t::index, target_root);
  index_build_t result;

  auto listing = list_files(target_root, max_thread);
  for (const auto &[path, reason] : listing.skipped) {
    sink.warning(path, "skip " + reason);
  }
  for (const auto &[path, reason] : listing.failed) {
    sink.warning(path, "cannot list: " + reason);
  }

  hash_all(listing.files, fp, max_thread, cancel,
           [&sink](uint64_t done, uint64_t total) {
             sink.scan_progress(phase_t::index, done, total);
           });

  for (auto &file : listing.files) {
    if (!file.hashed()) {
      // cancelled before this file was reached
      result.cancelled = true;
      break;
    }
    ++result.file_cnt;
    const auto &digest = file.digest(fp);
    if (digest) {
      result.index.add_hash(*digest);
    } else {
      ++result.error_cnt;
      sink.file_error(file.path(), file.hash_error().message());
    }
  }
  if (cancel.load()) {
    result.cancelled = true;
  }

  sink.index_built(result.file_cnt, result.index.size(), result.error_cnt);
  return result;
}

}  // namespace detail_v1

}  // namespace dedupcp
