#include "planner.hh"

#include "hash_pool.hh"
#include "ls_dir_rec.hh"

namespace dedupcp {

inline namespace detail_v1 {

plan_t plan(const std::filesystem::path &source_root,
            const target_index_t &index, const fingerprinter_t &fp,
            const uint32_t max_thread, event_sink_t &sink,
            const std::atomic<bool> &cancel,
            const std::vector<std::filesystem::path> &prune) {
  sink.phase_started(phase_t::plan, source_root);
  plan_t result;

  auto listing = list_files(source_root, max_thread, prune);
  for (const auto &[path, reason] : listing.skipped) {
    sink.warning(path, "skip " + reason);
  }
  for (const auto &[path, reason] : listing.failed) {
    ++result.stats.errors;
    sink.file_error(path, "cannot list: " + reason);
  }

  hash_all(listing.files, fp, max_thread, cancel,
           [&sink](uint64_t done, uint64_t total) {
             sink.scan_progress(phase_t::plan, done, total);
           });

  auto &stats = result.stats;
  result.entries.reserve(listing.files.size());
  for (auto &file : listing.files) {
    if (!file.hashed()) {
      result.cancelled = true;
      break;
    }
    ++stats.source_files;
    const auto &digest = file.digest(fp);
    if (!digest) {
      // fail open, neither duplicate nor copied
      ++stats.errors;
      sink.file_error(file.path(), file.hash_error().message());
      continue;
    }
    auto &entry = result.entries.emplace_back();
    entry.path = file.path().lexically_relative(source_root);
    entry.size = file.size();
    if (index.contains(*digest)) {
      entry.cls = class_t::duplicate;
      ++stats.duplicates;
    } else {
      entry.cls = class_t::to_copy;
      ++stats.to_copy;
      stats.bytes_to_copy += file.size();
    }
  }
  if (cancel.load()) {
    result.cancelled = true;
  }

  sink.plan_ready(result.entries, stats);
  return result;
}

}  // namespace detail_v1

}  // namespace dedupcp
