#include "copy_executor.hh"

#include <fcntl.h>
#include <sys/stat.h>

#include <cerrno>
#include <string>

#include "config.hh"
#include "hash_pool.hh"
#include "ls_dir_rec.hh"

namespace dedupcp {

inline namespace detail_v1 {

namespace fs = std::filesystem;

namespace {

bool path_taken(const fs::path &path) {
  std::error_code ec;
  // dangling symlinks occupy the name as well, unknown status does not so
  // that the copy itself reports the problem
  const auto type = fs::symlink_status(path, ec).type();
  return type != fs::file_type::not_found && type != fs::file_type::none;
}

// atime and mtime with nanosecond precision
void copy_times(const fs::path &src, const fs::path &dst,
                std::error_code &ec) noexcept {
  struct stat st {};
  if (::stat(src.c_str(), &st) != 0) {
    ec.assign(errno, std::generic_category());
    return;
  }
  const struct timespec times[2] = {st.st_atim, st.st_mtim};
  if (::utimensat(AT_FDCWD, dst.c_str(), times, 0) != 0) {
    ec.assign(errno, std::generic_category());
  }
}

}  // namespace

fs::path unique_name(const fs::path &path) {
  const auto parent = path.parent_path();
  const auto stem = path.stem().string();
  const auto ext = path.extension().string();
  for (uint64_t counter = 1;; ++counter) {
    auto candidate = parent / (stem + '_' + std::to_string(counter) + ext);
    if (!path_taken(candidate)) {
      return candidate;
    }
  }
}

bool copy_new_file(const fs::path &src, const fs::path &dst,
                   std::error_code &ec, std::error_code &meta_ec) {
  ec.clear();
  meta_ec.clear();
  // copy_options::none fails instead of overwriting
  if (!fs::copy_file(src, dst, fs::copy_options::none, ec) || ec) {
    if (!ec) {
      ec = std::make_error_code(std::errc::io_error);
    }
    if (ec != std::errc::file_exists) {
      // remove what this call left behind, e.g. on a full disk
      std::error_code rm_ec;
      fs::remove(dst, rm_ec);
    }
    return false;
  }
  std::error_code perm_ec;
  const auto st = fs::status(src, perm_ec);
  if (!perm_ec) {
    fs::permissions(dst, st.permissions(), fs::perm_options::replace, perm_ec);
  }
  copy_times(src, dst, meta_ec);
  if (!meta_ec && perm_ec) {
    meta_ec = perm_ec;
  }
  return true;
}

exec_result_t execute(const fs::path &source_root, const fs::path &target_root,
                      target_index_t &index, const fingerprinter_t &fp,
                      const uint32_t max_thread, event_sink_t &sink,
                      const std::atomic<bool> &cancel,
                      const std::vector<fs::path> &prune,
                      const uint64_t planned) {
  sink.phase_started(phase_t::execute, source_root);
  exec_result_t result;
  auto &stats = result.stats;

  auto listing = list_files(source_root, max_thread, prune);
  for (const auto &[path, reason] : listing.skipped) {
    sink.warning(path, "skip " + reason);
  }
  for (const auto &[path, reason] : listing.failed) {
    ++stats.errors;
    sink.file_error(path, "cannot list: " + reason);
  }

  // digests are computed ahead on the pool, decisions and copies below
  // run on this thread only so the index has a single writer
  hash_all(listing.files, fp, max_thread, cancel,
           [&sink](uint64_t done, uint64_t total) {
             sink.scan_progress(phase_t::execute, done, total);
           });

  for (auto &file : listing.files) {
    if (cancel.load() || !file.hashed()) {
      result.cancelled = true;
      break;
    }
    ++stats.source_files;

    // 1. hash
    const auto &digest = file.digest(fp);
    if (!digest) {
      ++stats.errors;
      sink.file_error(file.path(), file.hash_error().message());
      continue;
    }

    // 2. content already in target
    if (index.contains(*digest)) {
      ++stats.duplicates;
      continue;
    }

    // 3. mirror the relative path
    const auto rel_path = file.path().lexically_relative(source_root);
    auto dst_path = target_root / rel_path;
    std::error_code ec;
    fs::create_directories(dst_path.parent_path(), ec);
    if (ec) {
      ++stats.errors;
      sink.file_error(file.path(), "cannot create directory " +
                                       dst_path.parent_path().string() +
                                       ": " + ec.message());
      continue;
    }

    // 4. same name already taken
    if (path_taken(dst_path)) {
      std::error_code dst_ec;
      const auto dst_digest = fp.fingerprint(dst_path, dst_ec);
      if (dst_digest && *dst_digest == *digest) {
        // present but was not indexed, e.g. added after the scan
        index.add_hash(*digest);
        ++stats.duplicates;
        continue;
      }
      dst_path = unique_name(dst_path);
    }

    // 5. copy
    std::error_code meta_ec;
    if (!copy_new_file(file.path(), dst_path, ec, meta_ec)) {
      ++stats.errors;
      sink.file_error(file.path(), "cannot copy to " + dst_path.string() +
                                       ": " + ec.message());
      continue;
    }
    if (meta_ec) {
      sink.warning(dst_path, "metadata not preserved: " + meta_ec.message());
    }

    // 6. register
    index.add_hash(*digest);
    ++stats.copied;
    stats.bytes_copied += file.size();
    sink.file_copied(file.path(), dst_path, file.size());
    if (stats.copied % copy_progress_interval == 0) {
      sink.copy_progress(stats, planned);
    }
  }

  return result;
}

}  // namespace detail_v1

}  // namespace dedupcp
