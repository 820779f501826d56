#include "ls_dir_rec.hh"

#include <algorithm>
#include <functional>
#include <iterator>
#include <system_error>

#include <boost/asio.hpp>

namespace dedupcp {

inline namespace detail_v1 {

void ls_dir_rec(const std::filesystem::path dir, listing_t &listing,
                std::mutex &mtx, boost::asio::thread_pool &pool,
                const std::vector<std::filesystem::path> &prune) {
  listing_t listing_tmp;
  try {
    for (const auto &dir_entry : std::filesystem::directory_iterator(dir)) {
      std::error_code ec;
      if (is_pruned(dir_entry.path(), prune)) {
        // excluded subtree, skip silently

      } else if (dir_entry.is_symlink(ec)) {
        // symlink, skip
        listing_tmp.skipped.emplace_back(dir_entry.path(), "symlink");

      } else if (dir_entry.is_directory(ec)) {
        // directory, recursive call
        boost::asio::post(pool,
                          std::bind(ls_dir_rec, dir_entry.path(),
                                    std::ref(listing), std::ref(mtx),
                                    std::ref(pool), std::cref(prune)));

      } else if (dir_entry.is_regular_file(ec)) {
        // regular file, add to list, empty files included
        auto file_size = dir_entry.file_size(ec);
        if (ec) {
          listing_tmp.failed.emplace_back(dir_entry.path(), ec.message());
        } else {
          listing_tmp.files.emplace_back(dir_entry.path(), file_size);
        }

      } else if (ec) {
        listing_tmp.failed.emplace_back(dir_entry.path(), ec.message());

      } else {
        // other file type, skip
        listing_tmp.skipped.emplace_back(dir_entry.path(), "unsupported file");
      }
    }
  } catch (const std::filesystem::filesystem_error &e) {
    // error iterate directory, keep what was listed so far
    listing_tmp.failed.emplace_back(dir, e.code().message());
  }

  // append to global list
  std::lock_guard lk(mtx);
  listing.files.insert(listing.files.end(),
                       std::make_move_iterator(listing_tmp.files.begin()),
                       std::make_move_iterator(listing_tmp.files.end()));
  listing.skipped.insert(listing.skipped.end(),
                         std::make_move_iterator(listing_tmp.skipped.begin()),
                         std::make_move_iterator(listing_tmp.skipped.end()));
  listing.failed.insert(listing.failed.end(),
                        std::make_move_iterator(listing_tmp.failed.begin()),
                        std::make_move_iterator(listing_tmp.failed.end()));
}

listing_t list_files(const std::filesystem::path &root,
                     const uint32_t max_thread,
                     const std::vector<std::filesystem::path> &prune) {
  listing_t listing;
  std::error_code ec;
  if (!std::filesystem::is_directory(root, ec)) {
    return listing;
  }
  {
    boost::asio::thread_pool pool(max_thread);
    std::mutex mtx;
    boost::asio::post(pool, std::bind(ls_dir_rec, root, std::ref(listing),
                                      std::ref(mtx), std::ref(pool),
                                      std::cref(prune)));
    pool.join();
  }
  std::sort(listing.files.begin(), listing.files.end(),
            [](const auto &lhs, const auto &rhs) {
              return lhs.path() < rhs.path();
            });
  return listing;
}

}  // namespace detail_v1

}  // namespace dedupcp
