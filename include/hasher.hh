#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <system_error>

#include "config.hh"

namespace dedupcp {

inline namespace detail_v1 {

// lowercase hex digest, fixed length per algorithm
using digest_t = std::string;

/**
 * @brief streams file content through a digest algorithm.
 * collisions between distinct contents are treated as impossible,
 * this is a best-effort dedup tool, not an integrity checker.
 *
 * supported algorithms: "xxh128" (libxxhash) and every digest name
 * known to libcrypto (md5, sha1, sha256, ...)
 */
class DEDUPCP_EXPORT fingerprinter_t {
  std::string _algo;
  uint64_t _chunk_sz;

 public:
  /**
   * @throws std::invalid_argument on unknown algorithm or zero chunk size
   */
  explicit fingerprinter_t(std::string algo = default_hash_algo,
                           uint64_t chunk_size = chunk_sz);

  /**
   * @brief hash the whole file, reading at most chunk_size bytes at a time
   *
   * @param path file to hash
   * @param[out] ec reason of failure, cleared on success
   * @return digest, or nullopt when the file cannot be opened or read
   */
  std::optional<digest_t> fingerprint(const std::filesystem::path &path,
                                      std::error_code &ec) const noexcept;

  inline const std::string &algo() const noexcept { return _algo; }
  inline uint64_t chunk_size() const noexcept { return _chunk_sz; }
};

}  // namespace detail_v1

}  // namespace dedupcp
