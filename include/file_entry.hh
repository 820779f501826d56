#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <system_error>
#include <utility>

#include "hasher.hh"

namespace dedupcp {

inline namespace detail_v1 {

class file_entry_t {
  std::filesystem::path _path;
  uint64_t _size = 0;
  // cached for the lifetime of the entry, i.e. one pass
  std::optional<digest_t> _digest;
  std::error_code _hash_ec;
  bool _hashed = false;

 public:
  template <typename Tp>
  inline file_entry_t(Tp &&path, const uint64_t size) noexcept(
      noexcept(std::filesystem::path(std::forward<Tp>(path))))
      : _path(std::forward<Tp>(path)), _size(size) {}

  inline file_entry_t(const file_entry_t &rhs) = default;
  inline file_entry_t(file_entry_t &&rhs) = default;
  inline file_entry_t &operator=(const file_entry_t &rhs) = default;
  inline file_entry_t &operator=(file_entry_t &&rhs) = default;

  inline const std::filesystem::path &path() const noexcept { return _path; }
  inline uint64_t size() const noexcept { return _size; }

  /**
   * @brief lazy hash file content, computed on first call only
   *
   * @return digest, nullopt if the file could not be read (see hash_error)
   */
  inline const std::optional<digest_t> &digest(const fingerprinter_t &fp) {
    if (!_hashed) {
      _digest = fp.fingerprint(_path, _hash_ec);
      _hashed = true;
    }
    return _digest;
  }

  inline bool hashed() const noexcept { return _hashed; }
  inline const std::error_code &hash_error() const noexcept { return _hash_ec; }
};

}  // namespace detail_v1

}  // namespace dedupcp
