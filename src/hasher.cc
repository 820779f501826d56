#include "hasher.hh"

#include <openssl/evp.h>
#include <xxhash.h>

#include <cerrno>
#include <fstream>
#include <memory>
#include <stdexcept>
#include <utility>
#include <vector>

namespace dedupcp {

inline namespace detail_v1 {

namespace {

constexpr auto xxh128_name = "xxh128";
constexpr auto xxh_seed = 0x178ee47c0190226cUL;

std::string to_hex(const unsigned char *data, const std::size_t len) {
  static constexpr char digits[] = "0123456789abcdef";
  std::string hex;
  hex.reserve(len * 2);
  for (std::size_t i = 0; i < len; ++i) {
    hex.push_back(digits[data[i] >> 4U]);
    hex.push_back(digits[data[i] & 0xfU]);
  }
  return hex;
}

class hasher_t {
 public:
  virtual ~hasher_t() = default;
  virtual void update(const char *data, uint64_t size) = 0;
  virtual digest_t hexdigest() = 0;
};

// RAII wrapper for xxhash library.
class xxh_hasher_t final : public hasher_t {
  XXH3_state_t *_state;

 public:
  xxh_hasher_t() {
    _state = XXH3_createState();
    if (_state == nullptr) {
      throw std::runtime_error("XXH3_createState failed");
    }
    if (XXH3_128bits_reset_withSeed(_state, xxh_seed) == XXH_ERROR) {
      XXH3_freeState(_state);
      throw std::runtime_error("XXH3_128bits_reset_withSeed failed");
    }
  }
  ~xxh_hasher_t() noexcept override { XXH3_freeState(_state); }

  xxh_hasher_t(const xxh_hasher_t &rhs) = delete;
  xxh_hasher_t(xxh_hasher_t &&rhs) = delete;
  xxh_hasher_t &operator=(const xxh_hasher_t &rhs) = delete;
  xxh_hasher_t &operator=(xxh_hasher_t &&rhs) = delete;

  void update(const char *data, const uint64_t size) override {
    if (XXH3_128bits_update(_state, data, size) == XXH_ERROR) {
      throw std::runtime_error("XXH3_128bits_update failed");
    }
  }
  digest_t hexdigest() override {
    XXH128_canonical_t canonical;
    XXH128_canonicalFromHash(&canonical, XXH3_128bits_digest(_state));
    return to_hex(canonical.digest, sizeof(canonical.digest));
  }
};

// RAII wrapper for libcrypto message digests.
class evp_hasher_t final : public hasher_t {
  EVP_MD_CTX *_ctx;

 public:
  explicit evp_hasher_t(const EVP_MD *md) {
    _ctx = EVP_MD_CTX_new();
    if (_ctx == nullptr) {
      throw std::runtime_error("EVP_MD_CTX_new failed");
    }
    if (EVP_DigestInit_ex(_ctx, md, nullptr) != 1) {
      EVP_MD_CTX_free(_ctx);
      throw std::runtime_error("EVP_DigestInit_ex failed");
    }
  }
  ~evp_hasher_t() noexcept override { EVP_MD_CTX_free(_ctx); }

  evp_hasher_t(const evp_hasher_t &rhs) = delete;
  evp_hasher_t(evp_hasher_t &&rhs) = delete;
  evp_hasher_t &operator=(const evp_hasher_t &rhs) = delete;
  evp_hasher_t &operator=(evp_hasher_t &&rhs) = delete;

  void update(const char *data, const uint64_t size) override {
    if (EVP_DigestUpdate(_ctx, data, size) != 1) {
      throw std::runtime_error("EVP_DigestUpdate failed");
    }
  }
  digest_t hexdigest() override {
    unsigned char md[EVP_MAX_MD_SIZE];
    unsigned int md_len = 0;
    if (EVP_DigestFinal_ex(_ctx, md, &md_len) != 1) {
      throw std::runtime_error("EVP_DigestFinal_ex failed");
    }
    return to_hex(md, md_len);
  }
};

std::unique_ptr<hasher_t> make_hasher(const std::string &algo) {
  if (algo == xxh128_name) {
    return std::make_unique<xxh_hasher_t>();
  }
  const EVP_MD *md = EVP_get_digestbyname(algo.c_str());
  if (md == nullptr) {
    throw std::invalid_argument("invalid hash algorithm: " + algo);
  }
  return std::make_unique<evp_hasher_t>(md);
}

// one read buffer per worker thread, grown on demand
char *thread_buf(const uint64_t size) {
  thread_local std::vector<char> buf;
  if (buf.size() < size) {
    buf.resize(size);
  }
  return buf.data();
}

std::error_code last_error() noexcept {
  return {errno != 0 ? errno : EIO, std::generic_category()};
}

}  // namespace

fingerprinter_t::fingerprinter_t(std::string algo, const uint64_t chunk_size)
    : _algo(std::move(algo)), _chunk_sz(chunk_size) {
  if (_chunk_sz == 0) {
    throw std::invalid_argument("chunk size must be > 0");
  }
  if (_algo != xxh128_name &&
      EVP_get_digestbyname(_algo.c_str()) == nullptr) {
    throw std::invalid_argument("invalid hash algorithm: " + _algo);
  }
}

std::optional<digest_t> fingerprinter_t::fingerprint(
    const std::filesystem::path &path, std::error_code &ec) const noexcept {
  ec.clear();
  try {
    auto hasher = make_hasher(_algo);
    auto buf = thread_buf(_chunk_sz);
    errno = 0;
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs.is_open()) {
      ec = last_error();
      return std::nullopt;
    }
    while (true) {
      ifs.read(buf, (std::streamsize)_chunk_sz);
      const auto read_len = ifs.gcount();
      if (ifs.bad()) {
        ec = last_error();
        return std::nullopt;
      }
      if (read_len > 0) {
        hasher->update(buf, (uint64_t)read_len);
      }
      if (ifs.eof()) {
        break;
      }
      if (ifs.fail()) {
        ec = last_error();
        return std::nullopt;
      }
    }
    return hasher->hexdigest();
  } catch (const std::bad_alloc &) {
    ec = std::make_error_code(std::errc::not_enough_memory);
  } catch (const std::exception &) {
    ec = std::make_error_code(std::errc::io_error);
  }
  return std::nullopt;
}

}  // namespace detail_v1

}  // namespace dedupcp
