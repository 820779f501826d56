#pragma once

#include <string_view>
#include <version>

#if __cpp_lib_syncbuf >= 201803L

#include <syncstream>

namespace dedupcp {

inline namespace detail_v1 {

using oss = std::osyncstream;

}  // namespace detail_v1

}  // namespace dedupcp

#else

#include <mutex>
#include <ostream>
#include <sstream>

namespace dedupcp {

inline namespace detail_v1 {

// buffers one statement and emits it atomically on destruction
class oss {
  inline static std::mutex _mtx;
  std::ostream &_os;
  std::ostringstream _buf;

 public:
  oss() = delete;
  explicit oss(std::ostream &os) : _os(os) {}
  ~oss() {
    std::lock_guard lk(_mtx);
    _os << _buf.str();
  }

  oss(const oss &) = delete;
  oss(oss &&) = delete;
  oss &operator=(const oss &) = delete;
  oss &operator=(oss &&) = delete;

  template <typename Tp>
  oss &operator<<(const Tp &val) {
    _buf << val;
    return *this;
  }
  oss &operator<<(std::ostream &(*manip)(std::ostream &)) {
    _buf << manip;
    return *this;
  }
};

}  // namespace detail_v1

}  // namespace dedupcp

#endif

namespace dedupcp {

inline namespace detail_v1 {

enum class level_t { log, warn, err };

constexpr std::string_view tag(const level_t level) noexcept {
  switch (level) {
    case level_t::warn:
      return "[warn] ";
    case level_t::err:
      return "[err] ";
    default:
      return "[log] ";
  }
}

}  // namespace detail_v1

}  // namespace dedupcp
