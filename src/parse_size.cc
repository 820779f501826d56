#include "parse_size.hh"

#include <limits>
#include <stdexcept>
#include <string>

namespace utils {

namespace {

constexpr std::string_view unit_dict = "KMGTPE";

bool is_num(const char c) { return c >= '0' && c <= '9'; }

// multiply with overflow detection
uint64_t mul_checked(const uint64_t lhs, const uint64_t rhs,
                     std::string_view size_str) {
  if (rhs != 0 && lhs > std::numeric_limits<uint64_t>::max() / rhs) {
    throw std::out_of_range("size too large: " + std::string(size_str));
  }
  return lhs * rhs;
}

}  // namespace

uint64_t parse_size(std::string_view size_str) {
  const auto invalid = [&size_str]() {
    return std::invalid_argument("invalid size string: " +
                                 std::string(size_str));
  };

  std::size_t i = 0;
  uint64_t size_num = 0;
  for (; i < size_str.size() && is_num(size_str[i]); ++i) {
    size_num = mul_checked(size_num, 10, size_str);
    const auto digit = (uint64_t)(size_str[i] - '0');
    if (size_num > std::numeric_limits<uint64_t>::max() - digit) {
      throw std::out_of_range("size too large: " + std::string(size_str));
    }
    size_num += digit;
  }
  if (i == 0) {
    throw invalid();
  }

  // optional unit prefix
  std::size_t scale = 0;
  if (i < size_str.size()) {
    const auto pos = unit_dict.find((char)(size_str[i] & ~0x20));
    if (pos != std::string_view::npos) {
      scale = pos + 1;
      ++i;
    }
  }
  bool as_bibyte = false;
  if (scale != 0 && i < size_str.size() && size_str[i] == 'i') {
    as_bibyte = true;
    ++i;
  }
  bool as_bit = false;
  if (i < size_str.size()) {
    if (size_str[i] == 'b') {
      as_bit = true;
    } else if (size_str[i] != 'B') {
      throw invalid();
    }
    ++i;
  }
  if (i != size_str.size()) {
    throw invalid();
  }

  const uint64_t base = as_bibyte ? 1024 : 1000;
  for (std::size_t s = 0; s < scale; ++s) {
    size_num = mul_checked(size_num, base, size_str);
  }
  return as_bit ? size_num / 8 : size_num;
}

}  // namespace utils
