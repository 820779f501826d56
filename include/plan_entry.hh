#pragma once

#include <cstdint>
#include <filesystem>
#include <string_view>

namespace dedupcp {

inline namespace detail_v1 {

enum class class_t {
  duplicate,  // content already in target
  to_copy     // content new to target
};

constexpr std::string_view to_string(const class_t cls) noexcept {
  return cls == class_t::duplicate ? "duplicate" : "to_copy";
}

struct plan_entry_t {
  // relative to source root
  std::filesystem::path path;
  uint64_t size = 0;
  class_t cls = class_t::to_copy;
};

}  // namespace detail_v1

}  // namespace dedupcp
