#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

namespace dedupcp {

inline namespace detail_v1 {

struct space_report_t {
  // false when free space could not be queried, the guard is then skipped
  bool known = false;
  bool sufficient = true;
  uint64_t free_bytes = 0;
  uint64_t needed_bytes = 0;
  uint64_t shortfall_bytes = 0;
  std::string error;
};

/**
 * @brief compare needed bytes against a known amount of free space
 */
space_report_t evaluate(const uint64_t free_bytes, const uint64_t bytes_needed);

/**
 * @brief query free space on the filesystem holding target_root.
 * a target that does not exist yet is measured at its nearest existing
 * ancestor. query failures give an unknown (known == false) report.
 */
space_report_t check(const std::filesystem::path &target_root,
                     const uint64_t bytes_needed) noexcept;

}  // namespace detail_v1

}  // namespace dedupcp
