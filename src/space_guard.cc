#include "space_guard.hh"

#include <system_error>

namespace dedupcp {

inline namespace detail_v1 {

space_report_t evaluate(const uint64_t free_bytes, const uint64_t bytes_needed) {
  space_report_t report;
  report.known = true;
  report.free_bytes = free_bytes;
  report.needed_bytes = bytes_needed;
  report.sufficient = free_bytes >= bytes_needed;
  report.shortfall_bytes = report.sufficient ? 0 : bytes_needed - free_bytes;
  return report;
}

space_report_t check(const std::filesystem::path &target_root,
                     const uint64_t bytes_needed) noexcept {
  space_report_t report;
  report.needed_bytes = bytes_needed;
  try {
    // walk up to the first ancestor that exists
    auto existing = target_root;
    std::error_code ec;
    while (!std::filesystem::exists(existing, ec) && existing.has_relative_path()) {
      existing = existing.parent_path();
    }
    const auto info = std::filesystem::space(existing, ec);
    if (ec) {
      report.error = ec.message();
      return report;
    }
    return evaluate(info.available, bytes_needed);
  } catch (const std::exception &e) {
    report.error = e.what();
  }
  return report;
}

}  // namespace detail_v1

}  // namespace dedupcp
