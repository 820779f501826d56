#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

#include "plan_entry.hh"
#include "run_stats.hh"
#include "space_guard.hh"

namespace dedupcp {

inline namespace detail_v1 {

enum class phase_t { index, plan, execute };

enum class outcome_t {
  completed,       // dry run reported or execution finished
  declined,        // user refused to proceed
  space_declined,  // user refused to proceed without enough space
  cancelled        // interrupted, stats are partial
};

constexpr std::string_view to_string(const phase_t phase) noexcept {
  switch (phase) {
    case phase_t::index:
      return "index";
    case phase_t::plan:
      return "plan";
    default:
      return "execute";
  }
}

constexpr std::string_view to_string(const outcome_t outcome) noexcept {
  switch (outcome) {
    case outcome_t::completed:
      return "completed";
    case outcome_t::declined:
      return "declined";
    case outcome_t::space_declined:
      return "space_declined";
    default:
      return "cancelled";
  }
}

/**
 * @brief receiver of the structured event stream of a run.
 * every handler defaults to a no-op. scan_progress may be called from a
 * pool thread, but never concurrently with another handler.
 */
class event_sink_t {
 public:
  virtual ~event_sink_t() = default;

  virtual void phase_started(phase_t, const std::filesystem::path &) {}
  virtual void scan_progress(phase_t, uint64_t /*done*/, uint64_t /*total*/) {}
  virtual void index_built(uint64_t /*file_cnt*/, uint64_t /*unique_cnt*/,
                           uint64_t /*error_cnt*/) {}
  virtual void plan_ready(const std::vector<plan_entry_t> &,
                          const run_stats_t &) {}
  virtual void space_checked(const space_report_t &) {}
  virtual void file_copied(const std::filesystem::path & /*src*/,
                           const std::filesystem::path & /*dst*/,
                           uint64_t /*size*/) {}
  virtual void copy_progress(const run_stats_t &, uint64_t /*planned*/) {}
  virtual void file_error(const std::filesystem::path &,
                          const std::string & /*msg*/) {}
  virtual void warning(const std::filesystem::path &,
                       const std::string & /*msg*/) {}
  virtual void run_finished(outcome_t, const run_stats_t &) {}
};

struct confirm_request_t {
  enum class kind_t { proceed, low_space };

  kind_t kind = kind_t::proceed;
  std::filesystem::path source;
  std::filesystem::path target;
  const run_stats_t &stats;
  const space_report_t &space;
};

// synchronous, returns true to go on
using confirm_gate_t = std::function<bool(const confirm_request_t &)>;

}  // namespace detail_v1

}  // namespace dedupcp
