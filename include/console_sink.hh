#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <ostream>
#include <string>
#include <vector>

#include "config.hh"
#include "events.hh"
#include "oss.hh"

namespace dedupcp {

inline namespace detail_v1 {

class timer_t {
  std::chrono::steady_clock::time_point _prev_time;

 public:
  timer_t() noexcept : _prev_time(std::chrono::steady_clock::now()) {}
  // time since construction or the previous call
  std::chrono::milliseconds time() noexcept {
    auto cur_time = std::chrono::steady_clock::now();
    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        cur_time - _prev_time);
    _prev_time = cur_time;
    return duration;
  }
};

/**
 * @brief human readable progress and reports on a console stream,
 * mirrored with timestamps into an optional log file.
 */
class console_sink_t : public event_sink_t {
  std::ostream &_os;
  std::ofstream _log_file;
  std::filesystem::path _log_path;
  bool _verbose = false;
  bool _executed = false;
  uint64_t _target_files = 0;
  timer_t _phase_timer;
  std::chrono::steady_clock::time_point _phase_start =
      std::chrono::steady_clock::now();

  void emit(const level_t level, const std::string &msg);

 public:
  /**
   * @param os console stream
   * @param log_path file to append to, none if empty
   * @param verbose report the full plan and every copied file
   * @throws std::runtime_error if the log file cannot be opened
   */
  explicit console_sink_t(std::ostream &os,
                          const std::filesystem::path &log_path = {},
                          const bool verbose = false);

  void phase_started(phase_t phase, const std::filesystem::path &root) override;
  void scan_progress(phase_t phase, uint64_t done, uint64_t total) override;
  void index_built(uint64_t file_cnt, uint64_t unique_cnt,
                   uint64_t error_cnt) override;
  void plan_ready(const std::vector<plan_entry_t> &entries,
                  const run_stats_t &stats) override;
  void space_checked(const space_report_t &report) override;
  void file_copied(const std::filesystem::path &src,
                   const std::filesystem::path &dst, uint64_t size) override;
  void copy_progress(const run_stats_t &stats, uint64_t planned) override;
  void file_error(const std::filesystem::path &path,
                  const std::string &msg) override;
  void warning(const std::filesystem::path &path,
               const std::string &msg) override;
  void run_finished(outcome_t outcome, const run_stats_t &stats) override;

  // free text line, e.g. from the confirmation layer
  void note(const std::string &msg) { emit(level_t::log, msg); }
};

// bytes as GiB with two decimals
std::string fmt_gib(const uint64_t bytes);
// bytes as MiB with one decimal
std::string fmt_mib(const double bytes);

/**
 * @brief timestamped log file name inside dir,
 * dedupcp_YYYYmmdd_HHMMSS.log in local time
 */
std::filesystem::path default_log_name(const std::filesystem::path &dir);

}  // namespace detail_v1

}  // namespace dedupcp
