#include "console_sink.hh"

#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace dedupcp {

inline namespace detail_v1 {

namespace {

constexpr auto rule = "============================================================";

std::string timestamp() {
  const auto now = std::time(nullptr);
  std::tm local{};
  localtime_r(&now, &local);
  std::ostringstream ss;
  ss << std::put_time(&local, "%Y-%m-%d %H:%M:%S");
  return ss.str();
}

double seconds_since(const std::chrono::steady_clock::time_point start) {
  return std::chrono::duration<double>(std::chrono::steady_clock::now() -
                                       start)
      .count();
}

std::string fmt_sec(const double sec) {
  std::ostringstream ss;
  ss << std::fixed << std::setprecision(1) << sec << 's';
  return ss.str();
}

void list_examples(std::ostringstream &ss,
                   const std::vector<plan_entry_t> &entries, const class_t cls,
                   const uint64_t cnt) {
  if (cnt == 0 || cnt > example_list_lim) {
    return;
  }
  ss << '\n'
     << (cls == class_t::duplicate ? "examples of files already present:"
                                   : "examples of new files:");
  std::size_t shown = 0;
  for (const auto &entry : entries) {
    if (entry.cls != cls) {
      continue;
    }
    ss << "\n  " << entry.path.string() << " (" << fmt_mib((double)entry.size)
       << ')';
    if (++shown == example_cnt) {
      break;
    }
  }
}

}  // namespace

std::string fmt_gib(const uint64_t bytes) {
  std::ostringstream ss;
  ss << std::fixed << std::setprecision(2)
     << (double)bytes / (1024.0 * 1024.0 * 1024.0) << " GiB";
  return ss.str();
}

std::string fmt_mib(const double bytes) {
  std::ostringstream ss;
  ss << std::fixed << std::setprecision(1) << bytes / (1024.0 * 1024.0)
     << " MiB";
  return ss.str();
}

console_sink_t::console_sink_t(std::ostream &os,
                               const std::filesystem::path &log_path,
                               const bool verbose)
    : _os(os), _log_path(log_path), _verbose(verbose) {
  if (!_log_path.empty()) {
    _log_file.open(_log_path, std::ios::out | std::ios::app);
    if (!_log_file.is_open() || !_log_file.good()) {
      throw std::runtime_error("error opening logfile: " + _log_path.string());
    }
  }
}

void console_sink_t::emit(const level_t level, const std::string &msg) {
  oss(_os) << tag(level) << msg << '\n';
  if (_log_file.is_open()) {
    oss(_log_file) << timestamp() << " - " << tag(level) << msg << '\n';
  }
}

void console_sink_t::phase_started(const phase_t phase,
                                   const std::filesystem::path &root) {
  _phase_timer.time();
  _phase_start = std::chrono::steady_clock::now();
  switch (phase) {
    case phase_t::index:
      emit(level_t::log, "scan target: " + root.string());
      break;
    case phase_t::plan:
      emit(level_t::log, "analyse source: " + root.string());
      break;
    case phase_t::execute:
      _executed = true;
      emit(level_t::log, "start copying from " + root.string());
      break;
  }
}

void console_sink_t::scan_progress(const phase_t phase, const uint64_t done,
                                   const uint64_t total) {
  std::ostringstream ss;
  ss << "  " << to_string(phase) << ": " << done << '/' << total
     << " files hashed (" << fmt_sec(seconds_since(_phase_start)) << ")...";
  emit(level_t::log, ss.str());
}

void console_sink_t::index_built(const uint64_t file_cnt,
                                 const uint64_t unique_cnt,
                                 const uint64_t error_cnt) {
  _target_files = file_cnt;
  std::ostringstream ss;
  ss << "target scanned: " << file_cnt << " files, " << unique_cnt
     << " unique digests";
  if (error_cnt > 0) {
    ss << ", " << error_cnt << " unreadable";
  }
  ss << " in " << _phase_timer.time().count() << "ms";
  emit(level_t::log, ss.str());
}

void console_sink_t::plan_ready(const std::vector<plan_entry_t> &entries,
                                const run_stats_t &stats) {
  std::ostringstream ss;
  ss << rule << "\nanalysis result\n" << rule;
  ss << "\nanalysis time: " << _phase_timer.time().count() << "ms";
  ss << "\nsource files: " << stats.source_files;
  ss << "\ntarget files: " << _target_files;
  ss << "\nalready present (same content): " << stats.duplicates;
  ss << "\nto copy: " << stats.to_copy;
  if (stats.errors > 0) {
    ss << "\nunreadable: " << stats.errors;
  }
  if (stats.to_copy > 0) {
    ss << "\nspace needed: " << fmt_gib(stats.bytes_to_copy);
  }
  if (_verbose) {
    // full plan instead of a few examples
    for (const auto &entry : entries) {
      ss << "\n  " << to_string(entry.cls) << ' ' << entry.path.string()
         << " (" << fmt_mib((double)entry.size) << ')';
    }
  } else {
    list_examples(ss, entries, class_t::duplicate, stats.duplicates);
    list_examples(ss, entries, class_t::to_copy, stats.to_copy);
  }
  emit(level_t::log, ss.str());
}

void console_sink_t::space_checked(const space_report_t &report) {
  if (report.needed_bytes == 0) {
    return;
  }
  if (!report.known) {
    emit(level_t::warn, "space check failed: " + report.error);
    return;
  }
  emit(level_t::log, "free space: " + fmt_gib(report.free_bytes));
  if (!report.sufficient) {
    emit(level_t::warn, "not enough space, missing: " +
                            fmt_gib(report.shortfall_bytes));
  } else {
    emit(level_t::log,
         "remaining after copy: " +
             fmt_gib(report.free_bytes - report.needed_bytes));
  }
}

void console_sink_t::file_copied(const std::filesystem::path &src,
                                 const std::filesystem::path &dst,
                                 const uint64_t size) {
  if (_verbose) {
    emit(level_t::log, "copy " + src.string() + " -> " + dst.string() + " (" +
                           fmt_mib((double)size) + ')');
  }
}

void console_sink_t::copy_progress(const run_stats_t &stats,
                                   const uint64_t planned) {
  const auto elapsed = seconds_since(_phase_start);
  std::ostringstream ss;
  ss << "copied: " << stats.copied << '/' << planned << " (" << std::fixed
     << std::setprecision(1)
     << (elapsed > 0 ? (double)stats.copied / elapsed : 0.0)
     << " files/second)";
  emit(level_t::log, ss.str());
}

void console_sink_t::file_error(const std::filesystem::path &path,
                                const std::string &msg) {
  emit(level_t::err, path.string() + " - " + msg);
}

void console_sink_t::warning(const std::filesystem::path &path,
                             const std::string &msg) {
  emit(level_t::warn, path.string() + " - " + msg);
}

void console_sink_t::run_finished(const outcome_t outcome,
                                  const run_stats_t &stats) {
  switch (outcome) {
    case outcome_t::declined:
      emit(level_t::log, "aborted by user");
      break;
    case outcome_t::space_declined:
      emit(level_t::log, "aborted, not enough space");
      break;
    case outcome_t::cancelled:
      emit(level_t::warn, "interrupted, results below are partial");
      break;
    case outcome_t::completed:
      break;
  }
  const bool declined = outcome == outcome_t::declined ||
                        outcome == outcome_t::space_declined;
  if (!_executed) {
    if (outcome == outcome_t::completed) {
      emit(level_t::log, "dry run finished, nothing was modified");
    }
  } else if (!declined) {
    const auto elapsed = seconds_since(_phase_start);
    std::ostringstream ss;
    ss << rule << "\ncopy finished\n" << rule;
    ss << "\ntotal time: " << fmt_sec(elapsed);
    if (elapsed > 0) {
      ss << "\naverage: " << std::fixed << std::setprecision(1)
         << (double)stats.copied / elapsed << " files/second";
    }
    ss << "\ncopied:          " << stats.copied;
    ss << "\nalready present: " << stats.duplicates;
    ss << "\nerrors:          " << stats.errors;
    if (stats.copied > 0) {
      ss << "\naverage size:    "
         << fmt_mib((double)stats.bytes_copied / (double)stats.copied);
    }
    emit(level_t::log, ss.str());
  }
  emit(level_t::log, "run " + std::string(to_string(outcome)));
  if (!_log_path.empty()) {
    emit(level_t::log, "log file: " + _log_path.string());
  }
}

std::filesystem::path default_log_name(const std::filesystem::path &dir) {
  const auto now = std::time(nullptr);
  std::tm local{};
  localtime_r(&now, &local);
  std::ostringstream ss;
  ss << "dedupcp_" << std::put_time(&local, "%Y%m%d_%H%M%S") << ".log";
  return dir / ss.str();
}

}  // namespace detail_v1

}  // namespace dedupcp
