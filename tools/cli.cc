#include <algorithm>
#include <atomic>
#include <cctype>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include "console_sink.hh"
#include "dedup_copy.hh"
#include "parse_size.hh"

using namespace std::literals;

namespace {

constexpr auto usage =
    "usage: dedupcp (-n/--dry-run | -x/--execute) [options] <source> <target>\n"
    "  -j, --jobs N      worker threads, 1..256 (default 4)\n"
    "  -a, --hash ALGO   md5 (default), sha1, sha256, ..., xxh128\n"
    "  -b, --chunk SIZE  read chunk size, e.g. 8MiB (default 8MiB)\n"
    "  -l, --log PATH    append the report to PATH, a directory gets a new\n"
    "                    dedupcp_YYYYmmdd_HHMMSS.log (no log file by default)\n"
    "  -y, --yes         answer yes to every confirmation\n"
    "  -v, --verbose     report the full plan and every copied file\n"
    "  -h, --help        show this help\n"
    "copies files from source to target, skipping every file whose content\n"
    "already exists anywhere in target.\n";

bool read_yes(std::istream &is) {
  std::string answer;
  if (!std::getline(is, answer)) {
    return false;
  }
  std::transform(answer.begin(), answer.end(), answer.begin(),
                 [](unsigned char c) { return (char)std::tolower(c); });
  return answer == "y" || answer == "yes" || answer == "j" || answer == "ja";
}

bool ask(const dedupcp::confirm_request_t &req) {
  using kind_t = dedupcp::confirm_request_t::kind_t;
  if (req.kind == kind_t::proceed) {
    std::cout << "\nsource: " << req.source.string()
              << "\ntarget: " << req.target.string()
              << "\n\nnew files: " << req.stats.to_copy
              << "\nspace needed: " << dedupcp::fmt_gib(req.stats.bytes_to_copy)
              << "\n\nproceed? (y/n): " << std::flush;
  } else {
    std::cout << "\nmissing: " << dedupcp::fmt_gib(req.space.shortfall_bytes)
              << "\nproceed anyway? (y/n): " << std::flush;
  }
  return read_yes(std::cin);
}

}  // namespace

int main(int argc, char *argv[]) {
  dedupcp::options_t opts;
  std::filesystem::path log_path;
  bool dry_run = false;
  bool execute = false;
  bool assume_yes = false;
  bool verbose = false;
  int positional = 0;

  for (int i = 1; i < argc; ++i) {
    const std::string_view arg = argv[i];
    if (arg == "-n"sv || arg == "--dry-run"sv) {
      dry_run = true;
    } else if (arg == "-x"sv || arg == "--execute"sv) {
      execute = true;
    } else if (arg == "-y"sv || arg == "--yes"sv) {
      assume_yes = true;
    } else if (arg == "-v"sv || arg == "--verbose"sv) {
      verbose = true;
    } else if (arg == "-h"sv || arg == "--help"sv) {
      std::cerr << usage;
      return 0;
    } else if (arg == "-j"sv || arg == "--jobs"sv || arg == "-a"sv ||
               arg == "--hash"sv || arg == "-b"sv || arg == "--chunk"sv ||
               arg == "-l"sv || arg == "--log"sv) {
      ++i;
      if (i >= argc) {
        std::cerr << "missing value for " << arg << std::endl;
        return 1;
      }
      const std::string value = argv[i];
      try {
        if (arg == "-j"sv || arg == "--jobs"sv) {
          const auto jobs = std::stoul(value);
          if (jobs == 0 || jobs > dedupcp::max_thread) {
            std::cerr << "jobs must be > 0 and <= " << dedupcp::max_thread
                      << std::endl;
            return 1;
          }
          opts.max_thread = (uint32_t)jobs;
        } else if (arg == "-a"sv || arg == "--hash"sv) {
          opts.hash_algo = value;
        } else if (arg == "-b"sv || arg == "--chunk"sv) {
          opts.chunk_size = utils::parse_size(value);
        } else {
          log_path = value;
        }
      } catch (const std::exception &e) {
        std::cerr << "invalid value for " << arg << ": " << e.what()
                  << std::endl;
        return 1;
      }
    } else if (arg.starts_with("-"sv) && arg.size() > 1) {
      std::cerr << "unknown option: " << arg << std::endl;
      return 1;
    } else if (positional == 0) {
      opts.source = argv[i];
      ++positional;
    } else if (positional == 1) {
      opts.target = argv[i];
      ++positional;
    } else {
      std::cerr << "unexpected argument: " << arg << std::endl;
      return 1;
    }
  }

  if (dry_run == execute) {
    std::cerr << "exactly one of --dry-run or --execute is required\n"
              << usage;
    return 1;
  }
  if (positional != 2) {
    std::cerr << "source and target are required\n" << usage;
    return 1;
  }
  opts.mode = dry_run ? dedupcp::run_mode_t::dry_run
                      : dedupcp::run_mode_t::execute;
  std::error_code log_ec;
  if (!log_path.empty() && std::filesystem::is_directory(log_path, log_ec)) {
    log_path = dedupcp::default_log_name(log_path);
  }

  // ctrl-c stops between files, the summary is still reported
  std::atomic<bool> cancel(false);
  boost::asio::io_context signal_ctx;
  boost::asio::signal_set signals(signal_ctx, SIGINT, SIGTERM);
  std::function<void(const boost::system::error_code &, int)> on_signal =
      [&](const boost::system::error_code &ec, int) {
        if (ec) {
          return;
        }
        if (cancel.exchange(true)) {
          // second interrupt, give up immediately
          std::_Exit(1);
        }
        std::cerr << "\n[warn] interrupted, finishing current file"
                  << std::endl;
        signals.async_wait(on_signal);
      };
  signals.async_wait(on_signal);
  std::thread signal_thread([&signal_ctx]() { signal_ctx.run(); });

  int status = 1;
  try {
    dedupcp::console_sink_t sink(std::clog, log_path, verbose);
    const dedupcp::confirm_gate_t gate =
        [&](const dedupcp::confirm_request_t &req) {
          if (assume_yes) {
            sink.note("confirmed by --yes");
            return true;
          }
          return ask(req);
        };
    const auto result = dedupcp::run(opts, sink, gate, cancel);
    if (result.outcome == dedupcp::outcome_t::completed) {
      status = 0;
      if (opts.mode == dedupcp::run_mode_t::dry_run) {
        std::cout << "\nto copy, run:\n"
                  << argv[0] << " --execute \"" << result.source.string()
                  << "\" \"" << result.target.string() << "\"" << std::endl;
      }
    }
  } catch (const dedupcp::precondition_error &e) {
    std::cerr << "[err] " << e.what() << std::endl;
  } catch (const std::invalid_argument &e) {
    std::cerr << "[err] " << e.what() << '\n' << usage;
  } catch (const std::exception &e) {
    std::cerr << "[err] " << e.what() << std::endl;
  }

  signal_ctx.stop();
  signal_thread.join();
  return status;
}
