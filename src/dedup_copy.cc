#include "dedup_copy.hh"

#include <unistd.h>

#include <string>
#include <system_error>
#include <utility>

#include "copy_executor.hh"
#include "hasher.hh"
#include "planner.hh"
#include "target_index.hh"

namespace dedupcp {

inline namespace detail_v1 {

namespace fs = std::filesystem;

namespace {

bool is_inside(const fs::path &path, const fs::path &root) {
  const auto rel = path.lexically_relative(root);
  return !rel.empty() && *rel.begin() != ".." && rel != ".";
}

void check_roots(const fs::path &source, const fs::path &target,
                 const run_mode_t mode) {
  std::error_code ec;
  if (!fs::exists(source, ec)) {
    throw precondition_error("source does not exist: " + source.string());
  }
  if (!fs::is_directory(source, ec)) {
    throw precondition_error("source is not a directory: " + source.string());
  }
  if (::access(source.c_str(), R_OK | X_OK) != 0) {
    throw precondition_error("source is not readable: " + source.string());
  }
  if (source == target) {
    throw precondition_error("source and target are the same directory: " +
                             source.string());
  }
  if (fs::exists(target, ec)) {
    if (!fs::is_directory(target, ec)) {
      throw precondition_error("target is not a directory: " +
                               target.string());
    }
    if (mode == run_mode_t::execute &&
        ::access(target.c_str(), W_OK | X_OK) != 0) {
      throw precondition_error("target is not writable: " + target.string());
    }
    return;
  }
  if (mode != run_mode_t::execute) {
    return;
  }
  // missing target, created later below its nearest existing ancestor
  auto ancestor = target.parent_path();
  while (!fs::exists(ancestor, ec) && ancestor.has_relative_path()) {
    ancestor = ancestor.parent_path();
  }
  if (!fs::is_directory(ancestor, ec)) {
    throw precondition_error("cannot create target below " +
                             ancestor.string() + ": not a directory");
  }
  // access() grants root everything, so try a real mkdir
  const auto trial_dir =
      ancestor / (".dedupcp_" + std::to_string(::getpid()) + ".tmp");
  const bool created = fs::create_directory(trial_dir, ec);
  if (ec) {
    throw precondition_error("cannot create target below " +
                             ancestor.string() + ": " + ec.message());
  }
  if (created) {
    fs::remove(trial_dir, ec);
  }
}

}  // namespace

fs::path resolve_root(const fs::path &path) {
  std::error_code ec;
  auto resolved = fs::weakly_canonical(fs::absolute(path, ec), ec);
  if (ec) {
    resolved = fs::absolute(path, ec).lexically_normal();
  }
  if (!resolved.has_filename() && resolved.has_relative_path()) {
    resolved = resolved.parent_path();
  }
  return resolved;
}

run_result_t run(const options_t &opts, event_sink_t &sink,
                 const confirm_gate_t &gate,
                 const std::atomic<bool> &cancel) {
  run_result_t result;
  result.source = resolve_root(opts.source);
  result.target = resolve_root(opts.target);
  const auto &source = result.source;
  const auto &target = result.target;
  check_roots(source, target, opts.mode);

  const fingerprinter_t fp(opts.hash_algo, opts.chunk_size);
  // a target nested in the source must not be copied into itself
  std::vector<fs::path> prune;
  if (is_inside(target, source)) {
    prune.push_back(target);
  }

  auto finish = [&](const outcome_t outcome, const run_stats_t &stats) {
    result.outcome = outcome;
    sink.run_finished(outcome, stats);
    return std::move(result);
  };

  // index target
  auto built =
      target_index_t::build(target, fp, opts.max_thread, sink, cancel);
  result.target_files = built.file_cnt;
  if (built.cancelled) {
    result.plan_stats.target_files = built.file_cnt;
    return finish(outcome_t::cancelled, result.plan_stats);
  }

  // classify source
  auto planned = plan(source, built.index, fp, opts.max_thread, sink, cancel,
                      prune);
  planned.stats.target_files = built.file_cnt;
  result.plan = std::move(planned.entries);
  result.plan_stats = planned.stats;
  if (planned.cancelled) {
    return finish(outcome_t::cancelled, result.plan_stats);
  }

  const auto needed = result.plan_stats.bytes_to_copy;
  result.space = opts.space_query ? opts.space_query(target, needed)
                                  : check(target, needed);
  sink.space_checked(result.space);
  if (opts.mode == run_mode_t::dry_run) {
    return finish(outcome_t::completed, result.plan_stats);
  }

  // confirmation gates
  const confirm_request_t proceed_req{confirm_request_t::kind_t::proceed,
                                      source, target, result.plan_stats,
                                      result.space};
  if (!gate || !gate(proceed_req)) {
    return finish(outcome_t::declined, result.plan_stats);
  }
  if (!result.space.sufficient) {
    const confirm_request_t space_req{confirm_request_t::kind_t::low_space,
                                      source, target, result.plan_stats,
                                      result.space};
    if (!gate(space_req)) {
      return finish(outcome_t::space_declined, result.plan_stats);
    }
  }
  if (cancel.load()) {
    return finish(outcome_t::cancelled, result.plan_stats);
  }

  std::error_code ec;
  fs::create_directories(target, ec);
  if (ec) {
    throw precondition_error("cannot create target: " + target.string() +
                             " - " + ec.message());
  }

  // copy
  auto executed = execute(source, target, built.index, fp, opts.max_thread,
                          sink, cancel, prune, result.plan_stats.to_copy);
  executed.stats.target_files = built.file_cnt;
  result.exec_stats = executed.stats;
  return finish(executed.cancelled ? outcome_t::cancelled
                                   : outcome_t::completed,
                result.exec_stats);
}

}  // namespace detail_v1

}  // namespace dedupcp
