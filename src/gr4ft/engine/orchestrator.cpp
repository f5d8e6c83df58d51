#include "orchestrator.hpp"
#include <redlog.hpp>

namespace gr4ft::engine {

orchestrator::orchestrator(instrumentation_set set, orchestrator_options options)
    : set_(std::move(set)), options_(options) {}

batch_options orchestrator::make_batch_options() const {
  batch_options options;
  options.workers = options_.workers;
  options.stop = &stop_;
  return options;
}

group_report orchestrator::apply_group(operation_kind kind) const {
  const auto& group = set_.group(kind);
  auto log = redlog::get_logger("gr4ft.orchestrator");
  auto options = make_batch_options();

  auto partition = check_batch(group.operations, options);
  auto outcome = apply_batch(partition.unapplied, options);

  group_report report;
  report.kind = kind;
  report.processed = outcome.succeeded.size();
  report.skipped = partition.applied.size();
  report.failures = std::move(outcome.failures);

  log.inf(
      "group applied", redlog::field("group", std::string(group_name(kind))),
      redlog::field("applied", report.processed), redlog::field("already", report.skipped),
      redlog::field("failed", report.failures.size())
  );
  return report;
}

group_report orchestrator::revert_group(operation_kind kind) const {
  const auto& group = set_.group(kind);
  auto log = redlog::get_logger("gr4ft.orchestrator");
  auto options = make_batch_options();

  auto partition = check_batch(group.operations, options);
  auto outcome = revert_batch(partition.applied, options);

  group_report report;
  report.kind = kind;
  report.processed = outcome.succeeded.size();
  report.skipped = partition.unapplied.size();
  report.failures = std::move(outcome.failures);

  log.inf(
      "group reverted", redlog::field("group", std::string(group_name(kind))),
      redlog::field("reverted", report.processed), redlog::field("already", report.skipped),
      redlog::field("failed", report.failures.size())
  );
  return report;
}

run_summary orchestrator::apply() {
  auto log = redlog::get_logger("gr4ft.orchestrator");
  log.dbg("applying instrumentation", redlog::field("operations", set_.size()));

  run_summary summary;
  summary.resolution_failures = set_.resolution_failures;
  for (operation_kind kind : apply_sequence) {
    if (stop_.load(std::memory_order_acquire)) {
      summary.cancelled = true;
    }
    if (summary.cancelled) {
      // still report every group so callers always see four counts
      summary.groups.push_back(group_report{kind, 0, 0, {}});
      continue;
    }
    summary.groups.push_back(apply_group(kind));
  }
  if (stop_.load(std::memory_order_acquire)) {
    summary.cancelled = true;
  }
  return summary;
}

run_summary orchestrator::revert() {
  auto log = redlog::get_logger("gr4ft.orchestrator");
  log.dbg("reverting instrumentation", redlog::field("operations", set_.size()));

  run_summary summary;
  summary.resolution_failures = set_.resolution_failures;
  for (operation_kind kind : revert_sequence) {
    if (stop_.load(std::memory_order_acquire)) {
      summary.cancelled = true;
    }
    if (summary.cancelled) {
      summary.groups.push_back(group_report{kind, 0, 0, {}});
      continue;
    }
    summary.groups.push_back(revert_group(kind));
  }
  if (stop_.load(std::memory_order_acquire)) {
    summary.cancelled = true;
  }
  return summary;
}

std::vector<status_report> orchestrator::status() const {
  std::vector<status_report> reports;
  for (operation_kind kind : k_declaration_order) {
    auto partition = check_batch(set_.group(kind).operations, make_batch_options());
    reports.push_back(status_report{kind, partition.applied.size(), partition.unapplied.size()});
  }
  return reports;
}

} // namespace gr4ft::engine
