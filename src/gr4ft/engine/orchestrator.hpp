#pragma once

#include "engine/batch.hpp"
#include "engine/instrumentation_set.hpp"
#include "engine/report.hpp"
#include <array>
#include <atomic>
#include <vector>

namespace gr4ft::engine {

struct orchestrator_options {
  size_t workers = 1;
};

// drives check/apply/revert across the four groups.
// groups run strictly one after another; operations inside a group fan out across workers
class orchestrator {
public:
  // later groups may depend on files earlier groups produced
  static constexpr std::array<operation_kind, 4> apply_sequence = {
      operation_kind::override_file, operation_kind::patch, operation_kind::copy, operation_kind::annotation_removal
  };
  static constexpr std::array<operation_kind, 4> revert_sequence = {
      operation_kind::annotation_removal, operation_kind::override_file, operation_kind::patch, operation_kind::copy
  };

  explicit orchestrator(instrumentation_set set, orchestrator_options options = {});

  // apply every operation whose check reports not_applied
  run_summary apply();
  // revert every operation whose check reports applied
  run_summary revert();
  // applied / unapplied counts per group in declaration order, without mutating anything
  std::vector<status_report> status() const;

  // stop starting new operations; in-flight ones complete
  void request_stop() noexcept { stop_.store(true, std::memory_order_release); }

  const instrumentation_set& set() const noexcept { return set_; }

private:
  instrumentation_set set_;
  orchestrator_options options_;
  std::atomic<bool> stop_{false};

  batch_options make_batch_options() const;
  group_report apply_group(operation_kind kind) const;
  group_report revert_group(operation_kind kind) const;
};

} // namespace gr4ft::engine
