#pragma once

#include "engine/result.hpp"
#include "engine/types.hpp"
#include <string>
#include <vector>

namespace gr4ft::engine {

// one operation that could not be resolved, applied or reverted
struct operation_failure {
  operation_kind kind = operation_kind::override_file;
  std::string operation;
  engine::status status;
};

// outcome of one group in an apply or revert pass
struct group_report {
  operation_kind kind = operation_kind::override_file;
  size_t processed = 0; // newly applied (apply) or newly reverted (revert)
  size_t skipped = 0;   // already in the desired state
  std::vector<operation_failure> failures;
};

// read-only view of one group
struct status_report {
  operation_kind kind = operation_kind::override_file;
  size_t applied = 0;
  size_t unapplied = 0;
};

struct run_summary {
  std::vector<group_report> groups; // in execution order
  std::vector<operation_failure> resolution_failures;
  bool cancelled = false;

  size_t failure_count() const noexcept {
    size_t count = resolution_failures.size();
    for (const auto& group : groups) {
      count += group.failures.size();
    }
    return count;
  }

  size_t processed_count() const noexcept {
    size_t count = 0;
    for (const auto& group : groups) {
      count += group.processed;
    }
    return count;
  }

  bool fully_succeeded() const noexcept { return !cancelled && failure_count() == 0; }

  const group_report* find(operation_kind kind) const noexcept {
    for (const auto& group : groups) {
      if (group.kind == kind) {
        return &group;
      }
    }
    return nullptr;
  }
};

} // namespace gr4ft::engine
