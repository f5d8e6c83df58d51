#pragma once

#include "engine/report.hpp"
#include "engine/resource_resolver.hpp"
#include "ops/operation.hpp"
#include <array>
#include <vector>

namespace gr4ft::engine {

// operations listed explicitly in settings
struct declared_operations {
  std::vector<ops::override_op> overrides;
  std::vector<ops::patch_op> patches;
  std::vector<ops::copy_op> copies;
  std::vector<ops::annotation_removal_op> annotation_removals;
};

struct instrumentation_group {
  operation_kind kind = operation_kind::override_file;
  std::vector<ops::operation> operations;
};

// the four groups consumed by the orchestrator, indexed by group_index(kind)
struct instrumentation_set {
  std::array<instrumentation_group, 4> groups{};
  std::vector<operation_failure> resolution_failures;

  const instrumentation_group& group(operation_kind kind) const noexcept { return groups[group_index(kind)]; }
  size_t size() const noexcept;
};

// merge declared and discovered operations:
//   overrides           declared only
//   patches             declared, then discovered
//   copies              declared, then discovered
//   annotation removals declared only
// two operations of one group sharing a target path is a configuration_error
result<instrumentation_set> build_instrumentation_set(const declared_operations& declared, const discovery& discovered);

} // namespace gr4ft::engine
