#pragma once

#include "engine/report.hpp"
#include "ops/operation.hpp"
#include <atomic>
#include <cstddef>
#include <functional>
#include <vector>

namespace gr4ft::engine {

struct batch_options {
  size_t workers = 1;
  // when set and raised, no further operations are started; in-flight ones finish
  const std::atomic<bool>* stop = nullptr;
};

// run task(i) for i in [0, count) across up to options.workers threads and join before returning.
// returns the number of tasks that were started
size_t fan_out(size_t count, const batch_options& options, const std::function<void(size_t)>& task);

// partition of a group by its current check state, order preserved
struct check_partition {
  std::vector<ops::operation> applied;
  std::vector<ops::operation> unapplied;
};

struct batch_outcome {
  std::vector<ops::operation> succeeded;
  std::vector<operation_failure> failures;
  size_t not_started = 0;
};

check_partition check_batch(const std::vector<ops::operation>& operations, const batch_options& options);

// individual failures are collected, never abort the batch
batch_outcome apply_batch(const std::vector<ops::operation>& operations, const batch_options& options);
batch_outcome revert_batch(const std::vector<ops::operation>& operations, const batch_options& options);

} // namespace gr4ft::engine
