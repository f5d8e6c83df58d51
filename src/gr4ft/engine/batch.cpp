#include "batch.hpp"
#include <redlog.hpp>
#include <algorithm>
#include <optional>
#include <thread>

namespace gr4ft::engine {

namespace {

bool stop_requested(const batch_options& options) {
  return options.stop != nullptr && options.stop->load(std::memory_order_acquire);
}

batch_outcome run_mutations(
    const std::vector<ops::operation>& operations, const batch_options& options, bool reverting
) {
  auto log = redlog::get_logger("gr4ft.batch");

  std::vector<std::optional<status>> outcomes(operations.size());
  size_t started = fan_out(operations.size(), options, [&](size_t index) {
    const auto& op = operations[index];
    status result = reverting ? ops::revert(op) : ops::apply(op);
    if (!result.ok()) {
      log.warn(
          reverting ? "revert failed" : "apply failed", redlog::field("operation", ops::describe(op)),
          redlog::field("code", error_code_name(result.code)), redlog::field("error", result.message)
      );
    }
    outcomes[index] = std::move(result);
  });

  batch_outcome outcome;
  outcome.not_started = operations.size() - started;
  for (size_t index = 0; index < operations.size(); ++index) {
    if (!outcomes[index]) {
      continue;
    }
    if (outcomes[index]->ok()) {
      outcome.succeeded.push_back(operations[index]);
    } else {
      outcome.failures.push_back(
          operation_failure{ops::kind_of(operations[index]), ops::describe(operations[index]), *outcomes[index]}
      );
    }
  }
  return outcome;
}

} // namespace

size_t fan_out(size_t count, const batch_options& options, const std::function<void(size_t)>& task) {
  std::atomic<size_t> next{0};
  std::atomic<size_t> started{0};

  auto worker = [&]() {
    while (!stop_requested(options)) {
      size_t index = next.fetch_add(1, std::memory_order_relaxed);
      if (index >= count) {
        return;
      }
      started.fetch_add(1, std::memory_order_relaxed);
      task(index);
    }
  };

  size_t workers = std::min(std::max<size_t>(options.workers, 1), count);
  if (workers <= 1) {
    worker();
    return started.load();
  }

  std::vector<std::thread> threads;
  threads.reserve(workers);
  for (size_t i = 0; i < workers; ++i) {
    threads.emplace_back(worker);
  }
  for (auto& thread : threads) {
    thread.join();
  }
  return started.load();
}

check_partition check_batch(const std::vector<ops::operation>& operations, const batch_options& options) {
  std::vector<check_state> states(operations.size(), check_state::not_applied);
  batch_options unstoppable = options;
  // a partition must cover the whole group; checks are read-only so they always run
  unstoppable.stop = nullptr;
  fan_out(operations.size(), unstoppable, [&](size_t index) { states[index] = ops::check(operations[index]); });

  check_partition partition;
  for (size_t index = 0; index < operations.size(); ++index) {
    if (states[index] == check_state::applied) {
      partition.applied.push_back(operations[index]);
    } else {
      partition.unapplied.push_back(operations[index]);
    }
  }
  return partition;
}

batch_outcome apply_batch(const std::vector<ops::operation>& operations, const batch_options& options) {
  return run_mutations(operations, options, false);
}

batch_outcome revert_batch(const std::vector<ops::operation>& operations, const batch_options& options) {
  return run_mutations(operations, options, true);
}

} // namespace gr4ft::engine
