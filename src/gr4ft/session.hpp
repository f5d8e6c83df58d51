#pragma once

#include "detect/cakephp_detector.hpp"
#include "engine/instrumentation_set.hpp"
#include "engine/orchestrator.hpp"
#include "engine/report.hpp"
#include "engine/result.hpp"
#include "engine/target_context.hpp"
#include <filesystem>
#include <memory>
#include <optional>
#include <vector>

namespace gr4ft {

struct session_options {
  std::filesystem::path webroot_dir;
  std::optional<std::filesystem::path> settings_path;
  std::optional<std::filesystem::path> patch_dir;
  detect::detection_overrides detection;
  // 0 picks GR4FT_WORKERS, then the hardware concurrency
  size_t workers = 0;
};

// one orchestration run: target detected, settings evaluated and resources resolved up front,
// then apply / revert / status on the resulting instrumentation set
class session {
public:
  // explicit options win over GR4FT_* environment variables, which win over detection
  static engine::result<std::unique_ptr<session>> open(const session_options& options);

  static std::unique_ptr<session> from_parts(
      engine::target_context context, engine::instrumentation_set set, engine::orchestrator_options options = {}
  );

  const engine::target_context& context() const noexcept { return context_; }
  const engine::instrumentation_set& instrumentation() const noexcept { return orchestrator_->set(); }

  engine::run_summary apply() { return orchestrator_->apply(); }
  engine::run_summary revert() { return orchestrator_->revert(); }
  std::vector<engine::status_report> status() const { return orchestrator_->status(); }

  void request_stop() noexcept { orchestrator_->request_stop(); }

private:
  session(engine::target_context context, std::unique_ptr<engine::orchestrator> orchestrator);

  engine::target_context context_;
  std::unique_ptr<engine::orchestrator> orchestrator_;
};

} // namespace gr4ft
