#include "session.hpp"
#include "engine/resource_resolver.hpp"
#include "settings/settings.hpp"
#include "utils/env_config.hpp"
#include <redlog.hpp>
#include <algorithm>
#include <thread>

namespace gr4ft {

using engine::error_result;

session::session(engine::target_context context, std::unique_ptr<engine::orchestrator> orchestrator)
    : context_(std::move(context)), orchestrator_(std::move(orchestrator)) {}

std::unique_ptr<session> session::from_parts(
    engine::target_context context, engine::instrumentation_set set, engine::orchestrator_options options
) {
  auto orchestrator = std::make_unique<engine::orchestrator>(std::move(set), options);
  return std::unique_ptr<session>(new session(std::move(context), std::move(orchestrator)));
}

engine::result<std::unique_ptr<session>> session::open(const session_options& options) {
  auto log = redlog::get_logger("gr4ft.session");
  util::env_config env("GR4FT");

  auto detection = options.detection;
  if (!detection.framework_version && env.has("FRAMEWORK_VERSION")) {
    detection.framework_version = env.get<std::string>("FRAMEWORK_VERSION", "");
  }

  auto context = detect::detect_target(options.webroot_dir, detection);
  if (!context.ok()) {
    return error_result<std::unique_ptr<session>>(context.status);
  }

  settings::instrumentation_settings loaded;
  auto settings_path = options.settings_path;
  if (!settings_path && env.has("SETTINGS")) {
    settings_path = env.get<std::string>("SETTINGS", "");
  }
  if (settings_path) {
    auto evaluated = settings::load_settings(*settings_path, context.value);
    if (!evaluated.ok()) {
      return error_result<std::unique_ptr<session>>(evaluated.status);
    }
    loaded = std::move(evaluated.value);
  } else {
    log.dbg("no settings script, using discovered resources only");
  }

  std::filesystem::path patch_dir = loaded.patch_dir;
  if (options.patch_dir) {
    patch_dir = *options.patch_dir;
  } else if (env.has("PATCH_DIR")) {
    patch_dir = env.get<std::string>("PATCH_DIR", "");
  }

  engine::resource_resolver resolver(context.value, patch_dir);
  auto set = engine::build_instrumentation_set(loaded.declared, resolver.discover());
  if (!set.ok()) {
    return error_result<std::unique_ptr<session>>(set.status);
  }

  engine::orchestrator_options orchestration;
  orchestration.workers = options.workers;
  if (orchestration.workers == 0) {
    size_t hardware = std::max<size_t>(std::thread::hardware_concurrency(), 1);
    orchestration.workers = std::max<size_t>(env.get<size_t>("WORKERS", hardware), 1);
  }

  log.inf(
      "session ready", redlog::field("operations", set.value.size()), redlog::field("workers", orchestration.workers),
      redlog::field("rejected", set.value.resolution_failures.size())
  );
  return engine::ok_result(from_parts(std::move(context.value), std::move(set.value), orchestration));
}

} // namespace gr4ft
