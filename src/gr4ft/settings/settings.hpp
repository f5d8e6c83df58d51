#pragma once

#include "engine/instrumentation_set.hpp"
#include "engine/result.hpp"
#include "engine/target_context.hpp"
#include <filesystem>
#include <string>

namespace gr4ft::settings {

// what an instrumentation settings script declares
struct instrumentation_settings {
  std::filesystem::path patch_dir;
  engine::declared_operations declared;
};

// evaluate a settings script against a resolved target.
// the script sees the target as a read-only table `target` and sets the globals
// patch_dir, overrides, patches, copies and remove_annotations
engine::result<instrumentation_settings> load_settings(
    const std::filesystem::path& script_path, const engine::target_context& context
);

engine::result<instrumentation_settings> load_settings_source(
    const std::string& source, const std::filesystem::path& script_dir, const engine::target_context& context
);

} // namespace gr4ft::settings
