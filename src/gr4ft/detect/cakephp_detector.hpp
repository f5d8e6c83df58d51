#pragma once

#include "engine/result.hpp"
#include "engine/target_context.hpp"
#include <filesystem>
#include <optional>
#include <string>

namespace gr4ft::detect {

// explicit values that take precedence over filesystem detection
struct detection_overrides {
  std::optional<std::filesystem::path> app_dir;
  std::optional<std::filesystem::path> framework_dir;
  std::optional<std::string> framework_version;
};

// locate the cakephp installation serving webroot_dir:
//   framework dir  vendor/cakephp/cakephp (3.x and later) or lib/Cake (1.x, 2.x), searched upward
//   version        last non-comment line of <framework>/VERSION.txt
//   app dir        <webroot>/../src when present, else <webroot>/..
engine::result<engine::target_context> detect_target(
    const std::filesystem::path& webroot_dir, const detection_overrides& overrides = {}
);

// read the version string from a framework installation
engine::result<std::string> read_framework_version(const std::filesystem::path& framework_dir);

} // namespace gr4ft::detect
