#include "cakephp_detector.hpp"
#include "utils/file_utils.hpp"
#include "utils/string_utils.hpp"
#include <redlog.hpp>
#include <array>
#include <system_error>

namespace gr4ft::detect {

using engine::error_code;
using engine::error_result;
using engine::ok_result;
using engine::result;

namespace {

constexpr std::array<const char*, 2> k_framework_locations = {"vendor/cakephp/cakephp", "lib/Cake"};
constexpr const char* k_version_file = "VERSION.txt";

std::optional<std::filesystem::path> find_framework_dir(const std::filesystem::path& webroot_dir) {
  auto log = redlog::get_logger("gr4ft.detect");
  std::error_code ec;

  for (auto dir = webroot_dir; !dir.empty(); dir = dir.parent_path()) {
    for (const char* location : k_framework_locations) {
      auto candidate = dir / location;
      if (std::filesystem::is_regular_file(candidate / k_version_file, ec)) {
        log.dbg("found framework installation", redlog::field("path", candidate.string()));
        return candidate;
      }
    }
    if (dir == dir.parent_path()) {
      break;
    }
  }
  return std::nullopt;
}

std::filesystem::path find_app_dir(const std::filesystem::path& webroot_dir) {
  std::error_code ec;
  auto project_dir = webroot_dir.parent_path();
  auto src_dir = project_dir / "src";
  if (std::filesystem::is_directory(src_dir, ec)) {
    return src_dir;
  }
  return project_dir;
}

} // namespace

result<std::string> read_framework_version(const std::filesystem::path& framework_dir) {
  auto version_path = framework_dir / k_version_file;
  auto content = util::read_file(version_path);
  if (!content) {
    return error_result<std::string>(error_code::detection_error, "cannot read " + version_path.string());
  }

  std::string version;
  for (auto line : util::split_lines(*content)) {
    auto trimmed = util::trim_view(line);
    if (trimmed.empty() || trimmed.starts_with("//") || trimmed.starts_with('#')) {
      continue;
    }
    version = std::string(trimmed);
  }

  if (version.empty()) {
    return error_result<std::string>(error_code::detection_error, "no version in " + version_path.string());
  }
  return ok_result(version);
}

result<engine::target_context> detect_target(
    const std::filesystem::path& webroot_dir, const detection_overrides& overrides
) {
  auto log = redlog::get_logger("gr4ft.detect");

  std::error_code ec;
  auto webroot = std::filesystem::absolute(webroot_dir, ec);
  if (ec || !std::filesystem::is_directory(webroot, ec)) {
    return error_result<engine::target_context>(
        error_code::detection_error, "webroot is not a directory: " + webroot_dir.string()
    );
  }
  webroot = webroot.lexically_normal();
  if (!webroot.has_filename()) {
    webroot = webroot.parent_path();
  }

  std::filesystem::path framework_dir;
  if (overrides.framework_dir) {
    framework_dir = *overrides.framework_dir;
  } else {
    auto found = find_framework_dir(webroot);
    if (!found) {
      log.err("cakephp installation not found", redlog::field("webroot", webroot.string()));
      return error_result<engine::target_context>(
          error_code::detection_error, "cannot locate cakephp installation above " + webroot.string()
      );
    }
    framework_dir = *found;
  }

  std::string version;
  if (overrides.framework_version) {
    version = *overrides.framework_version;
  } else {
    auto read = read_framework_version(framework_dir);
    if (!read.ok()) {
      log.err("framework version unavailable", redlog::field("error", read.status.message));
      return error_result<engine::target_context>(read.status);
    }
    version = read.value;
  }

  auto app_dir = overrides.app_dir ? *overrides.app_dir : find_app_dir(webroot);

  auto context = engine::target_context::create(app_dir, framework_dir, webroot, version);
  if (!context.ok()) {
    log.err("target detection failed", redlog::field("error", context.status.message));
    return context;
  }

  log.inf(
      "target detected", redlog::field("version", context.value.version()),
      redlog::field("app", context.value.app_dir().string()),
      redlog::field("framework", context.value.framework_dir().string()),
      redlog::field("webroot", context.value.webroot_dir().string())
  );
  return context;
}

} // namespace gr4ft::detect
