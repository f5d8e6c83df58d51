#include "target_context.hpp"
#include "utils/string_utils.hpp"
#include <redlog.hpp>
#include <charconv>
#include <system_error>

namespace gr4ft::engine {

namespace {

result<std::filesystem::path> canonical_root(const std::filesystem::path& path, std::string_view label) {
  if (path.empty()) {
    return error_result<std::filesystem::path>(error_code::detection_error, std::string(label) + " is empty");
  }

  std::error_code ec;
  if (!std::filesystem::is_directory(path, ec)) {
    return error_result<std::filesystem::path>(
        error_code::detection_error, std::string(label) + " is not a directory: " + path.string()
    );
  }

  auto canonical = std::filesystem::weakly_canonical(path, ec);
  if (ec) {
    return error_result<std::filesystem::path>(
        error_code::detection_error, "failed to canonicalize " + std::string(label) + ": " + ec.message()
    );
  }
  return ok_result(canonical);
}

} // namespace

result<int> parse_major_version(std::string_view version) {
  std::string_view trimmed = util::trim_view(version);
  std::string_view major = trimmed.substr(0, trimmed.find('.'));
  if (major.empty()) {
    return error_result<int>(error_code::detection_error, "empty framework version");
  }

  int value = 0;
  auto [ptr, ec] = std::from_chars(major.data(), major.data() + major.size(), value);
  if (ec != std::errc() || ptr != major.data() + major.size()) {
    return error_result<int>(
        error_code::detection_error, "malformed framework version: " + std::string(version)
    );
  }
  if (value <= 0) {
    return error_result<int>(
        error_code::detection_error, "framework major version must be positive: " + std::string(version)
    );
  }
  return ok_result(value);
}

result<target_context> target_context::create(
    const std::filesystem::path& app_dir, const std::filesystem::path& framework_dir,
    const std::filesystem::path& webroot_dir, std::string_view version
) {
  auto log = redlog::get_logger("gr4ft.target_context");

  auto major = parse_major_version(version);
  if (!major.ok()) {
    return error_result<target_context>(major.status);
  }

  auto app = canonical_root(app_dir, "application dir");
  if (!app.ok()) {
    return error_result<target_context>(app.status);
  }
  auto framework = canonical_root(framework_dir, "framework dir");
  if (!framework.ok()) {
    return error_result<target_context>(framework.status);
  }
  auto webroot = canonical_root(webroot_dir, "webroot dir");
  if (!webroot.ok()) {
    return error_result<target_context>(webroot.status);
  }

  if (app.value == framework.value || app.value == webroot.value || framework.value == webroot.value) {
    log.err(
        "target roots are not distinct", redlog::field("app", app.value.string()),
        redlog::field("framework", framework.value.string()), redlog::field("webroot", webroot.value.string())
    );
    return error_result<target_context>(error_code::detection_error, "target roots must be distinct");
  }

  target_context context;
  context.app_dir_ = std::move(app.value);
  context.framework_dir_ = std::move(framework.value);
  context.webroot_dir_ = std::move(webroot.value);
  context.version_ = std::string(util::trim_view(version));
  context.major_version_ = major.value;

  log.dbg(
      "target context resolved", redlog::field("version", context.version_),
      redlog::field("major", context.major_version_), redlog::field("app", context.app_dir_.string()),
      redlog::field("framework", context.framework_dir_.string()),
      redlog::field("webroot", context.webroot_dir_.string())
  );
  return ok_result(std::move(context));
}

const std::filesystem::path& target_context::root(root_kind kind) const noexcept {
  switch (kind) {
  case root_kind::application:
    return app_dir_;
  case root_kind::framework:
    return framework_dir_;
  case root_kind::webroot:
    return webroot_dir_;
  }
  return app_dir_;
}

} // namespace gr4ft::engine
