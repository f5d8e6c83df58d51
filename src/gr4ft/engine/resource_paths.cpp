#include "resource_paths.hpp"
#include <redlog.hpp>
#include <algorithm>
#include <system_error>

namespace gr4ft::engine {

namespace {

bool escapes_root(const std::filesystem::path& normalized) {
  for (const auto& segment : normalized) {
    if (segment == "..") {
      return true;
    }
  }
  return false;
}

} // namespace

std::filesystem::path resource_root(const std::filesystem::path& base_dir, int major_version, root_kind root) {
  return base_dir / std::string(k_framework_resource_dir) / std::to_string(major_version) /
         std::string(root_directory_name(root));
}

result<std::vector<std::filesystem::path>> list_resources(
    const std::filesystem::path& base_dir, int major_version, root_kind root, std::string_view suffix
) {
  auto log = redlog::get_logger("gr4ft.resource_paths");
  auto root_dir = resource_root(base_dir, major_version, root);

  std::error_code ec;
  if (!std::filesystem::is_directory(root_dir, ec)) {
    log.trc("resource root absent", redlog::field("root", root_dir.string()));
    return ok_result(std::vector<std::filesystem::path>{});
  }

  std::vector<std::filesystem::path> found;
  std::filesystem::recursive_directory_iterator it(root_dir, ec);
  if (ec) {
    return error_result<std::vector<std::filesystem::path>>(
        error_code::io_error, "cannot walk " + root_dir.string() + ": " + ec.message()
    );
  }

  for (std::filesystem::recursive_directory_iterator end; it != end; it.increment(ec)) {
    if (ec) {
      return error_result<std::vector<std::filesystem::path>>(
          error_code::io_error, "cannot walk " + root_dir.string() + ": " + ec.message()
      );
    }
    std::error_code entry_ec;
    if (!it->is_regular_file(entry_ec)) {
      continue;
    }
    auto name = it->path().filename().string();
    if (name.size() <= suffix.size() || !name.ends_with(suffix)) {
      continue;
    }
    found.push_back(it->path().lexically_relative(root_dir));
  }
  if (ec) {
    return error_result<std::vector<std::filesystem::path>>(
        error_code::io_error, "cannot walk " + root_dir.string() + ": " + ec.message()
    );
  }

  std::sort(found.begin(), found.end());
  return ok_result(std::move(found));
}

result<std::filesystem::path> resolve_target_path(
    const std::filesystem::path& relative, root_kind root, const target_context& context, bool strip_suffix
) {
  if (relative.empty() || relative.has_root_name() || relative.has_root_directory()) {
    return error_result<std::filesystem::path>(
        error_code::resolution_error, "resource path must be relative: " + relative.string()
    );
  }

  std::filesystem::path adjusted = relative;
  if (strip_suffix) {
    auto name = adjusted.filename().string();
    if (name.size() <= k_patch_suffix.size() || !name.ends_with(k_patch_suffix)) {
      return error_result<std::filesystem::path>(
          error_code::resolution_error, "patch resource lacks " + std::string(k_patch_suffix) + ": " + relative.string()
      );
    }
    adjusted.replace_filename(name.substr(0, name.size() - k_patch_suffix.size()));
  }

  auto normalized = adjusted.lexically_normal();
  if (normalized.empty() || normalized == "." || escapes_root(normalized)) {
    return error_result<std::filesystem::path>(
        error_code::resolution_error, "resource path escapes its root: " + relative.string()
    );
  }

  auto resolved = (context.root(root) / normalized).lexically_normal();
  auto inside = resolved.lexically_relative(context.root(root));
  if (inside.empty() || escapes_root(inside)) {
    return error_result<std::filesystem::path>(
        error_code::resolution_error, "resource path escapes its root: " + relative.string()
    );
  }
  return ok_result(std::move(resolved));
}

} // namespace gr4ft::engine
