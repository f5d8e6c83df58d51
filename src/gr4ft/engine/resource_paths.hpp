#pragma once

#include "engine/result.hpp"
#include "engine/target_context.hpp"
#include "engine/types.hpp"
#include <filesystem>
#include <string_view>
#include <vector>

namespace gr4ft::engine {

inline constexpr std::string_view k_framework_resource_dir = "cakephp";
inline constexpr std::string_view k_patch_suffix = ".patch";
inline constexpr std::string_view k_script_suffix = ".php";

// <base>/cakephp/<major>/<APP_DIR|CAKEPHP_PATH|WEBROOT>
std::filesystem::path resource_root(const std::filesystem::path& base_dir, int major_version, root_kind root);

// regular files under the resource root whose name ends in suffix, relative to that root,
// sorted. a missing root yields an empty list
result<std::vector<std::filesystem::path>> list_resources(
    const std::filesystem::path& base_dir, int major_version, root_kind root, std::string_view suffix
);

// map a resource-relative path onto the live root it belongs to. strip_suffix removes a trailing
// ".patch" from the last segment. paths that would leave the root are rejected
result<std::filesystem::path> resolve_target_path(
    const std::filesystem::path& relative, root_kind root, const target_context& context, bool strip_suffix
);

} // namespace gr4ft::engine
