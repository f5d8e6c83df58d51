#pragma once

#include <array>
#include <cstddef>
#include <string_view>

namespace gr4ft::engine {

// the four instrumentation groups, in declaration order
enum class operation_kind { override_file, patch, copy, annotation_removal };

inline constexpr std::array<operation_kind, 4> k_declaration_order = {
    operation_kind::override_file, operation_kind::patch, operation_kind::copy, operation_kind::annotation_removal
};

// logical roots of the live tree
enum class root_kind { application, framework, webroot };

inline constexpr std::array<root_kind, 3> k_all_roots = {root_kind::application, root_kind::framework, root_kind::webroot};

enum class check_state { applied, not_applied };

constexpr std::size_t group_index(operation_kind kind) noexcept { return static_cast<std::size_t>(kind); }

constexpr std::string_view group_name(operation_kind kind) noexcept {
  switch (kind) {
  case operation_kind::override_file:
    return "overrides";
  case operation_kind::patch:
    return "patches";
  case operation_kind::copy:
    return "copies";
  case operation_kind::annotation_removal:
    return "annotations";
  }
  return "unknown";
}

// directory names of the version-scoped resource convention
constexpr std::string_view root_directory_name(root_kind kind) noexcept {
  switch (kind) {
  case root_kind::application:
    return "APP_DIR";
  case root_kind::framework:
    return "CAKEPHP_PATH";
  case root_kind::webroot:
    return "WEBROOT";
  }
  return "";
}

} // namespace gr4ft::engine
