#pragma once

#include "ops/annotation_removal_op.hpp"
#include "ops/copy_op.hpp"
#include "ops/override_op.hpp"
#include "ops/patch_op.hpp"
#include <concepts>
#include <filesystem>
#include <string>
#include <variant>

namespace gr4ft::ops {

// capability shared by every instrumentation operation.
// check never mutates; apply only runs after check reported not_applied, revert only after applied
template <typename T>
concept instrumentation = requires(const T& op) {
  { op.target_path() } -> std::convertible_to<const std::filesystem::path&>;
  { op.describe() } -> std::convertible_to<std::string>;
  { op.check() } -> std::same_as<engine::check_state>;
  { op.apply() } -> std::same_as<engine::status>;
  { op.revert() } -> std::same_as<engine::status>;
};

static_assert(instrumentation<override_op>);
static_assert(instrumentation<patch_op>);
static_assert(instrumentation<copy_op>);
static_assert(instrumentation<annotation_removal_op>);

// alternative order matches engine::operation_kind
using operation = std::variant<override_op, patch_op, copy_op, annotation_removal_op>;

inline engine::operation_kind kind_of(const operation& op) noexcept {
  return static_cast<engine::operation_kind>(op.index());
}

inline const std::filesystem::path& target_path(const operation& op) {
  return std::visit([](const auto& held) -> const std::filesystem::path& { return held.target_path(); }, op);
}

inline std::string describe(const operation& op) {
  return std::visit([](const auto& held) { return held.describe(); }, op);
}

inline engine::check_state check(const operation& op) {
  return std::visit([](const auto& held) { return held.check(); }, op);
}

inline engine::status apply(const operation& op) {
  return std::visit([](const auto& held) { return held.apply(); }, op);
}

inline engine::status revert(const operation& op) {
  return std::visit([](const auto& held) { return held.revert(); }, op);
}

} // namespace gr4ft::ops
