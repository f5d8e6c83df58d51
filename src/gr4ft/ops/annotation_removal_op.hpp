#pragma once

#include "engine/result.hpp"
#include "engine/types.hpp"
#include <filesystem>
#include <string>
#include <string_view>

namespace gr4ft::ops {

// php attribute markers such as #[\ReturnTypeWillChange] or #[Route('/x')]
inline constexpr std::string_view k_default_annotation_pattern = R"(#\[[^\]\n]*\])";

// strip every match of annotation_pattern (ecmascript regex) from target.
// custom patterns are matched per line, newline included, and lines over 8 KiB are rejected
struct annotation_removal_op {
  std::filesystem::path target;
  std::string annotation_pattern{k_default_annotation_pattern};

  bool operator==(const annotation_removal_op&) const = default;

  const std::filesystem::path& target_path() const noexcept { return target; }
  std::string describe() const;

  engine::check_state check() const;
  engine::status apply() const;
  engine::status revert() const;
};

} // namespace gr4ft::ops
