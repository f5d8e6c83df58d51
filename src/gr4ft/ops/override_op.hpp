#pragma once

#include "engine/result.hpp"
#include "engine/types.hpp"
#include <filesystem>
#include <string>

namespace gr4ft::ops {

// replace the full contents of target
struct override_op {
  std::filesystem::path target;
  std::string content;

  bool operator==(const override_op&) const = default;

  const std::filesystem::path& target_path() const noexcept { return target; }
  std::string describe() const;

  engine::check_state check() const;
  engine::status apply() const;
  engine::status revert() const;
};

} // namespace gr4ft::ops
