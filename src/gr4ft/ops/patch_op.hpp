#pragma once

#include "engine/result.hpp"
#include "engine/types.hpp"
#include <filesystem>
#include <string>

namespace gr4ft::ops {

// apply the unified diff in patch_file to original_file
struct patch_op {
  std::filesystem::path patch_file;
  std::filesystem::path original_file;

  bool operator==(const patch_op&) const = default;

  const std::filesystem::path& target_path() const noexcept { return original_file; }
  std::string describe() const;

  // applied when the patch reverses cleanly, i.e. its post-image is present
  engine::check_state check() const;
  engine::status apply() const;
  engine::status revert() const;
};

} // namespace gr4ft::ops
