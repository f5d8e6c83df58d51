#pragma once

#include "engine/result.hpp"
#include "engine/types.hpp"
#include <filesystem>
#include <string>

namespace gr4ft::ops {

// materialize destination from source
struct copy_op {
  std::filesystem::path source;
  std::filesystem::path destination;

  bool operator==(const copy_op&) const = default;

  const std::filesystem::path& target_path() const noexcept { return destination; }
  std::string describe() const;

  engine::check_state check() const;
  engine::status apply() const;
  engine::status revert() const;
};

} // namespace gr4ft::ops
