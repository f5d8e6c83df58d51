#pragma once

#include "engine/result.hpp"
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace gr4ft::mutation {

struct diff_line {
  char tag = ' '; // ' ' context, '-' removed, '+' added
  std::string text;
};

struct diff_hunk {
  size_t old_start = 0;
  size_t old_count = 0;
  size_t new_start = 0;
  size_t new_count = 0;
  std::vector<diff_line> lines;
  // "\ No newline at end of file" markers, per side
  bool old_missing_newline = false;
  bool new_missing_newline = false;
};

struct unified_diff {
  std::vector<diff_hunk> hunks;

  bool empty() const noexcept { return hunks.empty(); }
};

enum class diff_direction { forward, reverse };

// parse the hunks of a single-file unified diff; file headers are ignored
engine::result<unified_diff> parse_unified_diff(std::string_view text);

// how a diff lines up against some content in one direction
struct diff_fit {
  bool applies = false;
  size_t displacement = 0;  // total lines between stated and matched positions
  size_t matched_lines = 0; // pre-image lines that had to match
};

// apply every hunk to original or fail with context_mismatch without partial output.
// a hunk is tried at its stated line first, then at the nearest offset that matches.
// hunks with an empty pre-image (zero-context insertions) only go at their stated line
engine::result<std::string> apply_unified_diff(
    std::string_view original, const unified_diff& diff, diff_direction direction
);

diff_fit fit_unified_diff(std::string_view original, const unified_diff& diff, diff_direction direction);

} // namespace gr4ft::mutation
