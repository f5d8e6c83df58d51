#include "unified_diff.hpp"
#include "utils/string_utils.hpp"
#include <redlog.hpp>
#include <algorithm>
#include <charconv>
#include <optional>

namespace gr4ft::mutation {

using engine::error_code;
using engine::error_result;
using engine::ok_result;
using engine::result;

namespace {

struct file_lines {
  std::vector<std::string> lines;
  bool trailing_newline = true;
};

file_lines split_file(std::string_view text) {
  file_lines out;
  for (auto line : util::split_lines(text)) {
    out.lines.emplace_back(line);
  }
  out.trailing_newline = text.empty() || text.back() == '\n';
  return out;
}

std::string join_file(const file_lines& file) {
  std::string out;
  for (size_t i = 0; i < file.lines.size(); ++i) {
    out += file.lines[i];
    if (i + 1 < file.lines.size() || file.trailing_newline) {
      out += '\n';
    }
  }
  return out;
}

std::optional<size_t> parse_number(std::string_view text) {
  size_t value = 0;
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec != std::errc() || ptr != text.data() + text.size()) {
    return std::nullopt;
  }
  return value;
}

// "12,3" or "12" (count defaults to 1)
bool parse_range(std::string_view text, size_t& start, size_t& count) {
  auto comma = text.find(',');
  auto parsed_start = parse_number(text.substr(0, comma));
  if (!parsed_start) {
    return false;
  }
  start = *parsed_start;
  count = 1;
  if (comma != std::string_view::npos) {
    auto parsed_count = parse_number(text.substr(comma + 1));
    if (!parsed_count) {
      return false;
    }
    count = *parsed_count;
  }
  return true;
}

// "@@ -a,b +c,d @@ optional section"
bool parse_hunk_header(std::string_view line, diff_hunk& hunk) {
  if (!line.starts_with("@@ -")) {
    return false;
  }
  auto rest = line.substr(4);
  auto space = rest.find(' ');
  if (space == std::string_view::npos) {
    return false;
  }
  auto old_range = rest.substr(0, space);
  rest = rest.substr(space + 1);
  if (!rest.starts_with('+')) {
    return false;
  }
  rest = rest.substr(1);
  space = rest.find(' ');
  if (space == std::string_view::npos) {
    return false;
  }
  auto new_range = rest.substr(0, space);
  if (!rest.substr(space).starts_with(" @@")) {
    return false;
  }
  return parse_range(old_range, hunk.old_start, hunk.old_count) &&
         parse_range(new_range, hunk.new_start, hunk.new_count);
}

bool hunk_complete(const diff_hunk& hunk, size_t old_seen, size_t new_seen) {
  return old_seen == hunk.old_count && new_seen == hunk.new_count;
}

struct hunk_view {
  std::vector<const std::string*> before;
  std::vector<const std::string*> after;
  size_t start = 0;
  size_t count = 0;
  bool after_missing_newline = false;
};

hunk_view view_hunk(const diff_hunk& hunk, diff_direction direction) {
  char removed = direction == diff_direction::forward ? '-' : '+';
  char added = direction == diff_direction::forward ? '+' : '-';

  hunk_view view;
  for (const auto& line : hunk.lines) {
    if (line.tag == ' ' || line.tag == removed) {
      view.before.push_back(&line.text);
    }
    if (line.tag == ' ' || line.tag == added) {
      view.after.push_back(&line.text);
    }
  }
  view.start = direction == diff_direction::forward ? hunk.old_start : hunk.new_start;
  view.count = direction == diff_direction::forward ? hunk.old_count : hunk.new_count;
  view.after_missing_newline =
      direction == diff_direction::forward ? hunk.new_missing_newline : hunk.old_missing_newline;
  return view;
}

bool matches_at(const file_lines& file, const hunk_view& view, size_t pos) {
  if (pos + view.before.size() > file.lines.size()) {
    return false;
  }
  for (size_t i = 0; i < view.before.size(); ++i) {
    if (file.lines[pos + i] != *view.before[i]) {
      return false;
    }
  }
  return true;
}

// search outward from expected within [floor, last possible start]
std::optional<size_t> locate_hunk(const file_lines& file, const hunk_view& view, size_t floor, size_t expected) {
  if (view.before.size() > file.lines.size()) {
    return std::nullopt;
  }
  size_t last = file.lines.size() - view.before.size();
  if (floor > last) {
    return std::nullopt;
  }
  expected = std::clamp(expected, floor, last);

  for (size_t distance = 0;; ++distance) {
    bool in_range = false;
    if (expected >= floor + distance) {
      in_range = true;
      if (matches_at(file, view, expected - distance)) {
        return expected - distance;
      }
    }
    if (distance > 0 && expected + distance <= last) {
      in_range = true;
      if (matches_at(file, view, expected + distance)) {
        return expected + distance;
      }
    }
    if (!in_range) {
      return std::nullopt;
    }
  }
}

struct placement {
  std::vector<size_t> positions;
  size_t displacement = 0;
  size_t matched_lines = 0;
};

// find every hunk in order. a hunk with an empty pre-image carries no lines to
// match, so it is only accepted at its stated position
result<placement> place_hunks(const file_lines& input, const unified_diff& diff, diff_direction direction) {
  placement out;
  size_t cursor = 0;
  long long drift = 0;

  for (size_t index = 0; index < diff.hunks.size(); ++index) {
    auto view = view_hunk(diff.hunks[index], direction);

    // a zero-length side names the line after which the change goes
    long long stated = view.count == 0 ? static_cast<long long>(view.start)
                                       : static_cast<long long>(view.start) - 1;
    size_t expected = static_cast<size_t>(std::max<long long>(0, stated + drift));

    std::optional<size_t> position;
    if (view.before.empty()) {
      if (expected >= cursor && expected <= input.lines.size()) {
        position = expected;
      }
    } else {
      position = locate_hunk(input, view, cursor, expected);
    }
    if (!position) {
      return error_result<placement>(
          error_code::context_mismatch, "hunk " + std::to_string(index + 1) + " does not match target content"
      );
    }

    out.displacement += *position > expected ? *position - expected : expected - *position;
    drift = static_cast<long long>(*position) - stated;
    out.matched_lines += view.before.size();
    out.positions.push_back(*position);
    cursor = *position + view.before.size();
  }
  return ok_result(std::move(out));
}

} // namespace

result<unified_diff> parse_unified_diff(std::string_view text) {
  unified_diff diff;
  std::optional<diff_hunk> current;
  size_t old_seen = 0;
  size_t new_seen = 0;
  char last_tag = ' ';
  size_t line_number = 0;

  auto finish_hunk = [&]() -> bool {
    if (!current) {
      return true;
    }
    if (!hunk_complete(*current, old_seen, new_seen)) {
      return false;
    }
    diff.hunks.push_back(std::move(*current));
    current.reset();
    return true;
  };

  for (auto raw : util::split_lines(text)) {
    ++line_number;
    std::string_view line = raw;

    if (current && !hunk_complete(*current, old_seen, new_seen)) {
      if (line.empty()) {
        // some tools strip the single space of blank context lines
        current->lines.push_back(diff_line{' ', std::string()});
        ++old_seen;
        ++new_seen;
        last_tag = ' ';
        continue;
      }
      char tag = line.front();
      if (tag == ' ' || tag == '-' || tag == '+') {
        current->lines.push_back(diff_line{tag, std::string(line.substr(1))});
        if (tag != '+') {
          ++old_seen;
        }
        if (tag != '-') {
          ++new_seen;
        }
        last_tag = tag;
        continue;
      }
      if (tag != '\\') {
        return error_result<unified_diff>(
            error_code::invalid_argument, "truncated hunk before line " + std::to_string(line_number)
        );
      }
    }

    if (line.starts_with('\\')) {
      if (!current) {
        return error_result<unified_diff>(
            error_code::invalid_argument, "newline marker outside hunk at line " + std::to_string(line_number)
        );
      }
      if (last_tag != '+') {
        current->old_missing_newline = true;
      }
      if (last_tag != '-') {
        current->new_missing_newline = true;
      }
      continue;
    }

    if (line.starts_with("@@")) {
      if (!finish_hunk()) {
        return error_result<unified_diff>(
            error_code::invalid_argument, "hunk line counts do not match header before line " +
                                              std::to_string(line_number)
        );
      }
      diff_hunk hunk;
      if (!parse_hunk_header(line, hunk)) {
        return error_result<unified_diff>(
            error_code::invalid_argument, "malformed hunk header at line " + std::to_string(line_number)
        );
      }
      current = std::move(hunk);
      old_seen = 0;
      new_seen = 0;
      last_tag = ' ';
      continue;
    }

    // headers (diff, index, ---, +++) and trailing garbage between hunks
    if (!finish_hunk()) {
      return error_result<unified_diff>(
          error_code::invalid_argument, "hunk line counts do not match header at line " + std::to_string(line_number)
      );
    }
  }

  if (!finish_hunk()) {
    return error_result<unified_diff>(error_code::invalid_argument, "truncated final hunk");
  }
  if (diff.empty()) {
    return error_result<unified_diff>(error_code::invalid_argument, "patch contains no hunks");
  }
  return ok_result(std::move(diff));
}

result<std::string> apply_unified_diff(std::string_view original, const unified_diff& diff, diff_direction direction) {
  auto log = redlog::get_logger("gr4ft.unified_diff");

  file_lines input = split_file(original);
  auto placed = place_hunks(input, diff, direction);
  if (!placed.ok()) {
    log.trc("diff does not match", redlog::field("reason", placed.status.message));
    return error_result<std::string>(placed.status);
  }

  file_lines output;
  output.trailing_newline = input.trailing_newline;
  size_t cursor = 0;

  for (size_t index = 0; index < diff.hunks.size(); ++index) {
    auto view = view_hunk(diff.hunks[index], direction);
    size_t position = placed.value.positions[index];

    for (size_t i = cursor; i < position; ++i) {
      output.lines.push_back(input.lines[i]);
    }
    for (const auto* line : view.after) {
      output.lines.push_back(*line);
    }
    cursor = position + view.before.size();

    if (cursor == input.lines.size()) {
      output.trailing_newline = !view.after_missing_newline;
    }
  }

  for (size_t i = cursor; i < input.lines.size(); ++i) {
    output.lines.push_back(input.lines[i]);
  }
  return ok_result(join_file(output));
}

diff_fit fit_unified_diff(std::string_view original, const unified_diff& diff, diff_direction direction) {
  auto placed = place_hunks(split_file(original), diff, direction);
  if (!placed.ok()) {
    return diff_fit{};
  }
  return diff_fit{true, placed.value.displacement, placed.value.matched_lines};
}

} // namespace gr4ft::mutation
