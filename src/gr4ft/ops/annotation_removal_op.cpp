#include "annotation_removal_op.hpp"
#include "mutation/provenance.hpp"
#include "utils/file_utils.hpp"
#include <redlog.hpp>
#include <iterator>
#include <regex>

namespace gr4ft::ops {

using engine::check_state;
using engine::error_code;
using engine::make_status;
using engine::ok_status;
using engine::status;

namespace {

constexpr std::string_view k_layer = engine::group_name(engine::operation_kind::annotation_removal);

// std::regex recurses per character, so custom patterns only see one line at a time
constexpr size_t k_max_pattern_line = 8 * 1024;

struct stripped_text {
  std::string text;
  size_t removed = 0;
};

engine::result<std::regex> compile(const std::string& pattern) {
  try {
    return engine::ok_result(std::regex(pattern, std::regex::ECMAScript));
  } catch (const std::regex_error& e) {
    return engine::error_result<std::regex>(
        error_code::configuration_error, "invalid annotation pattern '" + pattern + "': " + e.what()
    );
  }
}

// "#[" up to the first "]" on the same line, the default pattern without a regex
stripped_text strip_attributes(std::string_view content) {
  stripped_text out;
  out.text.reserve(content.size());
  size_t copied = 0;
  size_t search = 0;

  for (;;) {
    auto open = content.find("#[", search);
    if (open == std::string_view::npos) {
      break;
    }
    auto close = content.find_first_of("]\n", open + 2);
    if (close == std::string_view::npos) {
      break;
    }
    search = close + 1;
    if (content[close] == '\n') {
      continue;
    }
    out.text.append(content.substr(copied, open - copied));
    copied = close + 1;
    ++out.removed;
  }

  out.text.append(content.substr(copied));
  return out;
}

// a line keeps its newline so a pattern may remove it along with the match
engine::result<stripped_text> strip_matches(std::string_view content, const std::regex& regex) {
  stripped_text out;
  out.text.reserve(content.size());

  size_t start = 0;
  while (start < content.size()) {
    auto newline = content.find('\n', start);
    size_t stop = newline == std::string_view::npos ? content.size() : newline + 1;
    if (stop - start > k_max_pattern_line) {
      return engine::error_result<stripped_text>(
          error_code::mutation_error, "line of " + std::to_string(stop - start) +
                                          " bytes is too long for a custom annotation pattern"
      );
    }

    std::string line(content.substr(start, stop - start));
    auto begin = std::sregex_iterator(line.begin(), line.end(), regex);
    out.removed += static_cast<size_t>(std::distance(begin, std::sregex_iterator()));
    out.text += std::regex_replace(line, regex, "");
    start = stop;
  }
  return engine::ok_result(std::move(out));
}

engine::result<stripped_text> strip(const annotation_removal_op& op, std::string_view content) {
  if (op.annotation_pattern == k_default_annotation_pattern) {
    return engine::ok_result(strip_attributes(content));
  }
  auto regex = compile(op.annotation_pattern);
  if (!regex.ok()) {
    return engine::error_result<stripped_text>(regex.status);
  }
  return strip_matches(content, regex.value);
}

} // namespace

std::string annotation_removal_op::describe() const {
  return "remove annotations /" + annotation_pattern + "/ from " + target.string();
}

check_state annotation_removal_op::check() const {
  if (mutation::recorded_provenance(target, k_layer) != mutation::provenance::original_file) {
    return check_state::not_applied;
  }
  auto content = util::read_file(target);
  if (!content) {
    return check_state::not_applied;
  }
  auto stripped = strip(*this, *content);
  if (!stripped.ok() || stripped.value.removed != 0) {
    return check_state::not_applied;
  }
  return check_state::applied;
}

status annotation_removal_op::apply() const {
  auto log = redlog::get_logger("gr4ft.ops.annotation_removal");

  auto content = util::read_file(target);
  if (!content) {
    return make_status(error_code::mutation_error, "cannot read annotation target " + target.string());
  }

  auto stripped = strip(*this, *content);
  if (!stripped.ok()) {
    return make_status(stripped.status.code, target.string() + ": " + stripped.status.message);
  }

  auto recorded = mutation::record_original(target, k_layer);
  if (!recorded.ok()) {
    return recorded.status;
  }

  std::string error;
  if (!util::write_file_atomic(target, stripped.value.text, error)) {
    if (recorded.value) {
      mutation::forget_original(target, k_layer);
    }
    return make_status(error_code::mutation_error, error);
  }

  log.dbg("annotations removed", redlog::field("target", target.string()), redlog::field("count", stripped.value.removed));
  return ok_status();
}

status annotation_removal_op::revert() const {
  auto restored = mutation::restore_original(target, k_layer);
  if (!restored.ok()) {
    return restored;
  }
  redlog::get_logger("gr4ft.ops.annotation_removal")
      .dbg("annotations restored", redlog::field("target", target.string()));
  return ok_status();
}

} // namespace gr4ft::ops
