#include "patch_op.hpp"
#include "mutation/unified_diff.hpp"
#include "utils/file_utils.hpp"
#include <redlog.hpp>

namespace gr4ft::ops {

using engine::check_state;
using engine::error_code;
using engine::make_status;
using engine::ok_status;
using engine::status;
using mutation::diff_direction;

namespace {

struct loaded_patch {
  mutation::unified_diff diff;
  std::string target_content;
};

engine::result<loaded_patch> load(const patch_op& op) {
  auto patch_text = util::read_file(op.patch_file);
  if (!patch_text) {
    return engine::error_result<loaded_patch>(
        error_code::mutation_error, "cannot read patch file " + op.patch_file.string()
    );
  }

  auto parsed = mutation::parse_unified_diff(*patch_text);
  if (!parsed.ok()) {
    return engine::error_result<loaded_patch>(
        error_code::mutation_error, op.patch_file.string() + ": " + parsed.status.message
    );
  }

  auto target_text = util::read_file(op.original_file);
  if (!target_text) {
    return engine::error_result<loaded_patch>(
        error_code::mutation_error, "cannot read patch target " + op.original_file.string()
    );
  }

  return engine::ok_result(loaded_patch{std::move(parsed.value), std::move(*target_text)});
}

status rewrite(const patch_op& op, diff_direction direction) {
  auto log = redlog::get_logger("gr4ft.ops.patch");

  auto loaded = load(op);
  if (!loaded.ok()) {
    return loaded.status;
  }

  auto patched = mutation::apply_unified_diff(loaded.value.target_content, loaded.value.diff, direction);
  if (!patched.ok()) {
    log.dbg(
        "patch rejected", redlog::field("patch", op.patch_file.string()),
        redlog::field("target", op.original_file.string()), redlog::field("reason", patched.status.message)
    );
    return make_status(error_code::mutation_error, op.original_file.string() + ": " + patched.status.message);
  }

  std::string error;
  if (!util::write_file_atomic(op.original_file, patched.value, error)) {
    return make_status(error_code::mutation_error, error);
  }

  log.dbg(
      direction == diff_direction::forward ? "patch applied" : "patch reverted",
      redlog::field("target", op.original_file.string()), redlog::field("hunks", loaded.value.diff.hunks.size())
  );
  return ok_status();
}

} // namespace

std::string patch_op::describe() const {
  return "patch " + original_file.string() + " with " + patch_file.filename().string();
}

check_state patch_op::check() const {
  auto loaded = load(*this);
  if (!loaded.ok()) {
    return check_state::not_applied;
  }
  const auto& content = loaded.value.target_content;
  auto reverse = mutation::fit_unified_diff(content, loaded.value.diff, diff_direction::reverse);
  if (!reverse.applies) {
    return check_state::not_applied;
  }
  auto forward = mutation::fit_unified_diff(content, loaded.value.diff, diff_direction::forward);
  if (!forward.applies) {
    return check_state::applied;
  }

  // both sides fit: zero-context hunks, or context that survives the patch.
  // the side that matched more pre-image lines wins, then the closer one
  if (reverse.matched_lines != forward.matched_lines) {
    return reverse.matched_lines > forward.matched_lines ? check_state::applied : check_state::not_applied;
  }
  return reverse.displacement < forward.displacement ? check_state::applied : check_state::not_applied;
}

status patch_op::apply() const { return rewrite(*this, diff_direction::forward); }

status patch_op::revert() const { return rewrite(*this, diff_direction::reverse); }

} // namespace gr4ft::ops
