#include "override_op.hpp"
#include "mutation/provenance.hpp"
#include "utils/file_utils.hpp"
#include <redlog.hpp>

namespace gr4ft::ops {

using engine::check_state;
using engine::error_code;
using engine::make_status;
using engine::ok_status;
using engine::status;

namespace {

constexpr std::string_view k_layer = engine::group_name(engine::operation_kind::override_file);

} // namespace

std::string override_op::describe() const { return "override " + target.string(); }

check_state override_op::check() const {
  if (mutation::recorded_provenance(target, k_layer) == mutation::provenance::none) {
    return check_state::not_applied;
  }
  auto current = util::read_file(target);
  return current && *current == content ? check_state::applied : check_state::not_applied;
}

status override_op::apply() const {
  auto log = redlog::get_logger("gr4ft.ops.override");

  auto recorded = mutation::record_original(target, k_layer);
  if (!recorded.ok()) {
    return recorded.status;
  }

  std::string error;
  if (!util::write_file_atomic(target, content, error)) {
    if (recorded.value) {
      mutation::forget_original(target, k_layer);
    }
    return make_status(error_code::mutation_error, error);
  }

  log.dbg("override written", redlog::field("target", target.string()), redlog::field("bytes", content.size()));
  return ok_status();
}

status override_op::revert() const {
  auto restored = mutation::restore_original(target, k_layer);
  if (!restored.ok()) {
    return restored;
  }
  redlog::get_logger("gr4ft.ops.override").dbg("override reverted", redlog::field("target", target.string()));
  return ok_status();
}

} // namespace gr4ft::ops
