#include "copy_op.hpp"
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

constexpr std::string_view k_layer = engine::group_name(engine::operation_kind::copy);

} // namespace

std::string copy_op::describe() const { return "copy " + source.string() + " -> " + destination.string(); }

check_state copy_op::check() const {
  if (mutation::recorded_provenance(destination, k_layer) == mutation::provenance::none) {
    return check_state::not_applied;
  }
  return util::files_equal(source, destination) ? check_state::applied : check_state::not_applied;
}

status copy_op::apply() const {
  auto log = redlog::get_logger("gr4ft.ops.copy");

  if (!util::file_exists(source)) {
    return make_status(error_code::mutation_error, "copy source missing: " + source.string());
  }

  auto recorded = mutation::record_original(destination, k_layer);
  if (!recorded.ok()) {
    return recorded.status;
  }

  std::string error;
  if (!util::copy_file_atomic(source, destination, error)) {
    // destination is untouched, only the fresh record needs to go
    if (recorded.value) {
      mutation::forget_original(destination, k_layer);
    }
    return make_status(error_code::mutation_error, "failed to copy to " + destination.string() + ": " + error);
  }

  log.dbg("copied", redlog::field("source", source.string()), redlog::field("destination", destination.string()));
  return ok_status();
}

status copy_op::revert() const {
  auto restored = mutation::restore_original(destination, k_layer);
  if (!restored.ok()) {
    return restored;
  }
  redlog::get_logger("gr4ft.ops.copy").dbg("copy reverted", redlog::field("destination", destination.string()));
  return ok_status();
}

} // namespace gr4ft::ops
