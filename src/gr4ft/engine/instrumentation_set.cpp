#include "instrumentation_set.hpp"
#include <redlog.hpp>
#include <map>

namespace gr4ft::engine {

namespace {

template <typename Op> void append(instrumentation_group& group, const std::vector<Op>& operations) {
  for (const auto& op : operations) {
    group.operations.emplace_back(op);
  }
}

status verify_disjoint(const instrumentation_group& group) {
  std::map<std::filesystem::path, const ops::operation*> seen;
  for (const auto& op : group.operations) {
    auto key = ops::target_path(op).lexically_normal();
    auto [it, inserted] = seen.emplace(key, &op);
    if (!inserted) {
      return make_status(
          error_code::configuration_error, "duplicate target in " + std::string(group_name(group.kind)) + ": " +
                                               key.string() + " (" + ops::describe(*it->second) + ", " +
                                               ops::describe(op) + ")"
      );
    }
  }
  return ok_status();
}

} // namespace

size_t instrumentation_set::size() const noexcept {
  size_t total = 0;
  for (const auto& group : groups) {
    total += group.operations.size();
  }
  return total;
}

result<instrumentation_set> build_instrumentation_set(const declared_operations& declared, const discovery& discovered) {
  auto log = redlog::get_logger("gr4ft.instrumentation_set");

  instrumentation_set set;
  for (operation_kind kind : k_declaration_order) {
    set.groups[group_index(kind)].kind = kind;
  }

  append(set.groups[group_index(operation_kind::override_file)], declared.overrides);
  append(set.groups[group_index(operation_kind::patch)], declared.patches);
  append(set.groups[group_index(operation_kind::patch)], discovered.patches);
  append(set.groups[group_index(operation_kind::copy)], declared.copies);
  append(set.groups[group_index(operation_kind::copy)], discovered.copies);
  append(set.groups[group_index(operation_kind::annotation_removal)], declared.annotation_removals);
  set.resolution_failures = discovered.rejected;

  for (const auto& group : set.groups) {
    auto disjoint = verify_disjoint(group);
    if (!disjoint.ok()) {
      log.err("instrumentation set rejected", redlog::field("error", disjoint.message));
      return error_result<instrumentation_set>(disjoint);
    }
  }

  log.dbg(
      "instrumentation set built", redlog::field("overrides", set.group(operation_kind::override_file).operations.size()),
      redlog::field("patches", set.group(operation_kind::patch).operations.size()),
      redlog::field("copies", set.group(operation_kind::copy).operations.size()),
      redlog::field("annotations", set.group(operation_kind::annotation_removal).operations.size())
  );
  return ok_result(std::move(set));
}

} // namespace gr4ft::engine
