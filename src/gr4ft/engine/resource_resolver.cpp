#include "resource_resolver.hpp"
#include "engine/resource_paths.hpp"
#include <redlog.hpp>

namespace gr4ft::engine {

resource_resolver::resource_resolver(const target_context& context, std::filesystem::path patch_dir)
    : context_(context), patch_dir_(std::move(patch_dir)) {}

discovery resource_resolver::discover() const {
  auto log = redlog::get_logger("gr4ft.resource_resolver");

  discovery out;
  if (patch_dir_.empty()) {
    log.dbg("no patch directory configured, nothing to discover");
    return out;
  }

  for (root_kind root : k_all_roots) {
    discover_patches(root, out);
  }
  for (root_kind root : k_all_roots) {
    discover_copies(root, out);
  }

  log.inf(
      "discovered version resources", redlog::field("major", context_.major_version()),
      redlog::field("patches", out.patches.size()), redlog::field("copies", out.copies.size()),
      redlog::field("rejected", out.rejected.size())
  );
  return out;
}

void resource_resolver::discover_patches(root_kind root, discovery& out) const {
  auto log = redlog::get_logger("gr4ft.resource_resolver");
  auto base = resource_root(patch_dir_, context_.major_version(), root);

  auto listed = list_resources(patch_dir_, context_.major_version(), root, k_patch_suffix);
  if (!listed.ok()) {
    out.rejected.push_back(operation_failure{operation_kind::patch, base.string(), listed.status});
    return;
  }

  for (const auto& relative : listed.value) {
    auto target = resolve_target_path(relative, root, context_, true);
    if (!target.ok()) {
      log.warn("rejected patch resource", redlog::field("resource", relative.string()),
               redlog::field("error", target.status.message));
      out.rejected.push_back(operation_failure{operation_kind::patch, (base / relative).string(), target.status});
      continue;
    }
    log.trc("patch resource", redlog::field("patch", relative.string()), redlog::field("target", target.value.string()));
    out.patches.push_back(ops::patch_op{base / relative, std::move(target.value)});
  }
}

void resource_resolver::discover_copies(root_kind root, discovery& out) const {
  auto log = redlog::get_logger("gr4ft.resource_resolver");
  auto base = resource_root(patch_dir_, context_.major_version(), root);

  auto listed = list_resources(patch_dir_, context_.major_version(), root, k_script_suffix);
  if (!listed.ok()) {
    out.rejected.push_back(operation_failure{operation_kind::copy, base.string(), listed.status});
    return;
  }

  for (const auto& relative : listed.value) {
    auto target = resolve_target_path(relative, root, context_, false);
    if (!target.ok()) {
      log.warn("rejected copy resource", redlog::field("resource", relative.string()),
               redlog::field("error", target.status.message));
      out.rejected.push_back(operation_failure{operation_kind::copy, (base / relative).string(), target.status});
      continue;
    }
    log.trc("copy resource", redlog::field("source", relative.string()), redlog::field("target", target.value.string()));
    out.copies.push_back(ops::copy_op{base / relative, std::move(target.value)});
  }
}

} // namespace gr4ft::engine
