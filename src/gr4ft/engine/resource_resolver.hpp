#pragma once

#include "engine/report.hpp"
#include "engine/target_context.hpp"
#include "ops/copy_op.hpp"
#include "ops/patch_op.hpp"
#include <filesystem>
#include <vector>

namespace gr4ft::engine {

// patches and copies found under the version-scoped resource tree
struct discovery {
  std::vector<ops::patch_op> patches;
  std::vector<ops::copy_op> copies;
  std::vector<operation_failure> rejected;
};

// walks <patch_dir>/cakephp/<major>/{APP_DIR,CAKEPHP_PATH,WEBROOT}:
//   **/*.patch -> patch of the live file (suffix stripped)
//   **/*.php   -> copy onto the live path
// only the detected major version is consulted; an absent version tree discovers nothing
class resource_resolver {
public:
  resource_resolver(const target_context& context, std::filesystem::path patch_dir);

  discovery discover() const;

private:
  const target_context& context_;
  std::filesystem::path patch_dir_;

  void discover_patches(root_kind root, discovery& out) const;
  void discover_copies(root_kind root, discovery& out) const;
};

} // namespace gr4ft::engine
