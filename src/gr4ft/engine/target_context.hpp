#pragma once

#include "engine/result.hpp"
#include "engine/types.hpp"
#include <filesystem>
#include <string>
#include <string_view>

namespace gr4ft::engine {

// parse the major component of a dotted version string ("4.5.2" -> 4)
result<int> parse_major_version(std::string_view version);

// resolved live roots and framework version for one run; immutable once created
class target_context {
public:
  target_context() = default;

  static result<target_context> create(
      const std::filesystem::path& app_dir, const std::filesystem::path& framework_dir,
      const std::filesystem::path& webroot_dir, std::string_view version
  );

  const std::filesystem::path& app_dir() const noexcept { return app_dir_; }
  const std::filesystem::path& framework_dir() const noexcept { return framework_dir_; }
  const std::filesystem::path& webroot_dir() const noexcept { return webroot_dir_; }
  const std::string& version() const noexcept { return version_; }
  int major_version() const noexcept { return major_version_; }

  const std::filesystem::path& root(root_kind kind) const noexcept;

private:
  std::filesystem::path app_dir_;
  std::filesystem::path framework_dir_;
  std::filesystem::path webroot_dir_;
  std::string version_;
  int major_version_ = 0;
};

} // namespace gr4ft::engine
