#include "env_config.hpp"
#include "string_utils.hpp"
#include <redlog.hpp>
#include <cstdlib>
#include <exception>

namespace gr4ft::util {

env_config::env_config(const std::string& prefix) : prefix_(prefix) {
  if (!prefix_.empty() && prefix_.back() != '_') {
    prefix_ += "_";
  }
}

std::string env_config::build_env_name(const std::string& name) const { return prefix_ + name; }

std::string env_config::get_env_value(const std::string& name) const {
  const char* value = std::getenv(build_env_name(name).c_str());
  return value ? std::string(value) : std::string();
}

template <> std::string env_config::get<std::string>(const std::string& name, std::string default_value) const {
  std::string value = get_env_value(name);
  return value.empty() ? default_value : value;
}

template <> size_t env_config::get<size_t>(const std::string& name, size_t default_value) const {
  std::string value = get_env_value(name);
  if (value.empty()) {
    return default_value;
  }

  if (trim_view(value).starts_with('-')) {
    redlog::get_logger("gr4ft.env_config")
        .warn("negative size, using default", redlog::field("name", build_env_name(name)));
    return default_value;
  }

  try {
    return static_cast<size_t>(std::stoull(value));
  } catch (const std::exception& e) {
    redlog::get_logger("gr4ft.env_config")
        .warn("failed to parse size, using default", redlog::field("name", build_env_name(name)),
              redlog::field("error", e.what()));
    return default_value;
  }
}

} // namespace gr4ft::util
