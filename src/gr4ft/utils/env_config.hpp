#pragma once

#include <cstddef>
#include <string>

namespace gr4ft::util {

// typed access to prefixed environment variables (prefix "GR4FT" reads GR4FT_<NAME>)
class env_config {
public:
  explicit env_config(const std::string& prefix = "");

  template <typename T> T get(const std::string& name, T default_value) const;

  bool has(const std::string& name) const { return !get_env_value(name).empty(); }

private:
  std::string prefix_;
  std::string build_env_name(const std::string& name) const;
  std::string get_env_value(const std::string& name) const;
};

template <> std::string env_config::get<std::string>(const std::string& name, std::string default_value) const;
template <> size_t env_config::get<size_t>(const std::string& name, size_t default_value) const;

} // namespace gr4ft::util
