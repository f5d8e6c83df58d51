#include <doctest/doctest.h>

#include "gr4ft/utils/env_config.hpp"

#include <cstdlib>
#include <string>
#include <utility>

namespace {

using gr4ft::util::env_config;

// sets a variable for the lifetime of the scope
class scoped_env {
public:
  scoped_env(std::string name, const std::string& value) : name_(std::move(name)) {
    ::setenv(name_.c_str(), value.c_str(), 1);
  }
  ~scoped_env() { ::unsetenv(name_.c_str()); }

private:
  std::string name_;
};

} // namespace

TEST_CASE("env config reads prefixed strings") {
  scoped_env settings("GR4FT_TEST_SETTINGS", "/etc/gr4ft/settings.lua");
  env_config env("GR4FT");

  CHECK(env.has("TEST_SETTINGS"));
  CHECK(env.get<std::string>("TEST_SETTINGS", "") == "/etc/gr4ft/settings.lua");
  CHECK_FALSE(env.has("TEST_UNSET"));
  CHECK(env.get<std::string>("TEST_UNSET", "fallback") == "fallback");
}

TEST_CASE("env config parses sizes") {
  env_config env("GR4FT_");

  {
    scoped_env workers("GR4FT_TEST_WORKERS", "8");
    CHECK(env.get<size_t>("TEST_WORKERS", 1) == 8);
  }
  {
    scoped_env workers("GR4FT_TEST_WORKERS", "-3");
    CHECK(env.get<size_t>("TEST_WORKERS", 2) == 2);
  }
  {
    scoped_env workers("GR4FT_TEST_WORKERS", "many");
    CHECK(env.get<size_t>("TEST_WORKERS", 3) == 3);
  }
  CHECK(env.get<size_t>("TEST_WORKERS", 4) == 4);
}
