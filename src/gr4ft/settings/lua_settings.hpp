#pragma once

#include "settings/settings.hpp"
#include <sol/sol.hpp>
#include <filesystem>
#include <string>

namespace gr4ft::settings {

// lua evaluator for instrumentation settings scripts
class lua_settings_engine {
public:
  lua_settings_engine();

  engine::result<instrumentation_settings> evaluate(
      const std::string& source, const std::filesystem::path& script_dir, const engine::target_context& context
  );

private:
  sol::state lua_;

  void setup_lua_environment();
  void setup_logging_integration();
  void publish_target(const engine::target_context& context);

  engine::result<instrumentation_settings> collect(const std::filesystem::path& script_dir);
};

} // namespace gr4ft::settings
