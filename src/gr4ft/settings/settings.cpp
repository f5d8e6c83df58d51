#include "settings.hpp"
#include "utils/file_utils.hpp"
#include <redlog.hpp>
#include <system_error>

#ifdef GR4FT_HAS_SCRIPTING
#include "settings/lua_settings.hpp"
#endif

namespace gr4ft::settings {

using engine::error_code;
using engine::error_result;

engine::result<instrumentation_settings> load_settings(
    const std::filesystem::path& script_path, const engine::target_context& context
) {
  auto log = redlog::get_logger("gr4ft.settings");

  auto source = util::read_file(script_path);
  if (!source) {
    log.err("cannot read settings script", redlog::field("path", script_path.string()));
    return error_result<instrumentation_settings>(
        error_code::configuration_error, "cannot read settings script " + script_path.string()
    );
  }

  std::error_code ec;
  auto script_dir = std::filesystem::absolute(script_path, ec).parent_path();
  if (ec) {
    return error_result<instrumentation_settings>(
        error_code::configuration_error, "cannot resolve settings script " + script_path.string() + ": " + ec.message()
    );
  }
  return load_settings_source(*source, script_dir, context);
}

engine::result<instrumentation_settings> load_settings_source(
    const std::string& source, const std::filesystem::path& script_dir, const engine::target_context& context
) {
#ifdef GR4FT_HAS_SCRIPTING
  lua_settings_engine engine;
  return engine.evaluate(source, script_dir, context);
#else
  (void) source;
  (void) script_dir;
  (void) context;
  redlog::get_logger("gr4ft.settings").err("settings scripts need a build with scripting support");
  return error_result<instrumentation_settings>(
      error_code::unsupported, "gr4ft was built without scripting support; settings scripts are unavailable"
  );
#endif
}

} // namespace gr4ft::settings
