#include "lua_settings.hpp"
#include "utils/file_utils.hpp"
#include <redlog.hpp>
#include <sstream>
#include <stdexcept>

namespace gr4ft::settings {

using engine::error_code;
using engine::error_result;
using engine::make_status;
using engine::ok_result;
using engine::ok_status;
using engine::result;
using engine::status;

namespace {

bool is_missing(const sol::object& value) { return !value.valid() || value.get_type() == sol::type::lua_nil; }

result<std::string> string_field(const sol::table& entry, const char* key, const std::string& where, bool required) {
  sol::object value = entry.get<sol::object>(key);
  if (is_missing(value)) {
    if (required) {
      return error_result<std::string>(error_code::configuration_error, where + "." + key + " is required");
    }
    return ok_result(std::string());
  }
  if (value.get_type() != sol::type::string) {
    return error_result<std::string>(error_code::configuration_error, where + "." + key + " must be a string");
  }
  return ok_result(value.as<std::string>());
}

// resource files (patches, copy sources, override sources) may be relative to the script
std::filesystem::path resolve_resource(const std::string& raw, const std::filesystem::path& script_dir) {
  std::filesystem::path path(raw);
  return (path.is_absolute() ? path : script_dir / path).lexically_normal();
}

// live tree targets must be absolute; scripts build them from the target table
result<std::filesystem::path> resolve_target(const std::string& raw, const std::string& where) {
  std::filesystem::path path(raw);
  if (!path.is_absolute()) {
    return error_result<std::filesystem::path>(
        error_code::configuration_error, where + ": target path must be absolute: " + raw
    );
  }
  return ok_result(path.lexically_normal());
}

template <typename Fn> status for_each_entry(sol::state& lua, const char* name, Fn&& fn) {
  sol::object list = lua[name];
  if (is_missing(list)) {
    return ok_status();
  }
  if (list.get_type() != sol::type::table) {
    return make_status(error_code::configuration_error, std::string(name) + " must be a list of tables");
  }

  sol::table entries = list.as<sol::table>();
  for (size_t index = 1; index <= entries.size(); ++index) {
    std::string where = std::string(name) + "[" + std::to_string(index) + "]";
    sol::object item = entries[index];
    if (is_missing(item) || item.get_type() != sol::type::table) {
      return make_status(error_code::configuration_error, where + " must be a table");
    }
    status parsed = fn(item.as<sol::table>(), where);
    if (!parsed.ok()) {
      return parsed;
    }
  }
  return ok_status();
}

} // namespace

lua_settings_engine::lua_settings_engine() {
  setup_lua_environment();
  setup_logging_integration();
}

void lua_settings_engine::setup_lua_environment() {
  auto log = redlog::get_logger("gr4ft.lua_settings");
  log.dbg("setting up lua environment");

  lua_.open_libraries(sol::lib::base, sol::lib::string, sol::lib::math, sol::lib::table, sol::lib::os);

  sol::table module = lua_.create_table();
  module.set_function("join", [](sol::variadic_args args) -> std::string {
    std::filesystem::path joined;
    for (auto arg : args) {
      joined /= arg.as<std::string>();
    }
    return joined.lexically_normal().string();
  });
  module.set_function("read_file", [](const std::string& path) -> std::string {
    auto content = util::read_file(path);
    if (!content) {
      throw std::runtime_error("read_file: cannot read " + path);
    }
    return *content;
  });
  lua_["gr4ft"] = module;
}

void lua_settings_engine::setup_logging_integration() {
  // route print through redlog
  lua_["print"] = [](sol::variadic_args args) {
    auto log = redlog::get_logger("gr4ft.lua.print");
    std::ostringstream oss;

    for (const auto& arg : args) {
      if (oss.tellp() > 0) {
        oss << "\t";
      }
      oss << lua_tostring(args.lua_state(), arg.stack_index());
    }

    log.inf(oss.str());
  };
}

void lua_settings_engine::publish_target(const engine::target_context& context) {
  sol::table values = lua_.create_table_with(
      "app_dir", context.app_dir().string(), "framework_dir", context.framework_dir().string(), "webroot_dir",
      context.webroot_dir().string(), "version", context.version(), "major_version", context.major_version()
  );

  sol::table meta = lua_.create_table();
  meta["__index"] = values;
  meta["__newindex"] = [](sol::table, sol::object, sol::object) { throw std::runtime_error("target is read-only"); };

  sol::table target = lua_.create_table();
  target[sol::metatable_key] = meta;
  lua_["target"] = target;
}

result<instrumentation_settings> lua_settings_engine::evaluate(
    const std::string& source, const std::filesystem::path& script_dir, const engine::target_context& context
) {
  auto log = redlog::get_logger("gr4ft.lua_settings");

  try {
    publish_target(context);

    auto script_result = lua_.safe_script(source, sol::script_pass_on_error, "=instrumentation settings");
    if (!script_result.valid()) {
      sol::error error = script_result;
      log.err("settings script failed", redlog::field("error", error.what()));
      return error_result<instrumentation_settings>(
          error_code::configuration_error, "settings script error: " + std::string(error.what())
      );
    }

    return collect(script_dir);
  } catch (const sol::error& e) {
    log.err("settings lua error", redlog::field("error", e.what()));
    return error_result<instrumentation_settings>(
        error_code::configuration_error, "settings lua error: " + std::string(e.what())
    );
  } catch (const std::exception& e) {
    log.err("settings evaluation failed", redlog::field("error", e.what()));
    return error_result<instrumentation_settings>(
        error_code::configuration_error, "settings evaluation failed: " + std::string(e.what())
    );
  }
}

result<instrumentation_settings> lua_settings_engine::collect(const std::filesystem::path& script_dir) {
  auto log = redlog::get_logger("gr4ft.lua_settings");
  instrumentation_settings settings;

  sol::object patch_dir = lua_["patch_dir"];
  if (!is_missing(patch_dir)) {
    if (patch_dir.get_type() != sol::type::string) {
      return error_result<instrumentation_settings>(error_code::configuration_error, "patch_dir must be a string");
    }
    settings.patch_dir = resolve_resource(patch_dir.as<std::string>(), script_dir);
  }

  auto overrides = for_each_entry(lua_, "overrides", [&](const sol::table& entry, const std::string& where) {
    auto path = string_field(entry, "path", where, true);
    auto content = string_field(entry, "content", where, false);
    auto source = string_field(entry, "source", where, false);
    for (const auto* field : {&path, &content, &source}) {
      if (!field->ok()) {
        return field->status;
      }
    }

    auto target = resolve_target(path.value, where);
    if (!target.ok()) {
      return target.status;
    }

    bool has_content = !is_missing(entry.get<sol::object>("content"));
    if (has_content == !source.value.empty()) {
      return make_status(error_code::configuration_error, where + " needs exactly one of content or source");
    }

    ops::override_op op;
    op.target = std::move(target.value);
    if (has_content) {
      op.content = std::move(content.value);
    } else {
      auto source_path = resolve_resource(source.value, script_dir);
      auto loaded = util::read_file(source_path);
      if (!loaded) {
        return make_status(error_code::configuration_error, where + ": cannot read " + source_path.string());
      }
      op.content = std::move(*loaded);
    }
    settings.declared.overrides.push_back(std::move(op));
    return ok_status();
  });
  if (!overrides.ok()) {
    return error_result<instrumentation_settings>(overrides);
  }

  auto patches = for_each_entry(lua_, "patches", [&](const sol::table& entry, const std::string& where) {
    auto patch = string_field(entry, "patch", where, true);
    if (!patch.ok()) {
      return patch.status;
    }
    auto original = string_field(entry, "original", where, true);
    if (!original.ok()) {
      return original.status;
    }
    auto target = resolve_target(original.value, where);
    if (!target.ok()) {
      return target.status;
    }
    settings.declared.patches.push_back(ops::patch_op{resolve_resource(patch.value, script_dir), target.value});
    return ok_status();
  });
  if (!patches.ok()) {
    return error_result<instrumentation_settings>(patches);
  }

  auto copies = for_each_entry(lua_, "copies", [&](const sol::table& entry, const std::string& where) {
    auto src = string_field(entry, "src", where, true);
    if (!src.ok()) {
      return src.status;
    }
    auto dst = string_field(entry, "dst", where, true);
    if (!dst.ok()) {
      return dst.status;
    }
    auto target = resolve_target(dst.value, where);
    if (!target.ok()) {
      return target.status;
    }
    settings.declared.copies.push_back(ops::copy_op{resolve_resource(src.value, script_dir), target.value});
    return ok_status();
  });
  if (!copies.ok()) {
    return error_result<instrumentation_settings>(copies);
  }

  auto removals = for_each_entry(lua_, "remove_annotations", [&](const sol::table& entry, const std::string& where) {
    auto path = string_field(entry, "path", where, true);
    if (!path.ok()) {
      return path.status;
    }
    auto pattern = string_field(entry, "pattern", where, false);
    if (!pattern.ok()) {
      return pattern.status;
    }
    auto target = resolve_target(path.value, where);
    if (!target.ok()) {
      return target.status;
    }

    ops::annotation_removal_op op;
    op.target = target.value;
    if (!pattern.value.empty()) {
      op.annotation_pattern = pattern.value;
    }
    settings.declared.annotation_removals.push_back(std::move(op));
    return ok_status();
  });
  if (!removals.ok()) {
    return error_result<instrumentation_settings>(removals);
  }

  log.inf(
      "settings loaded", redlog::field("patch_dir", settings.patch_dir.string()),
      redlog::field("overrides", settings.declared.overrides.size()),
      redlog::field("patches", settings.declared.patches.size()),
      redlog::field("copies", settings.declared.copies.size()),
      redlog::field("annotations", settings.declared.annotation_removals.size())
  );
  return ok_result(std::move(settings));
}

} // namespace gr4ft::settings
