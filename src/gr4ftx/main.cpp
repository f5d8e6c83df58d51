#include "commands/instrument.hpp"
#include <gr4ft/gr4ft.hpp>
#include <args.hxx>
#include <redlog.hpp>
#include <iostream>
#include <string>

namespace cli {
args::Group arguments("arguments");
args::HelpFlag help_flag(arguments, "help", "help", {'h', "help"});
args::CounterFlag verbosity_flag(arguments, "verbosity", "verbosity level", {'v'});

// -v traces resources and provenance records, -vv adds per-operation detail
void apply_verbosity() {
  switch (args::get(verbosity_flag)) {
  case 0:
    redlog::set_level(redlog::level::info);
    break;
  case 1:
    redlog::set_level(redlog::level::trace);
    break;
  case 2:
    redlog::set_level(redlog::level::debug);
    break;
  default:
    redlog::set_level(redlog::level::pedantic);
    break;
  }
}
} // namespace cli

namespace {

// target selection flags shared by apply, revert and status
struct target_flags {
  args::ValueFlag<std::string> webroot;
  args::ValueFlag<std::string> settings;
  args::ValueFlag<std::string> patch_dir;
  args::ValueFlag<std::string> app_dir;
  args::ValueFlag<std::string> framework_dir;
  args::ValueFlag<std::string> framework_version;
  args::ValueFlag<size_t> workers;

  explicit target_flags(args::Group& command)
      : webroot(command, "dir", "application webroot directory", {'w', "webroot"}),
        settings(command, "file", "instrumentation settings script (default: $GR4FT_SETTINGS)", {'s', "settings"}),
        patch_dir(command, "dir", "version-scoped resource directory (overrides settings)", {"patch-dir"}),
        app_dir(command, "dir", "application directory (skips detection)", {"app-dir"}),
        framework_dir(command, "dir", "framework installation directory (skips detection)", {"framework-dir"}),
        framework_version(command, "version", "framework version (skips VERSION.txt)", {"framework-version"}),
        workers(command, "count", "operations run concurrently within a group", {'j', "workers"}) {}
};

bool build_options(target_flags& flags, gr4ft::session_options& options) {
  auto log = redlog::get_logger("gr4ftx");

  if (!flags.webroot) {
    log.err("webroot required");
    std::cerr << "error: webroot (-w/--webroot) is required" << std::endl;
    return false;
  }

  options.webroot_dir = args::get(flags.webroot);
  if (flags.settings) {
    if (!gr4ft::has_scripting_support()) {
      log.err("settings scripts unavailable", redlog::field("settings", args::get(flags.settings)));
      std::cerr << "error: this build of gr4ftx has no settings script support" << std::endl;
      return false;
    }
    options.settings_path = args::get(flags.settings);
  }
  if (flags.patch_dir) {
    options.patch_dir = args::get(flags.patch_dir);
  }
  if (flags.app_dir) {
    options.detection.app_dir = args::get(flags.app_dir);
  }
  if (flags.framework_dir) {
    options.detection.framework_dir = args::get(flags.framework_dir);
  }
  if (flags.framework_version) {
    options.detection.framework_version = args::get(flags.framework_version);
  }
  if (flags.workers) {
    options.workers = args::get(flags.workers);
  }
  return true;
}

template <typename Command> int run_command(target_flags& flags, Command command) {
  cli::apply_verbosity();

  gr4ft::session_options options;
  if (!build_options(flags, options)) {
    return static_cast<int>(gr4ftx::commands::exit_status::fatal);
  }
  return command(options, std::cout);
}

} // namespace

int main(int argc, char* argv[]) {
  args::ArgumentParser parser("gr4ftx - reversible instrumentation of cakephp application trees");
  parser.helpParams.showTerminator = false;
  parser.helpParams.helpindent = 2;
  parser.helpParams.width = 120;

  // global flags
  parser.Add(cli::arguments);

  args::Command apply_cmd(parser, "apply", "apply every instrumentation not yet present");
  target_flags apply_flags(apply_cmd);

  args::Command revert_cmd(parser, "revert", "revert every applied instrumentation");
  target_flags revert_flags(revert_cmd);

  args::Command status_cmd(parser, "status", "report applied / unapplied counts per group");
  target_flags status_flags(status_cmd);

  try {
    parser.ParseCLI(argc, argv);

    if (apply_cmd) {
      return run_command(apply_flags, gr4ftx::commands::apply);
    } else if (revert_cmd) {
      return run_command(revert_flags, gr4ftx::commands::revert);
    } else if (status_cmd) {
      return run_command(status_flags, gr4ftx::commands::status);
    } else {
      std::cerr << "error: no command specified" << std::endl;
      std::cerr << parser;
      return 1;
    }

  } catch (const args::Help&) {
    std::cout << parser;
    return 0;
  } catch (const args::ParseError& e) {
    std::cerr << e.what() << std::endl;
    std::cerr << parser;
    return 1;
  } catch (const args::ValidationError& e) {
    std::cerr << e.what() << std::endl;
    std::cerr << parser;
    return 1;
  }

  return 0;
}
