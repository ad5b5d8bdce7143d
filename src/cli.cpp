#include "cli.h"
#include "tui.h"

#include "CLI/CLI.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <utility>

namespace ferry {

cli_args cli_parse(int argc, char **argv) {
  CLI::App app{ "ferry - language server binary provisioning" };
  // Disable Windows-style '/' option prefixes so absolute POSIX-style paths
  // like "/tmp/file" are treated as positional arguments on Windows.
  app.allow_windows_style_options(false);

  bool verbose{ false };
  app.add_flag(
      "--verbose",
      verbose,
      "Enable decorated verbose logging (prefix stdout/stderr with timestamp and level)");

  cli_args args{};

  app.add_option("--cache-root",
                 args.globals.cache_root,
                 "Cache root directory (default: $FERRY_CACHE_ROOT, then the user cache dir)");
  app.add_option("--tool-file", args.globals.tool_file, "JSON tool descriptor")
      ->check(CLI::ExistingFile);

  // Support version flags (-v / --version) triggering version command directly.
  bool version_flag_short{ false };
  bool version_flag_long{ false };
  app.add_flag("-v",
               version_flag_short,
               "Show version information (alias for version subcommand)");
  app.add_flag("--version",
               version_flag_long,
               "Show version information (alias for version subcommand)");

  std::optional<cli_args::cmd_cfg_t> cmd_cfg;
  auto on_selected{ [&cmd_cfg](auto cfg) { cmd_cfg = std::move(cfg); } };

  cmd_which::register_cli(app, on_selected);
  cmd_latest::register_cli(app, on_selected);
  cmd_install::register_cli(app, on_selected);
  cmd_cached::register_cli(app, on_selected);
  cmd_platform::register_cli(app, on_selected);
  cmd_version::register_cli(app, on_selected);

  try {
    app.parse(argc, argv);
  } catch (CLI::CallForHelp const &) {
    args.cli_output = app.help();
  } catch (CLI::ParseError const &e) { args.cli_output = std::string(e.what()); }

  if (verbose) {
    args.verbosity = tui::level::TUI_DEBUG;
    args.decorated_logging = true;
  } else {
    args.verbosity = tui::level::TUI_INFO;
    args.decorated_logging = false;
  }

  if (version_flag_short || version_flag_long) {
    args.cmd_cfg = cmd_version::cfg{};
    return args;
  }

  if (cmd_cfg && args.cli_output.empty()) {
    args.cmd_cfg = *cmd_cfg;
  } else if (args.cli_output.empty()) {
    args.cli_output = app.help();
  }

  return args;
}

}  // namespace ferry
