#include "cli.h"
#include "libcurl_util.h"
#include "tui.h"

#include <cstdlib>
#include <exception>
#include <variant>

int main(int argc, char **argv) {
  ferry::tui::init();

  auto args{ ferry::cli_parse(argc, argv) };
  ferry::tui::scope tui_scope{ args.verbosity, args.decorated_logging };

  if (!args.cli_output.empty()) {
    if (!args.cmd_cfg.has_value()) {
      ferry::tui::error("%s", args.cli_output.c_str());
      return EXIT_FAILURE;
    }
    ferry::tui::info("%s", args.cli_output.c_str());
  }

  if (!args.cmd_cfg.has_value()) { return EXIT_FAILURE; }

  try {
    ferry::libcurl_ensure_initialized();

    auto cmd{ std::visit(
        [&args](auto const &cfg) { return ferry::cmd::create(cfg, args.globals); },
        *args.cmd_cfg) };
    cmd->execute();
  } catch (std::exception const &ex) {
    ferry::tui::error("Execution failed: %s", ex.what());
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
