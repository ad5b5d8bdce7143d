#include "cmd_which.h"

#include "cmd_common.h"
#include "tui.h"

#include "CLI/CLI.hpp"

#include <memory>
#include <stdexcept>
#include <utility>

namespace ferry {

void cmd_which::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand("which", "Print the tool's path if installed on PATH") };
  auto cfg_ptr{ std::make_shared<cfg>() };
  sub->add_option("tool", cfg_ptr->tool, "Tool name (default: marksman)");
  sub->callback(
      [cfg_ptr, on_selected = std::move(on_selected)] { on_selected(*cfg_ptr); });
}

cmd_which::cmd_which(cmd_which::cfg cfg, cmd_globals const &globals)
    : cfg_{ std::move(cfg) }, globals_{ globals } {}

void cmd_which::execute() {
  auto const session{ open_tool_session(globals_, cfg_.tool) };
  auto const binary{ session->adapter.probe_installed() };
  if (!binary) {
    throw std::runtime_error(session->adapter.name() + " not found on PATH");
  }
  tui::print_stdout("%s\n", binary->path.string().c_str());
}

}  // namespace ferry
