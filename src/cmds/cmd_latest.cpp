#include "cmd_latest.h"

#include "cmd_common.h"
#include "tui.h"

#include "CLI/CLI.hpp"

#include <memory>
#include <utility>

namespace ferry {

void cmd_latest::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand("latest",
                                "Resolve the latest release asset for this platform") };
  auto cfg_ptr{ std::make_shared<cfg>() };
  sub->add_option("tool", cfg_ptr->tool, "Tool name (default: marksman)");
  sub->callback(
      [cfg_ptr, on_selected = std::move(on_selected)] { on_selected(*cfg_ptr); });
}

cmd_latest::cmd_latest(cmd_latest::cfg cfg, cmd_globals const &globals)
    : cfg_{ std::move(cfg) }, globals_{ globals } {}

void cmd_latest::execute() {
  auto session{ open_tool_session(globals_, cfg_.tool) };
  auto const version{ session->adapter.resolve_latest() };
  tui::print_stdout("%s %s\n", version.name.c_str(), version.url.c_str());
}

}  // namespace ferry
