#include "cmd_platform.h"

#include "asset_name.h"
#include "cmd_common.h"
#include "platform.h"
#include "tui.h"

#include "CLI/CLI.hpp"

#include <memory>
#include <string>
#include <utility>

namespace ferry {

void cmd_platform::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand("platform",
                                "Print the host platform and the asset name it maps to") };
  auto cfg_ptr{ std::make_shared<cfg>() };
  sub->add_option("tool", cfg_ptr->tool, "Tool name (default: marksman)");
  sub->callback(
      [cfg_ptr, on_selected = std::move(on_selected)] { on_selected(*cfg_ptr); });
}

cmd_platform::cmd_platform(cmd_platform::cfg cfg, cmd_globals const &globals)
    : cfg_{ std::move(cfg) }, globals_{ globals } {}

void cmd_platform::execute() {
  auto const spec{ resolve_tool_spec(globals_, cfg_.tool) };
  std::string const os{ platform::os_name() };
  std::string const arch{ platform::arch_name() };

  tui::print_stdout("%s %s %s\n", os.c_str(), arch.c_str(), asset_name_for_host(spec).c_str());
}

}  // namespace ferry
