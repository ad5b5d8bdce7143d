#include "cmd_cached.h"

#include "cmd_common.h"
#include "tui.h"

#include "CLI/CLI.hpp"

#include <memory>
#include <stdexcept>
#include <utility>

namespace ferry {

void cmd_cached::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand("cached", "Print the cached binary, without network access") };
  auto cfg_ptr{ std::make_shared<cfg>() };
  sub->add_option("tool", cfg_ptr->tool, "Tool name (default: marksman)");
  sub->callback(
      [cfg_ptr, on_selected = std::move(on_selected)] { on_selected(*cfg_ptr); });
}

cmd_cached::cmd_cached(cmd_cached::cfg cfg, cmd_globals const &globals)
    : cfg_{ std::move(cfg) }, globals_{ globals } {}

void cmd_cached::execute() {
  auto const session{ open_tool_session(globals_, cfg_.tool) };
  auto const container{ session->adapter.container_dir(resolve_cache_root(globals_.cache_root)) };

  auto const binary{ session->adapter.read_cached(container) };
  if (!binary) {
    throw std::runtime_error("no cached " + session->adapter.name() + " binary in " +
                             container.string());
  }
  tui::print_stdout("%s\n", binary->path.string().c_str());
}

}  // namespace ferry
