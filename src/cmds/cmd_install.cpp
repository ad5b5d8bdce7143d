#include "cmd_install.h"

#include "cmd_common.h"
#include "provision.h"
#include "tui.h"

#include "CLI/CLI.hpp"

#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

namespace ferry {

void cmd_install::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand(
      "install",
      "Provision the tool (installed, then latest release, then cache) and print it") };
  auto cfg_ptr{ std::make_shared<cfg>() };
  sub->add_option("tool", cfg_ptr->tool, "Tool name (default: marksman)");
  sub->add_flag("--offline", cfg_ptr->offline, "Use only the local cache");
  sub->add_flag("--no-system",
                cfg_ptr->no_system,
                "Ignore a copy of the tool already on PATH");
  sub->callback(
      [cfg_ptr, on_selected = std::move(on_selected)] { on_selected(*cfg_ptr); });
}

cmd_install::cmd_install(cmd_install::cfg cfg, cmd_globals const &globals)
    : cfg_{ std::move(cfg) }, globals_{ globals } {}

void cmd_install::execute() {
  auto session{ open_tool_session(globals_, cfg_.tool) };
  auto const container{ session->adapter.container_dir(resolve_cache_root(globals_.cache_root)) };

  auto const result{ provision(session->adapter,
                               container,
                               { .offline = cfg_.offline, .allow_installed = !cfg_.no_system }) };
  if (!result) {
    throw std::runtime_error("install: no " + session->adapter.name() + " binary available" +
                             (cfg_.offline ? " in " + container.string() : std::string{}));
  }

  tui::info("%s: %s binary",
            session->adapter.name().c_str(),
            std::string{ provision_source_name(result->source) }.c_str());

  std::string line{ result->binary.path.string() };
  for (auto const &arg : result->binary.arguments) {
    line += ' ';
    line += arg;
  }
  tui::print_stdout("%s\n", line.c_str());
}

}  // namespace ferry
