#include "cmd_version.h"

#include "libcurl_util.h"
#include "platform.h"
#include "tui.h"

#include "CLI/CLI.hpp"

#include <memory>
#include <string>
#include <utility>

#ifndef FERRY_VERSION_STR
#error "FERRY_VERSION_STR must be defined by the build system"
#endif

namespace ferry {

void cmd_version::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand("version", "Show version information") };
  auto cfg_ptr{ std::make_shared<cfg>() };
  sub->callback(
      [cfg_ptr, on_selected = std::move(on_selected)] { on_selected(*cfg_ptr); });
}

cmd_version::cmd_version(cmd_version::cfg cfg, cmd_globals const & /*globals*/)
    : cfg_{ std::move(cfg) } {}

void cmd_version::execute() {
  std::string const os{ platform::os_name() };
  std::string const arch{ platform::arch_name() };

  tui::info("ferry version %s (%s/%s)", FERRY_VERSION_STR, os.c_str(), arch.c_str());
  tui::info("");
  tui::info("Third-party component versions:");
  tui::info("  libcurl: %s", libcurl_version_string().c_str());
  tui::info("  CLI11: %s", CLI11_VERSION);
}

}  // namespace ferry
