#pragma once

#include "cmd.h"

#include <functional>
#include <optional>
#include <string>

namespace CLI { class App; }

namespace ferry {

class cmd_cached : public cmd {
 public:
  struct cfg : cmd_cfg<cmd_cached> {
    std::optional<std::string> tool;
  };

  static void register_cli(CLI::App &app, std::function<void(cfg)> on_selected);

  cmd_cached(cfg cfg, cmd_globals const &globals);

  void execute() override;
  cfg const &get_cfg() const { return cfg_; }

 private:
  cfg cfg_;
  cmd_globals globals_;
};

}  // namespace ferry
