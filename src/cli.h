#pragma once

#include "cmd.h"
#include "cmds/cmd_cached.h"
#include "cmds/cmd_install.h"
#include "cmds/cmd_latest.h"
#include "cmds/cmd_platform.h"
#include "cmds/cmd_version.h"
#include "cmds/cmd_which.h"
#include "tui.h"

#include <optional>
#include <string>
#include <variant>

namespace ferry {

struct cli_args {
  using cmd_cfg_t = std::variant<cmd_cached::cfg,
                                 cmd_install::cfg,
                                 cmd_latest::cfg,
                                 cmd_platform::cfg,
                                 cmd_version::cfg,
                                 cmd_which::cfg>;

  std::optional<cmd_cfg_t> cmd_cfg;
  cmd_globals globals;
  std::optional<tui::level> verbosity;
  bool decorated_logging{ false };
  std::string cli_output;
};

cli_args cli_parse(int argc, char **argv);

}  // namespace ferry
