#pragma once

#include "util.h"

#include <filesystem>
#include <memory>
#include <optional>

namespace ferry {

// Options given before the subcommand; they apply to every command.
struct cmd_globals {
  std::optional<std::filesystem::path> cache_root;
  std::optional<std::filesystem::path> tool_file;
};

class cmd : unmovable {
 public:
  using ptr_t = std::unique_ptr<cmd>;

  virtual ~cmd() = default;
  virtual void execute() = 0;

  template <typename config>
  static ptr_t create(config const &cfg, cmd_globals const &globals);

 protected:
  cmd() = default;
};

// Command configs inherit from this for factory creation.
template <typename command>
struct cmd_cfg {
  using cmd_t = command;
};

template <typename config>
cmd::ptr_t cmd::create(config const &cfg, cmd_globals const &globals) {
  return std::make_unique<typename config::cmd_t>(cfg, globals);
}

}  // namespace ferry
