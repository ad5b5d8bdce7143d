#include "cmd_common.h"

#include "platform.h"
#include "tui.h"

#include <stdexcept>
#include <utility>

namespace ferry {

std::filesystem::path resolve_cache_root(
    std::optional<std::filesystem::path> const &cache_root) {
  if (cache_root) { return *cache_root; }

  auto default_cache_root{ platform::get_default_cache_root() };
  if (!default_cache_root) {
    throw std::runtime_error(std::string{ "could not determine cache root (set " } +
                             platform::get_default_cache_root_env_vars() +
                             " or pass --cache-root)");
  }
  return *default_cache_root;
}

tool_spec resolve_tool_spec(cmd_globals const &globals,
                            std::optional<std::string> const &tool) {
  if (globals.tool_file) {
    auto spec{ tool_spec_load(*globals.tool_file) };
    if (tool && *tool != spec.name) {
      throw std::runtime_error("tool '" + *tool + "' does not match " +
                               globals.tool_file->string() + " (describes '" + spec.name +
                               "')");
    }
    return spec;
  }

  auto spec{ tool_spec_marksman() };
  if (tool && *tool != spec.name) {
    throw std::runtime_error("unknown tool '" + *tool + "' (use --tool-file to describe it)");
  }
  return spec;
}

tool_session::tool_session(tool_spec spec)
    : releases{ http }, adapter{ std::move(spec), paths, http, releases } {}

std::unique_ptr<tool_session> open_tool_session(cmd_globals const &globals,
                                                std::optional<std::string> const &tool) {
  auto spec{ resolve_tool_spec(globals, tool) };
  tui::debug("tool %s from %s", spec.name.c_str(), spec.repo.c_str());
  return std::make_unique<tool_session>(std::move(spec));
}

}  // namespace ferry
