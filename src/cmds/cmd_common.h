#pragma once

#include "cmd.h"
#include "github_release.h"
#include "libcurl_util.h"
#include "path_probe.h"
#include "tool_adapter.h"
#include "tool_spec.h"
#include "util.h"

#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace ferry {

std::filesystem::path resolve_cache_root(
    std::optional<std::filesystem::path> const &cache_root);

// `--tool-file` descriptor if given, else the built-in tool named `tool`
// (marksman when omitted). Throws std::runtime_error for unknown tools or a
// name that disagrees with the descriptor.
tool_spec resolve_tool_spec(cmd_globals const &globals, std::optional<std::string> const &tool);

// An adapter wired to the live collaborators: PATH, libcurl, GitHub.
struct tool_session : unmovable {
  explicit tool_session(tool_spec spec);

  env_path_resolver paths;
  libcurl_http_client http;
  github_release_index releases;
  tool_adapter adapter;
};

std::unique_ptr<tool_session> open_tool_session(cmd_globals const &globals,
                                                std::optional<std::string> const &tool);

}  // namespace ferry
