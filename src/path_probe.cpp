#include "path_probe.h"

#include "platform.h"
#include "tui.h"
#include "util.h"

#include <cstdlib>
#include <exception>
#include <system_error>
#include <utility>

namespace ferry {

env_path_resolver::env_path_resolver(std::string path_list)
    : path_list_{ std::move(path_list) } {}

std::optional<std::filesystem::path> env_path_resolver::which(std::string_view name) const {
  if (name.empty()) { return std::nullopt; }

  std::string path_list;
  if (path_list_) {
    path_list = *path_list_;
  } else if (char const *path_env{ std::getenv("PATH") }) {
    path_list = path_env;
  } else {
    return std::nullopt;
  }

  try {
    auto const suffixes{ platform::executable_suffixes() };
    for (auto const &dir : util_split_list(path_list, platform::path_list_separator())) {
      for (auto const &suffix : suffixes) {
        std::filesystem::path candidate{ std::filesystem::path{ dir } /
                                         (std::string{ name } + suffix) };
        if (!platform::is_executable_file(candidate)) { continue; }

        std::error_code ec;
        auto const absolute{ std::filesystem::absolute(candidate, ec) };
        return ec ? candidate : absolute.lexically_normal();
      }
    }
  } catch (std::exception const &e) {
    tui::debug("which %.*s: %s", static_cast<int>(name.size()), name.data(), e.what());
  }

  return std::nullopt;
}

}  // namespace ferry
