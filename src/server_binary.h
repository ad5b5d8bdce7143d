#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace ferry {

// What the host needs to spawn a language server. The host owns the process.
struct server_binary {
  std::filesystem::path path;
  std::optional<std::map<std::string, std::string>> env;
  std::vector<std::string> arguments;
};

}  // namespace ferry
