#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace ferry {

class path_resolver {
 public:
  virtual ~path_resolver() = default;

  // First executable named `name` on the search path. Never throws; any failure
  // (missing PATH, unreadable directory, permission denied) reads as "not found".
  virtual std::optional<std::filesystem::path> which(std::string_view name) const = 0;
};

// Searches the PATH environment variable at call time, or a fixed list if given.
class env_path_resolver : public path_resolver {
 public:
  env_path_resolver() = default;
  explicit env_path_resolver(std::string path_list);

  std::optional<std::filesystem::path> which(std::string_view name) const override;

 private:
  std::optional<std::string> path_list_;
};

}  // namespace ferry
