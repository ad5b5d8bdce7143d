#include "platform.h"

#include "util.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>

namespace ferry::platform {

std::optional<std::filesystem::path> get_default_cache_root() {
  if (char const *env_root{ std::getenv("FERRY_CACHE_ROOT") }; env_root && *env_root) {
    return std::filesystem::path{ env_root };
  }

  if (char const *local_app_data{ std::getenv("LOCALAPPDATA") }) {
    return std::filesystem::path{ local_app_data } / "ferry";
  }

  if (char const *user_profile{ std::getenv("USERPROFILE") }) {
    return std::filesystem::path{ user_profile } / "AppData" / "Local" / "ferry";
  }

  return std::nullopt;
}

char const *get_default_cache_root_env_vars() {
  return "FERRY_CACHE_ROOT, LOCALAPPDATA or USERPROFILE";
}

void set_env_var(char const *name, char const *value) {
  if (name == nullptr || value == nullptr) {
    throw std::invalid_argument("set_env_var: null name or value");
  }

  if (::_putenv_s(name, value) != 0) {
    throw std::runtime_error(std::string("set_env_var: failed to set ") + name);
  }
}

void unset_env_var(char const *name) {
  if (name == nullptr) { throw std::invalid_argument("unset_env_var: null name"); }
  ::_putenv_s(name, "");
}

std::string_view os_name() { return "windows"; }

std::string_view arch_name() {
#if defined(_M_ARM64)
  return "arm64";
#elif defined(_M_X64)
  return "x86_64";
#elif defined(_M_IX86)
  return "x86";
#else
  return "unknown";
#endif
}

bool requires_exec_bits() { return false; }

char path_list_separator() { return ';'; }

std::vector<std::string> executable_suffixes() {
  std::vector<std::string> suffixes;
  char const *pathext{ std::getenv("PATHEXT") };
  for (auto ext : util_split_list(pathext ? pathext : ".COM;.EXE;.BAT;.CMD", ';')) {
    std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) {
      return static_cast<char>(std::tolower(c));
    });
    suffixes.push_back(std::move(ext));
  }
  return suffixes;
}

bool is_executable_file(std::filesystem::path const &path) {
  std::error_code ec;
  return std::filesystem::is_regular_file(path, ec) && !ec;
}

}  // namespace ferry::platform
