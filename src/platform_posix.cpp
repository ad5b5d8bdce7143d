#include "platform.h"

#include <unistd.h>

#include <cstdlib>
#include <stdexcept>
#include <string>
#include <system_error>

namespace ferry::platform {

std::optional<std::filesystem::path> get_default_cache_root() {
  // FERRY_CACHE_ROOT takes precedence
  if (char const *env_root{ std::getenv("FERRY_CACHE_ROOT") }; env_root && *env_root) {
    return std::filesystem::path{ env_root };
  }

#ifdef __APPLE__
  if (char const *home{ std::getenv("HOME") }) {
    return std::filesystem::path{ home } / "Library" / "Caches" / "ferry";
  }
#else
  if (char const *xdg_cache{ std::getenv("XDG_CACHE_HOME") }; xdg_cache && *xdg_cache) {
    return std::filesystem::path{ xdg_cache } / "ferry";
  }

  if (char const *home{ std::getenv("HOME") }) {
    return std::filesystem::path{ home } / ".cache" / "ferry";
  }
#endif

  return std::nullopt;
}

char const *get_default_cache_root_env_vars() {
#ifdef __APPLE__
  return "FERRY_CACHE_ROOT or HOME";
#else
  return "FERRY_CACHE_ROOT, XDG_CACHE_HOME or HOME";
#endif
}

void set_env_var(char const *name, char const *value) {
  if (name == nullptr || value == nullptr) {
    throw std::invalid_argument("set_env_var: null name or value");
  }

  if (::setenv(name, value, 1) != 0) {
    throw std::runtime_error(std::string("set_env_var: failed to set ") + name);
  }
}

void unset_env_var(char const *name) {
  if (name == nullptr) { throw std::invalid_argument("unset_env_var: null name"); }
  ::unsetenv(name);
}

std::string_view os_name() {
#if defined(__APPLE__) && defined(__MACH__)
  return "macos";
#elif defined(__linux__)
  return "linux";
#elif defined(__FreeBSD__)
  return "freebsd";
#else
  return "unknown";
#endif
}

std::string_view arch_name() {
#if defined(__APPLE__) && (defined(__aarch64__) || defined(__arm64__))
  return "arm64";
#elif defined(__aarch64__)
  return "aarch64";
#elif defined(__x86_64__)
  return "x86_64";
#elif defined(__riscv) && __riscv_xlen == 64
  return "riscv64";
#else
  return "unknown";
#endif
}

bool requires_exec_bits() { return true; }

char path_list_separator() { return ':'; }

std::vector<std::string> executable_suffixes() { return { "" }; }

bool is_executable_file(std::filesystem::path const &path) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec) || ec) { return false; }
  return ::access(path.c_str(), X_OK) == 0;
}

}  // namespace ferry::platform
