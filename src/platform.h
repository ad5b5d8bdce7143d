#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#ifdef _WIN32
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#ifndef NOMINMAX
#define NOMINMAX
#endif

#include <windows.h>
#endif

namespace ferry::platform {

std::optional<std::filesystem::path> get_default_cache_root();
char const *get_default_cache_root_env_vars();

void set_env_var(char const *name, char const *value);
void unset_env_var(char const *name);

// Host OS as named by release distributors: "macos", "linux" or "windows".
std::string_view os_name();

// Host CPU architecture: "x86_64", "aarch64" (Linux) or "arm64" (macOS/Windows).
std::string_view arch_name();

// True where a downloaded file only runs once its execute permission bits are set.
bool requires_exec_bits();

char path_list_separator();

// Suffixes tried when resolving a bare command name on PATH. POSIX yields { "" };
// Windows yields the PATHEXT entries (".exe", ".cmd", ...).
std::vector<std::string> executable_suffixes();

// Regular file that the current user may execute. Never throws.
bool is_executable_file(std::filesystem::path const &path);

}  // namespace ferry::platform
