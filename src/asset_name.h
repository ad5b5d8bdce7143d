#pragma once

#include "tool_spec.h"

#include <string>
#include <string_view>

namespace ferry {

// Asset name the distributor publishes for (os, arch): "{tool}-{suffix}", or
// "{tool}{suffix}" when the suffix is a file extension (".exe").
// Throws provision_error{unsupported_platform} naming the unknown OS, or the
// unknown architecture when the OS is known.
std::string asset_name_resolve(tool_spec const &spec,
                               std::string_view os,
                               std::string_view arch);

std::string asset_name_for_host(tool_spec const &spec);

// Canonical spellings: darwin/osx -> macos, win32 -> windows; amd64/x64 -> x86_64.
std::string_view asset_normalize_os(std::string_view os);
std::string_view asset_normalize_arch(std::string_view arch);

}  // namespace ferry
