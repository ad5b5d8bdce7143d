#include "asset_name.h"

#include "platform.h"
#include "provision_error.h"

namespace ferry {

std::string_view asset_normalize_os(std::string_view os) {
  if (os == "darwin" || os == "osx" || os == "macos") { return "macos"; }
  if (os == "win32" || os == "windows") { return "windows"; }
  return os;
}

std::string_view asset_normalize_arch(std::string_view arch) {
  if (arch == "amd64" || arch == "x64" || arch == "x86_64") { return "x86_64"; }
  return arch;
}

std::string asset_name_resolve(tool_spec const &spec,
                               std::string_view os,
                               std::string_view arch) {
  auto const host_os{ asset_normalize_os(os) };
  auto const host_arch{ asset_normalize_arch(arch) };

  bool os_known{ false };
  asset_rule const *wildcard{ nullptr };
  asset_rule const *exact{ nullptr };

  for (auto const &rule : spec.assets) {
    if (asset_normalize_os(rule.os) != host_os) { continue; }
    os_known = true;
    if (rule.arch == "*") {
      if (!wildcard) { wildcard = &rule; }
    } else if (asset_normalize_arch(rule.arch) == host_arch) {
      exact = &rule;
      break;
    }
  }

  if (!os_known) {
    throw provision_error(provision_errc::unsupported_platform,
                          "Running on unsupported os: " + std::string{ os });
  }

  asset_rule const *const rule{ exact ? exact : wildcard };
  if (!rule) {
    throw provision_error(provision_errc::unsupported_platform,
                          "Running on unsupported architecture: " + std::string{ arch });
  }

  if (!rule->suffix.empty() && rule->suffix.front() == '.') {
    return spec.name + rule->suffix;
  }
  return spec.name + "-" + rule->suffix;
}

std::string asset_name_for_host(tool_spec const &spec) {
  return asset_name_resolve(spec, platform::os_name(), platform::arch_name());
}

}  // namespace ferry
