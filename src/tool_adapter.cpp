#include "tool_adapter.h"

#include "asset_name.h"
#include "platform.h"
#include "provision_error.h"
#include "tui.h"
#include "util.h"

#include <exception>
#include <stdexcept>
#include <utility>

namespace ferry {

host_platform host_platform_current() {
  return host_platform{ .os = std::string{ platform::os_name() },
                        .arch = std::string{ platform::arch_name() },
                        .requires_exec_bits = platform::requires_exec_bits() };
}

tool_adapter::tool_adapter(tool_spec spec,
                           path_resolver const &paths,
                           http_client &http,
                           release_index &releases,
                           host_platform host)
    : spec_{ std::move(spec) },
      paths_{ paths },
      releases_{ releases },
      host_{ std::move(host) },
      cache_{ spec_.name, spec_.server_arguments, http, host_.requires_exec_bits } {
  if (!util_is_plain_file_name(spec_.name)) {
    throw std::invalid_argument("tool name '" + spec_.name + "' is not a plain file name");
  }
}

std::filesystem::path tool_adapter::container_dir(
    std::filesystem::path const &cache_root) const {
  return cache_root / spec_.name;
}

std::optional<server_binary> tool_adapter::probe_installed() const {
  auto const path{ paths_.which(spec_.name) };
  if (!path) { return std::nullopt; }

  tui::debug("%s found on PATH at %s", spec_.name.c_str(), path->string().c_str());
  return server_binary{ .path = *path, .arguments = spec_.server_arguments };
}

release_version tool_adapter::resolve_latest() {
  // Before any network access: an unsupported host can never succeed.
  auto const asset_name{ asset_name_resolve(spec_, host_.os, host_.arch) };

  github_release release;
  try {
    release = releases_.latest_release({ .repo = spec_.repo,
                                         .include_prereleases = spec_.include_prereleases,
                                         .include_drafts = spec_.include_drafts,
                                         .require_assets = spec_.require_assets });
  } catch (provision_error const &) {
    throw;
  } catch (std::exception const &e) {
    throw provision_error(provision_errc::release_query_failed,
                          std::string{ "error fetching latest release: " } + e.what());
  }

  // The tag names the cache entry.
  if (!util_is_plain_file_name(release.tag_name)) {
    throw provision_error(provision_errc::release_query_failed,
                          "error fetching latest release: unusable tag \"" + release.tag_name +
                              "\" in " + spec_.repo);
  }

  auto const asset{ github_find_asset(release, asset_name) };
  if (!asset) {
    throw provision_error(provision_errc::no_matching_asset,
                          "no asset found matching \"" + asset_name + "\" in " + spec_.repo +
                              " " + release.tag_name);
  }

  tui::debug("%s latest is %s (%s)",
             spec_.name.c_str(),
             release.tag_name.c_str(),
             asset->browser_download_url.c_str());
  return release_version{ .name = release.tag_name, .url = asset->browser_download_url };
}

server_binary tool_adapter::materialize(release_version const &version,
                                        std::filesystem::path const &container) {
  return cache_.materialize(version, container);
}

std::optional<server_binary> tool_adapter::read_cached(
    std::filesystem::path const &container) const {
  return cache_.read_cached(container);
}

std::optional<code_label> tool_adapter::format_completion_label(
    completion_item const &item) const {
  return ferry::format_completion_label(item);
}

}  // namespace ferry
