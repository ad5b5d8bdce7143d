#include "binary_cache.h"

#include "provision_error.h"
#include "tui.h"
#include "util.h"

#include <cstdint>
#include <cstdio>
#include <exception>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace ferry {

namespace {

constexpr char kDownloadContext[]{ "error downloading release" };

}  // namespace

binary_cache::binary_cache(std::string tool_name,
                           std::vector<std::string> server_arguments,
                           http_client &http,
                           bool requires_exec_bits)
    : tool_name_{ std::move(tool_name) },
      server_arguments_{ std::move(server_arguments) },
      http_{ http },
      requires_exec_bits_{ requires_exec_bits } {}

std::filesystem::path binary_cache::entry_path(std::filesystem::path const &container,
                                               std::string const &version) const {
  // Both parts become a single file name; anything else could land outside `container`.
  if (!util_is_plain_file_name(tool_name_) || !util_is_plain_file_name(version)) {
    throw provision_error(provision_errc::download_failed,
                          std::string{ kDownloadContext } + ": invalid cache entry name '" +
                              tool_name_ + "-" + version + "'");
  }
  return container / (tool_name_ + "-" + version);
}

server_binary binary_cache::materialize(release_version const &version,
                                        std::filesystem::path const &container) {
  auto const target{ entry_path(container, version.name) };

  std::error_code ec;
  if (std::filesystem::exists(target, ec)) {
    tui::debug("%s %s already cached at %s",
               tool_name_.c_str(),
               version.name.c_str(),
               target.string().c_str());
    return server_binary{ .path = target, .arguments = server_arguments_ };
  }

  try {
    std::filesystem::create_directories(container);
  } catch (std::filesystem::filesystem_error const &e) {
    throw provision_error(provision_errc::download_failed,
                          std::string{ kDownloadContext } + ": " + e.what());
  }

  download(version, target);

  if (requires_exec_bits_) {
    std::filesystem::permissions(target,
                                 std::filesystem::perms::owner_exec |
                                     std::filesystem::perms::group_exec |
                                     std::filesystem::perms::others_exec,
                                 std::filesystem::perm_options::add,
                                 ec);
    if (ec) {
      throw provision_error(provision_errc::download_failed,
                            std::string{ kDownloadContext } + ": chmod " +
                                target.string() + ": " + ec.message());
    }
  }

  prune(container, target);
  return server_binary{ .path = target, .arguments = server_arguments_ };
}

void binary_cache::download(release_version const &version,
                            std::filesystem::path const &target) {
  tui::info("downloading %s %s from %s",
            tool_name_.c_str(),
            version.name.c_str(),
            version.url.c_str());

  file_ptr_t file;
  std::uint64_t written{ 0 };

  auto const on_status = [&](long status) {
    file = util_open_file(target, "wb");
    if (!file) { throw std::runtime_error("cannot create " + target.string()); }
    if (!http_status_is_success(status)) {
      throw provision_error(provision_errc::download_failed,
                            std::string{ kDownloadContext } + ": HTTP " +
                                std::to_string(status) + " from " + version.url,
                            status);
    }
    return true;
  };

  auto const on_body = [&](char const *data, std::size_t size) {
    if (std::fwrite(data, 1, size, file.get()) != size) {
      throw std::runtime_error("short write to " + target.string());
    }
    written += size;
  };

  http_request const request{ .url = version.url, .follow_redirects = true };
  try {
    http_.get(request, on_status, on_body);
    if (!file) { throw std::runtime_error("no response from " + version.url); }
    if (std::fclose(file.release()) != 0) {
      throw std::runtime_error("error closing " + target.string());
    }
  } catch (provision_error const &) {
    throw;
  } catch (std::exception const &e) {
    throw provision_error(provision_errc::download_failed,
                          std::string{ kDownloadContext } + ": " + e.what());
  }

  tui::info("downloaded %s (%s)", target.string().c_str(), util_format_bytes(written).c_str());
}

void binary_cache::prune(std::filesystem::path const &container,
                         std::filesystem::path const &keep) const {
  std::error_code ec;
  std::filesystem::directory_iterator it{ container, ec };
  if (ec) {
    tui::warn("cannot list %s for pruning: %s", container.string().c_str(), ec.message().c_str());
    return;
  }

  std::vector<std::filesystem::path> stale;
  for (auto const end{ std::filesystem::directory_iterator{} }; it != end; it.increment(ec)) {
    if (ec) { break; }
    if (it->path() != keep) { stale.push_back(it->path()); }
  }
  if (ec) {
    tui::warn("error listing %s: %s", container.string().c_str(), ec.message().c_str());
  }

  for (auto const &p : stale) {
    std::error_code remove_ec;
    std::filesystem::remove_all(p, remove_ec);
    if (remove_ec) {
      tui::warn("failed to remove stale %s: %s", p.string().c_str(), remove_ec.message().c_str());
    } else {
      tui::debug("removed stale %s", p.string().c_str());
    }
  }
}

std::optional<server_binary> binary_cache::read_cached(
    std::filesystem::path const &container) const {
  std::error_code ec;
  std::filesystem::directory_iterator it{ container, ec };
  if (ec) {
    tui::debug("no %s cache at %s: %s",
               tool_name_.c_str(),
               container.string().c_str(),
               ec.message().c_str());
    return std::nullopt;
  }

  std::optional<std::filesystem::path> last;
  for (auto const end{ std::filesystem::directory_iterator{} }; it != end; it.increment(ec)) {
    if (ec) { break; }
    last = it->path();
  }
  if (ec) {
    tui::warn("error reading %s cache at %s: %s",
              tool_name_.c_str(),
              container.string().c_str(),
              ec.message().c_str());
    return std::nullopt;
  }

  if (!last) {
    tui::debug("%s cache at %s is empty", tool_name_.c_str(), container.string().c_str());
    return std::nullopt;
  }

  return server_binary{ .path = *last, .arguments = {} };
}

}  // namespace ferry
