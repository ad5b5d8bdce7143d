#pragma once

#include "http.h"
#include "server_binary.h"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace ferry {

// A resolved upstream release: tag plus the exact URL of this platform's asset.
struct release_version {
  std::string name;  // release tag
  std::string url;
};

// Versioned cache of one tool's binary inside a container directory. Each entry is
// a single file "{tool}-{version}"; a successful fetch leaves only that file.
class binary_cache {
 public:
  binary_cache(std::string tool_name,
               std::vector<std::string> server_arguments,
               http_client &http,
               bool requires_exec_bits);

  // Throws provision_error{download_failed} unless the tool name and version are
  // plain file names.
  std::filesystem::path entry_path(std::filesystem::path const &container,
                                   std::string const &version) const;

  // Ensure the entry for `version` exists, downloading it if absent, then prune
  // every other entry. An existing entry short-circuits with no network access.
  // Throws provision_error{download_failed}; a non-2xx response leaves the
  // freshly created (empty) file behind.
  server_binary materialize(release_version const &version,
                            std::filesystem::path const &container);

  // Last entry in directory iteration order, with no arguments. Missing, empty
  // or unreadable containers yield nullopt.
  std::optional<server_binary> read_cached(std::filesystem::path const &container) const;

 private:
  void download(release_version const &version, std::filesystem::path const &target);
  void prune(std::filesystem::path const &container, std::filesystem::path const &keep) const;

  std::string tool_name_;
  std::vector<std::string> server_arguments_;
  http_client &http_;
  bool requires_exec_bits_;
};

}  // namespace ferry
