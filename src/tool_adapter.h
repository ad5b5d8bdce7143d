#pragma once

#include "binary_cache.h"
#include "completion_label.h"
#include "github_release.h"
#include "http.h"
#include "path_probe.h"
#include "server_binary.h"
#include "tool_spec.h"
#include "util.h"

#include <filesystem>
#include <optional>
#include <string>

namespace ferry {

struct host_platform {
  std::string os;
  std::string arch;
  bool requires_exec_bits{ true };
};

host_platform host_platform_current();

// Host-facing surface for one language-server tool. The tool's identity lives
// here, in `spec`, so several adapters can coexist in one process.
class tool_adapter : unmovable {
 public:
  tool_adapter(tool_spec spec,
               path_resolver const &paths,
               http_client &http,
               release_index &releases,
               host_platform host = host_platform_current());

  tool_spec const &spec() const { return spec_; }
  std::string const &name() const { return spec_.name; }

  // Per-tool directory under the cache root.
  std::filesystem::path container_dir(std::filesystem::path const &cache_root) const;

  std::optional<server_binary> probe_installed() const;

  // Throws provision_error: unsupported_platform, release_query_failed or
  // no_matching_asset.
  release_version resolve_latest();

  server_binary materialize(release_version const &version,
                            std::filesystem::path const &container);

  std::optional<server_binary> read_cached(std::filesystem::path const &container) const;

  std::optional<code_label> format_completion_label(completion_item const &item) const;

 private:
  tool_spec spec_;
  path_resolver const &paths_;
  release_index &releases_;
  host_platform host_;
  binary_cache cache_;
};

}  // namespace ferry
