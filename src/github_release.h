#pragma once

#include "http.h"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ferry {

struct github_asset {
  std::string name;
  std::string browser_download_url;
};

struct github_release {
  std::string tag_name;
  bool prerelease{ false };
  bool draft{ false };
  std::vector<github_asset> assets;
};

struct release_query {
  std::string repo;  // "owner/name"
  bool include_prereleases{ false };
  bool include_drafts{ false };
  bool require_assets{ true };
};

class release_index {
 public:
  virtual ~release_index() = default;

  // Newest release matching `query`. Throws std::runtime_error when the index
  // cannot be reached or holds no qualifying release.
  virtual github_release latest_release(release_query const &query) = 0;
};

// Talks to the GitHub REST API through `http`.
class github_release_index : public release_index {
 public:
  // Base URL from FERRY_GITHUB_API_URL (default https://api.github.com), bearer
  // token from GITHUB_TOKEN when set.
  explicit github_release_index(http_client &http);
  github_release_index(http_client &http,
                       std::string api_base_url,
                       std::optional<std::string> token);

  github_release latest_release(release_query const &query) override;

  http_request releases_request(std::string_view repo) const;

 private:
  http_client &http_;
  std::string api_base_url_;
  std::optional<std::string> token_;
};

// Parse the body of GET /repos/{owner}/{repo}/releases. Throws std::runtime_error
// on malformed JSON or missing required fields.
std::vector<github_release> github_parse_releases(std::string const &json);

// First release in API order (newest first) that the query admits.
std::optional<github_release> github_select_release(std::vector<github_release> const &releases,
                                                    release_query const &query);

std::optional<github_asset> github_find_asset(github_release const &release,
                                              std::string_view name);

}  // namespace ferry
