#include "github_release.h"

#include "tui.h"
#include "util.h"

#include "picojson.h"

#include <cstdlib>
#include <stdexcept>
#include <string>
#include <utility>

namespace ferry {

namespace {

constexpr char kDefaultApiBaseUrl[]{ "https://api.github.com" };

std::optional<std::string> env_string(char const *name) {
  char const *value{ std::getenv(name) };
  if (!value) { return std::nullopt; }
  auto const trimmed{ util_trim(value) };
  if (trimmed.empty()) { return std::nullopt; }
  return std::string{ trimmed };
}

std::string const &require_string(picojson::object const &obj, char const *key) {
  auto const it{ obj.find(key) };
  if (it == obj.end() || !it->second.is<std::string>()) {
    throw std::runtime_error(std::string{ "release JSON: missing string field '" } + key +
                             "'");
  }
  return it->second.get<std::string>();
}

bool optional_bool(picojson::object const &obj, char const *key) {
  auto const it{ obj.find(key) };
  return it != obj.end() && it->second.is<bool>() && it->second.get<bool>();
}

github_release parse_release(picojson::value const &v) {
  if (!v.is<picojson::object>()) {
    throw std::runtime_error("release JSON: release entry is not an object");
  }
  auto const &obj{ v.get<picojson::object>() };

  github_release release{ .tag_name = require_string(obj, "tag_name"),
                          .prerelease = optional_bool(obj, "prerelease"),
                          .draft = optional_bool(obj, "draft") };

  auto const assets_it{ obj.find("assets") };
  if (assets_it == obj.end() || assets_it->second.is<picojson::null>()) { return release; }
  if (!assets_it->second.is<picojson::array>()) {
    throw std::runtime_error("release JSON: field 'assets' is not an array");
  }

  for (auto const &a : assets_it->second.get<picojson::array>()) {
    if (!a.is<picojson::object>()) {
      throw std::runtime_error("release JSON: asset entry is not an object");
    }
    auto const &asset_obj{ a.get<picojson::object>() };
    release.assets.push_back({ .name = require_string(asset_obj, "name"),
                               .browser_download_url =
                                   require_string(asset_obj, "browser_download_url") });
  }
  return release;
}

}  // namespace

github_release_index::github_release_index(http_client &http)
    : github_release_index{ http,
                            env_string("FERRY_GITHUB_API_URL").value_or(kDefaultApiBaseUrl),
                            env_string("GITHUB_TOKEN") } {}

github_release_index::github_release_index(http_client &http,
                                           std::string api_base_url,
                                           std::optional<std::string> token)
    : http_{ http }, api_base_url_{ std::move(api_base_url) }, token_{ std::move(token) } {
  while (!api_base_url_.empty() && api_base_url_.back() == '/') { api_base_url_.pop_back(); }
}

http_request github_release_index::releases_request(std::string_view repo) const {
  http_request req{ .url = api_base_url_ + "/repos/" + std::string{ repo } + "/releases" };
  req.headers.emplace_back("Accept", "application/vnd.github+json");
  req.headers.emplace_back("X-GitHub-Api-Version", "2022-11-28");
  if (token_) { req.headers.emplace_back("Authorization", "Bearer " + *token_); }
  req.follow_redirects = true;
  return req;
}

github_release github_release_index::latest_release(release_query const &query) {
  auto const req{ releases_request(query.repo) };
  auto const response{ http_get_text(http_, req) };
  if (!http_status_is_success(response.status)) {
    throw std::runtime_error("GET " + req.url + " returned HTTP " +
                             std::to_string(response.status));
  }

  auto const releases{ github_parse_releases(response.body) };
  tui::debug("%s: %zu releases listed", query.repo.c_str(), releases.size());

  auto selected{ github_select_release(releases, query) };
  if (!selected) { throw std::runtime_error("no qualifying release found for " + query.repo); }
  return std::move(*selected);
}

std::vector<github_release> github_parse_releases(std::string const &json) {
  picojson::value root;
  std::string const err{ picojson::parse(root, json) };
  if (!err.empty()) { throw std::runtime_error("release JSON: " + err); }
  if (!root.is<picojson::array>()) {
    throw std::runtime_error("release JSON: top level is not an array");
  }

  std::vector<github_release> releases;
  for (auto const &v : root.get<picojson::array>()) { releases.push_back(parse_release(v)); }
  return releases;
}

std::optional<github_release> github_select_release(std::vector<github_release> const &releases,
                                                    release_query const &query) {
  for (auto const &r : releases) {
    if (r.draft && !query.include_drafts) { continue; }
    if (r.prerelease && !query.include_prereleases) { continue; }
    if (query.require_assets && r.assets.empty()) { continue; }
    return r;
  }
  return std::nullopt;
}

std::optional<github_asset> github_find_asset(github_release const &release,
                                              std::string_view name) {
  for (auto const &a : release.assets) {
    if (a.name == name) { return a; }
  }
  return std::nullopt;
}

}  // namespace ferry
