#pragma once

#include "server_binary.h"
#include "tool_adapter.h"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace ferry {

struct provision_options {
  bool offline{ false };         // consult only the local cache
  bool allow_installed{ true };  // a binary on PATH wins
};

enum class provision_source { installed, fetched, cached };

std::string_view provision_source_name(provision_source source);

struct provision_result {
  server_binary binary;
  provision_source source;
};

// Resolution chain: installed, then latest release (downloaded if needed), then
// whatever the cache already holds. Resolution or download errors are logged and
// fall through to the cache. nullopt when every strategy comes up empty.
std::optional<provision_result> provision(tool_adapter &adapter,
                                          std::filesystem::path const &container,
                                          provision_options const &options = {});

struct provision_request {
  tool_adapter *adapter;
  std::filesystem::path container;
  provision_options options{};
};

using provision_result_t = std::variant<provision_result, std::string>;  // string on error

// One thread per request. Adapters must be distinct.
std::vector<provision_result_t> provision_all(std::vector<provision_request> const &requests);

}  // namespace ferry
