#include "provision.h"

#include "provision_error.h"
#include "tui.h"
#include "util.h"

#include <exception>
#include <stdexcept>
#include <string>
#include <utility>

namespace ferry {

std::string_view provision_source_name(provision_source source) {
  switch (source) {
    case provision_source::installed: return "installed";
    case provision_source::fetched: return "fetched";
    case provision_source::cached: return "cached";
  }
  return "unknown";
}

namespace {

std::optional<provision_result> from_cache(tool_adapter const &adapter,
                                           std::filesystem::path const &container) {
  auto binary{ adapter.read_cached(container) };
  if (!binary) { return std::nullopt; }
  tui::debug("%s: using cached %s", adapter.name().c_str(), binary->path.string().c_str());
  return provision_result{ .binary = std::move(*binary), .source = provision_source::cached };
}

}  // namespace

std::optional<provision_result> provision(tool_adapter &adapter,
                                          std::filesystem::path const &container,
                                          provision_options const &options) {
  if (options.allow_installed) {
    if (auto binary{ adapter.probe_installed() }) {
      return provision_result{ .binary = std::move(*binary),
                               .source = provision_source::installed };
    }
  }

  if (options.offline) { return from_cache(adapter, container); }

  try {
    auto const version{ adapter.resolve_latest() };
    return provision_result{ .binary = adapter.materialize(version, container),
                             .source = provision_source::fetched };
  } catch (provision_error const &e) {
    tui::error("%s: %s (%s)",
               adapter.name().c_str(),
               e.what(),
               std::string{ provision_errc_name(e.code()) }.c_str());
  } catch (std::exception const &e) {
    tui::error("%s: %s", adapter.name().c_str(), e.what());
  }

  return from_cache(adapter, container);
}

std::vector<provision_result_t> provision_all(std::vector<provision_request> const &requests) {
  std::vector<provision_result_t> results(requests.size());

  util_thread_group workers;

  for (size_t i = 0; i < requests.size(); ++i) {
    workers.spawn([i, &requests, &results]() {
      auto const &req{ requests[i] };
      try {
        if (!req.adapter) { throw std::invalid_argument("provision: null adapter"); }
        if (auto result{ provision(*req.adapter, req.container, req.options) }) {
          results[i] = std::move(*result);
        } else {
          results[i] = "no " + req.adapter->name() + " binary available";
        }
      } catch (std::exception const &e) {
        results[i] = std::string(e.what());
      } catch (...) { results[i] = "Unknown error during provisioning"; }
    });
  }

  workers.join_all();

  return results;
}

}  // namespace ferry
