#include "provision_error.h"

namespace ferry {

std::string_view provision_errc_name(provision_errc code) {
  switch (code) {
    case provision_errc::unsupported_platform: return "unsupported_platform";
    case provision_errc::release_query_failed: return "release_query_failed";
    case provision_errc::no_matching_asset: return "no_matching_asset";
    case provision_errc::download_failed: return "download_failed";
  }
  return "unknown";
}

provision_error::provision_error(provision_errc code,
                                 std::string const &message,
                                 std::optional<long> http_status)
    : std::runtime_error{ message }, code_{ code }, http_status_{ http_status } {}

}  // namespace ferry
