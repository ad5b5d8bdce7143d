#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace ferry {

enum class provision_errc {
  unsupported_platform,  // host OS/arch has no asset; retrying cannot help
  release_query_failed,  // release index unreachable, rejected, or unparsable
  no_matching_asset,     // latest release ships nothing for this platform
  download_failed,       // non-2xx status or transfer/disk error mid-stream
};

std::string_view provision_errc_name(provision_errc code);

class provision_error : public std::runtime_error {
 public:
  provision_error(provision_errc code,
                  std::string const &message,
                  std::optional<long> http_status = std::nullopt);

  provision_errc code() const noexcept { return code_; }

  // Set only for download_failed caused by an unsuccessful HTTP response.
  std::optional<long> http_status() const noexcept { return http_status_; }

 private:
  provision_errc code_;
  std::optional<long> http_status_;
};

}  // namespace ferry
