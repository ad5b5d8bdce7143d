#pragma once

#include "http.h"

#include <string>

namespace ferry {

void libcurl_ensure_initialized();

// e.g. "8.5.0 (OpenSSL/3.0.13, zlib)"
std::string libcurl_version_string();

class libcurl_http_client : public http_client {
 public:
  long get(http_request const &request,
           http_status_cb_t const &on_status,
           http_body_cb_t const &on_body) override;
};

}  // namespace ferry
