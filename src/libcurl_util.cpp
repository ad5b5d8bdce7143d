#include "libcurl_util.h"

#include "tui.h"

#include "curl/curl.h"

#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>

#ifndef FERRY_VERSION_STR
#error "FERRY_VERSION_STR must be defined by the build system"
#endif

namespace ferry {

namespace {

constexpr char kDefaultUserAgent[]{ "ferry/" FERRY_VERSION_STR };

struct transfer_state {
  CURL *handle{ nullptr };
  http_response_stream *stream{ nullptr };
};

long current_status(CURL *handle) {
  long status{ 0 };
  if (curl_easy_getinfo(handle, CURLINFO_RESPONSE_CODE, &status) != CURLE_OK) { return 0; }
  return status;
}

size_t curl_write_body(char *ptr, size_t size, size_t nmemb, void *userdata) {
  auto *st{ static_cast<transfer_state *>(userdata) };
  size_t const total{ size * nmemb };
  return st->stream->write(current_status(st->handle), ptr, total) ? total : 0;
}

}  // namespace

void libcurl_ensure_initialized() {
  static std::once_flag once;
  std::call_once(once, [] {
    CURLcode const code{ curl_global_init(CURL_GLOBAL_DEFAULT) };
    if (code != CURLE_OK) {
      throw std::runtime_error(std::string("curl_global_init failed: ") +
                               curl_easy_strerror(code));
    }
  });
}

std::string libcurl_version_string() {
  curl_version_info_data const *info{ curl_version_info(CURLVERSION_NOW) };
  if (!info) { return "unknown"; }

  std::string result{ info->version };
  if (info->ssl_version) {
    result += " (";
    result += info->ssl_version;
    if (info->libz_version) {
      result += ", zlib/";
      result += info->libz_version;
    }
    result += ")";
  }
  return result;
}

long libcurl_http_client::get(http_request const &request,
                              http_status_cb_t const &on_status,
                              http_body_cb_t const &on_body) {
  libcurl_ensure_initialized();

  if (request.url.empty()) { throw std::invalid_argument("libcurl: url is empty"); }

  std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> handle{ curl_easy_init(),
                                                              &curl_easy_cleanup };
  if (!handle) { throw std::runtime_error("curl_easy_init failed"); }

  std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)> header_list{
    nullptr,
    &curl_slist_free_all
  };
  for (auto const &[name, value] : request.headers) {
    std::string const line{ name + ": " + value };
    curl_slist *const appended{ curl_slist_append(header_list.get(), line.c_str()) };
    if (!appended) { throw std::runtime_error("curl_slist_append failed"); }
    static_cast<void>(header_list.release());
    header_list.reset(appended);
  }

  auto const setopt = [handle = handle.get()](auto option, auto value) {
    CURLcode const rc{ curl_easy_setopt(handle, option, value) };
    if (rc != CURLE_OK) {
      throw std::runtime_error(std::string("curl_easy_setopt failed: ") +
                               curl_easy_strerror(rc));
    }
  };

  http_response_stream stream{ request.follow_redirects, on_status, on_body };
  transfer_state st{ .handle = handle.get(), .stream = &stream };

  setopt(CURLOPT_URL, request.url.c_str());
  setopt(CURLOPT_FOLLOWLOCATION, request.follow_redirects ? 1L : 0L);
  setopt(CURLOPT_NOSIGNAL, 1L);
  setopt(CURLOPT_USERAGENT, kDefaultUserAgent);
  setopt(CURLOPT_WRITEFUNCTION, curl_write_body);
  setopt(CURLOPT_WRITEDATA, &st);
  setopt(CURLOPT_NOPROGRESS, 1L);
  if (header_list) { setopt(CURLOPT_HTTPHEADER, header_list.get()); }

  tui::debug("GET %s", request.url.c_str());
  CURLcode const perform_result{ curl_easy_perform(handle.get()) };

  stream.rethrow_if_failed();
  if (stream.stopped_by_caller()) { return stream.status(); }
  if (perform_result != CURLE_OK) {
    throw std::runtime_error(std::string("curl_easy_perform failed: ") +
                             curl_easy_strerror(perform_result));
  }

  // Empty bodies never reach the write callback.
  stream.finish(current_status(handle.get()));
  return stream.status();
}

}  // namespace ferry
