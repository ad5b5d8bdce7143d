#include "http.h"

namespace ferry {

http_response_stream::http_response_stream(bool follow_redirects,
                                           http_status_cb_t const &on_status,
                                           http_body_cb_t const &on_body)
    : follow_redirects_{ follow_redirects }, on_status_{ on_status }, on_body_{ on_body } {}

bool http_response_stream::deliver_status(long status) {
  if (status_delivered_) { return !stopped_by_caller_; }
  status_delivered_ = true;
  status_ = status;
  if (on_status_ && !on_status_(status_)) {
    stopped_by_caller_ = true;
    return false;
  }
  return true;
}

bool http_response_stream::write(long status, char const *data, std::size_t size) {
  if (error_) { return false; }

  // Redirect bodies are not part of the response the caller asked for.
  if (follow_redirects_ && !status_delivered_ && status >= 300 && status < 400) {
    return true;
  }

  try {
    if (!deliver_status(status)) { return false; }
    if (on_body_) { on_body_(data, size); }
  } catch (...) {
    // Transports call this from C frames, which must not unwind.
    error_ = std::current_exception();
    return false;
  }
  return true;
}

void http_response_stream::finish(long status) { static_cast<void>(deliver_status(status)); }

void http_response_stream::rethrow_if_failed() const {
  if (error_) { std::rethrow_exception(error_); }
}

bool http_status_is_success(long status) { return status >= 200 && status < 300; }

http_text_response http_get_text(http_client &client, http_request const &request) {
  http_text_response response{};
  response.status = client.get(
      request,
      [](long) { return true; },
      [&response](char const *data, std::size_t size) { response.body.append(data, size); });
  return response;
}

}  // namespace ferry
