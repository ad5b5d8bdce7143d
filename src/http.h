#pragma once

#include <cstddef>
#include <exception>
#include <functional>
#include <string>
#include <utility>
#include <vector>

namespace ferry {

struct http_request {
  std::string url;
  std::vector<std::pair<std::string, std::string>> headers;
  bool follow_redirects{ true };
};

// Called once with the final response status, before any body bytes. Return false
// to stop the transfer without reading the body.
using http_status_cb_t = std::function<bool(long status)>;

// Called for each body chunk, in order. May throw; the exception aborts the
// transfer and propagates out of http_client::get.
using http_body_cb_t = std::function<void(char const *data, std::size_t size)>;

// Drives the status and body callbacks of one transfer. A transport feeds every body
// chunk together with the status of the response that chunk belongs to, which during
// redirects is not yet the final one.
class http_response_stream {
 public:
  http_response_stream(bool follow_redirects,
                       http_status_cb_t const &on_status,
                       http_body_cb_t const &on_body);

  // Returns false when the transfer should stop: the caller declined the body or a
  // callback threw. A thrown exception is held for rethrow_if_failed.
  bool write(long status, char const *data, std::size_t size);

  // End of a completed transfer. Delivers the status if no body chunk did.
  void finish(long status);

  void rethrow_if_failed() const;
  bool stopped_by_caller() const { return stopped_by_caller_; }
  long status() const { return status_; }

 private:
  bool deliver_status(long status);

  bool follow_redirects_;
  http_status_cb_t const &on_status_;
  http_body_cb_t const &on_body_;
  bool status_delivered_{ false };
  bool stopped_by_caller_{ false };
  long status_{ 0 };
  std::exception_ptr error_;
};

class http_client {
 public:
  virtual ~http_client() = default;

  // Stream a GET. Returns the final status. Transport failures (DNS, TLS,
  // connection reset mid-body) throw std::runtime_error.
  virtual long get(http_request const &request,
                   http_status_cb_t const &on_status,
                   http_body_cb_t const &on_body) = 0;
};

bool http_status_is_success(long status);

struct http_text_response {
  long status{ 0 };
  std::string body;
};

// Buffer a whole response body regardless of status.
http_text_response http_get_text(http_client &client, http_request const &request);

}  // namespace ferry
