#include "http.h"

#include "doctest/doctest.h"

#include <stdexcept>
#include <string>
#include <vector>

namespace {

struct recorded_stream {
  std::vector<long> statuses;
  std::string body;
  bool accept_body{ true };

  ferry::http_status_cb_t on_status{ [this](long status) {
    statuses.push_back(status);
    return accept_body;
  } };
  ferry::http_body_cb_t on_body{ [this](char const *data, std::size_t size) {
    body.append(data, size);
  } };
};

bool feed(ferry::http_response_stream &stream, long status, std::string const &chunk) {
  return stream.write(status, chunk.data(), chunk.size());
}

}  // namespace

TEST_CASE_FIXTURE(recorded_stream, "http_response_stream skips redirect bodies when following") {
  ferry::http_response_stream stream{ true, on_status, on_body };

  CHECK(feed(stream, 302, "<html>moved</html>"));
  CHECK(feed(stream, 301, "<html>moved again</html>"));
  CHECK(feed(stream, 200, "abc"));
  CHECK(feed(stream, 200, "def"));
  stream.finish(200);

  CHECK(statuses == std::vector<long>{ 200 });
  CHECK(body == "abcdef");
  CHECK(stream.status() == 200);
  CHECK_NOTHROW(stream.rethrow_if_failed());
}

TEST_CASE_FIXTURE(recorded_stream, "http_response_stream delivers 3xx bodies when not following") {
  ferry::http_response_stream stream{ false, on_status, on_body };

  CHECK(feed(stream, 302, "moved"));
  stream.finish(302);

  CHECK(statuses == std::vector<long>{ 302 });
  CHECK(body == "moved");
}

TEST_CASE_FIXTURE(recorded_stream, "http_response_stream reports the status once") {
  ferry::http_response_stream stream{ true, on_status, on_body };

  CHECK(feed(stream, 404, "Not "));
  CHECK(feed(stream, 0, "Found"));
  stream.finish(404);

  CHECK(statuses == std::vector<long>{ 404 });
  CHECK(body == "Not Found");
  CHECK(stream.status() == 404);
}

TEST_CASE_FIXTURE(recorded_stream, "http_response_stream reports the status of an empty body") {
  ferry::http_response_stream stream{ true, on_status, on_body };
  stream.finish(204);

  CHECK(statuses == std::vector<long>{ 204 });
  CHECK(body.empty());
  CHECK(stream.status() == 204);
}

TEST_CASE_FIXTURE(recorded_stream, "http_response_stream stops when the caller declines") {
  accept_body = false;
  ferry::http_response_stream stream{ true, on_status, on_body };

  CHECK_FALSE(feed(stream, 500, "boom"));
  CHECK_FALSE(feed(stream, 500, "more"));

  CHECK(stream.stopped_by_caller());
  CHECK(stream.status() == 500);
  CHECK(statuses == std::vector<long>{ 500 });
  CHECK(body.empty());
  CHECK_NOTHROW(stream.rethrow_if_failed());
}

TEST_CASE("http_response_stream holds callback exceptions for the caller") {
  int chunks{ 0 };
  ferry::http_status_cb_t const on_status{ [](long) { return true; } };
  ferry::http_body_cb_t const on_body{ [&chunks](char const *, std::size_t) {
    ++chunks;
    throw std::runtime_error("disk full");
  } };
  ferry::http_response_stream stream{ true, on_status, on_body };

  std::string const chunk{ "payload" };
  CHECK_FALSE(stream.write(200, chunk.data(), chunk.size()));
  CHECK_FALSE(stream.write(200, chunk.data(), chunk.size()));
  CHECK(chunks == 1);
  CHECK_FALSE(stream.stopped_by_caller());
  CHECK_THROWS_WITH_AS(stream.rethrow_if_failed(), "disk full", std::runtime_error);
}

TEST_CASE("http_response_stream propagates status callback exceptions from finish") {
  ferry::http_status_cb_t const on_status{ [](long status) -> bool {
    throw std::runtime_error("HTTP " + std::to_string(status));
  } };
  ferry::http_body_cb_t const on_body{};
  ferry::http_response_stream stream{ true, on_status, on_body };

  CHECK_THROWS_WITH_AS(stream.finish(404), "HTTP 404", std::runtime_error);
}

TEST_CASE("http_status_is_success covers 2xx only") {
  CHECK(ferry::http_status_is_success(200));
  CHECK(ferry::http_status_is_success(299));
  CHECK_FALSE(ferry::http_status_is_success(199));
  CHECK_FALSE(ferry::http_status_is_success(302));
  CHECK_FALSE(ferry::http_status_is_success(404));
  CHECK_FALSE(ferry::http_status_is_success(0));
}
