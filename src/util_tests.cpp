#include "util.h"

#include "doctest/doctest.h"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace {

std::filesystem::path make_temp_path(char const *tag) {
  static std::atomic<int> counter{ 0 };
  auto const id = counter.fetch_add(1, std::memory_order_relaxed);
  auto base{ std::filesystem::temp_directory_path() };
  return base / ("ferry-util-test-" + std::string(tag) + "-" + std::to_string(id));
}

}  // namespace

TEST_CASE("util_format_bytes uses integer for bytes") {
  CHECK(ferry::util_format_bytes(0) == "0B");
  CHECK(ferry::util_format_bytes(1023) == "1023B");
}

TEST_CASE("util_format_bytes scales to KB and MB") {
  CHECK(ferry::util_format_bytes(1536) == "1.50KB");
  CHECK(ferry::util_format_bytes(5ull * 1024 * 1024) == "5.00MB");
}

TEST_CASE("util_load_file loads empty file") {
  auto const path{ make_temp_path("empty") };
  { std::ofstream out{ path }; }

  CHECK(ferry::util_load_file(path).empty());
  std::filesystem::remove(path);
}

TEST_CASE("util_load_file loads small text file") {
  auto const path{ make_temp_path("text") };
  {
    std::ofstream out{ path, std::ios::binary };
    out << "{\"name\": \"marksman\"}\n";
  }

  CHECK(ferry::util_load_file(path) == "{\"name\": \"marksman\"}\n");
  std::filesystem::remove(path);
}

TEST_CASE("util_load_file throws on nonexistent file") {
  CHECK_THROWS_AS(ferry::util_load_file(make_temp_path("missing")), std::runtime_error);
}

TEST_CASE("util_split_list drops empty elements") {
  auto const parts{ ferry::util_split_list("/usr/bin::/bin:", ':') };
  REQUIRE(parts.size() == 2);
  CHECK(parts[0] == "/usr/bin");
  CHECK(parts[1] == "/bin");
}

TEST_CASE("util_split_list handles empty input") {
  CHECK(ferry::util_split_list("", ':').empty());
  CHECK(ferry::util_split_list(":::", ':').empty());
}

TEST_CASE("util_trim strips whitespace") {
  CHECK(ferry::util_trim("  2024-12-18\r\n") == "2024-12-18");
  CHECK(ferry::util_trim(" \t ").empty());
  CHECK(ferry::util_trim("v1") == "v1");
}

TEST_CASE("util_is_plain_file_name rejects path components") {
  CHECK(ferry::util_is_plain_file_name("marksman"));
  CHECK(ferry::util_is_plain_file_name("marksman-2023-12-09"));
  CHECK(ferry::util_is_plain_file_name("v1.2.3"));
  CHECK(ferry::util_is_plain_file_name("..."));

  CHECK_FALSE(ferry::util_is_plain_file_name(""));
  CHECK_FALSE(ferry::util_is_plain_file_name("."));
  CHECK_FALSE(ferry::util_is_plain_file_name(".."));
  CHECK_FALSE(ferry::util_is_plain_file_name("/tmp/victim"));
  CHECK_FALSE(ferry::util_is_plain_file_name("release/1.0"));
  CHECK_FALSE(ferry::util_is_plain_file_name("..\\up"));
  CHECK_FALSE(ferry::util_is_plain_file_name("C:tool"));
  CHECK_FALSE(ferry::util_is_plain_file_name(std::string{ "a\0b", 3 }));
}

TEST_CASE("util_thread_group joins started threads when a later step throws") {
  std::atomic<int> finished{ 0 };

  auto const spawn_then_fail = [&finished] {
    ferry::util_thread_group group;
    for (int i = 0; i < 3; ++i) {
      group.spawn([&finished] {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
        finished.fetch_add(1);
      });
    }
    throw std::runtime_error("spawn failed");
  };

  CHECK_THROWS_WITH_AS(spawn_then_fail(), "spawn failed", std::runtime_error);
  CHECK(finished.load() == 3);
}

TEST_CASE("util_thread_group join_all is idempotent") {
  std::atomic<int> finished{ 0 };
  ferry::util_thread_group group;
  group.spawn([&finished] { finished.fetch_add(1); });
  group.join_all();
  CHECK(finished.load() == 1);
  CHECK_NOTHROW(group.join_all());
}
