#include "path_probe.h"

#include "platform.h"

#include "doctest/doctest.h"

#include <atomic>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>

namespace {

struct temp_bin_dirs {
  temp_bin_dirs() {
    static std::atomic<int> counter{ 0 };
    root = std::filesystem::temp_directory_path() /
           ("ferry-path-probe-test-" + std::to_string(counter.fetch_add(1)));
    std::filesystem::remove_all(root);
    std::filesystem::create_directories(root / "a");
    std::filesystem::create_directories(root / "b");
  }

  ~temp_bin_dirs() {
    std::error_code ec;
    std::filesystem::remove_all(root, ec);
  }

  std::filesystem::path make_tool(char const *dir, std::string name, bool executable) {
#ifdef _WIN32
    name += ".exe";
#endif
    auto const path{ root / dir / name };
    { std::ofstream out{ path }; out << "#!/bin/sh\n"; }
    if (executable) {
      std::filesystem::permissions(path,
                                   std::filesystem::perms::owner_all,
                                   std::filesystem::perm_options::add);
    } else {
      std::filesystem::permissions(path,
                                   std::filesystem::perms::owner_exec |
                                       std::filesystem::perms::group_exec |
                                       std::filesystem::perms::others_exec,
                                   std::filesystem::perm_options::remove);
    }
    return path;
  }

  std::string path_list() const {
    std::string list{ (root / "a").string() };
    list += ferry::platform::path_list_separator();
    list += (root / "b").string();
    return list;
  }

  std::filesystem::path root;
};

}  // namespace

TEST_CASE_FIXTURE(temp_bin_dirs, "which finds executable on search path") {
  auto const expected{ make_tool("b", "marksman", true) };
  ferry::env_path_resolver resolver{ path_list() };

  auto const found{ resolver.which("marksman") };
  REQUIRE(found.has_value());
  CHECK(std::filesystem::equivalent(*found, expected));
}

TEST_CASE_FIXTURE(temp_bin_dirs, "which returns first match in search order") {
  auto const first{ make_tool("a", "marksman", true) };
  make_tool("b", "marksman", true);
  ferry::env_path_resolver resolver{ path_list() };

  auto const found{ resolver.which("marksman") };
  REQUIRE(found.has_value());
  CHECK(std::filesystem::equivalent(*found, first));
}

TEST_CASE_FIXTURE(temp_bin_dirs, "which returns nullopt when tool is absent") {
  ferry::env_path_resolver resolver{ path_list() };
  CHECK_FALSE(resolver.which("marksman").has_value());
}

TEST_CASE("which tolerates nonexistent directories and empty names") {
  ferry::env_path_resolver resolver{ "/nonexistent/ferry/bin" };
  CHECK_FALSE(resolver.which("marksman").has_value());
  CHECK_FALSE(resolver.which("").has_value());
}

#ifndef _WIN32
TEST_CASE_FIXTURE(temp_bin_dirs, "which skips files without execute permission") {
  make_tool("a", "marksman", false);
  auto const runnable{ make_tool("b", "marksman", true) };
  ferry::env_path_resolver resolver{ path_list() };

  auto const found{ resolver.which("marksman") };
  REQUIRE(found.has_value());
  CHECK(std::filesystem::equivalent(*found, runnable));
}

TEST_CASE_FIXTURE(temp_bin_dirs, "which skips directories named like the tool") {
  std::filesystem::create_directories(root / "a" / "marksman");
  ferry::env_path_resolver resolver{ path_list() };
  CHECK_FALSE(resolver.which("marksman").has_value());
}

TEST_CASE_FIXTURE(temp_bin_dirs, "default resolver reads PATH at call time") {
  auto const expected{ make_tool("a", "ferry-probe-tool", true) };
  char const *old_path{ std::getenv("PATH") };
  std::string const saved{ old_path ? old_path : "" };

  ferry::platform::set_env_var("PATH", path_list().c_str());
  ferry::env_path_resolver resolver;
  auto const found{ resolver.which("ferry-probe-tool") };
  ferry::platform::set_env_var("PATH", saved.c_str());

  REQUIRE(found.has_value());
  CHECK(std::filesystem::equivalent(*found, expected));
}
#endif
