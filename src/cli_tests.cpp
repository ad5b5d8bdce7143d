#include "cli.h"

#include "test_support.h"

#include "doctest/doctest.h"

#include <string>
#include <variant>
#include <vector>

namespace {

// Helper to convert vector of strings to argc/argv
std::vector<char *> make_argv(std::vector<std::string> &args) {
  std::vector<char *> argv;
  for (auto &arg : args) { argv.push_back(arg.data()); }
  argv.push_back(nullptr);
  return argv;
}

ferry::cli_args parse(std::vector<std::string> args) {
  auto argv{ make_argv(args) };
  return ferry::cli_parse(static_cast<int>(args.size()), argv.data());
}

}  // anonymous namespace

TEST_CASE("cli_parse: no arguments") {
  auto const parsed{ parse({ "ferry" }) };

  // With no arguments, help text returned and no command configuration.
  CHECK_FALSE(parsed.cmd_cfg.has_value());
  CHECK_FALSE(parsed.cli_output.empty());
}

TEST_CASE("cli_parse: cmd_version") {
  SUBCASE("subcommand") {
    auto const parsed{ parse({ "ferry", "version" }) };
    REQUIRE(parsed.cmd_cfg.has_value());
    CHECK(std::holds_alternative<ferry::cmd_version::cfg>(*parsed.cmd_cfg));
  }

  SUBCASE("-v flag") {
    auto const parsed{ parse({ "ferry", "-v" }) };
    REQUIRE(parsed.cmd_cfg.has_value());
    CHECK(std::holds_alternative<ferry::cmd_version::cfg>(*parsed.cmd_cfg));
  }

  SUBCASE("--version flag") {
    auto const parsed{ parse({ "ferry", "--version" }) };
    REQUIRE(parsed.cmd_cfg.has_value());
    CHECK(std::holds_alternative<ferry::cmd_version::cfg>(*parsed.cmd_cfg));
  }
}

TEST_CASE("cli_parse: tool defaults to unset") {
  auto const parsed{ parse({ "ferry", "which" }) };
  REQUIRE(parsed.cmd_cfg.has_value());
  auto const *cfg{ std::get_if<ferry::cmd_which::cfg>(&*parsed.cmd_cfg) };
  REQUIRE(cfg != nullptr);
  CHECK_FALSE(cfg->tool.has_value());
}

TEST_CASE("cli_parse: tool subcommands take a tool name") {
  SUBCASE("which") {
    auto const parsed{ parse({ "ferry", "which", "marksman" }) };
    REQUIRE(parsed.cmd_cfg.has_value());
    auto const *cfg{ std::get_if<ferry::cmd_which::cfg>(&*parsed.cmd_cfg) };
    REQUIRE(cfg != nullptr);
    CHECK(cfg->tool == "marksman");
  }

  SUBCASE("latest") {
    auto const parsed{ parse({ "ferry", "latest", "marksman" }) };
    REQUIRE(parsed.cmd_cfg.has_value());
    auto const *cfg{ std::get_if<ferry::cmd_latest::cfg>(&*parsed.cmd_cfg) };
    REQUIRE(cfg != nullptr);
    CHECK(cfg->tool == "marksman");
  }

  SUBCASE("cached") {
    auto const parsed{ parse({ "ferry", "cached", "taplo" }) };
    REQUIRE(parsed.cmd_cfg.has_value());
    auto const *cfg{ std::get_if<ferry::cmd_cached::cfg>(&*parsed.cmd_cfg) };
    REQUIRE(cfg != nullptr);
    CHECK(cfg->tool == "taplo");
  }

  SUBCASE("platform") {
    auto const parsed{ parse({ "ferry", "platform" }) };
    REQUIRE(parsed.cmd_cfg.has_value());
    CHECK(std::holds_alternative<ferry::cmd_platform::cfg>(*parsed.cmd_cfg));
  }
}

TEST_CASE("cli_parse: cmd_install") {
  SUBCASE("defaults") {
    auto const parsed{ parse({ "ferry", "install" }) };
    REQUIRE(parsed.cmd_cfg.has_value());
    auto const *cfg{ std::get_if<ferry::cmd_install::cfg>(&*parsed.cmd_cfg) };
    REQUIRE(cfg != nullptr);
    CHECK_FALSE(cfg->offline);
    CHECK_FALSE(cfg->no_system);
  }

  SUBCASE("flags") {
    auto const parsed{ parse({ "ferry", "install", "marksman", "--offline", "--no-system" }) };
    REQUIRE(parsed.cmd_cfg.has_value());
    auto const *cfg{ std::get_if<ferry::cmd_install::cfg>(&*parsed.cmd_cfg) };
    REQUIRE(cfg != nullptr);
    CHECK(cfg->tool == "marksman");
    CHECK(cfg->offline);
    CHECK(cfg->no_system);
  }
}

TEST_CASE("cli_parse: global options") {
  SUBCASE("cache root") {
    auto const parsed{ parse({ "ferry", "--cache-root", "/tmp/ferry-cache", "cached" }) };
    REQUIRE(parsed.cmd_cfg.has_value());
    REQUIRE(parsed.globals.cache_root.has_value());
    CHECK(parsed.globals.cache_root->string() == "/tmp/ferry-cache");
    CHECK_FALSE(parsed.globals.tool_file.has_value());
  }

  SUBCASE("tool file must exist") {
    auto const parsed{ parse({ "ferry", "--tool-file", "/nonexistent/taplo.json", "which" }) };
    CHECK_FALSE(parsed.cmd_cfg.has_value());
    CHECK_FALSE(parsed.cli_output.empty());
  }

  SUBCASE("tool file") {
    ferry::test::temp_dir scratch{ "cli" };
    auto const descriptor{ scratch.path / "taplo.json" };
    ferry::test::write_file(descriptor, "{}");

    auto const parsed{ parse({ "ferry", "--tool-file", descriptor.string(), "which" }) };
    REQUIRE(parsed.cmd_cfg.has_value());
    REQUIRE(parsed.globals.tool_file.has_value());
    CHECK(*parsed.globals.tool_file == descriptor);
  }
}

TEST_CASE("cli_parse: unknown subcommand") {
  auto const parsed{ parse({ "ferry", "frobnicate" }) };
  CHECK_FALSE(parsed.cmd_cfg.has_value());
  CHECK_FALSE(parsed.cli_output.empty());
}

TEST_CASE("cli_parse: verbose flag") {
  auto const parsed{ parse({ "ferry", "--verbose", "platform" }) };

  REQUIRE(parsed.cmd_cfg.has_value());
  REQUIRE(parsed.verbosity.has_value());
  CHECK(parsed.verbosity == ferry::tui::level::TUI_DEBUG);
  CHECK(parsed.decorated_logging);
}

TEST_CASE("cli_parse: default verbosity") {
  auto const parsed{ parse({ "ferry", "platform" }) };
  CHECK(parsed.verbosity == ferry::tui::level::TUI_INFO);
  CHECK_FALSE(parsed.decorated_logging);
}
