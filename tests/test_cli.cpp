#include "cli.hpp"
#include <catch2/catch_test_macros.hpp>
#include <string>
#include <vector>

using namespace gri;

namespace {
CliOptions parse(std::vector<std::string> args) {
  args.insert(args.begin(), "gitrepoimport");
  std::vector<char *> argv;
  for (auto &a : args) {
    argv.push_back(a.data());
  }
  return parse_cli(static_cast<int>(argv.size()), argv.data());
}

int exit_code_of(std::vector<std::string> args) {
  try {
    parse(std::move(args));
  } catch (const CliParseExit &e) {
    return e.exit_code();
  }
  return -1;
}
} // namespace

TEST_CASE("positional repository and flags", "[cli]") {
  CliOptions opts = parse({"octocat/hello", "--pretty", "-v"});
  REQUIRE(opts.repository == "octocat/hello");
  REQUIRE(opts.pretty);
  REQUIRE(opts.verbose);
  REQUIRE(!opts.validate_only);
  REQUIRE(!opts.auth_only);
}

TEST_CASE("authentication and network options", "[cli]") {
  CliOptions opts = parse({"owner/repo", "--token", "ghp_x", "--app-id", "12",
                           "--client-id", "c", "--client-secret", "s",
                           "--installation-id", "99", "--installation-url",
                           "https://github.com/apps/a/installations/new",
                           "--api-base", "https://ghe/api/v3", "--timeout",
                           "5s"});
  REQUIRE(opts.token == "ghp_x");
  REQUIRE(opts.app_id == "12");
  REQUIRE(opts.client_id == "c");
  REQUIRE(opts.client_secret == "s");
  REQUIRE(opts.installation_id == "99");
  REQUIRE(opts.installation_url ==
          "https://github.com/apps/a/installations/new");
  REQUIRE(opts.api_base == "https://ghe/api/v3");
  REQUIRE(opts.timeout == "5s");
}

TEST_CASE("log category overrides", "[cli]") {
  CliOptions opts = parse({"owner/repo", "--log-category", "auth=trace",
                           "--log-category", "resolver", "--log-level",
                           "warn", "--log-file", "gri.log"});
  REQUIRE(opts.log_categories.at("auth") == "trace");
  REQUIRE(opts.log_categories.at("resolver") == "debug");
  REQUIRE(opts.log_level == "warn");
  REQUIRE(opts.log_file == "gri.log");
  REQUIRE(exit_code_of({"owner/repo", "--log-category", "=debug"}) != 0);
}

TEST_CASE("auth-only does not need a repository", "[cli]") {
  CliOptions opts = parse({"--auth-only"});
  REQUIRE(opts.auth_only);
  REQUIRE(opts.repository.empty());
  REQUIRE(exit_code_of({}) == 2);
}

TEST_CASE("help, version and bad input exit early", "[cli]") {
  REQUIRE(exit_code_of({"--help"}) == 0);
  REQUIRE(exit_code_of({"--version"}) == 0);
  REQUIRE(exit_code_of({"owner/repo", "--timeout", "soon"}) != 0);
  REQUIRE(exit_code_of({"owner/repo", "--no-such-flag"}) != 0);
  REQUIRE(exit_code_of({"owner/repo", "--config", "/nonexistent/gri.yaml"}) !=
          0);
}
