#include "cli.hpp"
#include "log.hpp"
#include "util/duration.hpp"
#include "version.hpp"
#include <CLI/CLI.hpp>
#include <array>
#include <cstdint>
#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string_view>

#include <spdlog/spdlog.h>

namespace gri {

namespace {

std::shared_ptr<spdlog::logger> cli_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("cli");
  }();
  return logger;
}

std::string log_category_help_text() {
  static const std::array<std::string_view, 10> categories = {
      "app",  "auth",     "cli",     "config",          "github.app",
      "http", "logging",  "repo.url", "github.metadata", "resolver"};
  std::ostringstream oss;
  oss << "Logging categories: ";
  for (std::size_t i = 0; i < categories.size(); ++i) {
    if (i != 0) {
      oss << ", ";
    }
    oss << categories[i];
  }
  oss << "\nUse --log-category NAME=LEVEL to override (e.g., auth=debug).";
  oss << "\nExit codes: 0 ok, 1 error, 2 invalid input, 3 authentication "
         "failure, 4 GitHub App installation required.";
  return oss.str();
}

} // namespace

CliOptions parse_cli(int argc, char **argv) {
  CLI::App app{"Resolve a repository reference into GitHub metadata"};
  app.footer(log_category_help_text());
  CliOptions options;

  app.add_option("repository", options.repository,
                 "Repository URL or OWNER/REPO shorthand")
      ->type_name("REPO");
  app.add_option("-C,--config", options.config_file,
                 "Path to configuration file (YAML, JSON or TOML)")
      ->type_name("FILE")
      ->check(CLI::ExistingFile)
      ->group("General");
  app.add_flag_function(
         "--version",
         [](std::int64_t) {
           std::cout << "gitrepoimport " << kVersionString << std::endl;
           throw CliParseExit(0);
         },
         "Show version information and exit")
      ->group("General");
  app.add_flag("--validate-only", options.validate_only,
               "Only check that REPO is a well-formed reference")
      ->group("General");
  app.add_flag("--auth-only", options.auth_only,
               "Only resolve credentials and print the outcome")
      ->group("General");
  app.add_flag("--pretty", options.pretty, "Indent JSON output")
      ->group("General");

  app.add_flag("-v,--verbose", options.verbose, "Enable debug logging")
      ->group("Logging");
  app.add_option(
         "-G,--log-level", options.log_level,
         "Set logging level (trace, debug, info, warn, error, critical, off)")
      ->type_name("LEVEL")
      ->group("Logging");
  app.add_option("-F,--log-file", options.log_file, "Path to log file")
      ->type_name("FILE")
      ->group("Logging");
  app.add_option_function<std::string>(
         "--log-category",
         [&options](const std::string &value) {
           auto pos = value.find('=');
           std::string name =
               pos == std::string::npos ? value : value.substr(0, pos);
           std::string level = pos == std::string::npos ? std::string{"debug"}
                                                        : value.substr(pos + 1);
           if (name.empty()) {
             throw CLI::ValidationError("--log-category",
                                        "category name must not be empty");
           }
           options.log_categories[name] = level.empty() ? "debug" : level;
         },
         "Set a logging category level (NAME or NAME=LEVEL)")
      ->type_name("NAME[=LEVEL]")
      ->group("Logging");

  app.add_option("-t,--token", options.token, "GitHub personal access token")
      ->type_name("TOKEN")
      ->group("Authentication");
  app.add_option("--token-file", options.token_file,
                 "File containing a personal access token")
      ->type_name("FILE")
      ->check(CLI::ExistingFile)
      ->group("Authentication");
  app.add_option("--app-id", options.app_id, "GitHub App id")
      ->type_name("ID")
      ->group("GitHub App");
  app.add_option("--private-key-file", options.private_key_file,
                 "PEM private key of the GitHub App")
      ->type_name("FILE")
      ->check(CLI::ExistingFile)
      ->group("GitHub App");
  app.add_option("--client-id", options.client_id, "GitHub App client id")
      ->group("GitHub App");
  app.add_option("--client-secret", options.client_secret,
                 "GitHub App client secret")
      ->group("GitHub App");
  app.add_option("--installation-id", options.installation_id,
                 "GitHub App installation id")
      ->type_name("ID")
      ->group("GitHub App");
  app.add_option("--installation-url", options.installation_url,
                 "Installation page reported when the App is not installed")
      ->type_name("URL")
      ->group("GitHub App");

  app.add_option("--api-base", options.api_base, "Base URL for the GitHub API")
      ->type_name("URL")
      ->group("Network");
  app.add_option_function<std::string>(
         "--timeout",
         [&options](const std::string &value) {
           try {
             (void)parse_duration(value);
           } catch (const std::runtime_error &e) {
             throw CLI::ValidationError("--timeout", e.what());
           }
           options.timeout = value;
         },
         "HTTP timeout (e.g. 30, 10s, 500ms)")
      ->type_name("DURATION")
      ->group("Network");

  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError &e) {
    throw CliParseExit(app.exit(e));
  }
  if (options.repository.empty() && !options.auth_only) {
    std::cerr << "REPO is required unless --auth-only is given\n"
              << app.help() << std::endl;
    throw CliParseExit(2);
  }
  cli_log()->debug("Parsed command line (repository='{}', config='{}')",
                   options.repository, options.config_file);
  return options;
}

} // namespace gri
