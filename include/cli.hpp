/**
 * @file cli.hpp
 * @brief Command line interface parsing and options for gitrepoimport.
 */

#ifndef GITREPOIMPORT_CLI_HPP
#define GITREPOIMPORT_CLI_HPP

#include <exception>
#include <string>
#include <unordered_map>

namespace gri {

/**
 * Signals that CLI parsing requested an immediate exit (help, version, parse
 * errors) together with the process exit code to use.
 */
class CliParseExit : public std::exception {
public:
  explicit CliParseExit(int exit_code) noexcept : exit_code_(exit_code) {}

  /// Numeric process exit code.
  int exit_code() const noexcept { return exit_code_; }

  const char *what() const noexcept override {
    return "CLI parsing requested exit";
  }

private:
  int exit_code_;
};

/**
 * Parsed command line options. Empty strings mean "not given"; App merges
 * them over the configuration file.
 */
struct CliOptions {
  std::string repository;         ///< Repository reference to resolve
  std::string config_file;        ///< Optional path to configuration file
  bool verbose = false;           ///< Shortcut for --log-level debug
  std::string log_level;          ///< Logging verbosity level
  std::string log_file;           ///< Optional path to log file
  std::unordered_map<std::string, std::string>
      log_categories;             ///< Category -> level overrides
  std::string token;              ///< Personal access token
  std::string token_file;         ///< File holding the personal access token
  std::string app_id;             ///< GitHub App id
  std::string private_key_file;   ///< GitHub App PEM key path
  std::string client_id;          ///< GitHub App client id
  std::string client_secret;      ///< GitHub App client secret
  std::string installation_id;    ///< GitHub App installation id
  std::string installation_url;   ///< Installation page override
  std::string api_base;           ///< Base URL for GitHub API
  std::string timeout;            ///< HTTP timeout as a duration string
  bool validate_only = false;     ///< Only check the reference format
  bool auth_only = false;         ///< Only resolve credentials
  bool pretty = false;            ///< Indent JSON output
};

/**
 * Parse command line arguments.
 *
 * @param argc Number of elements supplied in @p argv.
 * @param argv Raw CLI argument strings.
 * @return Populated options structure.
 * @throws CliParseExit For `--help`, `--version` and parse errors.
 */
CliOptions parse_cli(int argc, char **argv);

} // namespace gri

#endif // GITREPOIMPORT_CLI_HPP
