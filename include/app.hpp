/**
 * @file app.hpp
 * @brief Command line application wiring configuration, logging and the
 * repository resolver together.
 */

#ifndef GITREPOIMPORT_APP_HPP
#define GITREPOIMPORT_APP_HPP

#include "cli.hpp"
#include "config.hpp"
#include "repo_resolver.hpp"
#include <iostream>
#include <nlohmann/json_fwd.hpp>
#include <ostream>

namespace gri {

/// Process exit codes reported by App::run().
enum ExitCode : int {
  kExitOk = 0,
  kExitError = 1,
  kExitInvalidInput = 2,
  kExitAuthFailed = 3,
  kExitInstallationRequired = 4
};

/**
 * Main application entry point. Results are written as JSON to the output
 * stream; diagnostics go through the logger.
 */
class App {
public:
  /**
   * @param http_factory Transport factory handed to the resolver; the
   *        default uses libcurl.
   * @param out Destination of JSON results.
   */
  explicit App(HttpClientFactory http_factory = {},
               std::ostream &out = std::cout);

  /**
   * Run the application with the given command line arguments.
   *
   * @return One of the ExitCode values.
   */
  int run(int argc, char **argv);

  const CliOptions &options() const { return options_; }

  const Config &config() const { return config_; }

private:
  void apply_cli_overrides();
  void init_logging();
  int execute();
  void print(const nlohmann::json &j) const;

  HttpClientFactory http_factory_;
  std::ostream &out_;
  CliOptions options_;
  Config config_;
};

} // namespace gri

#endif // GITREPOIMPORT_APP_HPP
