#include "app.hpp"
#include "log.hpp"

#include <exception>
#include <spdlog/spdlog.h>

/**
 * Program entry point. Resolves the repository given on the command line and
 * prints the result as JSON.
 *
 * @param argc Number of CLI arguments received from the OS.
 * @param argv Null-terminated array containing the raw CLI arguments.
 * @return Process exit code forwarded from the application logic.
 */
int main(int argc, char **argv) {
  int ret = gri::kExitError;
  try {
    gri::App app;
    ret = app.run(argc, argv);
  } catch (const std::exception &e) {
    gri::ensure_default_logger();
    gri::category_logger("main")->critical("Unhandled error: {}", e.what());
  }
  spdlog::shutdown();
  return ret;
}
