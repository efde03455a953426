/**
 * @file log.hpp
 * @brief Logging setup for gitrepoimport.
 *
 * Declares logger initialization, category loggers, and per-category level
 * overrides built on spdlog.
 */

#ifndef GITREPOIMPORT_LOG_HPP
#define GITREPOIMPORT_LOG_HPP

#include <cstddef>
#include <memory>
#include <spdlog/spdlog.h>
#include <string>
#include <unordered_map>

namespace gri {

/**
 * Initialize the global logger with a console sink and an optional file sink.
 *
 * @param level Logging verbosity level to use for all loggers.
 * @param pattern Log message pattern. Provide an empty string to keep the
 *        spdlog default.
 * @param file Optional log file path. When empty no file output is configured.
 * @param rotate_files Number of rotated backups to keep for @p file; zero
 *        selects a plain append-only file.
 */
void init_logger(spdlog::level::level_enum level,
                 const std::string &pattern = "", const std::string &file = "",
                 std::size_t rotate_files = 3);

/**
 * Retrieve or create a logger dedicated to a specific category.
 *
 * Category loggers share sinks with the default logger so messages appear in
 * the same destinations, and may carry their own level.
 *
 * @param category Category name, registered as `gri.<category>`.
 * @return Shared pointer to the category logger.
 */
std::shared_ptr<spdlog::logger> category_logger(const std::string &category);

/**
 * Apply log level overrides for specific categories.
 *
 * @param overrides Mapping of category name to desired log level.
 */
void configure_log_categories(
    const std::unordered_map<std::string, spdlog::level::level_enum>
        &overrides);

/**
 * Ensure a default logger exists before logging.
 */
void ensure_default_logger();

} // namespace gri

#endif // GITREPOIMPORT_LOG_HPP
