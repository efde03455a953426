/**
 * @file duration.hpp
 * @brief Human-readable duration parsing.
 *
 * Parses strings such as "500ms", "10s", "5m" or "1m30s" used for network
 * timeouts in configuration files and on the command line.
 */
#ifndef GITREPOIMPORT_UTIL_DURATION_HPP
#define GITREPOIMPORT_UTIL_DURATION_HPP

#include <chrono>
#include <string>

namespace gri {

/**
 * Parse a human-readable duration string into milliseconds. Units `ms`, `s`,
 * `m` and `h` may be combined; a bare number is interpreted as seconds.
 *
 * @param str Duration string; empty string returns zero.
 * @return Parsed duration in milliseconds.
 * @throws std::runtime_error if an invalid format or suffix is provided.
 */
std::chrono::milliseconds parse_duration(const std::string &str);

} // namespace gri

#endif // GITREPOIMPORT_UTIL_DURATION_HPP
