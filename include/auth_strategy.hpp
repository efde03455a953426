/**
 * @file auth_strategy.hpp
 * @brief Resolution of caller credentials into a single auth outcome.
 */

#ifndef GITREPOIMPORT_AUTH_STRATEGY_HPP
#define GITREPOIMPORT_AUTH_STRATEGY_HPP

#include "github_app_auth.hpp"
#include "http_client.hpp"
#include <chrono>
#include <optional>
#include <string>
#include <variant>

namespace gri {

/**
 * Caller supplied credentials. When both are set the App configuration wins.
 * An empty token is treated the same as no token.
 */
struct AuthConfig {
  std::optional<GitHubAppConfig> github_app;
  std::optional<std::string> token;
  std::string installation_url{kDefaultInstallationUrl};
};

/// No credential is attached to outgoing requests.
struct NoAuth {};

/// Personal access token sent as a bearer credential.
struct BearerToken {
  std::string token;
};

/// Installation-scoped token minted from App credentials.
struct AppInstallationToken {
  std::string token;
  std::optional<std::chrono::system_clock::time_point> expires_at;
};

/// App credentials are valid but the App is not installed yet.
struct AppAuthPending {
  std::string installation_url; ///< Never empty
};

/// Resolved authentication mode.
using AuthOutcome =
    std::variant<NoAuth, BearerToken, AppInstallationToken, AppAuthPending>;

/// Helper for building exhaustive std::visit overload sets.
template <class... Ts> struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

/// Personal access token prefixes accepted for bearer authentication.
bool has_personal_token_prefix(const std::string &token);

/**
 * Pick the authentication mode for @p config.
 *
 * Priority: App configuration, then bearer token, then no authentication.
 *
 * @param config Caller credentials.
 * @param http Transport used for the App token exchange.
 * @param api_base Base URL of the GitHub REST API.
 * @return The resolved outcome. AppAuthPending is returned, not thrown.
 * @throws InvalidTokenFormatError When the bearer token has an unknown prefix.
 * @throws AppAuthFailedError When the App token exchange fails.
 */
AuthOutcome resolve_auth(const AuthConfig &config, HttpClient &http,
                         const std::string &api_base = "https://api.github.com");

/**
 * `Authorization` header for an outcome carrying a usable token.
 *
 * @return `std::nullopt` for NoAuth and AppAuthPending.
 */
std::optional<std::string> authorization_header(const AuthOutcome &outcome);

/// Short label for logging and JSON output ("none", "bearer", ...).
const char *auth_outcome_name(const AuthOutcome &outcome);

} // namespace gri

#endif // GITREPOIMPORT_AUTH_STRATEGY_HPP
