/**
 * @file github_app_auth.hpp
 * @brief GitHub App authentication (app JWT and installation tokens).
 */

#ifndef GITREPOIMPORT_GITHUB_APP_AUTH_HPP
#define GITREPOIMPORT_GITHUB_APP_AUTH_HPP

#include "http_client.hpp"
#include <chrono>
#include <nlohmann/json_fwd.hpp>
#include <optional>
#include <string>

namespace gri {

/// Installation page users are sent to when the App is not installed yet.
constexpr const char *kDefaultInstallationUrl =
    "https://github.com/apps/your-app-name/installations/new";

/// Credentials identifying a GitHub App.
struct GitHubAppConfig {
  std::string app_id;
  std::string private_key; ///< PEM encoded RSA private key
  std::string client_id;
  std::string client_secret;
  std::optional<std::string> installation_id;
};

/**
 * Build an App configuration from a JSON document.
 *
 * Accepts both camelCase (`appId`) and snake_case (`app_id`) keys.
 *
 * @throws std::runtime_error When a required string field is missing or not a
 *         string, or when `installationId` is present but not a string/number.
 */
GitHubAppConfig validate_app_config(const nlohmann::json &j);

/// Token produced by GitHubAppAuth::authenticate().
struct AppAuthentication {
  enum class Type {
    App,         ///< App-level JWT; the App still needs an installation
    Installation ///< Installation-scoped access token
  };
  std::string token;
  Type type{Type::App};
  std::optional<std::chrono::system_clock::time_point> expires_at;
  std::optional<std::string> installation_url; ///< Set for Type::App only
};

/**
 * Exchanges GitHub App credentials for tokens.
 *
 * Without an installation id only the app-level JWT can be produced and the
 * result carries the installation URL; with one, the JWT is exchanged for an
 * installation access token via the REST API.
 */
class GitHubAppAuth {
public:
  /**
   * @param config App credentials.
   * @param http Transport used for the installation token exchange; must
   *        outlive this object.
   * @param api_base Base URL of the GitHub REST API.
   * @param installation_url URL reported when no installation id is set.
   */
  GitHubAppAuth(GitHubAppConfig config, HttpClient &http,
                std::string api_base = "https://api.github.com",
                std::string installation_url = kDefaultInstallationUrl);

  /**
   * Produce an app or installation token.
   *
   * @throws AppAuthFailedError When the key cannot sign, the exchange request
   *         fails, or the response carries no token.
   */
  AppAuthentication authenticate();

  /**
   * Create the RS256 signed JWT that authenticates as the App itself.
   *
   * @param now Issue time; `iat` is backdated by 60 seconds to absorb clock
   *        drift and `exp` is ten minutes after @p now.
   * @throws AppAuthFailedError When the private key is unusable.
   */
  std::string create_app_jwt(std::chrono::system_clock::time_point now) const;

private:
  GitHubAppConfig config_;
  HttpClient &http_;
  std::string api_base_;
  std::string installation_url_;
};

} // namespace gri

#endif // GITREPOIMPORT_GITHUB_APP_AUTH_HPP
