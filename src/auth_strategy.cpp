#include "auth_strategy.hpp"
#include "errors.hpp"
#include "log.hpp"
#include <array>
#include <memory>
#include <spdlog/spdlog.h>

namespace gri {

namespace {

std::shared_ptr<spdlog::logger> auth_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("auth");
  }();
  return logger;
}

constexpr std::array<const char *, 2> kTokenPrefixes = {"ghp_", "github_pat_"};

AuthOutcome resolve_app(const GitHubAppConfig &app,
                        const std::string &installation_url, HttpClient &http,
                        const std::string &api_base) {
  GitHubAppAuth auth(app, http, api_base, installation_url);
  AppAuthentication result = auth.authenticate();
  switch (result.type) {
  case AppAuthentication::Type::App: {
    std::string url = result.installation_url.value_or(installation_url);
    if (url.empty()) {
      url = kDefaultInstallationUrl;
    }
    return AppAuthPending{url};
  }
  case AppAuthentication::Type::Installation:
    return AppInstallationToken{result.token, result.expires_at};
  }
  throw AppAuthFailedError("unexpected authentication type");
}

} // namespace

bool has_personal_token_prefix(const std::string &token) {
  for (const char *prefix : kTokenPrefixes) {
    if (token.rfind(prefix, 0) == 0) {
      return true;
    }
  }
  return false;
}

AuthOutcome resolve_auth(const AuthConfig &config, HttpClient &http,
                         const std::string &api_base) {
  if (config.github_app) {
    auth_log()->debug("Using GitHub App {} credentials",
                      config.github_app->app_id);
    return resolve_app(*config.github_app, config.installation_url, http,
                       api_base);
  }
  if (config.token && !config.token->empty()) {
    if (!has_personal_token_prefix(*config.token)) {
      auth_log()->error("Rejected bearer token with unrecognised prefix");
      throw InvalidTokenFormatError("Invalid GitHub token format. Token should "
                                    "be a GitHub Personal Access Token.");
    }
    return BearerToken{*config.token};
  }
  return NoAuth{};
}

std::optional<std::string> authorization_header(const AuthOutcome &outcome) {
  return std::visit(
      overloaded{
          [](const NoAuth &) -> std::optional<std::string> {
            return std::nullopt;
          },
          [](const BearerToken &b) -> std::optional<std::string> {
            return "Authorization: Bearer " + b.token;
          },
          [](const AppInstallationToken &t) -> std::optional<std::string> {
            return "Authorization: Bearer " + t.token;
          },
          [](const AppAuthPending &) -> std::optional<std::string> {
            return std::nullopt;
          }},
      outcome);
}

const char *auth_outcome_name(const AuthOutcome &outcome) {
  return std::visit(
      overloaded{[](const NoAuth &) { return "none"; },
                 [](const BearerToken &) { return "bearer"; },
                 [](const AppInstallationToken &) { return "installation"; },
                 [](const AppAuthPending &) { return "app"; }},
      outcome);
}

} // namespace gri
