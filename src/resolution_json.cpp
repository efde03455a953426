#include "resolution_json.hpp"

namespace gri {

void to_json(nlohmann::json &j, const RepoMetadata &meta) {
  j = nlohmann::json{{"owner", meta.owner},
                     {"repo", meta.repo},
                     {"provider", provider_name(meta.provider)},
                     {"isPrivate", meta.is_private}};
  if (meta.branch) {
    j["branch"] = *meta.branch;
  }
  if (meta.commit) {
    j["commit"] = *meta.commit;
  }
  if (meta.details) {
    const RepoDetails &d = *meta.details;
    if (d.description) {
      j["description"] = *d.description;
    }
    if (d.html_url) {
      j["htmlUrl"] = *d.html_url;
    }
    if (d.default_branch) {
      j["defaultBranch"] = *d.default_branch;
    }
    if (d.visibility) {
      j["visibility"] = *d.visibility;
    }
    if (d.fork) {
      j["fork"] = *d.fork;
    }
  }
}

void to_json(nlohmann::json &j, const ResolutionWarning &warning) {
  j = nlohmann::json{{"kind", warning_kind_name(warning.kind)},
                     {"message", warning.message}};
  if (warning.status) {
    j["status"] = *warning.status;
  }
  if (warning.reset_at) {
    j["resetAt"] = format_iso8601(*warning.reset_at);
  }
  if (warning.remaining) {
    j["remaining"] = *warning.remaining;
  }
}

void to_json(nlohmann::json &j, const ResolvedRepository &result) {
  j = nlohmann::json{{"metadata", result.metadata},
                     {"normalizedUrl", result.normalized_url},
                     {"originalUrl", result.original_url},
                     {"warnings", result.warnings}};
}

void to_json(nlohmann::json &j, const InstallationRequired &pending) {
  j = nlohmann::json{{"needsInstallation", true},
                     {"installationUrl", pending.installation_url},
                     {"normalizedUrl", pending.reference.normalized_url}};
}

nlohmann::json auth_outcome_json(const AuthOutcome &outcome) {
  nlohmann::json j{{"type", auth_outcome_name(outcome)}};
  std::visit(overloaded{[](const NoAuth &) {}, [](const BearerToken &) {},
                        [&j](const AppInstallationToken &t) {
                          if (t.expires_at) {
                            j["expiresAt"] = format_iso8601(*t.expires_at);
                          }
                        },
                        [&j](const AppAuthPending &p) {
                          j["installationUrl"] = p.installation_url;
                        }},
             outcome);
  return j;
}

ErrorResponse map_error(const ResolveError &error) {
  switch (error.kind()) {
  case ErrorKind::InvalidFormat:
  case ErrorKind::MissingOwnerOrRepo:
    return {400, "INVALID_REPOSITORY_URL", error.what()};
  case ErrorKind::InvalidTokenFormat:
    return {401, "INVALID_TOKEN", error.what()};
  case ErrorKind::AppAuthFailed:
    return {401, "APP_AUTH_FAILED", error.what()};
  case ErrorKind::RepositoryNotFound:
    return {404, "REPOSITORY_NOT_FOUND", error.what()};
  case ErrorKind::RateLimitExceeded:
    return {429, "RATE_LIMIT_EXCEEDED", error.what()};
  case ErrorKind::ProviderApiError:
    return {502, "PROVIDER_API_ERROR", error.what()};
  }
  return {400, "INVALID_REPOSITORY_URL", error.what()};
}

ErrorResponse map_installation_required(const InstallationRequired &pending) {
  return {403, "APP_INSTALLATION_REQUIRED",
          "GitHub App installation required: " + pending.installation_url};
}

nlohmann::json error_response_json(const ErrorResponse &response) {
  return {{"error", {{"code", response.code}, {"message", response.message}}}};
}

} // namespace gri
