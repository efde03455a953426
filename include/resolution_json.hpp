/**
 * @file resolution_json.hpp
 * @brief JSON views of resolution results and transport-level error mapping.
 */

#ifndef GITREPOIMPORT_RESOLUTION_JSON_HPP
#define GITREPOIMPORT_RESOLUTION_JSON_HPP

#include "auth_strategy.hpp"
#include "errors.hpp"
#include "repo_resolver.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace gri {

void to_json(nlohmann::json &j, const RepoMetadata &meta);
void to_json(nlohmann::json &j, const ResolutionWarning &warning);
void to_json(nlohmann::json &j, const ResolvedRepository &result);
void to_json(nlohmann::json &j, const InstallationRequired &pending);

/// Token-free description of an auth outcome.
nlohmann::json auth_outcome_json(const AuthOutcome &outcome);

/// HTTP-facing classification of a failure.
struct ErrorResponse {
  int status{400};
  std::string code;
  std::string message;
};

/// Map a classified error onto a stable status/code pair.
ErrorResponse map_error(const ResolveError &error);

/// Response used when the App still has to be installed.
ErrorResponse map_installation_required(const InstallationRequired &pending);

/// `{"error": {"code": ..., "message": ...}}`
nlohmann::json error_response_json(const ErrorResponse &response);

} // namespace gri

#endif // GITREPOIMPORT_RESOLUTION_JSON_HPP
