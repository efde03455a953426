/**
 * @file metadata_fetcher.hpp
 * @brief Repository detail lookup against the GitHub REST API.
 */

#ifndef GITREPOIMPORT_METADATA_FETCHER_HPP
#define GITREPOIMPORT_METADATA_FETCHER_HPP

#include "auth_strategy.hpp"
#include "http_client.hpp"
#include "repo_url.hpp"
#include <optional>
#include <string>

namespace gri {

/// Subset of `GET /repos/{owner}/{repo}` consumed by the resolver.
struct RepoDetails {
  bool is_private{false};
  std::optional<std::string> description;
  std::optional<std::string> html_url;
  std::optional<std::string> default_branch;
  std::optional<std::string> visibility;
  std::optional<bool> fork;
};

/**
 * Issues a single repository-detail request and classifies the response.
 * No retries are attempted.
 */
class MetadataFetcher {
public:
  /**
   * @param http Transport; must outlive the fetcher.
   * @param api_base Base URL of the GitHub REST API.
   */
  explicit MetadataFetcher(HttpClient &http,
                           std::string api_base = "https://api.github.com");

  /**
   * Fetch repository details for @p ref.
   *
   * @param ref Normalized repository reference.
   * @param auth Resolved credentials; only token-carrying outcomes add an
   *        `Authorization` header.
   * @return Parsed repository details.
   * @throws RepositoryNotFoundError On HTTP 404.
   * @throws RateLimitExceededError On HTTP 403 with a zero remaining quota.
   * @throws ProviderApiError On any other non-2xx status or a malformed body.
   * @throws TransientNetworkError On transport failures.
   */
  RepoDetails fetch(const RepoReference &ref, const AuthOutcome &auth);

  /// Repository-detail endpoint for @p ref.
  std::string repo_url(const RepoReference &ref) const;

private:
  HttpClient &http_;
  std::string api_base_;
};

} // namespace gri

#endif // GITREPOIMPORT_METADATA_FETCHER_HPP
