/**
 * @file repo_resolver.hpp
 * @brief Orchestration of URL normalization, authentication and metadata
 * lookup into a single resolution result.
 */

#ifndef GITREPOIMPORT_REPO_RESOLVER_HPP
#define GITREPOIMPORT_REPO_RESOLVER_HPP

#include "auth_strategy.hpp"
#include "http_client.hpp"
#include "metadata_fetcher.hpp"
#include "repo_url.hpp"
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace gri {

/// Repository identity merged with provider metadata.
struct RepoMetadata {
  std::string owner;
  std::string repo;
  std::optional<std::string> branch;
  std::optional<std::string> commit;
  Provider provider{kPrimaryProvider};
  bool is_private{false};              ///< `false` when unknown
  std::optional<RepoDetails> details;  ///< Set when the API call succeeded
};

/// Reason the metadata lookup was skipped or degraded.
enum class WarningKind {
  RepositoryNotFound,
  RateLimitExceeded,
  ProviderApiError,
  NetworkError
};

/// Stable identifier for a warning kind (e.g. "RateLimitExceeded").
const char *warning_kind_name(WarningKind kind);

/**
 * Side-channel report of a metadata failure that did not abort resolution.
 */
struct ResolutionWarning {
  WarningKind kind{WarningKind::ProviderApiError};
  std::string message;
  std::optional<long> status;
  std::optional<std::chrono::system_clock::time_point> reset_at;
  std::optional<long> remaining;
};

/// Successful resolution.
struct ResolvedRepository {
  RepoMetadata metadata;
  std::string normalized_url;
  std::string original_url; ///< URL that was parsed (shorthand expanded)
  std::string original_input;
  std::vector<ResolutionWarning> warnings;

  /// `true` when visibility comes from the provider rather than a default.
  bool metadata_available() const { return metadata.details.has_value(); }
};

/// The GitHub App must be installed before the repository can be queried.
struct InstallationRequired {
  std::string installation_url;
  RepoReference reference;
};

/// Either a resolved repository or an authentication-required signal.
using ResolutionOutcome = std::variant<ResolvedRepository, InstallationRequired>;

/// Creates the transport used by one resolve() call.
using HttpClientFactory = std::function<std::unique_ptr<HttpClient>()>;

/// Transport settings used when no HttpClientFactory is supplied.
struct ResolverOptions {
  std::string api_base{"https://api.github.com"};
  long timeout_ms{30000};
  std::string http_proxy;
  std::string https_proxy;
  std::string user_agent{"gitrepoimport"};
};

/**
 * Resolves repository references into metadata.
 *
 * Input validation and authentication errors abort the call. Metadata lookup
 * failures degrade to `is_private = false` and are reported as warnings.
 * Each call builds its own transport, so concurrent calls share no state.
 */
class RepoResolutionService {
public:
  using WarningObserver = std::function<void(const ResolutionWarning &)>;

  explicit RepoResolutionService(ResolverOptions options = {},
                                 HttpClientFactory http_factory = {});

  /// Register a callback invoked for every warning as it is recorded.
  void set_warning_observer(WarningObserver observer) {
    observer_ = std::move(observer);
  }

  /**
   * Resolve @p input using the credentials in @p config.
   *
   * @return ResolvedRepository, or InstallationRequired when App credentials
   *         lack an installation id.
   * @throws InvalidFormatError, MissingOwnerOrRepoError On malformed input.
   * @throws InvalidTokenFormatError, AppAuthFailedError On credential errors.
   */
  ResolutionOutcome resolve(const std::string &input, const AuthConfig &config);

  /**
   * Resolve only the credentials, without touching a repository.
   *
   * @throws InvalidTokenFormatError, AppAuthFailedError On credential errors.
   */
  AuthOutcome resolve_credentials(const AuthConfig &config);

  const ResolverOptions &options() const { return options_; }

private:
  std::unique_ptr<HttpClient> make_http() const;
  void record(ResolvedRepository &result, ResolutionWarning warning) const;

  ResolverOptions options_;
  HttpClientFactory http_factory_;
  WarningObserver observer_;
};

} // namespace gri

#endif // GITREPOIMPORT_REPO_RESOLVER_HPP
