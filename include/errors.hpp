/**
 * @file errors.hpp
 * @brief Exception taxonomy for repository resolution.
 *
 * Declares the typed exceptions raised while normalizing repository
 * references, resolving credentials, and querying the provider API.
 */

#ifndef GITREPOIMPORT_ERRORS_HPP
#define GITREPOIMPORT_ERRORS_HPP

#include <chrono>
#include <stdexcept>
#include <string>
#include <utility>

namespace gri {

/// Stable classification of resolution failures.
enum class ErrorKind {
  InvalidFormat,
  MissingOwnerOrRepo,
  InvalidTokenFormat,
  AppAuthFailed,
  RepositoryNotFound,
  RateLimitExceeded,
  ProviderApiError
};

/// Return a stable identifier for an error kind (e.g. "InvalidFormat").
const char *error_kind_name(ErrorKind kind);

/**
 * Base class for every classified resolution failure.
 */
class ResolveError : public std::runtime_error {
public:
  ResolveError(ErrorKind kind, const std::string &message)
      : std::runtime_error(message), kind_(kind) {}

  /// Classification of this failure.
  ErrorKind kind() const { return kind_; }

private:
  ErrorKind kind_;
};

/// Input is neither an absolute URL nor an `owner/repo` shorthand.
class InvalidFormatError : public ResolveError {
public:
  explicit InvalidFormatError(const std::string &message)
      : ResolveError(ErrorKind::InvalidFormat, message) {}
};

/// URL parsed but the owner or repository path segment is missing.
class MissingOwnerOrRepoError : public ResolveError {
public:
  explicit MissingOwnerOrRepoError(const std::string &message)
      : ResolveError(ErrorKind::MissingOwnerOrRepo, message) {}
};

/// Bearer token does not look like a GitHub personal access token.
class InvalidTokenFormatError : public ResolveError {
public:
  explicit InvalidTokenFormatError(const std::string &message)
      : ResolveError(ErrorKind::InvalidTokenFormat, message) {}
};

/**
 * GitHub App credentials could not be turned into a token.
 */
class AppAuthFailedError : public ResolveError {
public:
  explicit AppAuthFailedError(const std::string &cause)
      : ResolveError(ErrorKind::AppAuthFailed,
                     "GitHub App authentication failed: " + cause),
        cause_(cause) {}

  /// Underlying reason reported by the token exchange.
  const std::string &cause() const { return cause_; }

private:
  std::string cause_;
};

/// Provider answered 404 for the repository resource.
class RepositoryNotFoundError : public ResolveError {
public:
  RepositoryNotFoundError(std::string owner, std::string repo)
      : ResolveError(ErrorKind::RepositoryNotFound,
                     "Repository not found: " + owner + "/" + repo),
        owner_(std::move(owner)), repo_(std::move(repo)) {}

  const std::string &owner() const { return owner_; }
  const std::string &repo() const { return repo_; }

private:
  std::string owner_;
  std::string repo_;
};

/**
 * Provider answered 403 with an exhausted rate-limit quota.
 */
class RateLimitExceededError : public ResolveError {
public:
  RateLimitExceededError(std::chrono::system_clock::time_point reset_at,
                         long remaining, const std::string &message)
      : ResolveError(ErrorKind::RateLimitExceeded, message),
        reset_at_(reset_at), remaining_(remaining) {}

  /// Absolute point in time at which the quota is replenished.
  std::chrono::system_clock::time_point reset_at() const { return reset_at_; }

  /// Remaining request count reported by the provider (always zero today).
  long remaining() const { return remaining_; }

private:
  std::chrono::system_clock::time_point reset_at_;
  long remaining_;
};

/// Any other non-success response from the provider API.
class ProviderApiError : public ResolveError {
public:
  ProviderApiError(long status, std::string body)
      : ResolveError(ErrorKind::ProviderApiError,
                     "GitHub API Error: " + std::to_string(status) + " - " +
                         body),
        status_(status), body_(std::move(body)) {}

  long status() const { return status_; }
  const std::string &body() const { return body_; }

private:
  long status_;
  std::string body_;
};

/**
 * Transport-level failure raised by HTTP clients (DNS, TLS, timeouts).
 */
class TransientNetworkError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

/// Format a time point as an ISO-8601 UTC timestamp with millisecond precision.
std::string format_iso8601(std::chrono::system_clock::time_point tp);

} // namespace gri

#endif // GITREPOIMPORT_ERRORS_HPP
