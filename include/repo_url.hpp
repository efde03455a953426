/**
 * @file repo_url.hpp
 * @brief Repository reference parsing and normalization.
 *
 * Turns loosely formatted repository references (full URLs, `owner/repo`
 * shorthands, URLs carrying `/tree/<branch>` or `/commit/<sha>` suffixes)
 * into a provider-tagged, canonical identity. Pure and free of I/O.
 */

#ifndef GITREPOIMPORT_REPO_URL_HPP
#define GITREPOIMPORT_REPO_URL_HPP

#include <optional>
#include <string>

namespace gri {

/// Hosting providers recognised by the parser.
enum class Provider { GitHub, GitLab, Bitbucket };

/// The only provider whose API is queried for metadata.
constexpr Provider kPrimaryProvider = Provider::GitHub;

/// Base web URL that shorthand references are anchored to.
constexpr const char *kPrimaryWebBase = "https://github.com";

/// Lowercase provider identifier ("github", "gitlab", "bitbucket").
const char *provider_name(Provider provider);

/// Inverse of provider_name(); unknown names yield `std::nullopt`.
std::optional<Provider> provider_from_string(const std::string &name);

/**
 * Normalized identity of a repository reference.
 */
struct RepoReference {
  std::string owner;                 ///< First path segment, never empty
  std::string repo_name;             ///< Second path segment without `.git`
  std::optional<std::string> branch; ///< From the first `/tree/<branch>`
  std::optional<std::string> commit; ///< From the first `/commit/<hex>`
  Provider provider{kPrimaryProvider};
  std::string normalized_url; ///< `https://<host>/<owner>/<repo>`
  std::string parsed_url;     ///< URL actually parsed (shorthand expanded)
  std::string original_input; ///< Verbatim caller input
};

/**
 * Check the lexical shape of a repository reference without parsing it
 * further.
 *
 * @param input Candidate reference.
 * @return `true` when @p input is an absolute URL that parses, or an
 *         `owner/repo` shorthand made of word characters, dots and hyphens.
 */
bool validate_repo_url(const std::string &input);

/**
 * Determine whether a URL is hosted by one of the recognised providers.
 *
 * Unlike normalize_repo_url() this does not fall back to the primary
 * provider: unparsable URLs and unknown hosts yield `false`.
 */
bool is_known_provider_url(const std::string &url);

/**
 * Decompose a repository reference into its normalized identity.
 *
 * Shorthands are anchored to kPrimaryWebBase. Hosts that match no known
 * provider are still accepted and tagged with kPrimaryProvider. Branch and
 * commit are located independently in the parsed string; the first match of
 * each wins.
 *
 * @param input Raw reference supplied by the user.
 * @return Normalized reference.
 * @throws InvalidFormatError When @p input is neither a URL nor a shorthand.
 * @throws MissingOwnerOrRepoError When the owner or repository segment is
 *         absent.
 */
RepoReference normalize_repo_url(const std::string &input);

} // namespace gri

#endif // GITREPOIMPORT_REPO_URL_HPP
