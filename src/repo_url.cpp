/**
 * @file repo_url.cpp
 * @brief Repository URL validation, provider detection and normalization.
 */

#include "repo_url.hpp"
#include "errors.hpp"
#include "log.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <curl/curl.h>
#include <memory>
#include <regex>
#include <spdlog/spdlog.h>
#include <utility>
#include <vector>

namespace gri {

namespace {

std::shared_ptr<spdlog::logger> url_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("repo.url");
  }();
  return logger;
}

const std::regex &shorthand_pattern() {
  static const std::regex re(R"(^[\w.-]+/[\w.-]+$)");
  return re;
}

const std::regex &branch_pattern() {
  static const std::regex re(R"(/tree/([\w.-]+))");
  return re;
}

const std::regex &commit_pattern() {
  static const std::regex re(R"(/commit/([a-f0-9]+))", std::regex::icase);
  return re;
}

struct ProviderPattern {
  Provider provider;
  std::regex host;
};

/// Ordered host table; the first matching entry wins.
const std::array<ProviderPattern, 3> &provider_patterns() {
  static const std::array<ProviderPattern, 3> table = {{
      {Provider::GitHub, std::regex(R"(github\.com)")},
      {Provider::GitLab, std::regex(R"(gitlab\.com)")},
      {Provider::Bitbucket, std::regex(R"(bitbucket\.org)")},
  }};
  return table;
}

std::optional<Provider> match_provider(const std::string &host) {
  for (const auto &entry : provider_patterns()) {
    if (std::regex_search(host, entry.host)) {
      return entry.provider;
    }
  }
  return std::nullopt;
}

std::string to_lower_copy(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return value;
}

bool has_scheme(const std::string &input) {
  return input.find("://") != std::string::npos;
}

/**
 * Owning handle for a libcurl URL object.
 */
struct CurlUrlDeleter {
  void operator()(CURLU *handle) const { curl_url_cleanup(handle); }
};
using CurlUrlPtr = std::unique_ptr<CURLU, CurlUrlDeleter>;

/// Parse @p url with libcurl, accepting schemes curl itself cannot fetch.
CurlUrlPtr parse_url(const std::string &url) {
  CurlUrlPtr handle(curl_url());
  if (!handle) {
    return nullptr;
  }
  auto rc = curl_url_set(handle.get(), CURLUPART_URL, url.c_str(),
                         CURLU_NON_SUPPORT_SCHEME);
  if (rc != CURLUE_OK) {
    url_log()->debug("Parsing URL '{}' failed: {}", url, curl_url_strerror(rc));
    return nullptr;
  }
  return handle;
}

std::optional<std::string> url_part(CURLU *handle, CURLUPart part) {
  char *value = nullptr;
  auto rc = curl_url_get(handle, part, &value, 0);
  if (rc != CURLUE_OK || value == nullptr) {
    return std::nullopt;
  }
  std::string out(value);
  curl_free(value);
  return out;
}

std::vector<std::string> split_path(const std::string &path) {
  std::vector<std::string> segments;
  std::size_t start = 0;
  while (start <= path.size()) {
    auto end = path.find('/', start);
    if (end == std::string::npos) {
      end = path.size();
    }
    if (end > start) {
      segments.push_back(path.substr(start, end - start));
    }
    start = end + 1;
  }
  return segments;
}

std::optional<std::string> first_capture(const std::string &text,
                                         const std::regex &pattern) {
  std::smatch match;
  if (std::regex_search(text, match, pattern)) {
    return match[1].str();
  }
  return std::nullopt;
}

std::string strip_git_suffix(std::string repo) {
  static const std::string suffix = ".git";
  // Repeated suffixes are all removed so normalization is idempotent.
  while (repo.size() >= suffix.size() &&
         repo.compare(repo.size() - suffix.size(), suffix.size(), suffix) ==
             0) {
    repo.erase(repo.size() - suffix.size());
  }
  return repo;
}

} // namespace

const char *provider_name(Provider provider) {
  switch (provider) {
  case Provider::GitHub:
    return "github";
  case Provider::GitLab:
    return "gitlab";
  case Provider::Bitbucket:
    return "bitbucket";
  }
  return "github";
}

std::optional<Provider> provider_from_string(const std::string &name) {
  const std::string lower = to_lower_copy(name);
  if (lower == "github") {
    return Provider::GitHub;
  }
  if (lower == "gitlab") {
    return Provider::GitLab;
  }
  if (lower == "bitbucket") {
    return Provider::Bitbucket;
  }
  return std::nullopt;
}

bool validate_repo_url(const std::string &input) {
  if (has_scheme(input)) {
    return parse_url(input) != nullptr;
  }
  return std::regex_match(input, shorthand_pattern());
}

bool is_known_provider_url(const std::string &url) {
  auto handle = parse_url(url);
  if (!handle) {
    return false;
  }
  auto host = url_part(handle.get(), CURLUPART_HOST);
  return host && match_provider(to_lower_copy(*host)).has_value();
}

RepoReference normalize_repo_url(const std::string &input) {
  if (!validate_repo_url(input)) {
    throw InvalidFormatError("Invalid Git repository URL format");
  }

  RepoReference ref;
  ref.original_input = input;
  ref.parsed_url =
      has_scheme(input) ? input : std::string(kPrimaryWebBase) + "/" + input;

  auto handle = parse_url(ref.parsed_url);
  if (!handle) {
    throw InvalidFormatError("Invalid Git repository URL format");
  }
  auto host = url_part(handle.get(), CURLUPART_HOST);
  if (!host || host->empty()) {
    throw InvalidFormatError("Invalid Git repository URL: missing host");
  }
  const std::string hostname = to_lower_copy(*host);
  const auto segments =
      split_path(url_part(handle.get(), CURLUPART_PATH).value_or(""));

  // Unrecognised hosts are treated as the primary provider.
  auto detected = match_provider(hostname);
  if (!detected) {
    url_log()->debug("Host '{}' matches no known provider; assuming {}",
                     hostname, provider_name(kPrimaryProvider));
  }
  ref.provider = detected.value_or(kPrimaryProvider);

  ref.branch = first_capture(ref.parsed_url, branch_pattern());
  ref.commit = first_capture(ref.parsed_url, commit_pattern());
  if (ref.commit) {
    *ref.commit = to_lower_copy(*ref.commit);
  }

  if (segments.size() >= 1) {
    ref.owner = segments[0];
  }
  if (segments.size() >= 2) {
    ref.repo_name = strip_git_suffix(segments[1]);
  }
  if (ref.owner.empty() || ref.repo_name.empty()) {
    throw MissingOwnerOrRepoError(
        "Invalid repository URL: missing owner or repository name");
  }

  ref.normalized_url = "https://" + hostname + "/" + ref.owner + "/" +
                       ref.repo_name;
  url_log()->debug("Normalized '{}' to {} ({})", input, ref.normalized_url,
                   provider_name(ref.provider));
  return ref;
}

} // namespace gri
