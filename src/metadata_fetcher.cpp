/**
 * @file metadata_fetcher.cpp
 * @brief Repository detail request and HTTP status classification.
 */

#include "metadata_fetcher.hpp"
#include "errors.hpp"
#include "log.hpp"
#include <chrono>
#include <memory>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <utility>
#include <vector>

namespace gri {

namespace {

std::shared_ptr<spdlog::logger> metadata_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("github.metadata");
  }();
  return logger;
}

std::optional<long> header_number(const HttpResponse &resp,
                                  const std::string &name) {
  auto value = header_value(resp, name);
  if (!value || value->empty()) {
    return std::nullopt;
  }
  try {
    std::size_t idx = 0;
    long n = std::stol(*value, &idx);
    if (idx != value->size()) {
      return std::nullopt;
    }
    return n;
  } catch (const std::exception &) {
    return std::nullopt;
  }
}

std::optional<std::string> optional_string(const nlohmann::json &j,
                                           const char *key) {
  auto it = j.find(key);
  if (it != j.end() && it->is_string()) {
    return it->get<std::string>();
  }
  return std::nullopt;
}

} // namespace

MetadataFetcher::MetadataFetcher(HttpClient &http, std::string api_base)
    : http_(http), api_base_(std::move(api_base)) {}

std::string MetadataFetcher::repo_url(const RepoReference &ref) const {
  return api_base_ + "/repos/" + ref.owner + "/" + ref.repo_name;
}

RepoDetails MetadataFetcher::fetch(const RepoReference &ref,
                                   const AuthOutcome &auth) {
  std::vector<std::string> headers = {"Accept: application/vnd.github.v3+json"};
  if (auto authz = authorization_header(auth)) {
    headers.push_back(*authz);
  }
  const std::string url = repo_url(ref);
  metadata_log()->debug("Fetching repository metadata from {} (auth={})", url,
                        auth_outcome_name(auth));
  HttpResponse resp = http_.get(url, headers);

  if (resp.status_code < 200 || resp.status_code >= 300) {
    if (resp.status_code == 404) {
      throw RepositoryNotFoundError(ref.owner, ref.repo_name);
    }
    auto remaining = header_number(resp, "X-RateLimit-Remaining");
    if (resp.status_code == 403 && remaining && *remaining == 0) {
      long reset = header_number(resp, "X-RateLimit-Reset").value_or(0);
      auto reset_at =
          std::chrono::system_clock::time_point(std::chrono::seconds(reset));
      throw RateLimitExceededError(
          reset_at, *remaining,
          "GitHub API rate limit exceeded. Reset at " +
              format_iso8601(reset_at));
    }
    throw ProviderApiError(resp.status_code, resp.body);
  }

  nlohmann::json body =
      nlohmann::json::parse(resp.body, nullptr, /*allow_exceptions=*/false);
  if (!body.is_object()) {
    throw ProviderApiError(resp.status_code,
                           "unexpected repository payload: " + resp.body);
  }
  RepoDetails details;
  auto priv = body.find("private");
  details.is_private = priv != body.end() && priv->is_boolean() &&
                       priv->get<bool>();
  details.description = optional_string(body, "description");
  details.html_url = optional_string(body, "html_url");
  details.default_branch = optional_string(body, "default_branch");
  details.visibility = optional_string(body, "visibility");
  auto fork = body.find("fork");
  if (fork != body.end() && fork->is_boolean()) {
    details.fork = fork->get<bool>();
  }
  return details;
}

} // namespace gri
