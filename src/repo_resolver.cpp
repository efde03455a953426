#include "repo_resolver.hpp"
#include "errors.hpp"
#include "log.hpp"
#include <spdlog/spdlog.h>
#include <utility>

namespace gri {

namespace {

std::shared_ptr<spdlog::logger> resolver_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("resolver");
  }();
  return logger;
}

RepoMetadata metadata_from(const RepoReference &ref) {
  RepoMetadata meta;
  meta.owner = ref.owner;
  meta.repo = ref.repo_name;
  meta.branch = ref.branch;
  meta.commit = ref.commit;
  meta.provider = ref.provider;
  return meta;
}

} // namespace

const char *warning_kind_name(WarningKind kind) {
  switch (kind) {
  case WarningKind::RepositoryNotFound:
    return "RepositoryNotFound";
  case WarningKind::RateLimitExceeded:
    return "RateLimitExceeded";
  case WarningKind::ProviderApiError:
    return "ProviderApiError";
  case WarningKind::NetworkError:
    return "NetworkError";
  }
  return "Unknown";
}

RepoResolutionService::RepoResolutionService(ResolverOptions options,
                                             HttpClientFactory http_factory)
    : options_(std::move(options)), http_factory_(std::move(http_factory)) {}

std::unique_ptr<HttpClient> RepoResolutionService::make_http() const {
  if (http_factory_) {
    return http_factory_();
  }
  return std::make_unique<CurlHttpClient>(options_.timeout_ms,
                                          options_.http_proxy,
                                          options_.https_proxy,
                                          options_.user_agent);
}

void RepoResolutionService::record(ResolvedRepository &result,
                                   ResolutionWarning warning) const {
  if (warning.kind == WarningKind::RateLimitExceeded) {
    resolver_log()->warn("{}", warning.message);
  } else {
    resolver_log()->error("Failed to fetch repository metadata: {}",
                          warning.message);
  }
  if (observer_) {
    observer_(warning);
  }
  result.warnings.push_back(std::move(warning));
}

AuthOutcome RepoResolutionService::resolve_credentials(const AuthConfig &config) {
  auto http = make_http();
  return resolve_auth(config, *http, options_.api_base);
}

ResolutionOutcome RepoResolutionService::resolve(const std::string &input,
                                                 const AuthConfig &config) {
  RepoReference ref = normalize_repo_url(input);

  ResolvedRepository result;
  result.metadata = metadata_from(ref);
  result.normalized_url = ref.normalized_url;
  result.original_url = ref.parsed_url;
  result.original_input = ref.original_input;

  if (ref.provider != kPrimaryProvider) {
    resolver_log()->debug("Skipping metadata lookup for {} repository {}",
                          provider_name(ref.provider), ref.normalized_url);
    return result;
  }

  auto http = make_http();
  AuthOutcome auth = resolve_auth(config, *http, options_.api_base);
  if (auto *pending = std::get_if<AppAuthPending>(&auth)) {
    resolver_log()->info("GitHub App installation required for {}",
                         ref.normalized_url);
    return InstallationRequired{pending->installation_url, std::move(ref)};
  }

  MetadataFetcher fetcher(*http, options_.api_base);
  try {
    RepoDetails details = fetcher.fetch(ref, auth);
    result.metadata.is_private = details.is_private;
    result.metadata.details = std::move(details);
  } catch (const RateLimitExceededError &e) {
    ResolutionWarning w{WarningKind::RateLimitExceeded, e.what()};
    w.status = 403;
    w.reset_at = e.reset_at();
    w.remaining = e.remaining();
    record(result, std::move(w));
  } catch (const RepositoryNotFoundError &e) {
    ResolutionWarning w{WarningKind::RepositoryNotFound, e.what()};
    w.status = 404;
    record(result, std::move(w));
  } catch (const ProviderApiError &e) {
    ResolutionWarning w{WarningKind::ProviderApiError, e.what()};
    w.status = e.status();
    record(result, std::move(w));
  } catch (const TransientNetworkError &e) {
    record(result, ResolutionWarning{WarningKind::NetworkError, e.what()});
  }
  return result;
}

} // namespace gri
