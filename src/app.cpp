#include "app.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "resolution_json.hpp"
#include "util/duration.hpp"
#include <cstdlib>
#include <exception>
#include <memory>
#include <spdlog/spdlog.h>
#include <string>
#include <unordered_map>
#include <utility>
#include <variant>

namespace gri {

namespace {
std::shared_ptr<spdlog::logger> app_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("app");
  }();
  return logger;
}

int exit_code_for(const ResolveError &error) {
  switch (error.kind()) {
  case ErrorKind::InvalidFormat:
  case ErrorKind::MissingOwnerOrRepo:
    return kExitInvalidInput;
  case ErrorKind::InvalidTokenFormat:
  case ErrorKind::AppAuthFailed:
    return kExitAuthFailed;
  default:
    return kExitError;
  }
}
} // namespace

App::App(HttpClientFactory http_factory, std::ostream &out)
    : http_factory_(std::move(http_factory)), out_(out) {}

void App::print(const nlohmann::json &j) const {
  // Provider error bodies are copied into warnings and may not be UTF-8.
  out_ << j.dump(options_.pretty ? 2 : -1, ' ', false,
                 nlohmann::json::error_handler_t::replace)
       << std::endl;
}

void App::apply_cli_overrides() {
  if (!options_.api_base.empty()) {
    config_.set_api_base(options_.api_base);
  }
  if (!options_.timeout.empty()) {
    config_.set_http_timeout_ms(
        static_cast<long>(parse_duration(options_.timeout).count()));
  }
  if (!options_.log_file.empty()) {
    config_.set_log_file(options_.log_file);
  }
  if (!options_.log_categories.empty()) {
    auto merged = config_.log_categories();
    for (const auto &[name, level] : options_.log_categories) {
      merged[name] = level;
    }
    config_.set_log_categories(merged);
  }
  if (!options_.token.empty()) {
    config_.set_token(options_.token);
    config_.set_token_file("");
  } else if (!options_.token_file.empty()) {
    config_.set_token("");
    config_.set_token_file(options_.token_file);
  }
  if (!options_.app_id.empty()) {
    config_.set_app_id(options_.app_id);
  }
  if (!options_.private_key_file.empty()) {
    config_.set_private_key("");
    config_.set_private_key_file(options_.private_key_file);
  }
  if (!options_.client_id.empty()) {
    config_.set_client_id(options_.client_id);
  }
  if (!options_.client_secret.empty()) {
    config_.set_client_secret(options_.client_secret);
  }
  if (!options_.installation_id.empty()) {
    config_.set_installation_id(options_.installation_id);
  }
  if (!options_.installation_url.empty()) {
    config_.set_installation_url(options_.installation_url);
  }
  if (config_.token().empty() && config_.token_file().empty()) {
    if (const char *env = std::getenv("GITHUB_TOKEN"); env && *env) {
      config_.set_token(env);
    }
  }
}

void App::init_logging() {
  std::string level_str = options_.verbose ? "debug" : config_.log_level();
  if (!options_.log_level.empty()) {
    level_str = options_.log_level;
  }
  spdlog::level::level_enum lvl = spdlog::level::from_str(level_str);
  bool bad_level = lvl == spdlog::level::off && level_str != "off";
  if (bad_level) {
    lvl = spdlog::level::info;
  }
  init_logger(lvl, config_.log_pattern(), config_.log_file(),
              static_cast<std::size_t>(config_.log_rotate()));
  if (bad_level) {
    app_log()->warn("Unknown log level '{}', using info", level_str);
  }
  std::unordered_map<std::string, spdlog::level::level_enum> category_levels;
  for (const auto &[category, category_level] : config_.log_categories()) {
    auto parsed = spdlog::level::from_str(category_level);
    if (parsed == spdlog::level::off && category_level != "off") {
      app_log()->warn("Ignoring invalid log level '{}' for category '{}'",
                      category_level, category);
      continue;
    }
    category_levels[category] = parsed;
  }
  configure_log_categories(category_levels);
}

int App::run(int argc, char **argv) {
  try {
    options_ = parse_cli(argc, argv);
  } catch (const CliParseExit &exit) {
    return exit.exit_code();
  }
  try {
    if (!options_.config_file.empty()) {
      config_ = Config::from_file(options_.config_file);
    }
    apply_cli_overrides();
  } catch (const std::exception &e) {
    init_logging();
    app_log()->error("Configuration error: {}", e.what());
    return kExitError;
  }
  init_logging();
  return execute();
}

int App::execute() {
  if (options_.validate_only) {
    bool valid = validate_repo_url(options_.repository);
    print({{"valid", valid},
           {"knownProvider", is_known_provider_url(options_.repository)}});
    return valid ? kExitOk : kExitInvalidInput;
  }

  RepoResolutionService service(config_.resolver_options(), http_factory_);
  service.set_warning_observer([](const ResolutionWarning &w) {
    app_log()->debug("Resolution warning recorded: {}",
                     warning_kind_name(w.kind));
  });
  try {
    AuthConfig auth = config_.auth_config();
    if (options_.auth_only) {
      AuthOutcome outcome = service.resolve_credentials(auth);
      app_log()->info("Resolved authentication mode: {}",
                      auth_outcome_name(outcome));
      print(auth_outcome_json(outcome));
      return kExitOk;
    }
    ResolutionOutcome outcome = service.resolve(options_.repository, auth);
    return std::visit(
        overloaded{[this](const ResolvedRepository &resolved) {
                     app_log()->info("Resolved {} ({} warning(s))",
                                     resolved.normalized_url,
                                     resolved.warnings.size());
                     print(resolved);
                     return static_cast<int>(kExitOk);
                   },
                   [this](const InstallationRequired &pending) {
                     app_log()->warn("Install the GitHub App at {}",
                                     pending.installation_url);
                     nlohmann::json j = pending;
                     j.update(error_response_json(
                         map_installation_required(pending)));
                     print(j);
                     return static_cast<int>(kExitInstallationRequired);
                   }},
        outcome);
  } catch (const ResolveError &e) {
    app_log()->error("{}", e.what());
    print(error_response_json(map_error(e)));
    return exit_code_for(e);
  } catch (const std::exception &e) {
    app_log()->error("{}", e.what());
    return kExitError;
  }
}

} // namespace gri
