#ifndef GITREPOIMPORT_CONFIG_HPP
#define GITREPOIMPORT_CONFIG_HPP

#include "auth_strategy.hpp"
#include "repo_resolver.hpp"
#include <nlohmann/json_fwd.hpp>
#include <string>
#include <unordered_map>

namespace gri {

/// Application configuration loaded from a YAML, TOML, or JSON file.
class Config {
public:
  /// Base URL for the GitHub REST API.
  const std::string &api_base() const { return api_base_; }
  void set_api_base(const std::string &base) { api_base_ = base; }

  /// HTTP request timeout in milliseconds.
  long http_timeout_ms() const { return http_timeout_ms_; }
  void set_http_timeout_ms(long ms) { http_timeout_ms_ = ms < 0 ? 0 : ms; }

  const std::string &http_proxy() const { return http_proxy_; }
  void set_http_proxy(const std::string &proxy) { http_proxy_ = proxy; }

  const std::string &https_proxy() const { return https_proxy_; }
  void set_https_proxy(const std::string &proxy) { https_proxy_ = proxy; }

  const std::string &user_agent() const { return user_agent_; }
  void set_user_agent(const std::string &ua) { user_agent_ = ua; }

  /// Logging verbosity level.
  const std::string &log_level() const { return log_level_; }
  void set_log_level(const std::string &level) { log_level_ = level; }

  /// Logging pattern.
  const std::string &log_pattern() const { return log_pattern_; }
  void set_log_pattern(const std::string &pattern) { log_pattern_ = pattern; }

  /// Log file path; empty disables file logging.
  const std::string &log_file() const { return log_file_; }
  void set_log_file(const std::string &file) { log_file_ = file; }

  /// Number of rotated log files to keep.
  int log_rotate() const { return log_rotate_; }
  void set_log_rotate(int rotate) { log_rotate_ = rotate < 0 ? 0 : rotate; }

  /// Per-category log level overrides.
  const std::unordered_map<std::string, std::string> &log_categories() const {
    return log_categories_;
  }
  void set_log_categories(
      const std::unordered_map<std::string, std::string> &categories) {
    log_categories_ = categories;
  }

  /// Personal access token.
  const std::string &token() const { return token_; }
  void set_token(const std::string &token) { token_ = token; }

  /// File holding the personal access token.
  const std::string &token_file() const { return token_file_; }
  void set_token_file(const std::string &file) { token_file_ = file; }

  const std::string &app_id() const { return app_id_; }
  void set_app_id(const std::string &id) { app_id_ = id; }

  /// Inline PEM private key of the GitHub App.
  const std::string &private_key() const { return private_key_; }
  void set_private_key(const std::string &key) { private_key_ = key; }

  const std::string &private_key_file() const { return private_key_file_; }
  void set_private_key_file(const std::string &file) {
    private_key_file_ = file;
  }

  const std::string &client_id() const { return client_id_; }
  void set_client_id(const std::string &id) { client_id_ = id; }

  const std::string &client_secret() const { return client_secret_; }
  void set_client_secret(const std::string &secret) {
    client_secret_ = secret;
  }

  const std::string &installation_id() const { return installation_id_; }
  void set_installation_id(const std::string &id) { installation_id_ = id; }

  /// Installation page reported when the App is not installed.
  const std::string &installation_url() const { return installation_url_; }
  void set_installation_url(const std::string &url) {
    installation_url_ = url;
  }

  /**
   * Assemble resolver credentials from the configured values.
   *
   * App credentials are used when `app_id` is set; key files and token files
   * are read at this point.
   *
   * @throws std::runtime_error When App credentials are incomplete or a file
   *         cannot be read.
   */
  AuthConfig auth_config() const;

  /// Transport settings for RepoResolutionService.
  ResolverOptions resolver_options() const;

  /**
   * Load configuration from a file. The format is inferred from the
   * extension (`.yaml`, `.yml`, `.json`, `.toml`).
   *
   * @throws std::runtime_error When the file cannot be read or parsed.
   */
  static Config from_file(const std::string &path);

  /// Create configuration from a parsed JSON object.
  static Config from_json(const nlohmann::json &j);

private:
  void load_json(const nlohmann::json &j);

  std::string api_base_{"https://api.github.com"};
  long http_timeout_ms_{30000};
  std::string http_proxy_;
  std::string https_proxy_;
  std::string user_agent_{"gitrepoimport"};
  std::string log_level_{"info"};
  std::string log_pattern_;
  std::string log_file_;
  int log_rotate_{3};
  std::unordered_map<std::string, std::string> log_categories_;
  std::string token_;
  std::string token_file_;
  std::string app_id_;
  std::string private_key_;
  std::string private_key_file_;
  std::string client_id_;
  std::string client_secret_;
  std::string installation_id_;
  std::string installation_url_{kDefaultInstallationUrl};
};

} // namespace gri

#endif // GITREPOIMPORT_CONFIG_HPP
