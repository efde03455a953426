#include "config.hpp"
#include "log.hpp"
#include "token_loader.hpp"
#include "util/duration.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <iterator>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <toml++/toml.h>
#include <yaml-cpp/yaml.h>

namespace gri {

namespace {

std::shared_ptr<spdlog::logger> config_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("config");
  }();
  return logger;
}

std::string to_lower_copy(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return value;
}

/**
 * Convert a YAML node into JSON, keeping booleans and numbers typed.
 */
nlohmann::json yaml_to_json(const YAML::Node &node) {
  using nlohmann::json;
  switch (node.Type()) {
  case YAML::NodeType::Scalar: {
    const std::string s = node.Scalar();
    const std::string lower = to_lower_copy(s);
    if (lower == "true")
      return true;
    if (lower == "false")
      return false;
    if (!s.empty() && (std::isdigit(static_cast<unsigned char>(s[0])) ||
                       s[0] == '-')) {
      try {
        std::size_t idx = 0;
        long long i = std::stoll(s, &idx, 10);
        if (idx == s.size())
          return i;
      } catch (const std::exception &) {
      }
    }
    return s;
  }
  case YAML::NodeType::Sequence: {
    json arr = json::array();
    std::transform(node.begin(), node.end(), std::back_inserter(arr),
                   [](const YAML::Node &item) { return yaml_to_json(item); });
    return arr;
  }
  case YAML::NodeType::Map: {
    json obj = json::object();
    for (const auto &kv : node) {
      obj[kv.first.as<std::string>()] = yaml_to_json(kv.second);
    }
    return obj;
  }
  default:
    return nullptr;
  }
}

/**
 * Translate a TOML node to JSON. Date and time values become strings.
 */
nlohmann::json toml_to_json(const toml::node &node) {
  using nlohmann::json;
  if (const auto *table = node.as_table()) {
    json obj = json::object();
    for (const auto &kv : *table) {
      obj[std::string(kv.first.str())] = toml_to_json(kv.second);
    }
    return obj;
  }
  if (const auto *array = node.as_array()) {
    json arr = json::array();
    for (const auto &item : *array) {
      arr.push_back(toml_to_json(item));
    }
    return arr;
  }
  if (const auto *value = node.as_boolean())
    return value->get();
  if (const auto *value = node.as_integer())
    return value->get();
  if (const auto *value = node.as_floating_point())
    return value->get();
  if (const auto *value = node.as_string())
    return value->get();
  auto stringify = [](const auto &temporal) {
    std::ostringstream oss;
    oss << temporal;
    return oss.str();
  };
  if (const auto *value = node.as_date())
    return stringify(value->get());
  if (const auto *value = node.as_time())
    return stringify(value->get());
  if (const auto *value = node.as_date_time())
    return stringify(value->get());
  return nullptr;
}

/**
 * Flatten grouped sections (`network`, `logging`, ...) onto the root object.
 * The `github_app` section is also accepted with camelCase keys.
 */
nlohmann::json normalize_config_sections(const nlohmann::json &source) {
  nlohmann::json normalized = source;
  auto merge_section = [&normalized](std::string_view name) {
    auto it = normalized.find(std::string{name});
    if (it == normalized.end() || !it->is_object()) {
      return;
    }
    const nlohmann::json section = *it;
    for (const auto &[key, value] : section.items()) {
      normalized[key] = value;
    }
  };
  for (std::string_view section :
       {"network", "logging", "github", "auth", "github_app"}) {
    merge_section(section);
  }
  static const std::pair<const char *, const char *> camel_keys[] = {
      {"appId", "app_id"},
      {"privateKey", "private_key"},
      {"clientId", "client_id"},
      {"clientSecret", "client_secret"},
      {"installationId", "installation_id"},
      {"installationUrl", "installation_url"}};
  for (const auto &[camel, snake] : camel_keys) {
    if (normalized.contains(camel) && !normalized.contains(snake)) {
      normalized[snake] = normalized[camel];
    }
  }
  return normalized;
}

/// Read a string value, accepting integers for identifiers such as app ids.
bool read_string(const nlohmann::json &j, const char *key, std::string &out) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) {
    return false;
  }
  if (it->is_string()) {
    out = it->get<std::string>();
  } else if (it->is_number_integer()) {
    out = std::to_string(it->get<long long>());
  } else {
    throw std::runtime_error(std::string("Config key '") + key +
                             "' must be a string");
  }
  return true;
}

} // namespace

void Config::load_json(const nlohmann::json &root) {
  if (!root.is_object()) {
    throw std::runtime_error("Configuration root must be an object");
  }
  const nlohmann::json j = normalize_config_sections(root);
  read_string(j, "api_base", api_base_);
  if (j.contains("http_timeout")) {
    const auto &t = j["http_timeout"];
    if (t.is_number_integer()) {
      set_http_timeout_ms(t.get<long>() * 1000);
    } else if (t.is_string()) {
      set_http_timeout_ms(
          static_cast<long>(parse_duration(t.get<std::string>()).count()));
    } else {
      throw std::runtime_error("Config key 'http_timeout' must be a number or "
                               "duration string");
    }
  }
  read_string(j, "http_proxy", http_proxy_);
  read_string(j, "https_proxy", https_proxy_);
  read_string(j, "user_agent", user_agent_);
  read_string(j, "log_level", log_level_);
  read_string(j, "log_pattern", log_pattern_);
  read_string(j, "log_file", log_file_);
  if (j.contains("log_rotate")) {
    set_log_rotate(j["log_rotate"].get<int>());
  }
  if (j.contains("log_categories")) {
    const auto &cats = j["log_categories"];
    if (!cats.is_object()) {
      throw std::runtime_error("Config key 'log_categories' must be a map");
    }
    log_categories_.clear();
    for (const auto &[name, level] : cats.items()) {
      log_categories_[name] = level.get<std::string>();
    }
  }
  read_string(j, "token", token_);
  read_string(j, "token_file", token_file_);
  read_string(j, "app_id", app_id_);
  read_string(j, "private_key", private_key_);
  read_string(j, "private_key_file", private_key_file_);
  read_string(j, "client_id", client_id_);
  read_string(j, "client_secret", client_secret_);
  read_string(j, "installation_id", installation_id_);
  read_string(j, "installation_url", installation_url_);
}

AuthConfig Config::auth_config() const {
  AuthConfig auth;
  auth.installation_url = installation_url_;
  if (!app_id_.empty()) {
    nlohmann::json app = {{"appId", app_id_},
                          {"clientId", client_id_},
                          {"clientSecret", client_secret_}};
    app["privateKey"] = private_key_.empty() && !private_key_file_.empty()
                            ? read_text_file(private_key_file_)
                            : private_key_;
    if (!installation_id_.empty()) {
      app["installationId"] = installation_id_;
    }
    for (const char *key : {"privateKey", "clientId", "clientSecret"}) {
      if (app[key].get<std::string>().empty()) {
        throw std::runtime_error(std::string("GitHub App field '") + key +
                                 "' is required when app_id is set");
      }
    }
    auth.github_app = validate_app_config(app);
  }
  if (!token_.empty()) {
    auth.token = token_;
  } else if (!token_file_.empty()) {
    auth.token = load_token_from_file(token_file_);
  }
  return auth;
}

ResolverOptions Config::resolver_options() const {
  ResolverOptions opts;
  opts.api_base = api_base_;
  opts.timeout_ms = http_timeout_ms_;
  opts.http_proxy = http_proxy_;
  opts.https_proxy = https_proxy_;
  opts.user_agent = user_agent_;
  return opts;
}

Config Config::from_json(const nlohmann::json &j) {
  Config cfg;
  cfg.load_json(j);
  return cfg;
}

Config Config::from_file(const std::string &path) {
  config_log()->debug("Loading config from {}", path);
  auto pos = path.find_last_of('.');
  if (pos == std::string::npos) {
    config_log()->error("Unknown config file extension for {}", path);
    throw std::runtime_error("Unknown config file extension");
  }
  const std::string ext = to_lower_copy(path.substr(pos + 1));
  nlohmann::json j;
  try {
    if (ext == "yaml" || ext == "yml") {
      j = yaml_to_json(YAML::LoadFile(path));
    } else if (ext == "json") {
      std::ifstream f(path);
      if (!f) {
        throw std::runtime_error("Failed to open config file " + path);
      }
      f >> j;
    } else if (ext == "toml" || ext == "tml") {
      toml::table tbl = toml::parse_file(path);
      j = toml_to_json(tbl);
    } else {
      throw std::runtime_error("Unsupported config format: " + ext);
    }
  } catch (const std::exception &e) {
    config_log()->error("Failed to load config {}: {}", path, e.what());
    throw;
  }
  Config cfg;
  cfg.load_json(j);
  config_log()->info("Config loaded from {}", path);
  return cfg;
}

} // namespace gri
