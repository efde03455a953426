#include "token_loader.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iterator>
#include <nlohmann/json.hpp>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <toml++/toml.h>
#include <yaml-cpp/yaml.h>

namespace gri {

namespace {

std::string extension_of(const std::string &path) {
  auto slash = path.find_last_of("/\\");
  auto pos = path.find_last_of('.');
  if (pos == std::string::npos ||
      (slash != std::string::npos && pos < slash)) {
    return {};
  }
  std::string ext = path.substr(pos + 1);
  std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return ext;
}

std::string trim(const std::string &value) {
  auto first = value.find_first_not_of(" \t\r\n");
  if (first == std::string::npos) {
    return {};
  }
  auto last = value.find_last_not_of(" \t\r\n");
  return value.substr(first, last - first + 1);
}

std::optional<std::string> token_from_yaml(const YAML::Node &node) {
  if (node.IsScalar()) {
    return node.as<std::string>();
  }
  if (node.IsSequence() && node.size() > 0) {
    return node[0].as<std::string>();
  }
  if (node.IsMap()) {
    if (node["token"]) {
      return node["token"].as<std::string>();
    }
    if (const YAML::Node tokens = node["tokens"]) {
      if (!tokens.IsSequence()) {
        throw std::runtime_error("YAML tokens entry must be a sequence");
      }
      if (tokens.size() > 0) {
        return tokens[0].as<std::string>();
      }
    }
  }
  return std::nullopt;
}

std::optional<std::string> token_from_json(const nlohmann::json &j) {
  if (j.is_string()) {
    return j.get<std::string>();
  }
  if (j.is_array() && !j.empty()) {
    return j.front().get<std::string>();
  }
  if (j.is_object()) {
    if (j.contains("token")) {
      return j["token"].get<std::string>();
    }
    if (j.contains("tokens")) {
      const auto &array = j["tokens"];
      if (!array.is_array()) {
        throw std::runtime_error("JSON tokens entry must be an array");
      }
      if (!array.empty()) {
        return array.front().get<std::string>();
      }
    }
  }
  return std::nullopt;
}

std::optional<std::string> token_from_toml(const toml::table &tbl) {
  if (auto single = tbl["token"].value<std::string>()) {
    return *single;
  }
  if (auto arr = tbl["tokens"].as_array()) {
    if (arr->empty()) {
      return std::nullopt;
    }
    if (auto value = (*arr)[0].value<std::string>()) {
      return *value;
    }
    throw std::runtime_error("TOML tokens array must contain strings");
  }
  return std::nullopt;
}

} // namespace

std::string read_text_file(const std::string &path) {
  std::ifstream f(path, std::ios::binary);
  if (!f) {
    throw std::runtime_error("Failed to open file " + path);
  }
  return std::string((std::istreambuf_iterator<char>(f)),
                     std::istreambuf_iterator<char>());
}

std::string load_token_from_file(const std::string &path) {
  const std::string ext = extension_of(path);
  std::optional<std::string> token;
  if (ext == "yaml" || ext == "yml") {
    token = token_from_yaml(YAML::LoadFile(path));
  } else if (ext == "json") {
    std::ifstream f(path);
    if (!f) {
      throw std::runtime_error("Failed to open token file " + path);
    }
    nlohmann::json j;
    f >> j;
    token = token_from_json(j);
  } else if (ext == "toml" || ext == "tml") {
    token = token_from_toml(toml::parse_file(path));
  } else {
    std::istringstream lines(read_text_file(path));
    std::string line;
    while (std::getline(lines, line)) {
      line = trim(line);
      if (!line.empty()) {
        token = line;
        break;
      }
    }
  }
  if (token) {
    *token = trim(*token);
  }
  if (!token || token->empty()) {
    throw std::runtime_error("No token found in " + path);
  }
  return *token;
}

} // namespace gri
