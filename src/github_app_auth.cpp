/**
 * @file github_app_auth.cpp
 * @brief GitHub App JWT signing and installation token exchange.
 */

#include "github_app_auth.hpp"
#include "errors.hpp"
#include "log.hpp"
#include <algorithm>
#include <ctime>
#include <iomanip>
#include <memory>
#include <nlohmann/json.hpp>
#include <openssl/bio.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/pem.h>
#include <spdlog/spdlog.h>
#include <sstream>
#include <stdexcept>
#include <utility>
#include <vector>

namespace gri {

namespace {

std::shared_ptr<spdlog::logger> app_auth_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("github.app");
  }();
  return logger;
}

struct BioDeleter {
  void operator()(BIO *bio) const { BIO_free(bio); }
};
struct PkeyDeleter {
  void operator()(EVP_PKEY *key) const { EVP_PKEY_free(key); }
};
struct MdCtxDeleter {
  void operator()(EVP_MD_CTX *ctx) const { EVP_MD_CTX_free(ctx); }
};

/// Most recent OpenSSL error as text.
std::string openssl_error() {
  unsigned long code = ERR_get_error();
  if (code == 0) {
    return "unknown OpenSSL error";
  }
  char buf[256];
  ERR_error_string_n(code, buf, sizeof(buf));
  ERR_clear_error();
  return buf;
}

std::string base64url(const unsigned char *data, std::size_t len) {
  if (len == 0) {
    return {};
  }
  std::vector<unsigned char> out(4 * ((len + 2) / 3) + 1);
  int written = EVP_EncodeBlock(out.data(), data, static_cast<int>(len));
  std::string encoded(reinterpret_cast<const char *>(out.data()),
                      static_cast<std::size_t>(written));
  while (!encoded.empty() && encoded.back() == '=') {
    encoded.pop_back();
  }
  std::replace(encoded.begin(), encoded.end(), '+', '-');
  std::replace(encoded.begin(), encoded.end(), '/', '_');
  return encoded;
}

std::string base64url(const std::string &data) {
  return base64url(reinterpret_cast<const unsigned char *>(data.data()),
                   data.size());
}

/// Keys pasted into environment variables often carry literal "\n" escapes.
std::string unescape_pem(const std::string &pem) {
  if (pem.find('\n') != std::string::npos) {
    return pem;
  }
  std::string out;
  out.reserve(pem.size());
  for (std::size_t i = 0; i < pem.size(); ++i) {
    if (pem[i] == '\\' && i + 1 < pem.size() && pem[i + 1] == 'n') {
      out.push_back('\n');
      ++i;
    } else {
      out.push_back(pem[i]);
    }
  }
  return out;
}

std::string sign_rs256(const std::string &pem, const std::string &input) {
  const std::string key_text = unescape_pem(pem);
  std::unique_ptr<BIO, BioDeleter> bio(
      BIO_new_mem_buf(key_text.data(), static_cast<int>(key_text.size())));
  if (!bio) {
    throw AppAuthFailedError("unable to allocate key buffer");
  }
  std::unique_ptr<EVP_PKEY, PkeyDeleter> key(
      PEM_read_bio_PrivateKey(bio.get(), nullptr, nullptr, nullptr));
  if (!key) {
    throw AppAuthFailedError("invalid private key: " + openssl_error());
  }
  std::unique_ptr<EVP_MD_CTX, MdCtxDeleter> ctx(EVP_MD_CTX_new());
  if (!ctx ||
      EVP_DigestSignInit(ctx.get(), nullptr, EVP_sha256(), nullptr,
                         key.get()) != 1) {
    throw AppAuthFailedError("unable to initialise signer: " + openssl_error());
  }
  std::size_t sig_len = 0;
  const auto *msg = reinterpret_cast<const unsigned char *>(input.data());
  if (EVP_DigestSign(ctx.get(), nullptr, &sig_len, msg, input.size()) != 1) {
    throw AppAuthFailedError("unable to sign JWT: " + openssl_error());
  }
  std::vector<unsigned char> sig(sig_len);
  if (EVP_DigestSign(ctx.get(), sig.data(), &sig_len, msg, input.size()) !=
      1) {
    throw AppAuthFailedError("unable to sign JWT: " + openssl_error());
  }
  return base64url(sig.data(), sig_len);
}

/// Parse GitHub's `2016-07-11T22:14:10Z` timestamps.
std::optional<std::chrono::system_clock::time_point>
parse_github_timestamp(const std::string &value) {
  std::tm tm{};
  std::istringstream iss(value);
  iss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
  if (iss.fail()) {
    return std::nullopt;
  }
#ifdef _WIN32
  std::time_t t = _mkgmtime(&tm);
#else
  std::time_t t = timegm(&tm);
#endif
  if (t == static_cast<std::time_t>(-1)) {
    return std::nullopt;
  }
  return std::chrono::system_clock::from_time_t(t);
}

std::string required_string(const nlohmann::json &j, const char *camel,
                            const char *snake) {
  for (const char *key : {camel, snake}) {
    auto it = j.find(key);
    if (it != j.end()) {
      if (!it->is_string()) {
        throw std::runtime_error(std::string("GitHub App field '") + key +
                                 "' must be a string");
      }
      return it->get<std::string>();
    }
  }
  throw std::runtime_error(std::string("GitHub App field '") + camel +
                           "' is required");
}

} // namespace

GitHubAppConfig validate_app_config(const nlohmann::json &j) {
  if (!j.is_object()) {
    throw std::runtime_error("GitHub App configuration must be an object");
  }
  GitHubAppConfig cfg;
  cfg.app_id = required_string(j, "appId", "app_id");
  cfg.private_key = required_string(j, "privateKey", "private_key");
  cfg.client_id = required_string(j, "clientId", "client_id");
  cfg.client_secret = required_string(j, "clientSecret", "client_secret");
  for (const char *key : {"installationId", "installation_id"}) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
      continue;
    }
    if (it->is_string()) {
      cfg.installation_id = it->get<std::string>();
    } else if (it->is_number_integer()) {
      cfg.installation_id = std::to_string(it->get<long long>());
    } else {
      throw std::runtime_error(
          "GitHub App field 'installationId' must be a string");
    }
    break;
  }
  if (cfg.installation_id && cfg.installation_id->empty()) {
    cfg.installation_id.reset();
  }
  return cfg;
}

GitHubAppAuth::GitHubAppAuth(GitHubAppConfig config, HttpClient &http,
                             std::string api_base,
                             std::string installation_url)
    : config_(std::move(config)), http_(http), api_base_(std::move(api_base)),
      installation_url_(std::move(installation_url)) {}

std::string
GitHubAppAuth::create_app_jwt(std::chrono::system_clock::time_point now) const {
  using namespace std::chrono;
  const auto issued = duration_cast<seconds>(now.time_since_epoch()).count();
  nlohmann::json header = {{"alg", "RS256"}, {"typ", "JWT"}};
  nlohmann::json payload = {
      {"iat", issued - 60}, {"exp", issued + 600}, {"iss", config_.app_id}};
  const std::string signing_input =
      base64url(header.dump()) + "." + base64url(payload.dump());
  return signing_input + "." + sign_rs256(config_.private_key, signing_input);
}

AppAuthentication GitHubAppAuth::authenticate() {
  const auto now = std::chrono::system_clock::now();
  AppAuthentication result;
  result.token = create_app_jwt(now);

  if (!config_.installation_id) {
    app_auth_log()->info("GitHub App {} has no installation id; installation "
                         "required",
                         config_.app_id);
    result.type = AppAuthentication::Type::App;
    result.expires_at = now + std::chrono::minutes(10);
    result.installation_url = installation_url_;
    return result;
  }

  const std::string url = api_base_ + "/app/installations/" +
                          *config_.installation_id + "/access_tokens";
  HttpResponse resp;
  try {
    resp = http_.post(url, "{}",
                      {"Accept: application/vnd.github.v3+json",
                       "Authorization: Bearer " + result.token,
                       "Content-Type: application/json"});
  } catch (const TransientNetworkError &e) {
    throw AppAuthFailedError(e.what());
  }
  if (resp.status_code < 200 || resp.status_code >= 300) {
    app_auth_log()->error("Installation token exchange for {} failed with "
                          "HTTP {}",
                          *config_.installation_id, resp.status_code);
    throw AppAuthFailedError("installation token request returned HTTP " +
                             std::to_string(resp.status_code) + " - " +
                             resp.body);
  }

  nlohmann::json body =
      nlohmann::json::parse(resp.body, nullptr, /*allow_exceptions=*/false);
  if (!body.is_object() || !body.contains("token") ||
      !body["token"].is_string()) {
    throw AppAuthFailedError("installation token response missing 'token'");
  }
  result.type = AppAuthentication::Type::Installation;
  result.token = body["token"].get<std::string>();
  result.expires_at.reset();
  if (body.contains("expires_at") && body["expires_at"].is_string()) {
    result.expires_at =
        parse_github_timestamp(body["expires_at"].get<std::string>());
  }
  app_auth_log()->debug("Obtained installation token for installation {}",
                        *config_.installation_id);
  return result;
}

} // namespace gri
