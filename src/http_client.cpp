/**
 * @file http_client.cpp
 * @brief libcurl-backed HTTP transport.
 */

#include "http_client.hpp"
#include "errors.hpp"
#include "log.hpp"
#include <algorithm>
#include <cctype>
#include <memory>
#include <mutex>
#include <spdlog/spdlog.h>
#include <sstream>
#include <utility>

namespace gri {

namespace {

std::shared_ptr<spdlog::logger> http_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("http");
  }();
  return logger;
}

std::string to_lower_copy(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return value;
}

std::string trim_copy(const std::string &value) {
  auto first = value.find_first_not_of(" \t\r\n");
  if (first == std::string::npos) {
    return {};
  }
  auto last = value.find_last_not_of(" \t\r\n");
  return value.substr(first, last - first + 1);
}

/**
 * Create a human readable error message for a CURL request.
 */
std::string format_curl_error(const char *verb, const std::string &url,
                              CURLcode code, const char *errbuf) {
  std::ostringstream oss;
  oss << "curl " << verb;
  if (!url.empty()) {
    oss << ' ' << url;
  }
  oss << " failed: " << curl_easy_strerror(code);
  if (errbuf != nullptr && errbuf[0] != '\0') {
    oss << " - " << errbuf;
  }
  return oss.str();
}

/**
 * RAII wrapper managing a CURL linked list of headers.
 */
struct CurlSlist {
  curl_slist *list{nullptr};
  CurlSlist() = default;
  ~CurlSlist() { curl_slist_free_all(list); }
  void append(const std::string &s) {
    list = curl_slist_append(list, s.c_str());
  }
  curl_slist *get() const { return list; }
  CurlSlist(const CurlSlist &) = delete;
  CurlSlist &operator=(const CurlSlist &) = delete;
};

size_t write_callback(void *contents, size_t size, size_t nmemb, void *userp) {
  size_t total = size * nmemb;
  auto *s = static_cast<std::string *>(userp);
  s->append(static_cast<char *>(contents), total);
  return total;
}

/**
 * Collect header lines, restarting the list whenever a new status line
 * arrives (redirects, proxy CONNECT responses).
 */
size_t header_callback(char *buffer, size_t size, size_t nitems,
                       void *userdata) {
  size_t total = size * nitems;
  std::string line(buffer, total);
  while (!line.empty() && (line.back() == '\r' || line.back() == '\n'))
    line.pop_back();
  auto *hdrs = static_cast<std::vector<std::string> *>(userdata);
  if (line.rfind("HTTP/", 0) == 0) {
    hdrs->clear();
  }
  if (!line.empty()) {
    hdrs->push_back(line);
  }
  return total;
}

} // namespace

std::optional<std::string> header_value(const HttpResponse &resp,
                                        const std::string &name) {
  const std::string wanted = to_lower_copy(name);
  for (const auto &h : resp.headers) {
    auto colon = h.find(':');
    if (colon == std::string::npos) {
      continue;
    }
    if (to_lower_copy(trim_copy(h.substr(0, colon))) == wanted) {
      return trim_copy(h.substr(colon + 1));
    }
  }
  return std::nullopt;
}

CurlHandle::CurlHandle() {
  static std::once_flag flag;
  std::call_once(flag, []() { curl_global_init(CURL_GLOBAL_DEFAULT); });
  handle_ = curl_easy_init();
  if (!handle_) {
    throw TransientNetworkError("Failed to init curl");
  }
}

CurlHandle::~CurlHandle() { curl_easy_cleanup(handle_); }

CurlHttpClient::CurlHttpClient(long timeout_ms, std::string http_proxy,
                               std::string https_proxy, std::string user_agent)
    : timeout_ms_(timeout_ms), http_proxy_(std::move(http_proxy)),
      https_proxy_(std::move(https_proxy)), user_agent_(std::move(user_agent)) {
}

/**
 * Configure proxy settings on the CURL handle based on the request URL.
 */
void CurlHttpClient::apply_proxy(CURL *curl, const std::string &url) {
  const std::string *proxy = nullptr;
  if (url.rfind("https://", 0) == 0) {
    if (!https_proxy_.empty()) {
      proxy = &https_proxy_;
    } else if (!http_proxy_.empty()) {
      proxy = &http_proxy_;
    }
    if (proxy) {
      curl_easy_setopt(curl, CURLOPT_HTTPPROXYTUNNEL, 1L);
    }
  } else if (url.rfind("http://", 0) == 0 && !http_proxy_.empty()) {
    proxy = &http_proxy_;
  }
  if (proxy) {
    curl_easy_setopt(curl, CURLOPT_PROXY, proxy->c_str());
  }
}

/**
 * Execute the request already configured on the easy handle. Non-2xx statuses
 * are returned to the caller; only transport failures throw.
 */
HttpResponse CurlHttpClient::perform(const char *verb, const std::string &url,
                                     const std::vector<std::string> &headers) {
  CURL *curl = curl_.get();
  HttpResponse out;
  curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
  apply_proxy(curl, url);
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &out.body);
  curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
  curl_easy_setopt(curl, CURLOPT_HEADERDATA, &out.headers);
  curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, timeout_ms_);
  curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, timeout_ms_);
  curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
  char errbuf[CURL_ERROR_SIZE];
  errbuf[0] = '\0';
  curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, errbuf);
  CurlSlist header_list;
  for (const auto &h : headers) {
    header_list.append(h);
  }
  header_list.append("User-Agent: " + user_agent_);
  curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list.get());
  http_log()->debug("{} {}", verb, url);
  CURLcode res = curl_easy_perform(curl);
  if (res != CURLE_OK) {
    std::string msg = format_curl_error(verb, url, res, errbuf);
    http_log()->error(msg);
    throw TransientNetworkError(msg);
  }
  curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &out.status_code);
  http_log()->debug("{} {} -> HTTP {}", verb, url, out.status_code);
  return out;
}

HttpResponse CurlHttpClient::get(const std::string &url,
                                 const std::vector<std::string> &headers) {
  curl_easy_reset(curl_.get());
  curl_easy_setopt(curl_.get(), CURLOPT_HTTPGET, 1L);
  return perform("GET", url, headers);
}

HttpResponse CurlHttpClient::post(const std::string &url,
                                  const std::string &data,
                                  const std::vector<std::string> &headers) {
  CURL *curl = curl_.get();
  curl_easy_reset(curl);
  curl_easy_setopt(curl, CURLOPT_POST, 1L);
  curl_easy_setopt(curl, CURLOPT_POSTFIELDS, data.c_str());
  curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE,
                   static_cast<long>(data.size()));
  return perform("POST", url, headers);
}

} // namespace gri
