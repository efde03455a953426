/**
 * @file http_client.hpp
 * @brief HTTP transport abstraction and libcurl implementation.
 */

#ifndef GITREPOIMPORT_HTTP_CLIENT_HPP
#define GITREPOIMPORT_HTTP_CLIENT_HPP

#include <curl/curl.h>
#include <optional>
#include <string>
#include <vector>

namespace gri {

/**
 * Simple HTTP response container capturing body, headers, and status code.
 */
struct HttpResponse {
  std::string body;                 ///< Response body
  std::vector<std::string> headers; ///< Raw response header lines
  long status_code = 0;             ///< HTTP status code
};

/**
 * Look up a response header by name, ignoring case.
 *
 * @param resp Response whose header lines are searched.
 * @param name Header name without the trailing colon.
 * @return Trimmed header value of the first matching line, if any.
 */
std::optional<std::string> header_value(const HttpResponse &resp,
                                        const std::string &name);

/** Interface for performing HTTP requests. */
class HttpClient {
public:
  virtual ~HttpClient() = default;

  /**
   * Perform a HTTP GET request.
   *
   * Every HTTP status is reported through the returned response; callers
   * classify non-2xx statuses themselves.
   *
   * @param url Absolute request URL.
   * @param headers Additional request headers expressed as `Header: value`
   *        strings.
   * @return Response body, headers, and HTTP status code.
   * @throws TransientNetworkError On transport failures.
   */
  virtual HttpResponse get(const std::string &url,
                           const std::vector<std::string> &headers) = 0;

  /**
   * Perform a HTTP POST request.
   *
   * @param url Absolute request URL.
   * @param data Request body payload encoded as UTF-8.
   * @param headers Additional request headers expressed as `Header: value`
   *        strings.
   * @return Response body, headers, and HTTP status code.
   * @throws TransientNetworkError On transport failures.
   */
  virtual HttpResponse post(const std::string &url, const std::string &data,
                            const std::vector<std::string> &headers) = 0;
};

/**
 * RAII wrapper for a CURL easy handle ensuring global CURL initialization.
 */
class CurlHandle {
public:
  CurlHandle();
  ~CurlHandle();
  CurlHandle(const CurlHandle &) = delete;
  CurlHandle &operator=(const CurlHandle &) = delete;

  /// Borrowed pointer to the managed easy handle.
  CURL *get() const { return handle_; }

private:
  CURL *handle_;
};

/**
 * CURL-based HTTP client implementation.
 *
 * @note This class is not thread-safe; use one instance per thread or provide
 *       external synchronization.
 */
class CurlHttpClient : public HttpClient {
public:
  /**
   * Construct a CURL based HTTP client.
   *
   * @param timeout_ms Request timeout in milliseconds.
   * @param http_proxy Proxy URL for HTTP requests.
   * @param https_proxy Proxy URL for HTTPS requests.
   * @param user_agent Value sent in the `User-Agent` header.
   */
  explicit CurlHttpClient(long timeout_ms = 30000, std::string http_proxy = {},
                          std::string https_proxy = {},
                          std::string user_agent = "gitrepoimport");

  /// @copydoc HttpClient::get()
  HttpResponse get(const std::string &url,
                   const std::vector<std::string> &headers) override;

  /// @copydoc HttpClient::post()
  HttpResponse post(const std::string &url, const std::string &data,
                    const std::vector<std::string> &headers) override;

  long timeout_ms() const { return timeout_ms_; }
  const std::string &http_proxy() const { return http_proxy_; }
  const std::string &https_proxy() const { return https_proxy_; }

private:
  void apply_proxy(CURL *curl, const std::string &url);
  HttpResponse perform(const char *verb, const std::string &url,
                       const std::vector<std::string> &headers);

  CurlHandle curl_;
  long timeout_ms_;
  std::string http_proxy_;
  std::string https_proxy_;
  std::string user_agent_;
};

} // namespace gri

#endif // GITREPOIMPORT_HTTP_CLIENT_HPP
