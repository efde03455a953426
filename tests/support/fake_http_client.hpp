#ifndef GITREPOIMPORT_TESTS_FAKE_HTTP_CLIENT_HPP
#define GITREPOIMPORT_TESTS_FAKE_HTTP_CLIENT_HPP

#include "errors.hpp"
#include "http_client.hpp"
#include <memory>
#include <openssl/bio.h>
#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/rsa.h>
#include <stdexcept>
#include <string>
#include <vector>

namespace gri::test {

/// Request captured by FakeHttpClient.
struct RecordedRequest {
  std::string verb;
  std::string url;
  std::string body;
  std::vector<std::string> headers;
};

/// Scripted HttpClient returning canned responses in order.
class FakeHttpClient : public HttpClient {
public:
  std::vector<HttpResponse> responses;
  std::vector<RecordedRequest> requests;
  bool fail_transport = false;

  HttpResponse get(const std::string &url,
                   const std::vector<std::string> &headers) override {
    return next({"GET", url, {}, headers});
  }

  HttpResponse post(const std::string &url, const std::string &data,
                    const std::vector<std::string> &headers) override {
    return next({"POST", url, data, headers});
  }

  bool has_header(std::size_t index, const std::string &header) const {
    for (const auto &h : requests.at(index).headers) {
      if (h == header)
        return true;
    }
    return false;
  }

private:
  HttpResponse next(RecordedRequest req) {
    requests.push_back(std::move(req));
    if (fail_transport) {
      throw TransientNetworkError("Could not resolve host: api.github.com");
    }
    if (responses.empty()) {
      throw std::logic_error("unexpected request to " + requests.back().url);
    }
    HttpResponse resp = responses.front();
    responses.erase(responses.begin());
    return resp;
  }
};

inline HttpResponse make_response(long status, std::string body,
                                  std::vector<std::string> headers = {}) {
  HttpResponse resp;
  resp.status_code = status;
  resp.body = std::move(body);
  resp.headers = std::move(headers);
  return resp;
}

/// Fresh 2048-bit RSA key in PKCS#8 PEM form.
inline std::string generate_rsa_pem() {
  std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)> ctx(
      EVP_PKEY_CTX_new_id(EVP_PKEY_RSA, nullptr), EVP_PKEY_CTX_free);
  EVP_PKEY *raw = nullptr;
  if (!ctx || EVP_PKEY_keygen_init(ctx.get()) != 1 ||
      EVP_PKEY_CTX_set_rsa_keygen_bits(ctx.get(), 2048) != 1 ||
      EVP_PKEY_keygen(ctx.get(), &raw) != 1) {
    throw std::runtime_error("RSA key generation failed");
  }
  std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)> key(raw, EVP_PKEY_free);
  std::unique_ptr<BIO, decltype(&BIO_free)> bio(BIO_new(BIO_s_mem()),
                                                BIO_free);
  if (!bio || PEM_write_bio_PrivateKey(bio.get(), key.get(), nullptr, nullptr,
                                       0, nullptr, nullptr) != 1) {
    throw std::runtime_error("PEM encoding failed");
  }
  char *data = nullptr;
  long len = BIO_get_mem_data(bio.get(), &data);
  return std::string(data, static_cast<std::size_t>(len));
}

} // namespace gri::test

#endif // GITREPOIMPORT_TESTS_FAKE_HTTP_CLIENT_HPP
