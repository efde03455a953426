#include "errors.hpp"
#include "http_client.hpp"
#include <catch2/catch_test_macros.hpp>
#include <string>

using namespace gri;

TEST_CASE("header lookup ignores case and whitespace", "[http]") {
  HttpResponse resp;
  resp.headers = {"HTTP/2 403", "x-ratelimit-remaining:  0 ",
                  "X-RateLimit-Reset: 1700000000", "content-type: text/plain"};
  REQUIRE(header_value(resp, "X-RateLimit-Remaining") ==
          std::optional<std::string>("0"));
  REQUIRE(header_value(resp, "x-ratelimit-reset") ==
          std::optional<std::string>("1700000000"));
  REQUIRE(!header_value(resp, "ETag"));
}

TEST_CASE("CurlHttpClient configuration", "[http]") {
  CurlHttpClient client(1500, "http://proxy", "http://secureproxy");
  REQUIRE(client.timeout_ms() == 1500);
  REQUIRE(client.http_proxy() == "http://proxy");
  REQUIRE(client.https_proxy() == "http://secureproxy");
}

TEST_CASE("CurlHttpClient reports transport failures", "[http]") {
  CurlHttpClient client(2000);
  REQUIRE_THROWS_AS(client.get("http://127.0.0.1:1/repos/a/b", {}),
                    TransientNetworkError);
  REQUIRE_THROWS_AS(client.post("http://127.0.0.1:1/app", "{}", {}),
                    TransientNetworkError);
}
