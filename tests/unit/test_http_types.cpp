#include <catch2/catch.hpp>

#include "net/http_types.h"
#include "server/http/http_message.h"

using namespace chatwarden;

TEST_CASE("Header lookup ignores case", "[http]") {
  HttpHeaders headers = {{"Content-Type", "application/json"},
                         {"set-cookie", "a=1"},
                         {"Set-Cookie", "b=2"}};
  REQUIRE(FindHeader(headers, "content-type") == "application/json");
  REQUIRE(FindHeader(headers, "SET-COOKIE") == "a=1");
  REQUIRE(HasHeader(headers, "Set-Cookie"));
  REQUIRE_FALSE(HasHeader(headers, "Host"));
  REQUIRE(FindHeader(headers, "Host").empty());
}

TEST_CASE("WithoutHeaders drops every occurrence", "[http]") {
  HttpHeaders headers = {{"Host", "x"},
                         {"connection", "keep-alive"},
                         {"Accept", "*/*"},
                         {"HOST", "y"}};
  auto kept = WithoutHeaders(headers, {"Host", "Connection"});
  REQUIRE(kept.size() == 1);
  REQUIRE(kept[0].first == "Accept");
}

TEST_CASE("ParseHeaderLines trims names and values", "[http]") {
  auto headers =
      ParseHeaderLines("Content-Type:  text/plain \r\nbogus line\r\nX-A: 1");
  REQUIRE(headers.size() == 2);
  REQUIRE(headers[0] == HttpHeaders::value_type{"Content-Type", "text/plain"});
  REQUIRE(headers[1] == HttpHeaders::value_type{"X-A", "1"});
}

TEST_CASE("DecodeChunkedBody joins chunks", "[http]") {
  std::string out;
  REQUIRE(DecodeChunkedBody("5\r\nhello\r\n6;ext=1\r\n world\r\n0\r\n\r\n", &out));
  REQUIRE(out == "hello world");
}

TEST_CASE("DecodeChunkedBody rejects broken framing", "[http]") {
  std::string out = "untouched";
  REQUIRE_FALSE(DecodeChunkedBody("5\r\nhel", &out));
  REQUIRE_FALSE(DecodeChunkedBody("zz\r\nhello\r\n0\r\n\r\n", &out));
  REQUIRE_FALSE(DecodeChunkedBody("5\r\nhelloXX0\r\n\r\n", &out));
  REQUIRE(out == "untouched");
}

TEST_CASE("IsChunked reads Transfer-Encoding", "[http]") {
  REQUIRE(IsChunked({{"Transfer-Encoding", "chunked"}}));
  REQUIRE(IsChunked({{"transfer-encoding", "gzip, Chunked"}}));
  REQUIRE_FALSE(IsChunked({{"Content-Length", "4"}}));
}

TEST_CASE("StatusText covers the statuses the proxies emit", "[http]") {
  REQUIRE(std::string(StatusText(200)) == "OK");
  REQUIRE(std::string(StatusText(422)) == "Unprocessable Entity");
  REQUIRE(std::string(StatusText(502)) == "Bad Gateway");
  REQUIRE(std::string(StatusText(504)) == "Gateway Timeout");
}

TEST_CASE("ParseRequestHead splits target, path and headers", "[http]") {
  HttpRequest request;
  REQUIRE(ParseRequestHead(
      "POST /v1/chat/completions?debug=1 HTTP/1.1\r\nHost: a\r\nX-Request-Id: r1",
      &request));
  REQUIRE(request.method == "POST");
  REQUIRE(request.target == "/v1/chat/completions?debug=1");
  REQUIRE(request.path == "/v1/chat/completions");
  REQUIRE(FindHeader(request.headers, "host") == "a");
  REQUIRE(RequestIdFor(request) == "r1");
}

TEST_CASE("ParseRequestHead rejects garbage", "[http]") {
  HttpRequest request;
  REQUIRE_FALSE(ParseRequestHead("HELLO", &request));
  REQUIRE_FALSE(ParseRequestHead("GET /\r\n", &request));
  REQUIRE_FALSE(ParseRequestHead("GET / SPDY/3", &request));
}

TEST_CASE("RequestIdFor generates ids when none is supplied", "[http]") {
  HttpRequest request;
  auto id = RequestIdFor(request);
  REQUIRE(id.rfind("req-", 0) == 0);
  REQUIRE(id.size() == 20);
  REQUIRE(RequestIdFor(request) != id);
}
