// Copyright (c) 2025 Vulcan contributors
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Vulcan, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>

#include "vulcan/network/http_message.hpp"

#include <stdexcept>

using namespace vulcan::network;

TEST_CASE("HTTP method names", "[http][method]")
{
  CHECK(toString(HttpMethod::GET) == "GET");
  CHECK(toString(HttpMethod::HEAD) == "HEAD");
  CHECK(parseMethod("DELETE") == HttpMethod::DELETE);
  CHECK(parseMethod("OPTIONS") == HttpMethod::OPTIONS);
  CHECK_THROWS_AS(parseMethod("get"), std::invalid_argument);
  CHECK_THROWS_AS(parseMethod("BREW"), std::invalid_argument);
}

TEST_CASE("HTTP version parsing", "[http][version]")
{
  HttpVersion v = HttpVersion::parse("HTTP/1.0");
  CHECK(v.major == 1);
  CHECK(v.minor == 0);
  CHECK(v.toString() == "HTTP/1.0");
  CHECK_THROWS_AS(HttpVersion::parse("HTTP/1"), std::invalid_argument);
  CHECK_THROWS_AS(HttpVersion::parse("HTTPS/1.1"), std::invalid_argument);
  CHECK_THROWS_AS(HttpVersion::parse("HTTP/x.1"), std::invalid_argument);
}

TEST_CASE("HTTP headers are case-insensitive", "[http][headers]")
{
  HttpHeaders headers;
  headers["Content-Type"] = "text/plain";
  headers["content-type"] = "text/html";
  CHECK(headers.size() == 1);
  CHECK(headers["CONTENT-TYPE"] == "text/html");
}

TEST_CASE("HttpRequest from wire format", "[http][request]")
{
  SECTION("request line, headers and body")
  {
    HttpRequest req = HttpRequest::fromWireFormat(
      "GET /docs/index.htl?x=1&y=2 HTTP/1.1\r\nHost: example\r\nX-Thing:  padded  \r\n\r\nbody");
    CHECK(req.method == HttpMethod::GET);
    CHECK(req.uri == "/docs/index.htl?x=1&y=2");
    CHECK(req.path() == "/docs/index.htl");
    CHECK(req.query() == "x=1&y=2");
    CHECK(req.version.minor == 1);
    CHECK(req.getHeader("host") == "example");
    CHECK(req.getHeader("x-thing") == "padded");
    CHECK(req.hasHeader("HOST"));
    CHECK_FALSE(req.hasHeader("Accept"));
    CHECK(req.body == "body");
  }

  SECTION("no query string")
  {
    HttpRequest req = HttpRequest::fromWireFormat("HEAD / HTTP/1.0\r\n\r\n");
    CHECK(req.method == HttpMethod::HEAD);
    CHECK(req.path() == "/");
    CHECK(req.query().empty());
    CHECK(req.headers.empty());
  }

  SECTION("malformed input")
  {
    CHECK_THROWS_AS(HttpRequest::fromWireFormat("GET / HTTP/1.1\r\n"), std::invalid_argument);
    CHECK_THROWS_AS(HttpRequest::fromWireFormat("GET /\r\n\r\n"), std::invalid_argument);
    CHECK_THROWS_AS(HttpRequest::fromWireFormat("GET / HTTP/1.1 extra\r\n\r\n"),
                    std::invalid_argument);
    CHECK_THROWS_AS(HttpRequest::fromWireFormat("GET / HTTP/1.1\r\nNoColon\r\n\r\n"),
                    std::invalid_argument);
    CHECK_THROWS_AS(HttpRequest::fromWireFormat("FETCH / HTTP/1.1\r\n\r\n"),
                    std::invalid_argument);
  }
}

TEST_CASE("HttpRequest to wire format", "[http][request]")
{
  HttpRequest req;
  req.method = HttpMethod::GET;
  req.uri = "/a";
  req.setHeader("Host", "h");
  CHECK(req.toWireFormat() == "GET /a HTTP/1.1\r\nHost: h\r\n\r\n");
}

TEST_CASE("HttpResponse wire format", "[http][response]")
{
  SECTION("default reason phrases")
  {
    CHECK(HttpResponse(404).statusText == "Not Found");
    CHECK(HttpResponse(405).statusText == "Method Not Allowed");
    CHECK(HttpResponse(200, "Fine").statusText == "Fine");
    CHECK(HttpResponse(299).statusText == "Unknown");
  }

  SECTION("serialize")
  {
    HttpResponse res(200);
    res.setHeader("Content-Length", "2");
    res.body = "hi";
    CHECK(res.toWireFormat() == "HTTP/1.1 200 OK\r\nContent-Length: 2\r\n\r\nhi");
    CHECK(res.isSuccess());
  }

  SECTION("parse")
  {
    HttpResponse res = HttpResponse::fromWireFormat(
      "HTTP/1.1 405 Method Not Allowed\r\nAllow: GET, HEAD\r\n\r\nnope");
    CHECK(res.statusCode == 405);
    CHECK(res.statusText == "Method Not Allowed");
    CHECK(res.getHeader("allow") == "GET, HEAD");
    CHECK(res.body == "nope");
    CHECK_FALSE(res.isSuccess());
  }

  SECTION("parse rejects garbage")
  {
    CHECK_THROWS_AS(HttpResponse::fromWireFormat(""), std::invalid_argument);
    CHECK_THROWS_AS(HttpResponse::fromWireFormat("HTTP/1.1 abc\r\n\r\n"), std::invalid_argument);
  }
}

TEST_CASE("Percent-decoding request paths", "[http][request]")
{
  CHECK(percentDecode("/plain/path") == "/plain/path");
  CHECK(percentDecode("/my%20page.htl") == "/my page.htl");
  CHECK(percentDecode("/%41%5a%7e") == "/AZ~");
  CHECK(percentDecode("/a+b") == "/a+b");
  CHECK_THROWS_AS(percentDecode("/50%"), std::invalid_argument);
  CHECK_THROWS_AS(percentDecode("/%g1"), std::invalid_argument);

  HttpRequest req = HttpRequest::fromWireFormat("GET /docs/read%20me.htl?q=%20 HTTP/1.1\r\n\r\n");
  CHECK(req.path() == "/docs/read%20me.htl");
  CHECK(req.decodedPath() == "/docs/read me.htl");
  CHECK(req.query() == "q=%20");
}
