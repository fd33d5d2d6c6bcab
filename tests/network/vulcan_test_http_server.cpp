// Copyright (c) 2025 Vulcan contributors
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Vulcan, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>
#include "test_helpers.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <stdexcept>
#include <string>

using namespace vulcan;
using vulcan::network::HttpServer;

namespace
{

struct RunningServer
{
  HttpServer server;

  RunningServer()
  {
    core::Logger::setLevel(core::Logger::Level::Warning);
    server.setPort(0);
    server.setBindAddress("127.0.0.1");
    server.onGet("/hello", [](const HttpServer::Request &req, HttpServer::Response &res)
                 { res.set_content("hello " + req.query, "text/plain"); });
    server.onGet("/boom", [](const HttpServer::Request &, HttpServer::Response &)
                 { throw std::runtime_error("boom"); });
    server.onGet("/made", [](const HttpServer::Request &, HttpServer::Response &res)
                 {
                   res.status = 201;
                   res.set_header("X-Custom", "yes");
                 });
    server.start();
  }

  ~RunningServer() { server.stop(); }
};

} // namespace

TEST_CASE("HttpServer serves registered routes", "[network][server]")
{
  RunningServer fixture;
  auto port = fixture.server.port();
  REQUIRE(port != 0);
  REQUIRE(fixture.server.isRunning());

  SECTION("GET")
  {
    auto res = test::httpGet(port, "/hello");
    CHECK(res.statusCode == 200);
    CHECK(res.body == "hello ");
    CHECK(res.getHeader("Content-Type") == "text/plain");
    CHECK(res.getHeader("Content-Length") == "6");
    CHECK(res.getHeader("Connection") == "close");
  }

  SECTION("query strings are stripped from the route")
  {
    auto res = test::httpGet(port, "/hello?who=you");
    CHECK(res.statusCode == 200);
    CHECK(res.body == "hello who=you");
  }

  SECTION("HEAD keeps headers but drops the body")
  {
    auto res = test::httpGet(port, "/hello", "HEAD");
    CHECK(res.statusCode == 200);
    CHECK(res.getHeader("Content-Length") == "6");
    CHECK(res.body.empty());
  }

  SECTION("handler-chosen status and headers")
  {
    auto res = test::httpGet(port, "/made");
    CHECK(res.statusCode == 201);
    CHECK(res.getHeader("X-Custom") == "yes");
    CHECK(res.getHeader("Content-Length") == "0");
  }
}

TEST_CASE("HttpServer error responses", "[network][server]")
{
  RunningServer fixture;
  auto port = fixture.server.port();

  SECTION("unknown route")
  {
    CHECK(test::httpGet(port, "/missing").statusCode == 404);
  }

  SECTION("wrong method")
  {
    auto res = test::httpGet(port, "/hello", "POST");
    CHECK(res.statusCode == 405);
    CHECK(res.getHeader("Allow") == "GET, HEAD");
  }

  SECTION("handler exception")
  {
    auto res = test::httpGet(port, "/boom");
    CHECK(res.statusCode == 500);
    CHECK(res.body == "Internal Server Error");
  }

  SECTION("malformed request")
  {
    std::string raw = test::roundTrip(port, "NONSENSE\r\n\r\n");
    auto res = network::HttpResponse::fromWireFormat(raw);
    CHECK(res.statusCode == 400);
  }

  SECTION("oversized headers")
  {
    std::string huge = "GET /hello HTTP/1.1\r\nX-Pad: " +
                       std::string(HttpServer::MAX_HEADER_BYTES + 1024, 'a');
    std::string raw = test::roundTrip(port, huge);
    auto res = network::HttpResponse::fromWireFormat(raw);
    CHECK(res.statusCode == 413);
  }

  SECTION("server keeps serving after errors")
  {
    CHECK(test::httpGet(port, "/boom").statusCode == 500);
    CHECK(test::httpGet(port, "/hello").statusCode == 200);
  }
}

TEST_CASE("HttpServer handle() without sockets", "[network][server]")
{
  HttpServer server;
  server.onGet("/", [](const HttpServer::Request &, HttpServer::Response &res)
               { res.set_content("root", "text/plain"); });

  CHECK(server.hasRoute("/"));
  CHECK_FALSE(server.hasRoute("/x"));
  // "/" is an exact route, not a catch-all for unmatched paths.
  CHECK(server.handle("GET /x HTTP/1.1\r\n\r\n").statusCode == 404);
  CHECK(server.handle("GET /x/ HTTP/1.1\r\n\r\n").statusCode == 404);

  auto ok = server.handle("GET /?q HTTP/1.1\r\n\r\n");
  CHECK(ok.statusCode == 200);
  CHECK(ok.body == "root");

  server.onGet("/", [](const HttpServer::Request &, HttpServer::Response &res)
               { res.set_content("replaced", "text/plain"); });
  CHECK(server.handle("GET / HTTP/1.1\r\n\r\n").body == "replaced");

  CHECK(server.handle("GET / HTTP/1.1\r\n").statusCode == 400);
  CHECK(server.handle("PUT / HTTP/1.1\r\n\r\n").statusCode == 405);
}

TEST_CASE("HttpServer matches routes on the decoded path", "[network][server]")
{
  HttpServer server;
  server.onGet("/my page.htl", [](const HttpServer::Request &req, HttpServer::Response &res)
               { res.set_content(req.path + "|" + req.query, "text/plain"); });
  server.onGet("/\xEC\x95\x88\xEB\x85\x95.htl",
               [](const HttpServer::Request &, HttpServer::Response &res)
               { res.set_content("hi", "text/plain"); });
  server.onGet("/100%.txt", [](const HttpServer::Request &, HttpServer::Response &res)
               { res.set_content("full", "text/plain"); });

  auto spaced = server.handle("GET /my%20page.htl?a=%20 HTTP/1.1\r\n\r\n");
  CHECK(spaced.statusCode == 200);
  CHECK(spaced.body == "/my page.htl|a=%20");

  CHECK(server.handle("GET /%EC%95%88%eb%85%95.htl HTTP/1.1\r\n\r\n").statusCode == 200);
  CHECK(server.handle("GET /100%25.txt HTTP/1.1\r\n\r\n").body == "full");
  CHECK(server.handle("GET /my+page.htl HTTP/1.1\r\n\r\n").statusCode == 404);

  CHECK(server.handle("GET /100%.txt HTTP/1.1\r\n\r\n").statusCode == 400);
  CHECK(server.handle("GET /bad%zzname HTTP/1.1\r\n\r\n").statusCode == 400);
  CHECK(server.handle("GET /trailing%2 HTTP/1.1\r\n\r\n").statusCode == 400);
}

TEST_CASE("HttpServer stops draining a client that keeps sending", "[network][server]")
{
  RunningServer fixture;
  auto port = fixture.server.port();

  int fd = ::socket(AF_INET, SOCK_STREAM, 0);
  REQUIRE(fd >= 0);
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(port);
  addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
  REQUIRE(::connect(fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) == 0);

  timeval tv{};
  tv.tv_sec = 5;
  ::setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));

  // The request is answered, then the server gives up on the rest.
  std::string request = "GET /hello HTTP/1.1\r\n\r\n";
  REQUIRE(::send(fd, request.data(), request.size(), MSG_NOSIGNAL) ==
          static_cast<ssize_t>(request.size()));

  const std::size_t limit = 64 * 1024 * 1024;
  std::string chunk(4096, 'x');
  std::size_t sent = 0;
  bool refused = false;
  while (sent < limit)
  {
    ssize_t n = ::send(fd, chunk.data(), chunk.size(), MSG_NOSIGNAL);
    if (n <= 0)
    {
      refused = true;
      break;
    }
    sent += static_cast<std::size_t>(n);
  }
  ::close(fd);

  CHECK(refused);
  CHECK(test::httpGet(port, "/hello").statusCode == 200);
}

TEST_CASE("HttpServer lifecycle", "[network][server]")
{
  SECTION("invalid bind address")
  {
    HttpServer server;
    server.setPort(0);
    server.setBindAddress("not-an-address");
    CHECK_THROWS_AS(server.start(), std::runtime_error);
    CHECK_FALSE(server.isRunning());
  }

  SECTION("port already in use")
  {
    RunningServer fixture;
    HttpServer second;
    second.setBindAddress("127.0.0.1");
    second.setPort(fixture.server.port());
    CHECK_THROWS_AS(second.start(), std::runtime_error);
  }

  SECTION("stop is idempotent and refuses connections afterwards")
  {
    HttpServer server;
    server.setPort(0);
    server.setBindAddress("127.0.0.1");
    server.start();
    auto port = server.port();
    server.stop();
    server.stop();
    CHECK_FALSE(server.isRunning());
    CHECK(test::roundTrip(port, "GET / HTTP/1.1\r\n\r\n").empty());
  }
}
