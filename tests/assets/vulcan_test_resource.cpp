// Copyright (c) 2025 Vulcan contributors
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Vulcan, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>
#include "test_helpers.hpp"

#include <filesystem>
#include <stdexcept>
#include <string>

using namespace vulcan;
using vulcan::test::TempDir;

namespace
{

network::HttpServer::Response serve(const network::HttpServer::Handler &handler)
{
  network::HttpServer::Request req;
  req.path = "/";
  network::HttpServer::Response res;
  handler(req, res);
  return res;
}

struct QuietLogs
{
  QuietLogs()
  {
    core::Logger::setExternalHandler([](core::Logger::Level, const std::string &,
                                        const std::string &) {});
  }
  ~QuietLogs() { core::Logger::clearExternalHandler(); }
};

} // namespace

TEST_CASE("Content types by extension", "[assets][mime]")
{
  CHECK(assets::mimeTypeForExtension(".html") == "text/html; charset=utf-8");
  CHECK(assets::mimeTypeForExtension(".htl") == "text/html; charset=utf-8");
  CHECK(assets::mimeTypeForExtension(".css") == "text/css; charset=utf-8");
  CHECK(assets::mimeTypeForExtension(".PNG") == "image/png");
  CHECK(assets::mimeTypeForExtension(".jpeg") == "image/jpeg");
  CHECK(assets::mimeTypeForExtension(".wasm") == "application/wasm");
  CHECK(assets::mimeTypeForExtension(".unknown") == "application/octet-stream");
  CHECK(assets::mimeTypeForExtension("") == "application/octet-stream");
}

TEST_CASE("resourceFromFile", "[assets][resource]")
{
  TempDir dir("vulcan_resource");

  SECTION("plain files are served as-is")
  {
    auto css = dir.write("site.css", "body { color: red; }");
    assets::Resource r = assets::resourceFromFile(css);
    CHECK(r.contentType == "text/css; charset=utf-8");
    CHECK(r.content == "body { color: red; }");
  }

  SECTION("binary content is preserved")
  {
    std::string bytes("\x89PNG\0\x01\x02", 7);
    auto png = dir.write("a.png", bytes);
    assets::Resource r = assets::resourceFromFile(png);
    CHECK(r.contentType == "image/png");
    CHECK(r.content == bytes);
  }

  SECTION("htl pages are rendered")
  {
    auto page = dir.write("index.htl", "(html (body (p :class x \"hi\")))");
    assets::Resource r = assets::resourceFromFile(page);
    CHECK(r.contentType == "text/html; charset=utf-8");
    CHECK(r.content == "<html><body><p class=\"x\">hi</p></body></html>");
  }

  SECTION("an empty htl page renders to nothing")
  {
    auto page = dir.write("empty.htl", "");
    CHECK(assets::resourceFromFile(page).content.empty());
  }

  SECTION("broken htl names the file")
  {
    auto page = dir.write("broken.htl", "(html (body)");
    try
    {
      assets::resourceFromFile(page);
      FAIL("expected std::runtime_error");
    }
    catch (const std::runtime_error &e)
    {
      std::string what = e.what();
      CHECK(what.find("broken.htl") != std::string::npos);
      CHECK(what.find("1 closing paren is missing") != std::string::npos);
    }
  }

  SECTION("missing file")
  {
    CHECK_THROWS_AS(assets::resourceFromFile(dir.path() / "nope.txt"), std::runtime_error);
  }
}

TEST_CASE("handlerFromFile", "[assets][handler]")
{
  TempDir dir("vulcan_handler");
  auto page = dir.write("p.htl", "(p one)");

  SECTION("production mode loads once")
  {
    auto handler = assets::handlerFromFile(page, false);
    dir.write("p.htl", "(p two)");
    auto res = serve(handler);
    CHECK(res.status == 200);
    CHECK(res.body == "<p>one</p>");
    CHECK(res.headers["Content-Type"] == "text/html; charset=utf-8");
  }

  SECTION("production mode fails early")
  {
    auto bad = dir.write("bad.htl", "(p");
    CHECK_THROWS_AS(assets::handlerFromFile(bad, false), std::runtime_error);
    CHECK_THROWS_AS(assets::handlerFromFile(dir.path() / "missing.htl", false),
                    std::runtime_error);
  }

  SECTION("dev mode reloads on every request")
  {
    auto handler = assets::handlerFromFile(page, true);
    CHECK(serve(handler).body == "<p>one</p>");
    dir.write("p.htl", "(p two)");
    CHECK(serve(handler).body == "<p>two</p>");
  }

  SECTION("dev mode answers 500 on a broken page")
  {
    QuietLogs quiet;
    auto handler = assets::handlerFromFile(page, true);
    dir.write("p.htl", "(p))");
    auto res = serve(handler);
    CHECK(res.status == 500);
    CHECK(res.body.empty());

    dir.write("p.htl", "(p fixed)");
    res = serve(handler);
    CHECK(res.status == 200);
    CHECK(res.body == "<p>fixed</p>");
  }
}

TEST_CASE("handlersFromDirs", "[assets][dirs]")
{
  TempDir first("vulcan_dirs_a");
  TempDir second("vulcan_dirs_b");
  first.write("index.htl", "(h1 first)");
  first.write("css/site.css", "a{}");
  first.write("js/deep/app.js", "x()");
  second.write("index.htl", "(h1 second)");
  second.write("robots.txt", "User-agent: *");

  SECTION("routes mirror relative paths")
  {
    auto handlers = assets::handlersFromDirs({first.path().string()}, false);
    CHECK(handlers.size() == 3);
    CHECK(handlers.count("/index.htl") == 1);
    CHECK(handlers.count("/css/site.css") == 1);
    CHECK(handlers.count("/js/deep/app.js") == 1);
    CHECK(handlers.count("/css") == 0);
  }

  SECTION("later directories win")
  {
    auto handlers =
      assets::handlersFromDirs({first.path().string(), second.path().string()}, false);
    CHECK(handlers.size() == 4);
    CHECK(serve(handlers.at("/index.htl")).body == "<h1>second</h1>");
    CHECK(serve(handlers.at("/css/site.css")).body == "a{}");
    CHECK(serve(handlers.at("/robots.txt")).body == "User-agent: *");
  }

  SECTION("a trailing separator does not change routes")
  {
    auto handlers = assets::handlersFromDirs({first.path().string() + "/"}, false);
    CHECK(handlers.count("/index.htl") == 1);
  }

  SECTION("file names with spaces are reachable through escaped targets")
  {
    first.write("my page.htl", "(p spaced)");
    auto handlers = assets::handlersFromDirs({first.path().string()}, false);
    REQUIRE(handlers.count("/my page.htl") == 1);
    CHECK(assets::routeFor(first.path(), first.path() / "my page.htl") == "/my page.htl");

    network::HttpServer server;
    for (const auto &entry : handlers)
    {
      server.onGet(entry.first, entry.second);
    }
    auto res = server.handle("GET /my%20page.htl HTTP/1.1\r\n\r\n");
    CHECK(res.statusCode == 200);
    CHECK(res.body == "<p>spaced</p>");
    CHECK(server.handle("GET /my page.htl HTTP/1.1\r\n\r\n").statusCode == 400);
  }

  SECTION("missing directory")
  {
    CHECK_THROWS_AS(assets::handlersFromDirs({(first.path() / "none").string()}, false),
                    std::runtime_error);
  }

  SECTION("a broken page fails the whole load outside dev mode")
  {
    first.write("bad.htl", "(oops");
    CHECK_THROWS_AS(assets::handlersFromDirs({first.path().string()}, false),
                    std::runtime_error);
    CHECK_NOTHROW(assets::handlersFromDirs({first.path().string()}, true));
  }
}

TEST_CASE("readFileContents and listRegularFiles", "[util][filesystem]")
{
  TempDir dir("vulcan_fs");
  dir.write("b.txt", "B");
  dir.write("a/c.txt", "C");

  auto files = util::listRegularFiles(dir.path());
  REQUIRE(files.size() == 2);
  CHECK(files[0].filename() == "c.txt");
  CHECK(files[1].filename() == "b.txt");
  CHECK(util::readFileContents(files[1]) == "B");
  CHECK_THROWS_AS(util::listRegularFiles(dir.path() / "b.txt"), std::runtime_error);
}
