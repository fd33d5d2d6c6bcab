// Copyright (c) 2025 Vulcan contributors
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Vulcan, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once
/// \file http_server.hpp
/// \brief Small blocking HTTP/1.1 server for serving static routes.

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <atomic>
#include <cerrno>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <functional>
#include <map>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>

#include "vulcan/core/logger.hpp"
#include "vulcan/network/http_message.hpp"

namespace vulcan
{
namespace network
{

/// \brief HTTP server with exact-path GET routes and one accept thread.
///
/// Each connection carries a single request and is closed after the response.
class HttpServer
{
public:
  static constexpr std::uint16_t DEFAULT_PORT = 8000;
  static constexpr std::size_t MAX_HEADER_BYTES = 64 * 1024;
  static constexpr int POLL_INTERVAL_MS = 200;
  static constexpr int RECEIVE_TIMEOUT_SECONDS = 5;
  /// \brief Unread input discarded at most before a connection is closed.
  static constexpr std::size_t MAX_DRAIN_BYTES = MAX_HEADER_BYTES;

  HttpServer(const HttpServer &) = delete;
  HttpServer &operator=(const HttpServer &) = delete;
  HttpServer(HttpServer &&) = delete;
  HttpServer &operator=(HttpServer &&) = delete;

  /// \brief Incoming request as seen by a handler
  struct Request
  {
    HttpMethod method{HttpMethod::GET};
    std::string path; ///< Percent-decoded, without the query string
    std::string query;
    HttpHeaders headers;
    std::string remoteAddr;

    std::string get_header_value(const std::string &key) const
    {
      auto it = headers.find(key);
      return it != headers.end() ? it->second : "";
    }
  };

  /// \brief Response filled in by a handler
  struct Response
  {
    int status = 200;
    HttpHeaders headers;
    std::string body;

    void set_content(const std::string &content, const std::string &contentType)
    {
      body = content;
      headers["Content-Type"] = contentType;
    }

    void set_header(const std::string &key, const std::string &value) { headers[key] = value; }
  };

  using Handler = std::function<void(const Request &, Response &)>;

  HttpServer() = default;

  ~HttpServer() { stop(); }

  void setPort(std::uint16_t port) { _port = port; }

  void setBindAddress(const std::string &address) { _bindAddress = address; }

  const std::string &bindAddress() const { return _bindAddress; }

  /// \brief Registers a handler for GET (and HEAD) on \p path. Registering
  /// the same path again replaces the handler.
  void onGet(const std::string &path, Handler handler)
  {
    std::lock_guard<std::mutex> lock(_mutex);
    _routes[path] = std::move(handler);
  }

  bool hasRoute(const std::string &path) const
  {
    std::lock_guard<std::mutex> lock(_mutex);
    return _routes.find(path) != _routes.end();
  }

  /// \brief The bound port once started, otherwise the configured one.
  std::uint16_t port() const { return _port; }

  bool isRunning() const { return _running.load(); }

  /// \brief Binds, listens and starts the accept thread.
  /// \throws std::runtime_error if the socket cannot be set up.
  void start()
  {
    if (_running.load())
    {
      throw std::runtime_error("HttpServer: already running");
    }

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(_port);
    if (::inet_pton(AF_INET, _bindAddress.c_str(), &addr.sin_addr) != 1)
    {
      throw std::runtime_error("HttpServer: invalid bind address '" + _bindAddress + "'");
    }

    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0)
    {
      throw std::runtime_error(std::string("HttpServer: socket() failed: ") + std::strerror(errno));
    }

    int reuse = 1;
    ::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));

    if (::bind(fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) < 0)
    {
      std::string reason = std::strerror(errno);
      ::close(fd);
      throw std::runtime_error("HttpServer: bind to " + _bindAddress + ":" +
                               std::to_string(_port) + " failed: " + reason);
    }
    if (::listen(fd, SOMAXCONN) < 0)
    {
      std::string reason = std::strerror(errno);
      ::close(fd);
      throw std::runtime_error("HttpServer: listen() failed: " + reason);
    }

    sockaddr_in bound{};
    socklen_t boundLen = sizeof(bound);
    if (::getsockname(fd, reinterpret_cast<sockaddr *>(&bound), &boundLen) == 0)
    {
      _port = ntohs(bound.sin_port);
    }

    _listenFd = fd;
    _running = true;
    _acceptThread = std::thread([this] { acceptLoop(); });
    core::Logger::info("HttpServer: listening on " + _bindAddress + ":" + std::to_string(_port));
  }

  /// \brief Stops accepting and joins the accept thread.
  void stop()
  {
    if (!_running.exchange(false))
    {
      return;
    }
    if (_acceptThread.joinable())
    {
      _acceptThread.join();
    }
    if (_listenFd >= 0)
    {
      ::close(_listenFd);
      _listenFd = -1;
    }
    core::Logger::debug("HttpServer: stopped");
  }

  /// \brief Produces the response for one raw request. Used by the accept
  /// loop for every connection.
  HttpResponse handle(const std::string &raw, const std::string &remoteAddr = "") const
  {
    HttpRequest httpReq;
    Request req;
    try
    {
      httpReq = HttpRequest::fromWireFormat(raw);
      req.path = httpReq.decodedPath();
    }
    catch (const std::invalid_argument &e)
    {
      core::Logger::debug(std::string("HttpServer: bad request: ") + e.what());
      return finish(plain(400), false);
    }

    req.method = httpReq.method;
    req.query = httpReq.query();
    req.headers = httpReq.headers;
    req.remoteAddr = remoteAddr;

    Handler handler;
    {
      std::lock_guard<std::mutex> lock(_mutex);
      auto it = _routes.find(req.path);
      if (it == _routes.end())
      {
        return finish(plain(404), false);
      }
      handler = it->second;
    }

    bool head = req.method == HttpMethod::HEAD;
    if (req.method != HttpMethod::GET && !head)
    {
      HttpResponse res = plain(405);
      res.setHeader("Allow", "GET, HEAD");
      return finish(std::move(res), false);
    }

    Response res;
    try
    {
      handler(req, res);
    }
    catch (const std::exception &e)
    {
      core::Logger::error("HttpServer: handler exception for " + req.path + ": " + e.what());
      return finish(plain(500), head);
    }

    HttpResponse out(res.status);
    out.headers = std::move(res.headers);
    out.body = std::move(res.body);
    return finish(std::move(out), head);
  }

private:
  std::uint16_t _port{DEFAULT_PORT};
  std::string _bindAddress{"0.0.0.0"};
  std::map<std::string, Handler> _routes;
  mutable std::mutex _mutex;
  std::atomic<bool> _running{false};
  int _listenFd{-1};
  std::thread _acceptThread;

  static HttpResponse plain(int status)
  {
    HttpResponse res(status);
    res.setHeader("Content-Type", "text/plain; charset=utf-8");
    res.body = res.statusText;
    return res;
  }

  /// \brief Sets the framing headers; HEAD keeps the length but drops the
  /// body.
  static HttpResponse finish(HttpResponse res, bool head)
  {
    res.setHeader("Content-Length", std::to_string(res.body.size()));
    res.setHeader("Connection", "close");
    if (head)
    {
      res.body.clear();
    }
    return res;
  }

  void acceptLoop()
  {
    while (_running.load())
    {
      pollfd pfd{};
      pfd.fd = _listenFd;
      pfd.events = POLLIN;
      int ready = ::poll(&pfd, 1, POLL_INTERVAL_MS);
      if (ready < 0)
      {
        if (errno == EINTR)
        {
          continue;
        }
        core::Logger::error(std::string("HttpServer: poll() failed: ") + std::strerror(errno));
        break;
      }
      if (ready == 0)
      {
        continue;
      }

      sockaddr_in peer{};
      socklen_t peerLen = sizeof(peer);
      int client = ::accept(_listenFd, reinterpret_cast<sockaddr *>(&peer), &peerLen);
      if (client < 0)
      {
        if (errno != EINTR && errno != EAGAIN && errno != ECONNABORTED)
        {
          core::Logger::warning(std::string("HttpServer: accept() failed: ") +
                                std::strerror(errno));
        }
        continue;
      }

      char peerName[INET_ADDRSTRLEN] = {0};
      ::inet_ntop(AF_INET, &peer.sin_addr, peerName, sizeof(peerName));
      serveConnection(client, peerName);
      closeConnection(client);
    }
  }

  void serveConnection(int client, const std::string &remoteAddr) const
  {
    timeval tv{};
    tv.tv_sec = RECEIVE_TIMEOUT_SECONDS;
    ::setsockopt(client, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

    std::string raw;
    char buffer[4096];
    while (raw.find("\r\n\r\n") == std::string::npos)
    {
      if (raw.size() > MAX_HEADER_BYTES)
      {
        core::Logger::warning("HttpServer: request headers from " + remoteAddr + " too large");
        sendAll(client, finish(plain(413), false).toWireFormat());
        return;
      }
      ssize_t n = ::recv(client, buffer, sizeof(buffer), 0);
      if (n < 0 && errno == EINTR)
      {
        continue;
      }
      if (n <= 0)
      {
        if (!raw.empty())
        {
          sendAll(client, finish(plain(400), false).toWireFormat());
        }
        return;
      }
      raw.append(buffer, static_cast<std::size_t>(n));
    }

    HttpResponse res = handle(raw, remoteAddr);
    core::Logger::debug("HttpServer: " + remoteAddr + " " + raw.substr(0, raw.find("\r\n")) +
                        " -> " + std::to_string(res.statusCode));
    sendAll(client, res.toWireFormat());
  }

  /// \brief Half-closes and discards unread input before closing, so that
  /// the peer receives the whole response instead of a reset. Draining stops
  /// after MAX_DRAIN_BYTES or RECEIVE_TIMEOUT_SECONDS.
  static void closeConnection(int client)
  {
    ::shutdown(client, SHUT_WR);
    auto deadline =
      std::chrono::steady_clock::now() + std::chrono::seconds(RECEIVE_TIMEOUT_SECONDS);
    std::size_t drained = 0;
    char discard[4096];
    while (drained < MAX_DRAIN_BYTES && std::chrono::steady_clock::now() < deadline)
    {
      ssize_t n = ::recv(client, discard, sizeof(discard), 0);
      if (n < 0 && errno == EINTR)
      {
        continue;
      }
      if (n <= 0)
      {
        break;
      }
      drained += static_cast<std::size_t>(n);
    }
    ::close(client);
  }

  static void sendAll(int client, const std::string &data)
  {
    std::size_t sent = 0;
    while (sent < data.size())
    {
      ssize_t n = ::send(client, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
      if (n < 0 && errno == EINTR)
      {
        continue;
      }
      if (n <= 0)
      {
        core::Logger::debug(std::string("HttpServer: send() failed: ") + std::strerror(errno));
        return;
      }
      sent += static_cast<std::size_t>(n);
    }
  }
};

} // namespace network
} // namespace vulcan
