// Copyright (c) 2025 Vulcan contributors
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Vulcan, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once
/// \file http_message.hpp
/// \brief HTTP/1.x request and response messages with wire-format
/// conversion, shared by the static front end and its tests.

#include <algorithm>
#include <array>
#include <cctype>
#include <map>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace vulcan
{
namespace network
{

  enum class HttpMethod
  {
    GET,
    HEAD,
    POST,
    PUT,
    DELETE,
    OPTIONS,
    PATCH
  };

  namespace detail
  {
    inline constexpr std::array<std::pair<HttpMethod, const char*>, 7> METHOD_NAMES = {{
        {HttpMethod::GET, "GET"},
        {HttpMethod::HEAD, "HEAD"},
        {HttpMethod::POST, "POST"},
        {HttpMethod::PUT, "PUT"},
        {HttpMethod::DELETE, "DELETE"},
        {HttpMethod::OPTIONS, "OPTIONS"},
        {HttpMethod::PATCH, "PATCH"},
    }};
  } // namespace detail

  inline std::string toString(HttpMethod method)
  {
    for (const auto& entry : detail::METHOD_NAMES)
    {
      if (entry.first == method)
      {
        return entry.second;
      }
    }
    return "GET";
  }

  /// \brief Method names are case-sensitive.
  /// \throws std::invalid_argument for unknown methods.
  inline HttpMethod parseMethod(const std::string& name)
  {
    for (const auto& entry : detail::METHOD_NAMES)
    {
      if (name == entry.second)
      {
        return entry.first;
      }
    }
    throw std::invalid_argument("Unknown HTTP method: " + name);
  }

  /// \brief `HTTP/<major>.<minor>` with single-digit components.
  struct HttpVersion
  {
    int major{1};
    int minor{1};

    std::string toString() const
    {
      std::ostringstream out;
      out << "HTTP/" << major << '.' << minor;
      return out.str();
    }

    static HttpVersion parse(const std::string& text)
    {
      auto digit = [&text](std::size_t i)
      { return i < text.size() && std::isdigit(static_cast<unsigned char>(text[i])); };

      bool wellFormed = text.size() == 8 && text.rfind("HTTP/", 0) == 0 && digit(5) &&
                        text[6] == '.' && digit(7);
      if (!wellFormed)
      {
        throw std::invalid_argument("Invalid HTTP version format: " + text);
      }
      return HttpVersion{text[5] - '0', text[7] - '0'};
    }
  };

  /// \brief Orders header names ignoring ASCII case.
  struct CaseInsensitiveCompare
  {
    bool operator()(const std::string& lhs, const std::string& rhs) const
    {
      auto lower = [](unsigned char c) { return std::tolower(c); };
      std::size_t n = std::min(lhs.size(), rhs.size());
      for (std::size_t i = 0; i < n; ++i)
      {
        int l = lower(lhs[i]);
        int r = lower(rhs[i]);
        if (l != r)
        {
          return l < r;
        }
      }
      return lhs.size() < rhs.size();
    }
  };

  using HttpHeaders = std::map<std::string, std::string, CaseInsensitiveCompare>;

  namespace detail
  {
    inline std::string trimmed(const std::string& s)
    {
      auto first = s.find_first_not_of(" \t");
      if (first == std::string::npos)
      {
        return {};
      }
      return s.substr(first, s.find_last_not_of(" \t") - first + 1);
    }

    /// \brief Whitespace-separated words of \p line.
    inline std::vector<std::string> words(const std::string& line)
    {
      std::vector<std::string> out;
      std::istringstream in(line);
      for (std::string word; in >> word;)
      {
        out.push_back(std::move(word));
      }
      return out;
    }

    /// \brief Start line, header fields and body of a message.
    struct RawMessage
    {
      std::string startLine;
      HttpHeaders headers;
      std::string body;
    };

    /// \throws std::invalid_argument when the header block is unterminated
    /// or a field has no name.
    inline RawMessage splitMessage(const std::string& data, const char* kind)
    {
      const std::string terminator = "\r\n\r\n";
      auto headEnd = data.find(terminator);
      if (headEnd == std::string::npos)
      {
        throw std::invalid_argument(std::string("Invalid HTTP ") + kind +
                                    ": missing header terminator");
      }

      RawMessage msg;
      msg.body = data.substr(headEnd + terminator.size());

      std::size_t pos = 0;
      bool first = true;
      while (pos <= headEnd)
      {
        auto eol = data.find("\r\n", pos);
        if (eol == std::string::npos || eol > headEnd)
        {
          eol = headEnd;
        }
        std::string line = data.substr(pos, eol - pos);
        pos = eol + 2;

        if (first)
        {
          msg.startLine = std::move(line);
          first = false;
          continue;
        }
        if (line.empty())
        {
          continue;
        }
        auto colon = line.find(':');
        if (colon == std::string::npos || colon == 0)
        {
          throw std::invalid_argument("Malformed header line: " + line);
        }
        msg.headers[trimmed(line.substr(0, colon))] = trimmed(line.substr(colon + 1));
      }
      return msg;
    }
  } // namespace detail

  /// \brief Decode `%XX` escapes, as in a request path. `+` stays a plus.
  /// \throws std::invalid_argument on a truncated or non-hex escape.
  inline std::string percentDecode(const std::string& text)
  {
    auto hexValue = [](char c) -> int
    {
      if (c >= '0' && c <= '9')
        return c - '0';
      if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
      if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
      return -1;
    };

    std::string out;
    out.reserve(text.size());
    for (std::size_t i = 0; i < text.size(); ++i)
    {
      if (text[i] != '%')
      {
        out += text[i];
        continue;
      }
      int hi = i + 1 < text.size() ? hexValue(text[i + 1]) : -1;
      int lo = i + 2 < text.size() ? hexValue(text[i + 2]) : -1;
      if (hi < 0 || lo < 0)
      {
        throw std::invalid_argument("Invalid percent escape in: " + text);
      }
      out += static_cast<char>(hi * 16 + lo);
      i += 2;
    }
    return out;
  }

  /// \brief Fields common to requests and responses.
  class HttpMessage
  {
  public:
    HttpVersion version{1, 1};
    HttpHeaders headers;
    std::string body;

    /// \return the header value, or an empty string when absent
    std::string getHeader(const std::string& name) const
    {
      auto it = headers.find(name);
      if (it == headers.end())
      {
        return {};
      }
      return it->second;
    }

    void setHeader(const std::string& name, const std::string& value) { headers[name] = value; }

    bool hasHeader(const std::string& name) const { return headers.count(name) > 0; }

  protected:
    std::string serialize(const std::string& startLine) const
    {
      std::string out = startLine + "\r\n";
      for (const auto& field : headers)
      {
        out += field.first + ": " + field.second + "\r\n";
      }
      out += "\r\n";
      out += body;
      return out;
    }
  };

  class HttpRequest : public HttpMessage
  {
  public:
    HttpMethod method{HttpMethod::GET};
    std::string uri{"/"};

    /// \brief The target without its query string.
    std::string path() const { return uri.substr(0, uri.find('?')); }

    /// \brief path() with `%XX` escapes decoded.
    /// \throws std::invalid_argument on a malformed escape.
    std::string decodedPath() const { return percentDecode(path()); }

    /// \brief The query string without the leading '?'; empty if none.
    std::string query() const
    {
      auto mark = uri.find('?');
      return mark == std::string::npos ? std::string{} : uri.substr(mark + 1);
    }

    std::string toWireFormat() const
    {
      return serialize(toString(method) + " " + uri + " " + version.toString());
    }

    /// \throws std::invalid_argument on a malformed request line or header.
    static HttpRequest fromWireFormat(const std::string& data)
    {
      detail::RawMessage raw = detail::splitMessage(data, "request");

      std::vector<std::string> parts = detail::words(raw.startLine);
      if (parts.size() != 3)
      {
        throw std::invalid_argument("Malformed request line: " + raw.startLine);
      }

      HttpRequest request;
      request.method = parseMethod(parts[0]);
      request.uri = parts[1];
      request.version = HttpVersion::parse(parts[2]);
      request.headers = std::move(raw.headers);
      request.body = std::move(raw.body);
      return request;
    }
  };

  class HttpResponse : public HttpMessage
  {
  public:
    int statusCode{200};
    std::string statusText{"OK"};

    HttpResponse() = default;

    /// \brief An empty \p text picks the standard reason phrase.
    HttpResponse(int code, const std::string& text = "")
      : statusCode(code), statusText(text.empty() ? reasonPhrase(code) : text)
    {
    }

    bool isSuccess() const { return statusCode >= 200 && statusCode < 300; }

    std::string toWireFormat() const
    {
      return serialize(version.toString() + " " + std::to_string(statusCode) + " " +
                       statusText);
    }

    /// \brief The body is everything after the header terminator.
    /// \throws std::invalid_argument on a malformed status line or header.
    static HttpResponse fromWireFormat(const std::string& data)
    {
      detail::RawMessage raw = detail::splitMessage(data, "response");

      HttpResponse response;
      parseStatusLine(raw.startLine, response);
      response.headers = std::move(raw.headers);
      response.body = std::move(raw.body);
      return response;
    }

    static std::string reasonPhrase(int code)
    {
      static const std::map<int, std::string> phrases = {
          {200, "OK"},
          {201, "Created"},
          {204, "No Content"},
          {400, "Bad Request"},
          {404, "Not Found"},
          {405, "Method Not Allowed"},
          {413, "Payload Too Large"},
          {500, "Internal Server Error"},
          {503, "Service Unavailable"},
      };
      auto it = phrases.find(code);
      return it == phrases.end() ? "Unknown" : it->second;
    }

  private:
    static void parseStatusLine(const std::string& line, HttpResponse& response)
    {
      auto firstSpace = line.find(' ');
      if (firstSpace == std::string::npos)
      {
        throw std::invalid_argument("Malformed status line: " + line);
      }
      auto secondSpace = line.find(' ', firstSpace + 1);
      std::string code = line.substr(firstSpace + 1, secondSpace == std::string::npos
                                                          ? std::string::npos
                                                          : secondSpace - firstSpace - 1);
      bool numeric = code.size() == 3 &&
                     std::all_of(code.begin(), code.end(),
                                 [](unsigned char c) { return std::isdigit(c) != 0; });
      if (!numeric)
      {
        throw std::invalid_argument("Malformed status line: " + line);
      }

      response.version = HttpVersion::parse(line.substr(0, firstSpace));
      response.statusCode = std::stoi(code);
      response.statusText = secondSpace == std::string::npos
                                ? std::string{}
                                : detail::trimmed(line.substr(secondSpace + 1));
    }
  };

} // namespace network
} // namespace vulcan
