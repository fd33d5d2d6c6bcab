// Copyright (c) 2025 Vulcan contributors
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Vulcan, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once
/// \file resource.hpp
/// \brief Static resources loaded from disk, with HTL pages rendered to HTML,
/// and the route handlers that serve them.

#include <cctype>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

#include "vulcan/core/logger.hpp"
#include "vulcan/htl/htl.hpp"
#include "vulcan/network/http_server.hpp"
#include "vulcan/util/filesystem.hpp"

namespace vulcan
{
namespace assets
{

/// \brief A file ready to be served.
struct Resource
{
  std::string contentType;
  std::string content;
};

using Transformer = std::function<void(const std::filesystem::path &, Resource &)>;
using HandlerMap = std::map<std::string, network::HttpServer::Handler>;

inline constexpr const char *HTML_CONTENT_TYPE = "text/html; charset=utf-8";
inline constexpr const char *DEFAULT_CONTENT_TYPE = "application/octet-stream";

/// \brief Content type for a file extension including the dot, such as
/// `.css`. Matching ignores case.
inline std::string mimeTypeForExtension(const std::string &extension)
{
  static const std::unordered_map<std::string, std::string> types = {
    {".html", HTML_CONTENT_TYPE},
    {".htm", HTML_CONTENT_TYPE},
    {".htl", HTML_CONTENT_TYPE},
    {".css", "text/css; charset=utf-8"},
    {".js", "text/javascript; charset=utf-8"},
    {".json", "application/json"},
    {".txt", "text/plain; charset=utf-8"},
    {".svg", "image/svg+xml"},
    {".png", "image/png"},
    {".jpg", "image/jpeg"},
    {".jpeg", "image/jpeg"},
    {".gif", "image/gif"},
    {".ico", "image/x-icon"},
    {".webp", "image/webp"},
    {".woff", "font/woff"},
    {".woff2", "font/woff2"},
    {".xml", "text/xml; charset=utf-8"},
    {".pdf", "application/pdf"},
    {".wasm", "application/wasm"},
  };

  std::string key = extension;
  for (auto &c : key)
  {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  auto it = types.find(key);
  return it != types.end() ? it->second : DEFAULT_CONTENT_TYPE;
}

/// \brief Renders an HTL page in place.
/// \throws std::runtime_error naming \p path when the page does not parse.
inline void transformHtl(const std::filesystem::path &path, Resource &resource)
{
  htl::ParseResult result = htl::parse(resource.content);
  if (result.error)
  {
    throw std::runtime_error(path.string() + ": " + result.error->describe());
  }
  resource.contentType = HTML_CONTENT_TYPE;
  resource.content = htl::render(result.tree.get());
}

/// \brief Transformers keyed by extension.
inline const std::unordered_map<std::string, Transformer> &transformers()
{
  static const std::unordered_map<std::string, Transformer> table = {
    {".htl", transformHtl},
  };
  return table;
}

/// \brief Reads \p path and applies the transformer registered for its
/// extension, if any.
/// \throws std::runtime_error on I/O or transform failure.
inline Resource resourceFromFile(const std::filesystem::path &path)
{
  Resource resource;
  resource.content = util::readFileContents(path);

  std::string extension = path.extension().string();
  resource.contentType = mimeTypeForExtension(extension);

  auto it = transformers().find(extension);
  if (it != transformers().end())
  {
    it->second(path, resource);
  }
  return resource;
}

/// \brief Handler serving one file.
///
/// In dev mode the file is reloaded on every request and a failure is logged
/// and answered with an empty 500. Otherwise the file is loaded once, now.
/// \throws std::runtime_error outside dev mode if the file cannot be loaded.
inline network::HttpServer::Handler handlerFromFile(const std::filesystem::path &path, bool dev)
{
  if (dev)
  {
    return [path](const network::HttpServer::Request &, network::HttpServer::Response &res)
    {
      try
      {
        Resource resource = resourceFromFile(path);
        res.set_content(resource.content, resource.contentType);
      }
      catch (const std::exception &e)
      {
        VULCAN_LOG_ERROR("failed to load " << path.string() << ": " << e.what());
        res.status = 500;
        res.body.clear();
      }
    };
  }

  auto resource = std::make_shared<const Resource>(resourceFromFile(path));
  return [resource](const network::HttpServer::Request &, network::HttpServer::Response &res)
  { res.set_content(resource->content, resource->contentType); };
}

/// \brief Route for \p file below \p dir: `/` followed by the relative path
/// with generic separators.
inline std::string routeFor(const std::filesystem::path &dir, const std::filesystem::path &file)
{
  return "/" + file.lexically_relative(dir).generic_string();
}

/// \brief Handlers for every regular file under each of \p dirs. A route
/// found in a later directory replaces the earlier one.
/// \throws std::runtime_error if a directory is missing or a file fails to
/// load outside dev mode.
inline HandlerMap handlersFromDirs(const std::vector<std::string> &dirs, bool dev)
{
  HandlerMap handlers;
  for (const auto &dir : dirs)
  {
    std::filesystem::path root = std::filesystem::path(dir).lexically_normal();
    if (root.filename().empty() && root.has_relative_path())
    {
      root = root.parent_path();
    }
    for (const auto &file : util::listRegularFiles(root))
    {
      handlers[routeFor(root, file)] = handlerFromFile(file, dev);
    }
  }
  return handlers;
}

} // namespace assets
} // namespace vulcan
