// Copyright (c) 2025 Vulcan contributors
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Vulcan, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#include <vulcan/vulcan.hpp>

#include <csignal>
#include <cstdlib>
#include <iostream>
#include <pthread.h>

namespace
{

/// \brief Registers every file route, plus the index page at "/".
void registerRoutes(vulcan::network::HttpServer &server, const vulcan::frontend::Settings &settings)
{
  vulcan::assets::HandlerMap handlers = vulcan::assets::handlersFromDirs(settings.dirs, settings.dev);
  for (auto &[route, handler] : handlers)
  {
    VULCAN_LOG_INFO("Handling " << route);
    server.onGet(route, handler);
  }

  auto index = handlers.find(settings.index);
  if (index == handlers.end())
  {
    VULCAN_LOG_WARN("Index route " << settings.index << " has no file; / is not served");
    return;
  }
  server.onGet("/", index->second);
  VULCAN_LOG_INFO("Handling / as " << settings.index);
}

} // namespace

int main(int argc, char **argv)
{
  vulcan::frontend::Config config;
  vulcan::frontend::Settings settings;
  try
  {
    settings = vulcan::frontend::loadSettings(argc, argv, config);
  }
  catch (const std::exception &ex)
  {
    std::cerr << "Error: " << ex.what() << "\n\n";
    vulcan::frontend::printHelp(std::cerr, argv[0]);
    return EXIT_FAILURE;
  }

  if (config.help)
  {
    vulcan::frontend::printHelp(std::cout, argv[0]);
    return 0;
  }

  vulcan::core::Logger::init(settings.logLevel, settings.logFile);

  // Block the termination signals before any thread starts so that only
  // sigwait below sees them.
  sigset_t signals;
  sigemptyset(&signals);
  sigaddset(&signals, SIGINT);
  sigaddset(&signals, SIGTERM);
  pthread_sigmask(SIG_BLOCK, &signals, nullptr);

  vulcan::network::HttpServer server;
  try
  {
    server.setPort(settings.port);
    server.setBindAddress(settings.bindAddress);
    registerRoutes(server, settings);
    server.start();
  }
  catch (const std::exception &ex)
  {
    VULCAN_LOG_FATAL("Startup failed: " << ex.what());
    vulcan::core::Logger::shutdown();
    return EXIT_FAILURE;
  }

  int received = 0;
  if (sigwait(&signals, &received) != 0)
  {
    VULCAN_LOG_ERROR("sigwait failed");
  }
  VULCAN_LOG_INFO("Received signal " << received << ", shutting down");

  server.stop();
  vulcan::core::Logger::shutdown();
  return 0;
}
