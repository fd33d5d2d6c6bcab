// Copyright (c) 2025 Vulcan contributors
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Vulcan, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#include <vulcan/htl/htl.hpp>
#include <vulcan/htl/json_dump.hpp>

#include <iostream>
#include <iterator>
#include <string>

/// \brief Print help message
static void printHelp()
{
  std::cout << "Usage: htl [options] < input.htl\n"
            << "Reads HTL from stdin and writes HTML to stdout.\n\n"
            << "  -h, --help    Show this help message\n"
            << "  -j, --json    Print the parse result as JSON instead of HTML\n";
}

int main(int argc, char **argv)
{
  bool json = false;
  for (int i = 1; i < argc; ++i)
  {
    std::string arg = argv[i];
    if (arg == "-h" || arg == "--help")
    {
      printHelp();
      return 0;
    }
    if (arg == "-j" || arg == "--json")
    {
      json = true;
      continue;
    }
    std::cerr << "Unknown option: " << arg << std::endl;
    printHelp();
    return 2;
  }

  std::string input((std::istreambuf_iterator<char>(std::cin)), std::istreambuf_iterator<char>());
  if (std::cin.bad())
  {
    std::cerr << "error reading stdin" << std::endl;
    return 1;
  }

  vulcan::htl::ParseResult result = vulcan::htl::parse(input);

  if (json)
  {
    std::cout << vulcan::core::toPrettyString(vulcan::htl::toJson(result)) << std::endl;
    return result.ok() ? 0 : 1;
  }

  if (result.error)
  {
    std::cerr << result.error->describe() << std::endl;
    return 1;
  }

  std::cout << vulcan::htl::render(result.tree.get()) << std::endl;
  return 0;
}
