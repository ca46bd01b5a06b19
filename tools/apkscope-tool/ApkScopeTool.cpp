/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <algorithm>
#include <cstdlib>
#include <cstring>
#include <iomanip>
#include <iostream>
#include <stdexcept>

#include "ApkScopeException.h"
#include "Debug.h"
#include "Tool.h"
#include "ToolRegistry.h"

namespace {

constexpr int kApkScopeError = 2;

void show_help(const po::options_description& od) {
  std::cout << "Usage:\n"
               "  apkscope-tool <tool> --dex <file> [--dex <file> ...] "
               "[<tool-options>]\n"
               "  apkscope-tool <tool> --help\n"
               "\n"
               "Available tools:\n";
  for (const auto* tool : ToolRegistry::get().get_tools()) {
    std::cout << "  " << std::left << std::setw(12) << tool->name() << " "
              << tool->desc() << "\n";
  }
  std::cout << "\nOptions:\n" << od << std::endl;
}

// Required options would fail the parse, so look for --help by hand.
bool help_requested(int argc, char* argv[]) {
  return std::any_of(argv + 1, argv + argc, [](const char* arg) {
    return strcmp(arg, "--help") == 0 || strcmp(arg, "-h") == 0;
  });
}

} // namespace

int main(int argc, char* argv[]) {
  po::options_description od;
  od.add_options()("help,h", "show this screen and exit");

  Tool* tool = argc > 1 ? ToolRegistry::get().get_tool(argv[1]) : nullptr;
  if (tool == nullptr) {
    show_help(od);
    if (argc > 1 && !help_requested(argc, argv)) {
      std::cerr << argv[1] << " is not a valid tool name!" << std::endl;
      return EXIT_FAILURE;
    }
    return argc > 1 ? 0 : EXIT_FAILURE;
  }

  tool->add_options(od);
  if (help_requested(argc, argv)) {
    show_help(od);
    return 0;
  }

  po::variables_map vm;
  try {
    // Everything after the tool name.
    po::store(po::parse_command_line(argc - 1, argv + 1, od), vm);
    po::notify(vm);
  } catch (const po::error& e) {
    std::cerr << e.what() << "\n" << std::endl;
    show_help(od);
    return EXIT_FAILURE;
  }

  try {
    tool->run(vm);
  } catch (const std::invalid_argument& e) {
    std::cerr << e.what() << std::endl;
    return EXIT_FAILURE;
  } catch (const ApkScopeException& e) {
    std::cerr << e.what() << std::endl;
    print_stack_trace(std::cerr, e);
    return kApkScopeError;
  }
  return 0;
}
