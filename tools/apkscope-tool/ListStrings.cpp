/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

// Workflow:
//
// $ apkscope-tool strings --dex classes.dex --dex classes2.dex

#include <iostream>

#include "ApkInfo.h"
#include "Tool.h"

namespace {

class ListStrings : public Tool {
 public:
  ListStrings() : Tool("strings", "list the strings of the sub-images") {}

  void add_options(po::options_description& options) const override {
    add_standard_options(options);
  }

  void run(const po::variables_map& options) override {
    auto apk = init(options);
    for (const auto& str : apk->get_strings()) {
      std::cout << str << std::endl;
    }
  }
};

static ListStrings s_tool;

} // namespace
