/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

// Workflow:
//
// $ apkscope-tool xrefs --dex classes.dex \
//      --class 'Lcom/example/Foo;' --name send

#include <algorithm>
#include <iostream>
#include <vector>

#include "ApkInfo.h"
#include "Tool.h"

namespace {

class ShowXrefs : public Tool {
 public:
  ShowXrefs() : Tool("xrefs", "show the callers and callees of a method") {}

  void add_options(po::options_description& options) const override {
    add_standard_options(options);
    add_method_options(options);
  }

  void run(const po::variables_map& options) override {
    auto apk = init(options);
    auto method = find_method(*apk, options);
    std::cout << "=== " << method << " ===" << std::endl;

    auto upper = apk->upperfunc(method);
    std::vector<MethodSignature> callers(upper.begin(), upper.end());
    std::sort(callers.begin(), callers.end());
    std::cout << "callers:" << std::endl;
    for (const auto& caller : callers) {
      std::cout << "  " << caller << std::endl;
    }

    std::cout << "callees:" << std::endl;
    for (const auto& callee : apk->lowerfunc(method)) {
      std::cout << "  +" << callee.second << " " << callee.first
                << std::endl;
    }
  }
};

static ShowXrefs s_tool;

} // namespace
