/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

// Workflow:
//
// $ apkscope-tool methods --dex classes.dex --dex classes2.dex [--custom]

#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <vector>

#include "ApkInfo.h"
#include "Tool.h"

namespace {

class ListMethods : public Tool {
 public:
  ListMethods() : Tool("methods", "list the methods of the sub-images") {}

  void add_options(po::options_description& options) const override {
    add_standard_options(options);
    options.add_options()("custom", "only methods with code in the app")(
        "apis", "only the Android APIs the app imports");
  }

  void run(const po::variables_map& options) override {
    if (options.count("custom") && options.count("apis")) {
      throw std::invalid_argument("--custom and --apis are exclusive");
    }
    auto apk = init(options);
    MethodSignatureSet methods;
    if (options.count("custom")) {
      methods = apk->custom_methods();
    } else if (options.count("apis")) {
      methods = apk->android_apis();
    } else {
      methods = apk->all_methods();
    }

    std::vector<MethodSignature> sorted(methods.begin(), methods.end());
    std::sort(sorted.begin(), sorted.end());
    for (const auto& method : sorted) {
      std::cout << method << std::endl;
    }
  }
};

static ListMethods s_tool;

} // namespace
