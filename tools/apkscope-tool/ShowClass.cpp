/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

// Workflow:
//
// $ apkscope-tool class --dex classes.dex --class 'Lcom/example/Foo;'
//
// Also prints the permissions when given --permissions.

#include <iostream>

#include "ApkInfo.h"
#include "Tool.h"

namespace {

class ShowClass : public Tool {
 public:
  ShowClass()
      : Tool("class", "show the superclasses and subclasses of a class") {}

  void add_options(po::options_description& options) const override {
    add_standard_options(options);
    options.add_options()(
        "class",
        po::value<std::string>()->value_name("Lcom/foo/Bar;")->required(),
        "class descriptor");
  }

  void run(const po::variables_map& options) override {
    auto apk = init(options);
    auto cls = options["class"].as<std::string>();
    std::cout << "superclasses:" << std::endl;
    for (const auto& super : apk->superclass_of(cls)) {
      std::cout << "  " << super << std::endl;
    }
    std::cout << "subclasses:" << std::endl;
    for (const auto& sub : apk->subclasses_of(cls)) {
      std::cout << "  " << sub << std::endl;
    }
    auto permissions = apk->permissions();
    if (!permissions.empty()) {
      std::cout << "permissions:" << std::endl;
      for (const auto& permission : permissions) {
        std::cout << "  " << permission << std::endl;
      }
    }
  }
};

static ShowClass s_tool;

} // namespace
