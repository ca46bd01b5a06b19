/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

// Workflow:
//
// $ apkscope-tool bytecode --dex classes.dex \
//      --class 'Lcom/example/Foo;' --name send \
//      --descriptor '(Landroid/os/Handler; Ljava/lang/String;)V'

#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include <json/json.h>

#include "ApkInfo.h"
#include "Tool.h"

namespace {

class DumpBytecode : public Tool {
 public:
  DumpBytecode()
      : Tool("bytecode", "dump the parsed instructions of a method") {}

  void add_options(po::options_description& options) const override {
    add_standard_options(options);
    add_method_options(options);
    options.add_options()(
        "wrapper-of",
        po::value<std::vector<std::string>>()->multitoken()->value_name(
            "FIRST SECOND"),
        "instead, show how the method invokes two others, each given as "
        "'<class> <name> <descriptor>'");
  }

  void run(const po::variables_map& options) override {
    auto apk = init(options);
    auto method = find_method(*apk, options);
    if (options.count("wrapper-of")) {
      dump_wrapper(*apk, method,
                   options["wrapper-of"].as<std::vector<std::string>>());
      return;
    }
    std::cout << "=== " << method << " ===" << std::endl;
    for (const auto& insn : apk->get_method_bytecode(method)) {
      std::cout << insn << std::endl;
    }
  }

 private:
  void dump_wrapper(ApkInfo& apk,
                    const MethodSignature& parent,
                    const std::vector<std::string>& targets) {
    if (targets.size() != 2) {
      throw std::invalid_argument("--wrapper-of takes exactly two methods");
    }
    auto first = parse_method(apk, targets[0]);
    auto second = parse_method(apk, targets[1]);
    auto evidence = apk.get_wrapper_evidence(parent, first, second);
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "  ";
    std::cout << Json::writeString(builder, evidence.to_json()) << std::endl;
  }

  MethodSignature parse_method(ApkInfo& apk, const std::string& full_name) {
    auto first_space = full_name.find(' ');
    auto second_space = full_name.find(' ', first_space + 1);
    if (first_space == std::string::npos ||
        second_space == std::string::npos) {
      throw std::invalid_argument("'" + full_name +
                                  "' is not '<class> <name> <descriptor>'");
    }
    auto cls = full_name.substr(0, first_space);
    auto name = full_name.substr(first_space + 1,
                                 second_space - first_space - 1);
    auto descriptor = full_name.substr(second_space + 1);
    auto method = apk.find_method(cls, name, descriptor);
    // Methods the app never lists can still be invoked by it.
    return method ? *method : MethodSignature(cls, name, descriptor);
  }
};

static DumpBytecode s_tool;

} // namespace
