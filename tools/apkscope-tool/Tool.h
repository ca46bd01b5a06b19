/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <boost/program_options.hpp>
#include <memory>
#include <string>

#include "ToolRegistry.h"

namespace po = boost::program_options;

class ApkInfo;
class MethodSignature;

class Tool {
 public:
  Tool(const std::string& name, const std::string& desc)
      : m_name(name), m_desc(desc) {
    ToolRegistry::get().register_tool(this);
  }

  virtual ~Tool() {}

  virtual void run(const po::variables_map& options) = 0;

  virtual void add_options(po::options_description& options) const {}

  const std::string& name() const { return m_name; }
  const std::string& desc() const { return m_desc; }

 protected:
  // --dex (repeatable), --config and --permissions.
  void add_standard_options(po::options_description& options) const;

  // --class, --name and --descriptor, each optional.
  void add_method_options(po::options_description& options) const;

  std::unique_ptr<ApkInfo> init(const po::variables_map& options) const;

  /*
   * The method selected by the --class/--name/--descriptor options. Throws
   * std::invalid_argument when nothing matches.
   */
  MethodSignature find_method(ApkInfo& apk,
                              const po::variables_map& options) const;

 private:
  std::string m_name;
  std::string m_desc;
};
