/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "Tool.h"

#include <boost/filesystem.hpp>
#include <fstream>
#include <set>
#include <sstream>
#include <stdexcept>
#include <vector>

#include <json/value.h>

#include "AnalysisConfig.h"
#include "ApkInfo.h"
#include "JsonWrapper.h"
#include "ManifestReader.h"
#include "MethodSignature.h"
#include "Trace.h"

namespace fs = boost::filesystem;

namespace {

boost::optional<std::string> get_optional(const po::variables_map& options,
                                          const char* name) {
  if (!options.count(name)) {
    return boost::none;
  }
  return options[name].as<std::string>();
}

// A JSON array of permission names, e.g. as dumped by aapt.
std::shared_ptr<ManifestReader> load_permissions(const std::string& path) {
  std::ifstream file(path, std::ios::in);
  if (!file) {
    throw std::invalid_argument("Cannot open '" + path + "'");
  }
  std::stringstream buffer;
  buffer << file.rdbuf();

  Json::Value json;
  std::string error;
  if (!parse_json(buffer.str(), json, error) || !json.isArray()) {
    throw std::invalid_argument("'" + path +
                                "' is not a JSON array of permissions");
  }
  std::set<std::string> permissions;
  for (const auto& permission : json) {
    permissions.insert(permission.asString());
  }
  return std::make_shared<StaticManifestReader>(std::move(permissions));
}

} // namespace

void Tool::add_standard_options(po::options_description& options) const {
  options.add_options()(
      "dex,d",
      po::value<std::vector<std::string>>()
          ->value_name("classes.dex")
          ->required(),
      "a sub-image to analyze, repeat for multidex")(
      "config,c",
      po::value<std::string>()->value_name("apkscope.json"),
      "backend configuration")(
      "permissions,p",
      po::value<std::string>()->value_name("permissions.json"),
      "JSON array of the permissions the manifest requests");
}

void Tool::add_method_options(po::options_description& options) const {
  options.add_options()("class",
                        po::value<std::string>()->value_name("Lcom/foo/Bar;"),
                        "declaring class descriptor")(
      "name", po::value<std::string>()->value_name("baz"), "method name")(
      "descriptor",
      po::value<std::string>()->value_name("(Ljava/lang/String; I)V"),
      "method descriptor, argument types separated by a space");
}

std::unique_ptr<ApkInfo> Tool::init(const po::variables_map& options) const {
  auto dexen = options["dex"].as<std::vector<std::string>>();
  for (const auto& dex : dexen) {
    if (!fs::is_regular_file(fs::path(dex))) {
      throw std::invalid_argument("'" + dex + "' is not a file");
    }
  }

  AnalysisConfig config;
  if (options.count("config")) {
    config = AnalysisConfig::load(options["config"].as<std::string>());
  }

  std::shared_ptr<ManifestReader> manifest;
  if (options.count("permissions")) {
    manifest = load_permissions(options["permissions"].as<std::string>());
  }

  TRACE(TOOL, 2, "%s: %zu sub-images, %s backend", m_name.c_str(),
        dexen.size(), config.backend.c_str());
  return std::make_unique<ApkInfo>(std::move(dexen), std::move(manifest),
                                   config);
}

MethodSignature Tool::find_method(ApkInfo& apk,
                                  const po::variables_map& options) const {
  auto cls = get_optional(options, "class");
  auto name = get_optional(options, "name");
  auto descriptor = get_optional(options, "descriptor");
  auto method = apk.find_method(cls, name, descriptor);
  if (!method) {
    throw std::invalid_argument("No method matches " + cls.value_or("*") +
                                " " + name.value_or("*") + " " +
                                descriptor.value_or("*"));
  }
  return *method;
}
