/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "AnalysisConfig.h"

#include <fstream>
#include <sstream>

#include <boost/filesystem.hpp>
#include <json/value.h>

#include "ApkScopeException.h"
#include "JsonWrapper.h"
#include "ReplayBackend.h"
#include "Trace.h"
#include "WorkQueue.h"

namespace {

constexpr const char* kRizinBackend = "rizin";
constexpr const char* kReplayBackend = "replay";

} // namespace

AnalysisConfig::AnalysisConfig()
    : num_threads(apkscope_parallel::default_num_threads()) {}

AnalysisConfig AnalysisConfig::from_json(const Json::Value& json) {
  if (!json.isNull() && !json.isObject()) {
    throw apkscope::InvalidConfigException(
        "Configuration must be a JSON object");
  }
  JsonWrapper jw(json);
  AnalysisConfig config;

  jw.get("backend", config.backend, config.backend);
  if (config.backend != kRizinBackend && config.backend != kReplayBackend) {
    throw apkscope::InvalidConfigException("Unknown backend",
                                           {{"backend", config.backend}});
  }

  auto rizin = jw.sub("rizin");
  rizin.get("path", config.rizin.path, config.rizin.path);
  rizin.get("args", config.rizin.args, config.rizin.args);
  rizin.get("analysis_command", config.rizin.analysis_command,
            config.rizin.analysis_command);

  jw.sub("replay").get("transcripts", config.replay_transcripts,
                       config.replay_transcripts);

  jw.get("num_threads", config.num_threads, config.num_threads);
  if (config.num_threads == 0) {
    config.num_threads = 1;
  }

  TRACE(CONFIG, 2, "Backend %s, %zu threads", config.backend.c_str(),
        config.num_threads);
  return config;
}

AnalysisConfig AnalysisConfig::load(const std::string& path) {
  std::ifstream input(path);
  if (!input) {
    throw apkscope::InvalidConfigException("Cannot open configuration",
                                           {{"path", path}});
  }
  std::stringstream buffer;
  buffer << input.rdbuf();

  Json::Value json;
  std::string error;
  if (!parse_json(buffer.str(), json, error)) {
    throw apkscope::InvalidConfigException(
        "Cannot parse configuration", {{"path", path}, {"error", error}});
  }
  auto config = from_json(json);

  auto base = boost::filesystem::path(path).parent_path();
  for (auto& transcript : config.replay_transcripts) {
    boost::filesystem::path p(transcript);
    if (p.is_relative()) {
      transcript = (base / p).string();
    }
  }
  return config;
}

BackendFactory make_backend_factory(const AnalysisConfig& config) {
  if (config.backend == kRizinBackend) {
    auto options = config.rizin;
    return [options](size_t) -> std::unique_ptr<AnalysisBackend> {
      return std::make_unique<RizinBackend>(options);
    };
  }
  if (config.backend == kReplayBackend) {
    auto transcripts = config.replay_transcripts;
    return [transcripts](
               size_t subimage_index) -> std::unique_ptr<AnalysisBackend> {
      if (subimage_index >= transcripts.size()) {
        throw apkscope::InvalidConfigException(
            "No replay transcript for sub-image",
            {{"index", std::to_string(subimage_index)}});
      }
      return std::make_unique<ReplayBackend>(transcripts[subimage_index]);
    };
  }
  throw apkscope::InvalidConfigException("Unknown backend",
                                         {{"backend", config.backend}});
}
