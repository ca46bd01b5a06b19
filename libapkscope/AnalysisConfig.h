/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <string>
#include <vector>

#include "AnalysisBackend.h"
#include "RizinBackend.h"

namespace Json {
class Value;
} // namespace Json

/*
 * Selects and configures the backend, e.g.
 *
 *   {
 *     "backend": "rizin",
 *     "rizin": {"path": "/opt/rizin/bin/rizin", "args": ["-e", "io.va=1"]},
 *     "num_threads": 4
 *   }
 *
 *   {
 *     "backend": "replay",
 *     "replay": {"transcripts": ["classes.json", "classes2.json"]}
 *   }
 *
 * Every key is optional. The replay backend answers sub-image i from
 * transcript i; relative transcript paths are taken relative to the
 * configuration file.
 */
struct AnalysisConfig {
  std::string backend{"rizin"};
  RizinOptions rizin;
  std::vector<std::string> replay_transcripts;
  size_t num_threads{1};

  AnalysisConfig();

  // Throws InvalidConfigException for unknown backends and ill-typed values.
  static AnalysisConfig from_json(const Json::Value& json);

  // Throws InvalidConfigException when the file cannot be read or parsed.
  static AnalysisConfig load(const std::string& path);
};

BackendFactory make_backend_factory(const AnalysisConfig& config);
