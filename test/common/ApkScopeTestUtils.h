/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */


#pragma once

#include <string>

namespace apkscope {

/*
 * A scratch directory removed with everything under it when the owning
 * TempDir goes away. Moving transfers the ownership; a default-constructed
 * TempDir owns nothing.
 */
class TempDir {
 public:
  TempDir() = default;
  explicit TempDir(std::string dir) : path(std::move(dir)) {}
  TempDir(TempDir&& other) noexcept : path(std::move(other.path)) {
    other.path.clear();
  }
  TempDir& operator=(TempDir&& other) noexcept;
  ~TempDir();

  TempDir(const TempDir&) = delete;
  TempDir& operator=(const TempDir&) = delete;

  std::string path;

 private:
  void remove() noexcept;
};

// Creates a fresh directory under the system temp dir. Each '%' in `model`
// becomes a random hex digit.
TempDir make_tmp_dir(const std::string& model);

// Writes `content` to `dir`/`name` and returns the file's path.
std::string write_file(const std::string& dir,
                       const std::string& name,
                       const std::string& content);

} // namespace apkscope
