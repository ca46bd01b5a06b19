/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <set>
#include <string>

/*
 * Reads what the package manifest declares. Decoding the binary manifest is
 * left to implementations.
 */
class ManifestReader {
 public:
  virtual ~ManifestReader() {}

  // The names of the requested permissions ("uses-permission").
  virtual std::set<std::string> permissions() const = 0;
};

// A manifest whose permissions were extracted beforehand.
class StaticManifestReader final : public ManifestReader {
 public:
  explicit StaticManifestReader(std::set<std::string> permissions)
      : m_permissions(std::move(permissions)) {}

  std::set<std::string> permissions() const override { return m_permissions; }

 private:
  std::set<std::string> m_permissions;
};
