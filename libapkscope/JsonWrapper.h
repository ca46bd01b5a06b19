/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */


#pragma once

#include <json/value.h>
#include <string>
#include <vector>

/*
 * Typed, defaulted reads out of one JSON object. A key that is absent or null
 * yields the default; a key holding the wrong type throws
 * InvalidConfigException naming the key.
 */
class JsonWrapper {
 public:
  JsonWrapper() : m_config(Json::objectValue) {}
  explicit JsonWrapper(Json::Value config) : m_config(std::move(config)) {}

  void get(const std::string& name, size_t dflt, size_t& param) const;

  void get(const std::string& name,
           const std::string& dflt,
           std::string& param) const;
  std::string get(const std::string& name, const std::string& dflt) const;

  // Also accepts 0/1 and the strings true/false, on/off, yes/no and 1/0.
  void get(const std::string& name, bool dflt, bool& param) const;
  bool get(const std::string& name, bool dflt) const;

  void get(const std::string& name,
           const std::vector<std::string>& dflt,
           std::vector<std::string>& param) const;

  // The object under `name`; an empty one when the key is absent.
  JsonWrapper sub(const std::string& name) const;

  bool contains(const std::string& name) const;

 private:
  const Json::Value* find(const std::string& name) const;

  Json::Value m_config;
};

/*
 * Parses `text` into `root`. On failure returns false and stores the reader's
 * messages in `error`.
 */
bool parse_json(const std::string& text, Json::Value& root, std::string& error);
