/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */


#include "JsonWrapper.h"

#include <boost/algorithm/string/case_conv.hpp>
#include <json/reader.h>
#include <memory>

#include "ApkScopeException.h"

namespace {

[[noreturn]] void throw_conversion_error(const std::string& name,
                                         const char* type) {
  throw apkscope::InvalidConfigException(
      std::string("Cannot convert JSON value to ") + type, {{"key", name}});
}

} // namespace

const Json::Value* JsonWrapper::find(const std::string& name) const {
  if (!m_config.isObject()) {
    return nullptr;
  }
  const auto* val = m_config.find(name.data(), name.data() + name.size());
  return val == nullptr || val->isNull() ? nullptr : val;
}

void JsonWrapper::get(const std::string& name,
                      size_t dflt,
                      size_t& param) const {
  const auto* val = find(name);
  if (val == nullptr) {
    param = dflt;
    return;
  }
  if (!val->isUInt64()) {
    throw_conversion_error(name, "unsigned int");
  }
  param = static_cast<size_t>(val->asUInt64());
}

void JsonWrapper::get(const std::string& name,
                      const std::string& dflt,
                      std::string& param) const {
  const auto* val = find(name);
  if (val == nullptr) {
    param = dflt;
    return;
  }
  if (!val->isString()) {
    throw_conversion_error(name, "string");
  }
  param = val->asString();
}

std::string JsonWrapper::get(const std::string& name,
                             const std::string& dflt) const {
  std::string res;
  get(name, dflt, res);
  return res;
}

void JsonWrapper::get(const std::string& name, bool dflt, bool& param) const {
  const auto* val = find(name);
  if (val == nullptr) {
    param = dflt;
    return;
  }
  if (val->isBool()) {
    param = val->asBool();
    return;
  }
  if (val->isIntegral()) {
    auto num = val->asLargestInt();
    if (num == 0 || num == 1) {
      param = num == 1;
      return;
    }
  }
  if (val->isString()) {
    auto word = boost::algorithm::to_lower_copy(val->asString());
    for (const char* no : {"0", "false", "off", "no"}) {
      if (word == no) {
        param = false;
        return;
      }
    }
    for (const char* yes : {"1", "true", "on", "yes"}) {
      if (word == yes) {
        param = true;
        return;
      }
    }
  }
  throw_conversion_error(name, "bool");
}

bool JsonWrapper::get(const std::string& name, bool dflt) const {
  bool res = dflt;
  get(name, dflt, res);
  return res;
}

void JsonWrapper::get(const std::string& name,
                      const std::vector<std::string>& dflt,
                      std::vector<std::string>& param) const {
  const auto* val = find(name);
  if (val == nullptr) {
    param = dflt;
    return;
  }
  if (!val->isArray()) {
    throw_conversion_error(name, "array");
  }
  std::vector<std::string> entries;
  entries.reserve(val->size());
  for (const auto& entry : *val) {
    if (!entry.isString()) {
      throw_conversion_error(name, "array of strings");
    }
    entries.push_back(entry.asString());
  }
  param = std::move(entries);
}

JsonWrapper JsonWrapper::sub(const std::string& name) const {
  const auto* val = find(name);
  if (val == nullptr) {
    return JsonWrapper();
  }
  if (!val->isObject()) {
    throw_conversion_error(name, "object");
  }
  return JsonWrapper(*val);
}

bool JsonWrapper::contains(const std::string& name) const {
  return find(name) != nullptr;
}

bool parse_json(const std::string& text,
                Json::Value& root,
                std::string& error) {
  Json::CharReaderBuilder builder;
  builder["collectComments"] = false;
  std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
  return reader->parse(text.data(), text.data() + text.size(), &root, &error);
}
