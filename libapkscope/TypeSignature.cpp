/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "TypeSignature.h"

#include <unordered_map>
#include <vector>

#include <boost/algorithm/string/join.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/replace.hpp>

#include "ApkScopeException.h"

namespace {

const std::unordered_map<std::string_view, std::string_view>&
primitive_types() {
  static const std::unordered_map<std::string_view, std::string_view> prim_map =
      {{"void", "V"},  {"boolean", "Z"}, {"byte", "B"},
       {"char", "C"},  {"short", "S"},   {"int", "I"},
       {"long", "J"},  {"float", "F"},   {"double", "D"}};
  return prim_map;
}

bool is_primitive_descriptor(char c) {
  switch (c) {
  case 'Z':
  case 'B':
  case 'C':
  case 'S':
  case 'I':
  case 'J':
  case 'F':
  case 'D':
    return true;
  default:
    return false;
  }
}

} // namespace

namespace type_signature {

std::string convert(std::string_view raw_type) {
  if (raw_type.empty()) {
    return std::string(raw_type);
  }

  if (boost::ends_with(raw_type, "[]")) {
    return "[" + convert(raw_type.substr(0, raw_type.size() - 2));
  }

  if (raw_type.front() == '[') {
    return "[" + convert(raw_type.substr(1));
  }

  auto ellipsis = raw_type.find("...");
  if (ellipsis != std::string_view::npos) {
    return "[" + convert(raw_type.substr(0, ellipsis));
  }

  const auto& prim_map = primitive_types();
  auto it = prim_map.find(raw_type);
  if (it != prim_map.end()) {
    return std::string(it->second);
  }

  std::string name(raw_type);
  if (name.find('.') != std::string::npos ||
      name.find('_') != std::string::npos) {
    boost::replace_all(name, ".", "/");
    boost::replace_all(name, "_", "$");
    return "L" + name + ";";
  }

  return "Ljava/lang/" + name + ";";
}

std::string normalize_descriptor(std::string_view descriptor) {
  auto open = descriptor.find('(');
  auto close = descriptor.find(')');
  if (open == std::string_view::npos || close == std::string_view::npos ||
      close < open) {
    throw apkscope::MalformedDescriptorException(
        "Invalid descriptor", {{"descriptor", std::string(descriptor)}});
  }

  std::vector<std::string> args;
  std::string array_prefix;
  auto arg_str = descriptor.substr(open + 1, close - open - 1);
  for (size_t i = 0; i < arg_str.size(); ++i) {
    char c = arg_str[i];
    if (c == '[') {
      array_prefix.push_back(c);
    } else if (c == 'L') {
      auto end = arg_str.find(';', i);
      if (end == std::string_view::npos) {
        throw apkscope::MalformedDescriptorException(
            "Unterminated class type in descriptor",
            {{"descriptor", std::string(descriptor)}});
      }
      args.push_back(array_prefix +
                     std::string(arg_str.substr(i, end - i + 1)));
      array_prefix.clear();
      i = end;
    } else if (is_primitive_descriptor(c)) {
      args.push_back(array_prefix + c);
      array_prefix.clear();
    }
    // Anything else is a separator.
  }

  return "(" + boost::algorithm::join(args, " ") +
         std::string(descriptor.substr(close));
}

std::string compact_descriptor(std::string_view descriptor) {
  std::string res;
  res.reserve(descriptor.size());
  for (char c : descriptor) {
    if (c != ' ') {
      res.push_back(c);
    }
  }
  return res;
}

} // namespace type_signature
