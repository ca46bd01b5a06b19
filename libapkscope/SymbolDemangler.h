/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <cstdint>
#include <string>

#include <boost/optional.hpp>

#include "MethodSignature.h"

namespace Json {
class Value;
} // namespace Json

/*
 * One entry of the backend's symbol listing, e.g.
 *
 *   {
 *     "type": "METH",
 *     "name": "int getCapabilities(android.accessibilityservice.Info)",
 *     "realname": "getCapabilities",
 *     "flagname": "sym.android.support.v4.Compat_getCapabilities_2",
 *     "is_imported": false,
 *     "vaddr": 165932
 *   }
 */
struct SymbolRecord {
  std::string kind;
  std::string name;
  std::string realname;
  std::string flagname;
  bool is_imported{false};
  uint64_t vaddr{0};

  // Missing keys read as empty, false or zero.
  static SymbolRecord from_json(const Json::Value& json);
};

namespace demangler {

/*
 * Recovers the method a symbol stands for. The flag name carries the
 * declaring class (mangled, possibly truncated), the display name carries the
 * argument and return types either in descriptor form or in Java source form.
 *
 * Returns none for records that are not functions or methods, that carry no
 * argument list, or whose flag name is too damaged to find the method name in.
 * Damaged and truncated flags are traced under DEMANGLE.
 */
boost::optional<MethodSignature> parse(const SymbolRecord& record,
                                       size_t subimage_index);

// Replaces the characters the backend cannot put in a flag name with '_'.
std::string escape_flag_chars(const std::string& raw);

} // namespace demangler
