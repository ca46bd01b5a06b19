/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "SymbolDemangler.h"

#include <vector>

#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/regex.hpp>
#include <boost/regex.hpp>
#include <json/value.h>

#include "ApkScopeException.h"
#include "Trace.h"
#include "TypeSignature.h"

namespace {

constexpr const char* kCloneImportFlag = "sym.imp.clone";

std::string json_string(const Json::Value& json, const char* key) {
  const auto& val = json[key];
  return val.isString() ? val.asString() : std::string();
}

/*
 * Turns the Java source form "(android.os.Handler, String)" found in a
 * display name such as "void Request(android.os.Handler, String)" into a
 * descriptor. Returns none when no return type can be found.
 */
boost::optional<std::string> convert_source_signature(
    const std::string& display_name, const std::string& raw_arguments) {
  static const boost::regex return_type_re(
      R"([A-Za-zL][A-Za-z0-9L/;\[\]$.]+ )");

  std::vector<std::string> arguments;
  auto inner = raw_arguments.substr(1, raw_arguments.size() - 2);
  boost::algorithm::split_regex(arguments, inner, boost::regex(", "));

  std::string converted;
  for (const auto& arg : arguments) {
    converted += type_signature::convert(arg);
  }

  boost::smatch match;
  if (!boost::regex_search(display_name, match, return_type_re)) {
    return boost::none;
  }
  auto return_type = match.str(0);
  return_type.pop_back(); // The trailing space.

  return "(" + converted + ")" + type_signature::convert(return_type);
}

} // namespace

SymbolRecord SymbolRecord::from_json(const Json::Value& json) {
  SymbolRecord record;
  if (!json.isObject()) {
    return record;
  }
  record.kind = json_string(json, "type");
  record.name = json_string(json, "name");
  record.realname = json_string(json, "realname");
  record.flagname = json_string(json, "flagname");
  const auto& imported = json["is_imported"];
  record.is_imported = imported.isBool() && imported.asBool();
  const auto& vaddr = json["vaddr"];
  record.vaddr = vaddr.isIntegral() ? vaddr.asUInt64() : 0;
  return record;
}

namespace demangler {

std::string escape_flag_chars(const std::string& raw) {
  std::string escaped(raw);
  for (auto& c : escaped) {
    if (c == '<' || c == '>' || c == '$') {
      c = '_';
    }
  }
  return escaped;
}

boost::optional<MethodSignature> parse(const SymbolRecord& record,
                                       size_t subimage_index) {
  if (record.kind != "FUNC" && record.kind != "METH") {
    return boost::none;
  }

  // -- Descriptor --
  auto open = record.name.find('(');
  if (open == std::string::npos ||
      record.name.find(')', open) == std::string::npos) {
    return boost::none;
  }
  std::string raw_descriptor = record.name.substr(open);

  if (boost::ends_with(raw_descriptor, ")")) {
    auto converted = convert_source_signature(record.name, raw_descriptor);
    if (!converted) {
      TRACE(DEMANGLE, 1, "Unresolved method signature: %s",
            record.name.c_str());
      return boost::none;
    }
    raw_descriptor = *converted;
  }

  std::string descriptor;
  try {
    descriptor = type_signature::normalize_descriptor(raw_descriptor);
  } catch (const apkscope::MalformedDescriptorException& e) {
    TRACE(DEMANGLE, 1, "%s", e.what());
    return boost::none;
  }

  BackendHandle handle(subimage_index, record.vaddr, record.is_imported);

  // sym.imp.clone doesn't belong to a class
  if (record.flagname == kCloneImportFlag) {
    return MethodSignature("", "clone", "()Ljava/lang/Object;", handle);
  }

  // -- Class name --
  auto escaped_name = escape_flag_chars(record.realname);
  if (boost::ends_with(escaped_name, "_")) {
    escaped_name.pop_back();
  }
  if (record.flagname.find(escaped_name) == std::string::npos) {
    TRACE(DEMANGLE, 1, "The class name may be truncated: %s",
          record.flagname.c_str());
  }

  // The method name is the last run of letters after underscores.
  static const boost::regex method_name_re("_+[A-Za-z]+");
  boost::sregex_iterator it(record.flagname.begin(), record.flagname.end(),
                            method_name_re);
  boost::sregex_iterator end;
  boost::optional<size_t> last_match;
  for (; it != end; ++it) {
    last_match = static_cast<size_t>(it->position());
  }
  if (!last_match) {
    TRACE(DEMANGLE, 1, "Skip the damaged flag: %s", record.flagname.c_str());
    return boost::none;
  }

  std::string class_part = record.flagname.substr(0, *last_match);
  while (boost::starts_with(class_part, "sym.") ||
         boost::starts_with(class_part, "imp.")) {
    class_part.erase(0, 4);
  }

  return MethodSignature(type_signature::convert(class_part), record.realname,
                         std::move(descriptor), handle);
}

} // namespace demangler
