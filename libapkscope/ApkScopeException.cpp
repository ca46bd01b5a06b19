/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "ApkScopeException.h"

const char* error_name(ApkScopeError type) {
  switch (type) {
  case ApkScopeError::INTERNAL_ERROR:
    return "INTERNAL_ERROR";
  case ApkScopeError::GENERIC_ASSERTION_ERROR:
    return "GENERIC_ASSERTION_ERROR";
  case ApkScopeError::UNSUPPORTED_INPUT_KIND:
    return "UNSUPPORTED_INPUT_KIND";
  case ApkScopeError::MALFORMED_DESCRIPTOR:
    return "MALFORMED_DESCRIPTOR";
  case ApkScopeError::UNPARSABLE_SYMBOL:
    return "UNPARSABLE_SYMBOL";
  case ApkScopeError::UNRESOLVED_ADDRESS:
    return "UNRESOLVED_ADDRESS";
  case ApkScopeError::BACKEND_FAILURE:
    return "BACKEND_FAILURE";
  case ApkScopeError::MALFORMED_RESPONSE:
    return "MALFORMED_RESPONSE";
  case ApkScopeError::INVALID_SMALI:
    return "INVALID_SMALI";
  case ApkScopeError::INVALID_CONFIG:
    return "INVALID_CONFIG";
  }
  return "UNKNOWN";
}

ApkScopeException::ApkScopeException(
    ApkScopeError type_of_error,
    const std::string& message,
    const std::map<std::string, std::string>& extra_info)
    : type(type_of_error), message(message), extra_info(extra_info) {

  std::ostringstream oss;
  if (type_of_error != ApkScopeError::GENERIC_ASSERTION_ERROR) {
    oss << "ApkScopeError: " << error_name(type) << " with message: ";
  }
  oss << message;
  if (!extra_info.empty()) {
    oss << " with extra info:";
    for (auto it = extra_info.begin(); it != extra_info.end(); it++) {
      oss << " (\"" << it->first << "\", \"" << it->second << "\")";
    }
  }
  m_msg = oss.str();
}

const char* ApkScopeException::what() const noexcept { return m_msg.c_str(); }

void assert_or_throw(bool cond,
                     ApkScopeError type,
                     const std::string& message,
                     const std::map<std::string, std::string>& extra_info) {
  if (!cond) {
    switch (type) {
    case ApkScopeError::UNSUPPORTED_INPUT_KIND:
      throw apkscope::UnsupportedInputKindException(message, extra_info);
    case ApkScopeError::MALFORMED_DESCRIPTOR:
      throw apkscope::MalformedDescriptorException(message, extra_info);
    case ApkScopeError::BACKEND_FAILURE:
      throw apkscope::BackendFailureException(message, extra_info);
    case ApkScopeError::MALFORMED_RESPONSE:
      throw apkscope::MalformedResponseException(message, extra_info);
    case ApkScopeError::INVALID_SMALI:
      throw apkscope::InvalidSmaliException(message, extra_info);
    case ApkScopeError::INVALID_CONFIG:
      throw apkscope::InvalidConfigException(message, extra_info);
    default:
      break;
    }
    throw ApkScopeException(type, message, extra_info);
  }
}
