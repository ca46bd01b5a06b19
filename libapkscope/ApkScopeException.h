/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <map>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

enum ApkScopeError {
  INTERNAL_ERROR = 1,
  GENERIC_ASSERTION_ERROR = 2,
  UNSUPPORTED_INPUT_KIND = 3,
  MALFORMED_DESCRIPTOR = 4,
  UNPARSABLE_SYMBOL = 5,
  UNRESOLVED_ADDRESS = 6,
  BACKEND_FAILURE = 7,
  MALFORMED_RESPONSE = 8,
  INVALID_SMALI = 9,
  INVALID_CONFIG = 10,
  MAX = 10,
};

const char* error_name(ApkScopeError type);

class ApkScopeException : public std::exception {
 public:
  const ApkScopeError type;
  const std::string message;
  const std::map<std::string, std::string> extra_info;

  explicit ApkScopeException(
      ApkScopeError type_of_error,
      const std::string& message = "",
      const std::map<std::string, std::string>& extra_info = {});

  const char* what() const noexcept override;

 private:
  std::string m_msg;
};

namespace apkscope {

/*
 * The input file is neither a single bytecode sub-image nor a recognized
 * container. Raised when a session is constructed for it.
 */
class UnsupportedInputKindException : public ApkScopeException {
 public:
  explicit UnsupportedInputKindException(
      const std::string& message,
      const std::map<std::string, std::string>& extra_info = {})
      : ApkScopeException(
            ApkScopeError::UNSUPPORTED_INPUT_KIND, message, extra_info) {}
};

/*
 * A method descriptor without a balanced `(` `)` pair.
 */
class MalformedDescriptorException : public ApkScopeException {
 public:
  explicit MalformedDescriptorException(
      const std::string& message,
      const std::map<std::string, std::string>& extra_info = {})
      : ApkScopeException(
            ApkScopeError::MALFORMED_DESCRIPTOR, message, extra_info) {}
};

/*
 * The backend channel is gone (closed pipe, crashed process) or the session
 * that owns it was already poisoned by an earlier failure. A session that has
 * raised this must be discarded.
 */
class BackendFailureException : public ApkScopeException {
 public:
  explicit BackendFailureException(
      const std::string& message,
      const std::map<std::string, std::string>& extra_info = {})
      : ApkScopeException(ApkScopeError::BACKEND_FAILURE, message, extra_info) {
  }
};

/*
 * One response could not be decoded. The channel itself is still in sync.
 */
class MalformedResponseException : public ApkScopeException {
 public:
  explicit MalformedResponseException(
      const std::string& message,
      const std::map<std::string, std::string>& extra_info = {})
      : ApkScopeException(
            ApkScopeError::MALFORMED_RESPONSE, message, extra_info) {}
};

class InvalidSmaliException : public ApkScopeException {
 public:
  explicit InvalidSmaliException(
      const std::string& message,
      const std::map<std::string, std::string>& extra_info = {})
      : ApkScopeException(ApkScopeError::INVALID_SMALI, message, extra_info) {}
};

class InvalidConfigException : public ApkScopeException {
 public:
  explicit InvalidConfigException(
      const std::string& message,
      const std::map<std::string, std::string>& extra_info = {})
      : ApkScopeException(ApkScopeError::INVALID_CONFIG, message, extra_info) {}
};

} // namespace apkscope

void assert_or_throw(
    bool cond,
    ApkScopeError type = ApkScopeError::GENERIC_ASSERTION_ERROR,
    const std::string& message = "",
    const std::map<std::string, std::string>& extra_info = {});
