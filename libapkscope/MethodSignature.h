/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <cstdint>
#include <functional>
#include <iosfwd>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

#include <boost/optional.hpp>

/*
 * Where a method lives in the backend: the sub-image it was listed in, its
 * code address there, and whether it is an import (no code in the sub-image).
 * Only used to query the backend again; never part of a method's identity.
 */
struct BackendHandle {
  size_t subimage_index{0};
  uint64_t address{0};
  bool is_imported{false};

  BackendHandle() = default;
  BackendHandle(size_t subimage_index, uint64_t address, bool is_imported)
      : subimage_index(subimage_index),
        address(address),
        is_imported(is_imported) {}
};

/*
 * A method named by (declaring class descriptor, name, descriptor).
 *
 * Equality and hashing look at these three fields only, so the same method
 * listed by two sub-images, or by two different backends, compares equal.
 */
class MethodSignature {
 public:
  MethodSignature() = default;
  MethodSignature(std::string class_name,
                  std::string name,
                  std::string descriptor,
                  boost::optional<BackendHandle> handle = boost::none,
                  boost::optional<std::string> access_flags = boost::none)
      : m_class_name(std::move(class_name)),
        m_name(std::move(name)),
        m_descriptor(std::move(descriptor)),
        m_handle(std::move(handle)),
        m_access_flags(std::move(access_flags)) {}

  const std::string& get_class_name() const { return m_class_name; }
  const std::string& get_name() const { return m_name; }
  const std::string& get_descriptor() const { return m_descriptor; }

  const boost::optional<BackendHandle>& get_handle() const { return m_handle; }
  void set_handle(const BackendHandle& handle) { m_handle = handle; }

  const boost::optional<std::string>& get_access_flags() const {
    return m_access_flags;
  }
  void set_access_flags(std::string flags) {
    m_access_flags = std::move(flags);
  }

  // Imports have no code in the sub-image that lists them.
  bool is_imported() const { return m_handle && m_handle->is_imported; }

  // Declared in one of the platform packages.
  bool is_android_api() const;

  // "<class> <name> <descriptor>"
  std::string full_name() const;

  // "Lcls;->name(args)ret", with the descriptor compacted the way the
  // disassembler prints it.
  std::string invocation_text() const;

  bool operator==(const MethodSignature& that) const {
    return m_class_name == that.m_class_name && m_name == that.m_name &&
           m_descriptor == that.m_descriptor;
  }
  bool operator!=(const MethodSignature& that) const {
    return !(*this == that);
  }
  // Orders by (class, name, descriptor); used for deterministic output.
  bool operator<(const MethodSignature& that) const;

 private:
  std::string m_class_name;
  std::string m_name;
  std::string m_descriptor;
  boost::optional<BackendHandle> m_handle;
  boost::optional<std::string> m_access_flags;
};

std::ostream& operator<<(std::ostream& os, const MethodSignature& method);

namespace std {
template <>
struct hash<MethodSignature> {
  size_t operator()(const MethodSignature& method) const;
};
} // namespace std

using MethodSignatureSet = std::unordered_set<MethodSignature>;

// A callee together with the offset of the call site in the caller.
using MethodOffset = std::pair<MethodSignature, int64_t>;
using MethodOffsetList = std::vector<MethodOffset>;
