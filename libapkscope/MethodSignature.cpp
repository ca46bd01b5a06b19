/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "MethodSignature.h"

#include <array>
#include <ostream>
#include <tuple>

#include <boost/algorithm/string/predicate.hpp>
#include <boost/functional/hash.hpp>

#include "TypeSignature.h"

namespace {

// Packages listed at https://developer.android.com/reference/packages
constexpr std::array<const char*, 11> kAndroidApiPrefixes = {
    "Landroid/", "Lcom/google/android/", "Ldalvik/",   "Ljava/",
    "Ljavax/",   "Ljunit/",              "Lorg/apache/", "Lorg/json/",
    "Lorg/w3c/", "Lorg/xml/",            "Lorg/xmlpull/",
};
} // namespace

bool MethodSignature::is_android_api() const {
  for (const auto* prefix : kAndroidApiPrefixes) {
    if (boost::starts_with(m_class_name, prefix)) {
      return true;
    }
  }
  return false;
}

std::string MethodSignature::full_name() const {
  return m_class_name + " " + m_name + " " + m_descriptor;
}

std::string MethodSignature::invocation_text() const {
  return m_class_name + "->" + m_name +
         type_signature::compact_descriptor(m_descriptor);
}

bool MethodSignature::operator<(const MethodSignature& that) const {
  return std::tie(m_class_name, m_name, m_descriptor) <
         std::tie(that.m_class_name, that.m_name, that.m_descriptor);
}

std::ostream& operator<<(std::ostream& os, const MethodSignature& method) {
  return os << method.full_name();
}

size_t std::hash<MethodSignature>::operator()(
    const MethodSignature& method) const {
  size_t seed = 0;
  boost::hash_combine(seed, method.get_class_name());
  boost::hash_combine(seed, method.get_name());
  boost::hash_combine(seed, method.get_descriptor());
  return seed;
}
