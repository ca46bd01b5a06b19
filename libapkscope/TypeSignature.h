/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <string>
#include <string_view>

namespace type_signature {

/*
 * Converts a type written the way the Java language writes it into a JVM type
 * descriptor.
 *
 *   "int"                          -> "I"
 *   "String[][]"                   -> "[[Ljava/lang/String;"
 *   "String..."                    -> "[Ljava/lang/String;"
 *   "[android.os.Handler"          -> "[Landroid/os/Handler;"
 *   "com.foo.Outer_Inner"          -> "Lcom/foo/Outer$Inner;"
 *
 * Names without a package are taken to live in java.lang. An empty input is
 * returned unchanged.
 */
std::string convert(std::string_view raw_type);

/*
 * Canonical form of a method descriptor: the argument types are separated by a
 * single space, the return type is kept as is.
 *
 *   "(Landroid/os/Handler;Ljava/lang/String;I)V"
 *     -> "(Landroid/os/Handler; Ljava/lang/String; I)V"
 *
 * Throws MalformedDescriptorException if `descriptor` has no `(` ... `)` pair.
 */
std::string normalize_descriptor(std::string_view descriptor);

/*
 * The descriptor as the disassembler prints it, i.e. without the separators
 * added by normalize_descriptor.
 */
std::string compact_descriptor(std::string_view descriptor);

} // namespace type_signature
