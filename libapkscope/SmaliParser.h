/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <string>
#include <string_view>

#include "BytecodeInstruction.h"

namespace smali {

/*
 * Parses one line of disassembly, e.g.
 *
 *   "invoke-virtual {v1, v2}, Ljava/lang/String;->concat(Ljava/lang/String;)V"
 *   "invoke-static/range {v0 .. v5}, Lcom/foo/Bar;->baz(IIIIII)V"
 *   "const-string v0, \"hello, world\""
 *   "return-void"
 *
 * Ranged register lists ("v0..v5", "v0:v5") are expanded. For invoke-kind
 * instructions written with a dotted method reference ("Lcom/foo/Bar.baz()V")
 * the first '.' becomes "->".
 *
 * Throws InvalidSmaliException for an empty line or a register operand that
 * is not "v<integer>".
 */
BytecodeInstruction parse(std::string_view line);

/*
 * Drops a trailing disassembler comment (" ; ...") from a line.
 */
std::string strip_comment(std::string_view line);

bool is_invoke(std::string_view mnemonic);

} // namespace smali
