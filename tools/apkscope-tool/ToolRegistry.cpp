/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */


#include "ToolRegistry.h"

#include "Tool.h"

ToolRegistry& ToolRegistry::get() {
  static ToolRegistry s_registry;
  return s_registry;
}

void ToolRegistry::register_tool(Tool* tool) { m_tools[tool->name()] = tool; }

std::vector<Tool*> ToolRegistry::get_tools() const {
  std::vector<Tool*> tools;
  tools.reserve(m_tools.size());
  for (const auto& entry : m_tools) {
    tools.push_back(entry.second);
  }
  return tools;
}

Tool* ToolRegistry::get_tool(const std::string& name) const {
  auto it = m_tools.find(name);
  return it == m_tools.end() ? nullptr : it->second;
}
