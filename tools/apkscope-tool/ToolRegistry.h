/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */


#pragma once

#include <map>
#include <string>
#include <vector>

class Tool;

/*
 * Every Tool registers itself here on construction, so tools are defined as
 * static objects and looked up by name from main().
 */
class ToolRegistry {
 public:
  static ToolRegistry& get();

  // A later tool with the same name replaces the earlier one.
  void register_tool(Tool* tool);

  // Ordered by name.
  std::vector<Tool*> get_tools() const;

  // Null when no tool has this name.
  Tool* get_tool(const std::string& name) const;

 private:
  ToolRegistry() = default;
  ToolRegistry(const ToolRegistry&) = delete;
  ToolRegistry& operator=(const ToolRegistry&) = delete;

  std::map<std::string, Tool*> m_tools;
};
