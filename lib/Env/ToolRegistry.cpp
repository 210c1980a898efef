//===-- ToolRegistry.cpp --------------------------------------------------===//
//
// This source file is part of the Swift.org open source project
//
// Copyright (c) 2014 - 2026 Apple Inc. and the Swift project authors
// Licensed under Apache License v2.0 with Runtime Library Exception
//
// See http://swift.org/LICENSE.txt for license information
// See http://swift.org/CONTRIBUTORS.txt for the list of Swift project authors
//
//===----------------------------------------------------------------------===//

#include "mkdone/Env/ToolRegistry.h"

#include "mkdone/Core/Rule.h"
#include "mkdone/Core/TaskEngine.h"
#include "mkdone/Env/Environment.h"

using namespace mkdone;
using namespace mkdone::env;

namespace {

/// The rule installing a tool if its command does not exist.
class ToolInstallRule : public core::Rule {
  std::string installName;

  std::string installCommand;

public:
  ToolInstallRule(const Environment& environment, const Tool& tool)
    : Rule(Kind::Tool, tool.getName(), tool.getCommandPath(),
           { tool.getPrerequisite().str() }),
      installName(tool.getInstallName()),
      installCommand(environment.getInstallCommand(tool.getPackage())) {}

  virtual bool isExistenceOnly() const override { return true; }

  virtual bool execute(core::RuleCommandInterface& commandInterface) override {
    return commandInterface.runShellCommand(installName, installCommand);
  }
};

}

ToolRegistry::ToolRegistry(const Environment& environment)
  : environment(environment) {}

ToolRegistry::~ToolRegistry() {}

Tool* ToolRegistry::declareTool(StringRef name, StringRef package,
                                StringRef prerequisite,
                                std::string* error_out) {
  auto it = tools.find(name);
  if (it != tools.end())
    return it->second.get();

  if (name.empty() || name.contains('/')) {
    *error_out = "invalid tool name '" + name.str() + "'";
    return nullptr;
  }

  auto tool = std::make_unique<Tool>(
      name, environment.getCommandPath(name),
      package.empty() ? name : package,
      prerequisite.empty() ? environment.getDescriptorPath() : prerequisite);
  Tool* result = tool.get();
  tools[name] = std::move(tool);
  toolList.push_back(result);
  return result;
}

bool ToolRegistry::setPackage(StringRef name, StringRef package,
                              std::string* error_out) {
  auto it = tools.find(name);
  if (it == tools.end()) {
    *error_out = "package given for undeclared tool '" + name.str() + "'";
    return false;
  }
  if (package.empty()) {
    *error_out = "empty package for tool '" + name.str() + "'";
    return false;
  }
  it->second->package = package.str();
  return true;
}

bool ToolRegistry::setPrerequisite(StringRef name, StringRef prerequisite,
                                   std::string* error_out) {
  auto it = tools.find(name);
  if (it == tools.end()) {
    *error_out = "prerequisite given for undeclared tool '" + name.str() + "'";
    return false;
  }
  if (prerequisite.empty()) {
    *error_out = "empty prerequisite for tool '" + name.str() + "'";
    return false;
  }
  it->second->prerequisite = prerequisite.str();
  return true;
}

const Tool* ToolRegistry::lookupTool(StringRef name) const {
  auto it = tools.find(name);
  if (it == tools.end())
    return nullptr;
  return it->second.get();
}

bool ToolRegistry::addRules(core::TaskEngine& engine,
                            std::string* error_out) const {
  for (const Tool* tool: toolList) {
    // The installer is provided by the environment itself.
    if (!engine.lookupRule(tool->getCommandPath())) {
      if (!engine.addRule(std::make_unique<ToolInstallRule>(environment,
                                                            *tool),
                          error_out))
        return false;
    }

    if (!engine.addAlias(tool->getInstallName(), tool->getCommandPath(),
                         error_out))
      return false;
  }
  return true;
}
