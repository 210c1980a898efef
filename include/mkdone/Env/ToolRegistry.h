//===- ToolRegistry.h -------------------------------------------*- C++ -*-===//
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

#ifndef MKDONE_ENV_TOOLREGISTRY_H
#define MKDONE_ENV_TOOLREGISTRY_H

#include "mkdone/Basic/Compiler.h"
#include "mkdone/Basic/LLVM.h"

#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/StringMap.h"
#include "llvm/ADT/StringRef.h"

#include <memory>
#include <string>
#include <vector>

namespace mkdone {
namespace core {

class TaskEngine;

}

namespace env {

class Environment;

/// A command provisioned into the environment on first use.
///
/// Tools have no stamp. The presence of the command itself records that it
/// has been installed.
class Tool {
  std::string name;

  std::string commandPath;

  /// The name of the package providing the command.
  std::string package;

  /// The resource which must exist before installing.
  std::string prerequisite;

  friend class ToolRegistry;

public:
  Tool(StringRef name, StringRef commandPath, StringRef package,
       StringRef prerequisite)
    : name(name), commandPath(commandPath), package(package),
      prerequisite(prerequisite) {}

  StringRef getName() const { return name; }

  StringRef getCommandPath() const { return commandPath; }

  StringRef getPackage() const { return package; }

  StringRef getPrerequisite() const { return prerequisite; }

  /// Get the name of the target installing the tool.
  std::string getInstallName() const { return name + "-install"; }
};

/// The registry of tools to provision into an environment.
class ToolRegistry {
  const Environment& environment;

  llvm::StringMap<std::unique_ptr<Tool>> tools;

  /// The tools, in declaration order.
  std::vector<Tool*> toolList;

  ToolRegistry(const ToolRegistry&) MKDONE_DELETED_FUNCTION;
  void operator=(const ToolRegistry&) MKDONE_DELETED_FUNCTION;

public:
  explicit ToolRegistry(const Environment& environment);
  ~ToolRegistry();

  const Environment& getEnvironment() const { return environment; }

  /// Declare the tool \arg name.
  ///
  /// The first declaration of a name determines its package and
  /// prerequisite; later declarations return the existing tool unchanged.
  ///
  /// \param package The package providing the tool, or empty for \arg name.
  /// \param prerequisite The path which must exist before installing, or
  /// empty for the environment descriptor.
  /// \param error_out [out] Error string if the return value is null.
  Tool* declareTool(StringRef name, StringRef package, StringRef prerequisite,
                    std::string* error_out);

  Tool* declareTool(StringRef name, std::string* error_out) {
    return declareTool(name, "", "", error_out);
  }

  /// Set the package of the declared tool \arg name.
  ///
  /// \param error_out [out] Error string if return value is false.
  bool setPackage(StringRef name, StringRef package, std::string* error_out);

  /// Set the prerequisite of the declared tool \arg name.
  ///
  /// \param error_out [out] Error string if return value is false.
  bool setPrerequisite(StringRef name, StringRef prerequisite,
                       std::string* error_out);

  const Tool* lookupTool(StringRef name) const;

  /// Get all tools, in declaration order.
  ArrayRef<Tool*> getTools() const { return toolList; }

  /// Add the install rule of every tool to \arg engine, along with the alias
  /// "<name>-install" for each.
  ///
  /// \param error_out [out] Error string if return value is false.
  bool addRules(core::TaskEngine& engine, std::string* error_out) const;
};

}
}

#endif
