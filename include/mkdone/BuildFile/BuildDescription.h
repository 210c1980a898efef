//===- BuildDescription.h ---------------------------------------*- C++ -*-===//
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

#ifndef MKDONE_BUILDFILE_BUILDDESCRIPTION_H
#define MKDONE_BUILDFILE_BUILDDESCRIPTION_H

#include "mkdone/Basic/Compiler.h"
#include "mkdone/Basic/LLVM.h"

#include "llvm/ADT/StringMap.h"
#include "llvm/ADT/StringRef.h"

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace mkdone {
namespace buildfile {

/// The definition of a single task, from the 'commands' section.
struct TaskDefinition {
  std::string name;

  /// Plain file prerequisites.
  std::vector<std::string> inputs;

  /// Names of tasks which must complete first.
  std::vector<std::string> requiredTasks;

  /// Names of tools used by the task.
  std::vector<std::string> tools;

  /// The commands making up the run operation.
  std::vector<std::string> run;

  /// Custom clean commands, if \see hasCleanCommands.
  std::vector<std::string> clean;

  bool hasCleanCommands = false;

  /// The name of the clean operation, or empty for the default.
  std::string cleanName;
};

/// The contents of a manifest, before configuration.
///
/// The description is a direct representation of the file: task and tool
/// names appear as often as they were listed, and no reference has been
/// resolved.
class BuildDescription {
public:
  typedef std::vector<std::string> value_list;
  typedef std::vector<std::pair<std::string, value_list>> config_list;
  typedef std::vector<std::pair<std::string, std::string>> property_list;

private:
  std::string clientName;

  uint32_t clientVersion = 0;

  /// The configuration entries, in file order.
  config_list config;

  /// The declared task names, in order and including repetitions.
  std::vector<std::string> taskNames;

  /// The declared tool names, in order and including repetitions.
  std::vector<std::string> toolNames;

  /// The package providing each tool, where it differs from the tool name.
  property_list packages;

  /// The prerequisite of each tool, where it is not the environment.
  property_list toolRequires;

  /// The task definitions, in file order.
  std::vector<TaskDefinition> taskDefinitions;

public:
  StringRef getClientName() const { return clientName; }
  std::string& getClientName() { return clientName; }

  uint32_t getClientVersion() const { return clientVersion; }
  uint32_t& getClientVersion() { return clientVersion; }

  const config_list& getConfig() const { return config; }
  config_list& getConfig() { return config; }

  const std::vector<std::string>& getTaskNames() const { return taskNames; }
  std::vector<std::string>& getTaskNames() { return taskNames; }

  const std::vector<std::string>& getToolNames() const { return toolNames; }
  std::vector<std::string>& getToolNames() { return toolNames; }

  const property_list& getPackages() const { return packages; }
  property_list& getPackages() { return packages; }

  const property_list& getToolRequires() const { return toolRequires; }
  property_list& getToolRequires() { return toolRequires; }

  const std::vector<TaskDefinition>& getTaskDefinitions() const {
    return taskDefinitions;
  }
  std::vector<TaskDefinition>& getTaskDefinitions() {
    return taskDefinitions;
  }

  /// Find the definition of \arg name, if any.
  const TaskDefinition* lookupTaskDefinition(StringRef name) const {
    for (const auto& definition: taskDefinitions) {
      if (definition.name == name)
        return &definition;
    }
    return nullptr;
  }
};

}
}

#endif
