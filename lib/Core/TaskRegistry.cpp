//===-- TaskRegistry.cpp --------------------------------------------------===//
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

#include "mkdone/Core/TaskRegistry.h"

#include "mkdone/Core/Rule.h"
#include "mkdone/Core/StampStore.h"

#include <cassert>

using namespace mkdone;
using namespace mkdone::core;

CleanOperation::~CleanOperation() {}

namespace {

class RemoveStampCleanOperation : public CleanOperation {
public:
  virtual bool execute(const Task& task,
                       RuleCommandInterface& commandInterface) override {
    std::string error;
    if (!commandInterface.getStampStore().remove(task.getStampPath(),
                                                 &error)) {
      commandInterface.error(error);
      return false;
    }
    return true;
  }
};

class CommandCleanOperation : public CleanOperation {
  std::vector<std::string> commands;

public:
  explicit CommandCleanOperation(std::vector<std::string> commands)
    : commands(std::move(commands)) {}

  virtual bool execute(const Task& task,
                       RuleCommandInterface& commandInterface) override {
    for (const auto& command: commands) {
      if (!commandInterface.runShellCommand(task.getCleanName(), command))
        return false;
    }

    // Removing the stamp is part of this operation's contract.
    std::string error;
    if (!commandInterface.getStampStore().remove(task.getStampPath(),
                                                 &error)) {
      commandInterface.error(error);
      return false;
    }
    return true;
  }
};

}

std::unique_ptr<CleanOperation> core::createRemoveStampCleanOperation() {
  return std::make_unique<RemoveStampCleanOperation>();
}

std::unique_ptr<CleanOperation>
core::createCommandCleanOperation(std::vector<std::string> commands) {
  return std::make_unique<CommandCleanOperation>(std::move(commands));
}

TaskRegistry::TaskRegistry(StampStore& stampStore) : stampStore(stampStore) {}

TaskRegistry::~TaskRegistry() {}

Task* TaskRegistry::declareTask(StringRef name, std::string* error_out) {
  return declareTask(name, CleanOverride(), error_out);
}

Task* TaskRegistry::declareTask(StringRef name, CleanOverride cleanOverride,
                                std::string* error_out) {
  if (finalized) {
    *error_out = "cannot declare task '" + name.str() +
      "' after registration is complete";
    return nullptr;
  }

  // Redundant declarations are expected when a task is named from more than
  // one place.
  auto it = tasks.find(name);
  if (it != tasks.end())
    return it->second.get();

  if (name.empty()) {
    *error_out = "invalid empty task name";
    return nullptr;
  }

  // Task names and clean names share one namespace.
  auto cleanIt = tasksByCleanName.find(name);
  if (cleanIt != tasksByCleanName.end()) {
    *error_out = "task '" + name.str() +
      "' conflicts with the clean operation of task '" +
      cleanIt->second->getName().str() + "'";
    return nullptr;
  }

  std::string cleanName = cleanOverride.name.empty() ?
    (name + "-clean").str() : cleanOverride.name;
  if (cleanName == name || tasks.count(cleanName)) {
    *error_out = "clean operation '" + cleanName + "' for task '" +
      name.str() + "' conflicts with a task of the same name";
    return nullptr;
  }
  if (tasksByCleanName.count(cleanName)) {
    *error_out = "clean operation '" + cleanName + "' for task '" +
      name.str() + "' is already used by task '" +
      tasksByCleanName[cleanName]->getName().str() + "'";
    return nullptr;
  }

  bool isCustom = cleanOverride.operation != nullptr;
  std::unique_ptr<CleanOperation> cleanOperation = isCustom ?
    std::move(cleanOverride.operation) : createRemoveStampCleanOperation();

  auto task = std::make_unique<Task>(name, stampStore.getStampPath(name),
                                     cleanName, std::move(cleanOperation),
                                     isCustom);
  Task* result = task.get();
  tasks[name] = std::move(task);
  taskList.push_back(result);
  tasksByCleanName[cleanName] = result;
  allStamps.push_back(result->getStampPath().str());
  return result;
}

bool TaskRegistry::defineRunOperation(StringRef name, RunOperation operation,
                                      std::string* error_out) {
  if (finalized) {
    *error_out = "cannot define task '" + name.str() +
      "' after registration is complete";
    return false;
  }

  auto it = tasks.find(name);
  if (it == tasks.end()) {
    *error_out = "cannot define undeclared task '" + name.str() + "'";
    return false;
  }

  Task& task = *it->second;
  if (task.runOperationDefined) {
    *error_out = "task '" + name.str() + "' is already defined";
    return false;
  }

  task.runOperation = std::move(operation);
  task.runOperationDefined = true;
  return true;
}

bool TaskRegistry::finalizeRegistration(std::string* error_out) {
  assert(!finalized && "registration already finalized");

  for (const Task* task: taskList) {
    const RunOperation* operation = task->getRunOperation();
    if (!operation)
      continue;

    for (const auto& required: operation->requiredTasks) {
      if (!tasks.count(required)) {
        *error_out = "task '" + task->getName().str() +
          "' requires undeclared task '" + required + "'";
        return false;
      }
    }
  }

  finalized = true;
  return true;
}

const Task* TaskRegistry::lookupTask(StringRef name) const {
  auto it = tasks.find(name);
  if (it == tasks.end())
    return nullptr;
  return it->second.get();
}

const Task* TaskRegistry::lookupTaskByCleanName(StringRef cleanName) const {
  auto it = tasksByCleanName.find(cleanName);
  if (it == tasksByCleanName.end())
    return nullptr;
  return it->second;
}
