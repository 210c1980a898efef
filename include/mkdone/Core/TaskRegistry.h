//===- TaskRegistry.h -------------------------------------------*- C++ -*-===//
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
//
// This file declares the registry of tasks: the explicit replacement of a
// per-name target template. Declaring a task name generates its stamp, its
// clean operation and its entry in the collection of all stamps, exactly once
// no matter how many times the name is declared.
//
//===----------------------------------------------------------------------===//

#ifndef MKDONE_CORE_TASKREGISTRY_H
#define MKDONE_CORE_TASKREGISTRY_H

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

class RuleCommandInterface;
class StampStore;
class Task;

/// The work performed to complete a task.
struct RunOperation {
  /// Paths which must exist, and whose modification time is compared against
  /// the task stamp.
  std::vector<std::string> inputs;

  /// Names of tasks whose stamps are prerequisites of this task.
  std::vector<std::string> requiredTasks;

  /// Command paths of provisioned tools used by the commands. These are
  /// prerequisites of the task in the same way as \see inputs, and bringing
  /// the task up to date installs any which are missing.
  std::vector<std::string> requiredTools;

  /// The shell commands doing the actual work, run in order.
  std::vector<std::string> commands;
};

/// An operation which invalidates a task.
///
/// Implementations must leave the task stamp removed when they succeed; the
/// engine never removes the stamp on their behalf.
class CleanOperation {
public:
  virtual ~CleanOperation();

  /// Invalidate \arg task.
  ///
  /// \returns True on success, in which case the stamp no longer exists.
  virtual bool execute(const Task& task,
                       RuleCommandInterface& commandInterface) = 0;
};

/// Create the default clean operation, which only removes the stamp.
std::unique_ptr<CleanOperation> createRemoveStampCleanOperation();

/// Create a clean operation which runs \arg commands, then removes the stamp.
std::unique_ptr<CleanOperation>
createCommandCleanOperation(std::vector<std::string> commands);

/// A custom clean operation supplied when a task is declared.
struct CleanOverride {
  /// The name of the clean operation, or empty for "<task>-clean".
  std::string name;

  /// The operation, or null for the default.
  std::unique_ptr<CleanOperation> operation;
};

/// A declared task.
class Task {
  std::string name;

  std::string stampPath;

  std::string cleanName;

  std::unique_ptr<CleanOperation> cleanOperation;

  bool customCleanOperation;

  bool runOperationDefined = false;

  RunOperation runOperation;

  friend class TaskRegistry;

  Task(const Task&) MKDONE_DELETED_FUNCTION;
  void operator=(const Task&) MKDONE_DELETED_FUNCTION;

public:
  Task(StringRef name, StringRef stampPath, StringRef cleanName,
       std::unique_ptr<CleanOperation> cleanOperation,
       bool customCleanOperation)
    : name(name), stampPath(stampPath), cleanName(cleanName),
      cleanOperation(std::move(cleanOperation)),
      customCleanOperation(customCleanOperation) {}

  StringRef getName() const { return name; }

  StringRef getStampPath() const { return stampPath; }

  StringRef getCleanName() const { return cleanName; }

  CleanOperation& getCleanOperation() const { return *cleanOperation; }

  bool hasCustomCleanOperation() const { return customCleanOperation; }

  /// Get the run operation, or null if none has been defined.
  const RunOperation* getRunOperation() const {
    return runOperationDefined ? &runOperation : nullptr;
  }
};

/// The registry of all declared tasks.
///
/// The registry has two phases. During registration tasks are declared and
/// their run operations defined; \see finalizeRegistration() validates the
/// result and closes the registry, after which it is read-only.
class TaskRegistry {
  StampStore& stampStore;

  llvm::StringMap<std::unique_ptr<Task>> tasks;

  /// The tasks, in declaration order.
  std::vector<Task*> taskList;

  llvm::StringMap<Task*> tasksByCleanName;

  /// The stamps of every declared task, each appended once.
  std::vector<std::string> allStamps;

  bool finalized = false;

  TaskRegistry(const TaskRegistry&) MKDONE_DELETED_FUNCTION;
  void operator=(const TaskRegistry&) MKDONE_DELETED_FUNCTION;

public:
  explicit TaskRegistry(StampStore& stampStore);
  ~TaskRegistry();

  StampStore& getStampStore() const { return stampStore; }

  /// @name Registration
  /// @{

  /// Declare the task \arg name.
  ///
  /// The first declaration of a name creates the task, its stamp path, its
  /// default clean operation and its entry in \see getAllStamps(). Any later
  /// declaration of the same name returns the existing task unchanged.
  ///
  /// \param error_out [out] Error string if the return value is null.
  /// \returns The task, or null if the registry is finalized.
  Task* declareTask(StringRef name, std::string* error_out);

  /// Declare the task \arg name with a custom clean operation.
  ///
  /// The override only applies to the first declaration of the name.
  ///
  /// \param error_out [out] Error string if the return value is null.
  /// \returns The task, or null on error.
  Task* declareTask(StringRef name, CleanOverride cleanOverride,
                    std::string* error_out);

  /// Define the run operation of the declared task \arg name.
  ///
  /// \param error_out [out] Error string if return value is false.
  bool defineRunOperation(StringRef name, RunOperation operation,
                          std::string* error_out);

  /// Close the registration phase.
  ///
  /// \param error_out [out] Error string if return value is false.
  /// \returns False if a run operation requires an undeclared task.
  bool finalizeRegistration(std::string* error_out);

  bool isFinalized() const { return finalized; }

  /// @}

  /// @name Queries
  /// @{

  const Task* lookupTask(StringRef name) const;

  const Task* lookupTaskByCleanName(StringRef cleanName) const;

  /// Get all tasks, in declaration order.
  ArrayRef<Task*> getTasks() const { return taskList; }

  /// Get the stamps of all declared tasks.
  ArrayRef<std::string> getAllStamps() const { return allStamps; }

  /// @}
};

}
}

#endif
