//===- TaskEngine.h ---------------------------------------------*- C++ -*-===//
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
// This file declares the engine which brings task stamps, provisioned tools
// and plain files up to date by comparing modification times, in the manner
// of make.
//
//===----------------------------------------------------------------------===//

#ifndef MKDONE_CORE_TASKENGINE_H
#define MKDONE_CORE_TASKENGINE_H

#include "mkdone/Basic/Compiler.h"
#include "mkdone/Basic/LLVM.h"
#include "mkdone/Core/Rule.h"

#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/ADT/Twine.h"

#include <memory>
#include <string>

namespace mkdone {
namespace basic {

class CommandRunner;
struct ProcessResult;

}

namespace core {

class RunJournal;
class TaskRegistry;

/// Delegate interface for receiving progress and diagnostics from the engine.
class TaskEngineDelegate {
public:
  virtual ~TaskEngineDelegate();

  /// Called when a rule is about to execute because its target is stale.
  virtual void ruleStarted(const Rule& rule, const Staleness& reason);

  /// Called when a rule target was found to be up to date.
  virtual void ruleUpToDate(const Rule& rule);

  /// Called immediately before \arg command is run on behalf of \arg owner.
  virtual void commandStarted(StringRef owner, StringRef command) = 0;

  /// Called once \arg command has completed, successfully or not.
  virtual void commandFinished(StringRef owner, StringRef command,
                               const basic::ProcessResult& result) = 0;

  /// Called to report an error. The operation in progress will fail.
  virtual void error(const Twine& message) = 0;

  /// Called to report an informational message.
  virtual void note(const Twine& message);

  /// Called when the rules form a cycle.
  ///
  /// \param cycle The rules on the cycle, starting and ending with the same
  /// rule.
  virtual void cycleDetected(ArrayRef<const Rule*> cycle) = 0;
};

/// The engine executing tasks.
///
/// The engine owns one rule for each task of a finalized \see TaskRegistry,
/// producing the task stamp, and any number of additional rules registered by
/// clients (for example to provision tools). Rules are keyed by the path of
/// their target; a prerequisite path with no rule is a plain file which must
/// already exist.
///
/// All work is performed serially on the calling thread.
class TaskEngine {
  void* impl;

  TaskEngine(const TaskEngine&) MKDONE_DELETED_FUNCTION;
  void operator=(const TaskEngine&) MKDONE_DELETED_FUNCTION;

public:
  /// Create an engine for the tasks of \arg registry.
  ///
  /// \param registry The task registry, which must be finalized.
  /// \param runner The object used to run commands.
  /// \param delegate The delegate receiving progress and diagnostics.
  TaskEngine(TaskRegistry& registry, basic::CommandRunner& runner,
             TaskEngineDelegate& delegate);
  ~TaskEngine();

  TaskRegistry& getRegistry();

  TaskEngineDelegate& getDelegate();

  /// @name Rule Definition
  /// @{

  /// Add a rule producing its target.
  ///
  /// \param error_out [out] Error string if return value is false.
  /// \returns False if a rule for the same target already exists.
  bool addRule(std::unique_ptr<Rule> rule, std::string* error_out);

  /// Add a name which may be used in place of the path \arg target.
  ///
  /// \param error_out [out] Error string if return value is false.
  bool addAlias(StringRef name, StringRef target, std::string* error_out);

  /// Get the rule producing \arg target, or null if it is a plain file.
  const Rule* lookupRule(StringRef target);

  /// Resolve a target name: an alias, a task name (resolving to its stamp)
  /// or a path.
  std::string resolveTarget(StringRef name);

  /// Record every executed command in \arg journal, which must outlive the
  /// engine. Passing null stops recording.
  void setJournal(RunJournal* journal);

  /// @}

  /// @name Execution
  /// @{

  /// Bring \arg target up to date.
  ///
  /// Every prerequisite is brought up to date first, depth first. Execution
  /// stops at the first failure.
  ///
  /// \returns True if the target is up to date on return.
  bool build(StringRef target);

  /// Unconditionally rerun the task \arg name, by running its clean operation
  /// and then bringing its stamp up to date.
  bool runTask(StringRef name);

  /// Run the clean operation of the task \arg name.
  bool cleanTask(StringRef name);

  /// Remove every stamp of the registry.
  ///
  /// All stamps are attempted even if removing one fails.
  bool cleanAll();

  /// Determine whether \arg target, or anything it depends on, would be
  /// executed by \see build(). Nothing is executed.
  Staleness checkTarget(StringRef target);

  bool isUpToDate(StringRef target) {
    return !checkTarget(target).isStale();
  }

  /// @}
};

}
}

#endif
