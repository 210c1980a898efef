//===-- TaskEngine.cpp ----------------------------------------------------===//
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

#include "mkdone/Core/TaskEngine.h"

#include "mkdone/Basic/Clock.h"
#include "mkdone/Basic/FileSystem.h"
#include "mkdone/Basic/Subprocess.h"
#include "mkdone/Core/RunJournal.h"
#include "mkdone/Core/StampStore.h"
#include "mkdone/Core/TaskRegistry.h"

#include "llvm/ADT/StringMap.h"
#include "llvm/ADT/StringSet.h"

#include <algorithm>
#include <cassert>
#include <vector>

using namespace mkdone;
using namespace mkdone::core;

TaskEngineDelegate::~TaskEngineDelegate() {}

void TaskEngineDelegate::ruleStarted(const Rule&, const Staleness&) {}

void TaskEngineDelegate::ruleUpToDate(const Rule&) {}

void TaskEngineDelegate::note(const Twine&) {}

#pragma mark - StampRule

namespace {

/// The rule producing the stamp of a task.
class StampRule : public Rule {
  const Task& task;

  static std::vector<std::string> getPrerequisites(const TaskRegistry& registry,
                                                   const Task& task) {
    std::vector<std::string> result;
    const RunOperation* operation = task.getRunOperation();
    if (!operation)
      return result;

    result.insert(result.end(), operation->inputs.begin(),
                  operation->inputs.end());
    for (const auto& name: operation->requiredTasks) {
      const Task* required = registry.lookupTask(name);
      assert(required && "registry was not validated");
      result.push_back(required->getStampPath().str());
    }
    result.insert(result.end(), operation->requiredTools.begin(),
                  operation->requiredTools.end());
    return result;
  }

public:
  StampRule(const TaskRegistry& registry, const Task& task)
    : Rule(Kind::Stamp, task.getName(), task.getStampPath(),
           getPrerequisites(registry, task)),
      task(task) {}

  virtual bool execute(RuleCommandInterface& commandInterface) override {
    const RunOperation* operation = task.getRunOperation();
    if (!operation) {
      commandInterface.error("no run operation defined for task '" +
                             task.getName() + "'");
      return false;
    }

    for (const auto& command: operation->commands) {
      if (!commandInterface.runShellCommand(task.getName(), command))
        return false;
    }

    // The stamp is only touched once all of the work has succeeded.
    std::string error;
    if (!commandInterface.getStampStore().touch(task.getStampPath(), &error)) {
      commandInterface.error(error);
      return false;
    }
    return true;
  }
};

#pragma mark - TaskEngineImpl

class TaskEngineImpl : public RuleCommandInterface {
  TaskRegistry& registry;

  basic::CommandRunner& runner;

  TaskEngineDelegate& delegate;

  RunJournal* journal = nullptr;

  /// The rules, keyed by target path.
  llvm::StringMap<std::unique_ptr<Rule>> rules;

  llvm::StringMap<std::string> aliases;

  /// The kind recorded in the journal for commands being run.
  RunRecord::Kind currentKind = RunRecord::Kind::Task;

  /// @name Build State
  /// @{

  /// The targets already brought up to date during the current operation.
  llvm::StringSet<> completedTargets;

  /// The stack of rules currently being built, used to detect cycles.
  std::vector<const Rule*> activeRules;

  /// @}

  static RunRecord::Kind getRecordKind(Rule::Kind kind) {
    switch (kind) {
    case Rule::Kind::Stamp: return RunRecord::Kind::Task;
    case Rule::Kind::Tool: return RunRecord::Kind::Tool;
    case Rule::Kind::Environment: return RunRecord::Kind::Environment;
    }
    return RunRecord::Kind::Task;
  }

  /// Report the cycle closed by \arg rule, if it is active.
  bool checkForCycle(const Rule* rule) {
    auto it = std::find(activeRules.begin(), activeRules.end(), rule);
    if (it == activeRules.end())
      return false;

    std::vector<const Rule*> cycle(it, activeRules.end());
    cycle.push_back(rule);
    delegate.cycleDetected(cycle);
    return true;
  }

  bool buildTarget(StringRef target, const Rule* requester) {
    if (completedTargets.count(target))
      return true;

    auto it = rules.find(target);
    if (it == rules.end()) {
      // A plain file, which must exist.
      if (getFileSystem().getFileInfo(target.str()).isMissing()) {
        if (requester) {
          delegate.error("no rule to make '" + target + "', needed by '" +
                         requester->getName() + "'");
        } else {
          delegate.error("no rule to make '" + target + "'");
        }
        return false;
      }
      completedTargets.insert(target);
      return true;
    }

    Rule* rule = it->second.get();
    if (checkForCycle(rule))
      return false;

    if (rule->isExistenceOnly() &&
        !getFileSystem().getFileInfo(target.str()).isMissing()) {
      delegate.ruleUpToDate(*rule);
      completedTargets.insert(target);
      return true;
    }

    activeRules.push_back(rule);
    for (const auto& prerequisite: rule->getPrerequisites()) {
      if (!buildTarget(prerequisite, rule)) {
        activeRules.pop_back();
        return false;
      }
    }
    activeRules.pop_back();

    Staleness staleness = rule->checkStaleness(getFileSystem());
    if (!staleness.isStale()) {
      delegate.ruleUpToDate(*rule);
      completedTargets.insert(target);
      return true;
    }

    delegate.ruleStarted(*rule, staleness);
    currentKind = getRecordKind(rule->getKind());
    if (!rule->execute(*this))
      return false;

    if (getFileSystem().getFileInfo(target.str()).isMissing()) {
      delegate.error("'" + rule->getName() + "' did not produce '" + target +
                     "'");
      return false;
    }

    completedTargets.insert(target);
    return true;
  }

  Staleness checkTarget(StringRef target,
                        llvm::StringMap<Staleness>& results) {
    auto result = results.find(target);
    if (result != results.end())
      return result->second;

    auto it = rules.find(target);
    if (it == rules.end()) {
      if (getFileSystem().getFileInfo(target.str()).isMissing())
        return Staleness(Staleness::Kind::TargetMissing);
      return Staleness();
    }

    const Rule* rule = it->second.get();
    if (checkForCycle(rule))
      return Staleness(Staleness::Kind::PrerequisiteStale, target);

    if (rule->isExistenceOnly()) {
      Staleness staleness = rule->checkStaleness(getFileSystem());
      if (!staleness.isStale()) {
        results[target] = staleness;
        return staleness;
      }
    }

    activeRules.push_back(rule);
    Staleness staleness;
    for (const auto& prerequisite: rule->getPrerequisites()) {
      Staleness prerequisiteStaleness = checkTarget(prerequisite, results);
      if (!prerequisiteStaleness.isStale())
        continue;

      if (rules.count(prerequisite)) {
        staleness = Staleness(Staleness::Kind::PrerequisiteStale,
                              prerequisite);
      } else {
        staleness = Staleness(Staleness::Kind::PrerequisiteMissing,
                              prerequisite);
      }
      break;
    }
    activeRules.pop_back();

    if (!staleness.isStale())
      staleness = rule->checkStaleness(getFileSystem());
    results[target] = staleness;
    return staleness;
  }

public:
  TaskEngineImpl(TaskRegistry& registry, basic::CommandRunner& runner,
                 TaskEngineDelegate& delegate)
    : registry(registry), runner(runner), delegate(delegate)
  {
    assert(registry.isFinalized() && "registration is not complete");
    for (const Task* task: registry.getTasks()) {
      rules[task->getStampPath()] = std::make_unique<StampRule>(registry,
                                                                *task);
    }
  }

  TaskRegistry& getRegistry() { return registry; }

  TaskEngineDelegate& getDelegate() { return delegate; }

  /// @name RuleCommandInterface Implementation
  /// @{

  virtual basic::FileSystem& getFileSystem() override {
    return registry.getStampStore().getFileSystem();
  }

  virtual StampStore& getStampStore() override {
    return registry.getStampStore();
  }

  virtual bool runShellCommand(StringRef owner, StringRef command) override {
    delegate.commandStarted(owner, command);

    RunRecord record;
    record.kind = currentKind;
    record.owner = owner.str();
    record.command = command.str();
    record.start = basic::Clock::now();
    basic::ProcessResult result = runner.executeShellCommand(command);
    record.end = basic::Clock::now();
    record.exitStatus = result.exitStatus;

    delegate.commandFinished(owner, command, result);

    if (journal) {
      std::string error;
      if (!journal->recordRun(record, &error)) {
        // Stop recording, the journal has no bearing on the build.
        delegate.error("unable to record command: " + error);
        journal = nullptr;
      }
    }

    if (result.executionFailed) {
      delegate.error("unable to execute command for '" + owner + "': " +
                     result.errorMessage);
      return false;
    }
    if (result.exitStatus != 0) {
      delegate.error("command for '" + owner + "' failed with exit status " +
                     Twine(result.exitStatus));
      return false;
    }
    return true;
  }

  virtual void error(const Twine& message) override {
    delegate.error(message);
  }

  virtual void note(const Twine& message) override {
    delegate.note(message);
  }

  /// @}

  /// @name Client API
  /// @{

  bool addRule(std::unique_ptr<Rule> rule, std::string* error_out) {
    StringRef target = rule->getTarget();
    if (rules.count(target)) {
      *error_out = "duplicate rule for '" + target.str() + "'";
      return false;
    }
    rules[target] = std::move(rule);
    return true;
  }

  bool addAlias(StringRef name, StringRef target, std::string* error_out) {
    if (aliases.count(name) || registry.lookupTask(name)) {
      *error_out = "duplicate target name '" + name.str() + "'";
      return false;
    }
    aliases[name] = target.str();
    return true;
  }

  const Rule* lookupRule(StringRef target) {
    auto it = rules.find(target);
    if (it == rules.end())
      return nullptr;
    return it->second.get();
  }

  std::string resolveTarget(StringRef name) {
    auto it = aliases.find(name);
    if (it != aliases.end())
      return it->second;
    if (const Task* task = registry.lookupTask(name))
      return task->getStampPath().str();
    return name.str();
  }

  void setJournal(RunJournal* journal) {
    this->journal = journal;
  }

  bool build(StringRef target) {
    completedTargets.clear();
    activeRules.clear();
    return buildTarget(resolveTarget(target), nullptr);
  }

  bool runTask(StringRef name) {
    const Task* task = registry.lookupTask(name);
    if (!task) {
      delegate.error("unknown task '" + name + "'");
      return false;
    }

    if (!cleanTask(name))
      return false;
    return build(task->getStampPath());
  }

  bool cleanTask(StringRef name) {
    const Task* task = registry.lookupTask(name);
    if (!task) {
      delegate.error("unknown task '" + name + "'");
      return false;
    }

    currentKind = RunRecord::Kind::Clean;
    if (!task->getCleanOperation().execute(*task, *this))
      return false;

    if (getStampStore().exists(task->getStampPath())) {
      delegate.error("'" + task->getCleanName() +
                     "' did not remove the stamp of '" + name + "'");
      return false;
    }
    completedTargets.erase(task->getStampPath());
    return true;
  }

  bool cleanAll() {
    bool success = true;
    for (const auto& stamp: registry.getAllStamps()) {
      std::string error;
      if (!getStampStore().remove(stamp, &error)) {
        delegate.error(error);
        success = false;
      }
    }
    completedTargets.clear();
    return success;
  }

  Staleness checkTarget(StringRef target) {
    llvm::StringMap<Staleness> results;
    activeRules.clear();
    return checkTarget(resolveTarget(target), results);
  }

  /// @}
};

}

#pragma mark - TaskEngine

TaskEngine::TaskEngine(TaskRegistry& registry, basic::CommandRunner& runner,
                       TaskEngineDelegate& delegate)
  : impl(new TaskEngineImpl(registry, runner, delegate))
{
}

TaskEngine::~TaskEngine() {
  delete static_cast<TaskEngineImpl*>(impl);
}

TaskRegistry& TaskEngine::getRegistry() {
  return static_cast<TaskEngineImpl*>(impl)->getRegistry();
}

TaskEngineDelegate& TaskEngine::getDelegate() {
  return static_cast<TaskEngineImpl*>(impl)->getDelegate();
}

bool TaskEngine::addRule(std::unique_ptr<Rule> rule, std::string* error_out) {
  return static_cast<TaskEngineImpl*>(impl)->addRule(std::move(rule),
                                                     error_out);
}

bool TaskEngine::addAlias(StringRef name, StringRef target,
                          std::string* error_out) {
  return static_cast<TaskEngineImpl*>(impl)->addAlias(name, target, error_out);
}

const Rule* TaskEngine::lookupRule(StringRef target) {
  return static_cast<TaskEngineImpl*>(impl)->lookupRule(target);
}

std::string TaskEngine::resolveTarget(StringRef name) {
  return static_cast<TaskEngineImpl*>(impl)->resolveTarget(name);
}

void TaskEngine::setJournal(RunJournal* journal) {
  static_cast<TaskEngineImpl*>(impl)->setJournal(journal);
}

bool TaskEngine::build(StringRef target) {
  return static_cast<TaskEngineImpl*>(impl)->build(target);
}

bool TaskEngine::runTask(StringRef name) {
  return static_cast<TaskEngineImpl*>(impl)->runTask(name);
}

bool TaskEngine::cleanTask(StringRef name) {
  return static_cast<TaskEngineImpl*>(impl)->cleanTask(name);
}

bool TaskEngine::cleanAll() {
  return static_cast<TaskEngineImpl*>(impl)->cleanAll();
}

Staleness TaskEngine::checkTarget(StringRef target) {
  return static_cast<TaskEngineImpl*>(impl)->checkTarget(target);
}
