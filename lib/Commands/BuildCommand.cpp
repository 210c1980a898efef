//===-- BuildCommand.cpp --------------------------------------------------===//
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
// This file implements the 'build' command, the make-like front end of the
// task engine.
//
//===----------------------------------------------------------------------===//

#include "mkdone/Commands/Commands.h"

#include "CommandUtil.h"
#include "ConsoleDelegate.h"

#include "mkdone/Basic/Clock.h"
#include "mkdone/Basic/FileSystem.h"
#include "mkdone/Basic/Subprocess.h"
#include "mkdone/BuildFile/Project.h"
#include "mkdone/Core/RunJournal.h"
#include "mkdone/Core/TaskEngine.h"
#include "mkdone/Core/TaskRegistry.h"

#include <cstdio>
#include <cstdlib>

using namespace mkdone;
using namespace mkdone::commands;

static void buildUsage(int exitCode) {
  int optionWidth = 25;
  fprintf(stderr, "Usage: %s build [options] [<key>=<value>...] [<target>...]\n",
          getProgramName());
  fprintf(stderr, "\nOptions:\n");
  util::printProjectOptions(/*allowJournal=*/true);
  fprintf(stderr, "\nTargets:\n");
  fprintf(stderr, "  %-*s %s\n", optionWidth, "<task>",
          "clean and rerun the task");
  fprintf(stderr, "  %-*s %s\n", optionWidth, "<task>-clean",
          "run the clean operation of the task");
  fprintf(stderr, "  %-*s %s\n", optionWidth, "<tool>-install",
          "install the tool, if missing");
  fprintf(stderr, "  %-*s %s\n", optionWidth, "clean",
          "remove every task stamp");
  fprintf(stderr, "  %-*s %s\n", optionWidth, "env",
          "provision the environment, if missing");
  fprintf(stderr, "  %-*s %s\n", optionWidth, "env-realclean",
          "remove the environment");
  fprintf(stderr, "  %-*s %s\n", optionWidth, "<path>",
          "bring the path up to date");
  fprintf(stderr,
          "\nWith no target, every task is brought up to date in order.\n");
  ::exit(exitCode);
}

int commands::executeBuildCommand(const std::vector<std::string> &args) {
  util::ProjectInvocation invocation;
  invocation.parse(args, /*allowJournal=*/true);

  // Handle invocation actions.
  if (invocation.showUsage) {
    buildUsage(0);
  } else if (invocation.hadErrors) {
    buildUsage(1);
  }

  auto fileSystem = basic::createLocalFileSystem();
  auto project = util::loadProject(invocation, *fileSystem);
  if (!project)
    return 1;

  auto runner = basic::createLocalCommandRunner();
  ConsoleEngineDelegate delegate(invocation.verbose, invocation.quiet);
  core::TaskEngine engine(project->getTaskRegistry(), *runner, delegate);
  std::string error;
  if (!project->addRules(engine, &error)) {
    delegate.error(error);
    return 1;
  }

  // Open the journal, if requested.
  std::unique_ptr<core::RunJournal> journal;
  if (!invocation.journalPath.empty()) {
    journal = core::createSQLiteRunJournal(invocation.journalPath, &error);
    if (!journal || !journal->beginSession(basic::Clock::now(), &error)) {
      delegate.error("unable to open run journal: " + error);
      return 1;
    }
    engine.setJournal(journal.get());
  }

  // With no explicit target, bring every task up to date.
  std::vector<std::string> targets = invocation.positionalArgs;
  bool success = true;
  if (targets.empty()) {
    for (const core::Task* task: project->getTaskRegistry().getTasks()) {
      if (!engine.build(task->getName())) {
        success = false;
        break;
      }
    }
  } else {
    for (const auto& target: targets) {
      if (!project->buildTarget(engine, target)) {
        success = false;
        break;
      }
    }
  }

  engine.setJournal(nullptr);
  if (!success)
    return 1;

  if (delegate.getNumCommands() == 0)
    delegate.note("nothing to be done");
  return 0;
}
