//===-- StatusCommand.cpp -------------------------------------------------===//
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

#include "mkdone/Commands/Commands.h"

#include "CommandUtil.h"
#include "ConsoleDelegate.h"

#include "mkdone/Basic/FileSystem.h"
#include "mkdone/Basic/Subprocess.h"
#include "mkdone/BuildFile/Project.h"
#include "mkdone/Core/TaskEngine.h"
#include "mkdone/Core/TaskRegistry.h"
#include "mkdone/Env/ToolRegistry.h"

#include "llvm/Support/raw_ostream.h"

#include <cstdio>
#include <cstdlib>

using namespace mkdone;
using namespace mkdone::commands;

static void statusUsage(int exitCode) {
  fprintf(stderr, "Usage: %s status [options] [<key>=<value>...] [<target>...]\n",
          getProgramName());
  fprintf(stderr, "\nOptions:\n");
  util::printProjectOptions(/*allowJournal=*/false);
  fprintf(stderr,
          "\nWith targets, the exit status is 1 if any of them is stale.\n");
  ::exit(exitCode);
}

static void printStatus(StringRef label, const core::Staleness& staleness) {
  llvm::outs() << label << ": ";
  if (staleness.isStale()) {
    llvm::outs() << "stale (" << staleness.getDescription() << ")\n";
  } else {
    llvm::outs() << "up to date\n";
  }
}

int commands::executeStatusCommand(const std::vector<std::string> &args) {
  util::ProjectInvocation invocation;
  invocation.parse(args, /*allowJournal=*/false);

  if (invocation.showUsage) {
    statusUsage(0);
  } else if (invocation.hadErrors) {
    statusUsage(1);
  }

  auto fileSystem = basic::createLocalFileSystem();
  auto project = util::loadProject(invocation, *fileSystem);
  if (!project)
    return 1;

  // Nothing is executed, the runner is only needed to construct the engine.
  auto runner = basic::createLocalCommandRunner();
  ConsoleEngineDelegate delegate(invocation.verbose, invocation.quiet);
  core::TaskEngine engine(project->getTaskRegistry(), *runner, delegate);
  std::string error;
  if (!project->addRules(engine, &error)) {
    delegate.error(error);
    return 1;
  }

  if (!invocation.positionalArgs.empty()) {
    bool anyStale = false;
    for (const auto& target: invocation.positionalArgs) {
      core::Staleness staleness = engine.checkTarget(target);
      printStatus(target, staleness);
      anyStale |= staleness.isStale();
    }
    return (anyStale || delegate.getNumErrors()) ? 1 : 0;
  }

  printStatus("env", engine.checkTarget("env"));
  for (const env::Tool* tool: project->getToolRegistry().getTools()) {
    printStatus(tool->getInstallName(),
                engine.checkTarget(tool->getInstallName()));
  }
  for (const core::Task* task: project->getTaskRegistry().getTasks()) {
    printStatus(task->getName(), engine.checkTarget(task->getName()));
  }
  return delegate.getNumErrors() ? 1 : 0;
}
