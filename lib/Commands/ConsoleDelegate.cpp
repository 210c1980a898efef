//===-- ConsoleDelegate.cpp -----------------------------------------------===//
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

#include "ConsoleDelegate.h"
#include "CommandUtil.h"

#include "mkdone/Basic/Subprocess.h"
#include "mkdone/Commands/Commands.h"

#include "llvm/ADT/Twine.h"
#include "llvm/Support/raw_ostream.h"

using namespace mkdone;
using namespace mkdone::commands;

void ConsoleBuildFileDelegate::setFileContentsBeingParsed(StringRef buffer) {
  bufferBeingParsed = buffer;
}

void ConsoleBuildFileDelegate::error(StringRef filename,
                                     const buildfile::BuildFileToken& at,
                                     const Twine& message) {
  if (at.start) {
    util::emitError(filename, message.str(), at.start, at.length,
                    bufferBeingParsed);
  } else {
    llvm::errs() << filename << ": error: " << message << "\n";
  }
}

void ConsoleEngineDelegate::ruleStarted(const core::Rule& rule,
                                        const core::Staleness& reason) {
  if (!quiet) {
    note("building '" + rule.getName() + "' (" + reason.getDescription() +
         ")");
  }
}

void ConsoleEngineDelegate::ruleUpToDate(const core::Rule& rule) {
  if (verbose)
    note("'" + rule.getName() + "' is up to date");
}

void ConsoleEngineDelegate::commandStarted(StringRef owner,
                                           StringRef command) {
  ++numCommands;
  if (verbose) {
    llvm::outs() << command << "\n";
    llvm::outs().flush();
  }
}

void ConsoleEngineDelegate::commandFinished(StringRef owner,
                                            StringRef command,
                                            const basic::ProcessResult&) {
  // Flush before the next command writes to the same terminal.
  llvm::outs().flush();
}

static void emitDiagnostic(StringRef kind, const Twine& message) {
  auto& os = llvm::errs();
  os << kind << ": ";
  if (const char* programName = getProgramName())
    os << programName << ": ";
  os << message << "\n";
}

void ConsoleEngineDelegate::error(const Twine& message) {
  ++numErrors;
  emitDiagnostic("error", message);
}

void ConsoleEngineDelegate::note(const Twine& message) {
  if (quiet)
    return;
  emitDiagnostic("note", message);
}

void ConsoleEngineDelegate::cycleDetected(
    ArrayRef<const core::Rule*> cycle) {
  std::string message;
  llvm::raw_string_ostream os(message);
  os << "cycle detected among targets:";
  bool first = true;
  for (const auto* rule: cycle) {
    os << (first ? " " : " -> ") << "'" << rule->getName() << "'";
    first = false;
  }
  os.flush();
  error(message);
}
