//===-- JournalCommand.cpp ------------------------------------------------===//
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

#include "mkdone/Core/RunJournal.h"

#include "llvm/Support/Format.h"
#include "llvm/Support/raw_ostream.h"

#include <cstdio>
#include <cstdlib>

using namespace mkdone;
using namespace mkdone::commands;

static void journalUsage(int exitCode) {
  int optionWidth = 20;
  fprintf(stderr, "Usage: %s journal [options] <path>\n", getProgramName());
  fprintf(stderr, "\nOptions:\n");
  fprintf(stderr, "  %-*s %s\n", optionWidth, "--help",
          "show this help message and exit");
  fprintf(stderr, "  %-*s %s\n", optionWidth, "--failed",
          "only show failed commands");
  ::exit(exitCode);
}

int commands::executeJournalCommand(const std::vector<std::string> &argsIn) {
  std::vector<std::string> args = argsIn;
  bool onlyFailed = false;

  while (!args.empty() && !args[0].empty() && args[0][0] == '-') {
    const std::string option = args[0];
    args.erase(args.begin());

    if (option == "--")
      break;

    if (option == "--help") {
      journalUsage(0);
    } else if (option == "--failed") {
      onlyFailed = true;
    } else {
      fprintf(stderr, "error: %s: invalid option: '%s'\n\n",
              getProgramName(), option.c_str());
      journalUsage(1);
    }
  }

  if (args.size() != 1) {
    fprintf(stderr, "error: %s: invalid number of arguments\n",
            getProgramName());
    journalUsage(1);
  }

  std::string error;
  auto journal = core::createSQLiteRunJournal(args[0], &error);
  if (!journal) {
    fprintf(stderr, "error: %s: %s\n", getProgramName(), error.c_str());
    return 1;
  }

  std::vector<core::RunRecord> records;
  if (!journal->getRecords(records, &error)) {
    fprintf(stderr, "error: %s: %s\n", getProgramName(), error.c_str());
    return 1;
  }

  auto& os = llvm::outs();
  for (const auto& record: records) {
    if (onlyFailed && record.exitStatus == 0)
      continue;

    os << "[" << core::RunRecord::getKindName(record.kind) << "] "
       << record.owner << ": " << record.command << " (exit "
       << record.exitStatus << ", "
       << llvm::format("%.3f", record.end - record.start) << "s)\n";
  }
  return 0;
}
