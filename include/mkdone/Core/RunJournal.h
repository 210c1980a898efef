//===- RunJournal.h ---------------------------------------------*- C++ -*-===//
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

#ifndef MKDONE_CORE_RUNJOURNAL_H
#define MKDONE_CORE_RUNJOURNAL_H

#include "mkdone/Basic/Compiler.h"
#include "mkdone/Basic/LLVM.h"

#include "llvm/ADT/StringRef.h"

#include <memory>
#include <string>
#include <vector>

namespace mkdone {
namespace core {

/// A single command executed by the engine.
struct RunRecord {
  enum class Kind {
    /// A command of a task run operation.
    Task = 0,

    /// A command of a clean operation.
    Clean,

    /// A tool installation.
    Tool,

    /// An environment bootstrap command.
    Environment
  };

  Kind kind = Kind::Task;

  /// The name of the task, clean operation or resource owning the command.
  std::string owner;

  std::string command;

  /// The start and end times, in seconds since the epoch.
  double start = 0.0;
  double end = 0.0;

  /// The exit status, or a negative value if the command could not be run.
  int exitStatus = 0;

  static StringRef getKindName(Kind kind);
};

/// A persistent log of executed commands.
///
/// The journal is diagnostic only. The engine never reads it back to decide
/// what to run; task completion is recorded exclusively by stamps.
class RunJournal {
  RunJournal(const RunJournal&) MKDONE_DELETED_FUNCTION;
  void operator=(const RunJournal&) MKDONE_DELETED_FUNCTION;

public:
  RunJournal() {}
  virtual ~RunJournal();

  /// Open a new session, recorded with the given \arg start time.
  ///
  /// \param error_out [out] Error string if return value is false.
  virtual bool beginSession(double start, std::string* error_out) = 0;

  /// Append a record to the current session.
  ///
  /// \param error_out [out] Error string if return value is false.
  virtual bool recordRun(const RunRecord& record, std::string* error_out) = 0;

  /// Get every record in the journal, oldest first.
  ///
  /// \param error_out [out] Error string if return value is false.
  virtual bool getRecords(std::vector<RunRecord>& records_out,
                          std::string* error_out) = 0;
};

/// Create a journal backed by the SQLite database at \arg path, creating the
/// database if necessary.
///
/// \param error_out [out] Error string if return value is null.
std::unique_ptr<RunJournal> createSQLiteRunJournal(StringRef path,
                                                   std::string* error_out);

}
}

#endif
