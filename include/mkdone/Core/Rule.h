//===- Rule.h ---------------------------------------------------*- C++ -*-===//
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

#ifndef MKDONE_CORE_RULE_H
#define MKDONE_CORE_RULE_H

#include "mkdone/Basic/Compiler.h"
#include "mkdone/Basic/LLVM.h"

#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/ADT/Twine.h"

#include <string>
#include <utility>
#include <vector>

namespace mkdone {
namespace basic {

class FileSystem;

}

namespace core {

class StampStore;

/// Describes whether a target must be (re)produced, and why.
struct Staleness {
  enum class Kind {
    /// The target exists and no prerequisite is newer.
    UpToDate = 0,

    /// The target does not exist.
    TargetMissing,

    /// A prerequisite is strictly newer than the target.
    PrerequisiteNewer,

    /// A prerequisite does not exist.
    PrerequisiteMissing,

    /// A prerequisite is itself out of date (only reported by dry queries).
    PrerequisiteStale
  };

  Kind kind = Kind::UpToDate;

  /// The prerequisite responsible, for the prerequisite kinds.
  std::string prerequisite;

  Staleness() {}
  Staleness(Kind kind, StringRef prerequisite = "")
    : kind(kind), prerequisite(prerequisite) {}

  bool isStale() const { return kind != Kind::UpToDate; }

  /// Get a short human readable description.
  std::string getDescription() const;
};

/// Compare the modification time of \arg target against each of
/// \arg prerequisites.
///
/// The target is stale if it is missing, or if any prerequisite is missing or
/// has a modification time strictly newer than the target. Equal times are
/// considered up-to-date.
Staleness checkStaleness(basic::FileSystem& fileSystem, StringRef target,
                         ArrayRef<std::string> prerequisites);

/// Check only whether \arg target exists.
Staleness checkExistence(basic::FileSystem& fileSystem, StringRef target);

/// The services available to a rule while it executes.
class RuleCommandInterface {
public:
  virtual ~RuleCommandInterface();

  virtual basic::FileSystem& getFileSystem() = 0;

  virtual StampStore& getStampStore() = 0;

  /// Run \arg command on behalf of \arg owner.
  ///
  /// Failures are reported to the engine delegate.
  ///
  /// \returns True if the command ran and exited successfully.
  virtual bool runShellCommand(StringRef owner, StringRef command) = 0;

  /// Report an error encountered while executing.
  virtual void error(const Twine& message) = 0;

  /// Report an informational message.
  virtual void note(const Twine& message) = 0;
};

/// A rule knows how to bring a single file-backed target up to date.
///
/// Rules are registered with the \see TaskEngine keyed by their target path.
/// The engine brings every prerequisite up to date before asking the rule
/// whether its target is stale, and only executes the rule if it is.
class Rule {
public:
  enum class Kind {
    /// A task stamp.
    Stamp = 0,

    /// A provisioned tool command.
    Tool,

    /// The environment descriptor.
    Environment
  };

private:
  Kind kind;

  /// The name used in diagnostics.
  std::string name;

  /// The path of the file produced by the rule.
  std::string target;

  std::vector<std::string> prerequisites;

  Rule(const Rule&) MKDONE_DELETED_FUNCTION;
  void operator=(const Rule&) MKDONE_DELETED_FUNCTION;

public:
  Rule(Kind kind, StringRef name, StringRef target,
       std::vector<std::string> prerequisites)
    : kind(kind), name(name), target(target),
      prerequisites(std::move(prerequisites)) {}
  virtual ~Rule();

  Kind getKind() const { return kind; }

  StringRef getName() const { return name; }

  StringRef getTarget() const { return target; }

  ArrayRef<std::string> getPrerequisites() const { return prerequisites; }

  /// Whether the existence of the target alone makes it up to date.
  ///
  /// The prerequisites of an existing existence-only target are not brought
  /// up to date, nor compared against it.
  virtual bool isExistenceOnly() const { return false; }

  /// Check whether the target must be produced.
  ///
  /// The default implementation applies \see checkExistence() to
  /// existence-only rules, and \see checkStaleness() to the target and
  /// prerequisites otherwise.
  virtual Staleness checkStaleness(basic::FileSystem& fileSystem) const;

  /// Produce the target.
  ///
  /// \returns True on success.
  virtual bool execute(RuleCommandInterface& commandInterface) = 0;
};

}
}

#endif
