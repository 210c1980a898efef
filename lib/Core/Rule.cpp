//===-- Rule.cpp ----------------------------------------------------------===//
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

#include "mkdone/Core/Rule.h"

#include "mkdone/Basic/FileSystem.h"

using namespace mkdone;
using namespace mkdone::core;

std::string Staleness::getDescription() const {
  switch (kind) {
  case Kind::UpToDate:
    return "up to date";
  case Kind::TargetMissing:
    return "target does not exist";
  case Kind::PrerequisiteNewer:
    return "'" + prerequisite + "' is newer";
  case Kind::PrerequisiteMissing:
    return "'" + prerequisite + "' does not exist";
  case Kind::PrerequisiteStale:
    return "'" + prerequisite + "' is out of date";
  }
  return "unknown";
}

Staleness core::checkStaleness(basic::FileSystem& fileSystem,
                               StringRef target,
                               ArrayRef<std::string> prerequisites) {
  auto targetInfo = fileSystem.getFileInfo(target.str());
  if (targetInfo.isMissing())
    return Staleness(Staleness::Kind::TargetMissing);

  for (const auto& prerequisite: prerequisites) {
    auto info = fileSystem.getFileInfo(prerequisite);
    if (info.isMissing())
      return Staleness(Staleness::Kind::PrerequisiteMissing, prerequisite);
    if (info.modTime > targetInfo.modTime)
      return Staleness(Staleness::Kind::PrerequisiteNewer, prerequisite);
  }

  return Staleness();
}

Staleness core::checkExistence(basic::FileSystem& fileSystem,
                               StringRef target) {
  if (fileSystem.getFileInfo(target.str()).isMissing())
    return Staleness(Staleness::Kind::TargetMissing);
  return Staleness();
}

RuleCommandInterface::~RuleCommandInterface() {}

Rule::~Rule() {}

Staleness Rule::checkStaleness(basic::FileSystem& fileSystem) const {
  if (isExistenceOnly())
    return core::checkExistence(fileSystem, target);
  return core::checkStaleness(fileSystem, target, prerequisites);
}
