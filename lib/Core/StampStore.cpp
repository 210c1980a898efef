//===-- StampStore.cpp ----------------------------------------------------===//
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

#include "mkdone/Core/StampStore.h"

#include "mkdone/Basic/FileSystem.h"

#include "llvm/ADT/SmallString.h"
#include "llvm/Support/Path.h"

using namespace mkdone;
using namespace mkdone::core;

StampStore::StampStore(basic::FileSystem& fileSystem, StringRef rootDir)
  : fileSystem(fileSystem), rootDir(rootDir) {}

std::string StampStore::getStampPath(StringRef name) const {
  SmallString<256> path(rootDir);
  llvm::sys::path::append(path, "." + name + "_done");
  return path.str().str();
}

bool StampStore::exists(StringRef stampPath) const {
  return !getInfo(stampPath).isMissing();
}

basic::FileInfo StampStore::getInfo(StringRef stampPath) const {
  return fileSystem.getFileInfo(stampPath.str());
}

bool StampStore::touch(StringRef stampPath, std::string* error_out) {
  StringRef parent = llvm::sys::path::parent_path(stampPath);
  if (!parent.empty() && !fileSystem.createDirectories(parent.str())) {
    *error_out = "unable to create stamp directory '" + parent.str() + "'";
    return false;
  }

  return fileSystem.touch(stampPath.str(), error_out);
}

bool StampStore::remove(StringRef stampPath, std::string* error_out) {
  if (!exists(stampPath))
    return true;

  if (!fileSystem.remove(stampPath.str())) {
    *error_out = "unable to remove stamp '" + stampPath.str() + "'";
    return false;
  }
  return true;
}
