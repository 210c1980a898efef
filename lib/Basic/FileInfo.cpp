//===-- FileInfo.cpp ------------------------------------------------------===//
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

#include "mkdone/Basic/FileInfo.h"

#include "mkdone/Basic/Stat.h"

#include <cassert>
#include <cstring>

using namespace mkdone;
using namespace mkdone::basic;

bool FileInfo::isDirectory() const {
  return (mode & S_IFMT) == S_IFDIR;
}

FileInfo FileInfo::getInfoForPath(const std::string& path, bool asLink) {
  FileInfo result;

  sys::StatStruct buf;
  auto statResult =
    asLink ? sys::lstat(path.c_str(), &buf) : sys::stat(path.c_str(), &buf);
  if (statResult != 0) {
    memset(&result, 0, sizeof(result));
    assert(result.isMissing());
    return result;
  }

  result.mode = buf.st_mode;
  result.size = buf.st_size;
#if defined(__APPLE__)
  result.modTime.seconds = buf.st_mtimespec.tv_sec;
  result.modTime.nanoseconds = buf.st_mtimespec.tv_nsec;
#else
  result.modTime.seconds = buf.st_mtim.tv_sec;
  result.modTime.nanoseconds = buf.st_mtim.tv_nsec;
#endif

  return result;
}
