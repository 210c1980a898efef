//===-- PlatformUtility.cpp -----------------------------------------------===//
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

#include "mkdone/Basic/PlatformUtility.h"
#include "mkdone/Basic/Stat.h"

#include <cstring>

#include <unistd.h>

using namespace mkdone;
using namespace mkdone::basic;

bool sys::chdir(const char *fileName) {
  return ::chdir(fileName) == 0;
}

int sys::lstat(const char *fileName, sys::StatStruct *buf) {
  return ::lstat(fileName, buf);
}

bool sys::mkdir(const char* fileName) {
  return ::mkdir(fileName, S_IRWXU | S_IRWXG |  S_IRWXO) == 0;
}

int sys::rmdir(const char *path) {
  return ::rmdir(path);
}

int sys::stat(const char *fileName, StatStruct *buf) {
  return ::stat(fileName, buf);
}

int sys::unlink(const char *fileName) {
  return ::unlink(fileName);
}

std::string sys::strerror(int error) {
  return ::strerror(error);
}

int sys::symlink(const char *source, const char *target) {
  return ::symlink(source, target);
}
