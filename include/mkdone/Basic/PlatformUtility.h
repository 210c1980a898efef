//===- PlatformUtility.h ----------------------------------------*- C++ -*-===//
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
// This file implements small platform compatability wrapper functions for
// common functions.
//
//===----------------------------------------------------------------------===//

#ifndef MKDONE_BASIC_PLATFORMUTILITY_H
#define MKDONE_BASIC_PLATFORMUTILITY_H

#include <string>

namespace mkdone {
namespace basic {
namespace sys {

bool chdir(const char *fileName);
bool mkdir(const char *fileName);
int rmdir(const char *path);
int unlink(const char *fileName);
std::string strerror(int error);
int symlink(const char *source, const char *target);

}
}
}

#endif
