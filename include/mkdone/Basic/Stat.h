//===- Stat.h ---------------------------------------------------*- C++ -*-===//
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

#ifndef MKDONE_BASIC_STAT_H
#define MKDONE_BASIC_STAT_H

#include <sys/stat.h>

namespace mkdone {
namespace basic {
namespace sys {

using StatStruct = struct ::stat;

int lstat(const char *fileName, StatStruct *buf);
int stat(const char *fileName, StatStruct *buf);

}
}
}

#endif // MKDONE_BASIC_STAT_H
