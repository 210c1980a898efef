//===- Clock.h --------------------------------------------------*- C++ -*-===//
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

#ifndef MKDONE_BASIC_CLOCK_H
#define MKDONE_BASIC_CLOCK_H

#include "mkdone/Basic/Compiler.h"

#include <chrono>

namespace mkdone {
namespace basic {

class Clock {
public:
  /// A timestamp is the number of seconds since the Unix epoch.
  typedef double Timestamp;

  Clock() MKDONE_DELETED_FUNCTION;

  /// Returns the current wall clock time in seconds since the Unix epoch.
  ///
  /// Wall clock time is used (rather than a monotonic clock) because these
  /// values are persisted and read back by later invocations.
  inline static Timestamp now() {
    auto now = std::chrono::system_clock::now();
    auto difference = std::chrono::duration_cast<std::chrono::duration<double>>(
        now.time_since_epoch());
    return difference.count();
  }
};

}
}

#endif
