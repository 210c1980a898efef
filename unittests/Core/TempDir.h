//===- TempDir.h ------------------------------------------------*- C++ -*-===//
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

#ifndef MKDONE_TESTS_TEMPDIR
#define MKDONE_TESTS_TEMPDIR

#include "llvm/ADT/SmallString.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Chrono.h"

#include <string>

namespace mkdone {

/// Creates a temporary directory in its constructor and removes it in its
/// destructor. Makes it available via str() and c_str().
class TmpDir {
private:
    TmpDir(const TmpDir&) = delete;
    TmpDir& operator=(const TmpDir&) = delete;

    llvm::SmallString<256> tempDir;

public:
    TmpDir(llvm::StringRef namePrefix = "");
    ~TmpDir();

    const char *c_str();
    std::string str() const;

    /// Get the path of \arg name within the directory.
    std::string path(llvm::StringRef name) const;
};

/// Write \arg contents to the file at \arg path, creating parent directories.
void writeFile(llvm::StringRef path, llvm::StringRef contents = "");

/// Set the modification time of \arg path to \arg time.
void setModificationTime(llvm::StringRef path, llvm::sys::TimePoint<> time);

/// Set the modification time of \arg path to \arg secondsAgo seconds in the
/// past.
void setModificationTime(llvm::StringRef path, unsigned secondsAgo);

}

#endif /* MKDONE_TESTS_TEMPDIR */
