//===- unittests/Core/TempDir.cpp -----------------------------------------===//
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

#include "TempDir.h"

#include "mkdone/Basic/FileSystem.h"

#include "llvm/Support/FileSystem.h"
#include "llvm/Support/Path.h"
#include "llvm/Support/Process.h"
#include "llvm/Support/raw_ostream.h"

#include "gtest/gtest.h"

#include <cassert>
#include <chrono>

mkdone::TmpDir::TmpDir(llvm::StringRef namePrefix) {
    llvm::SmallString<256> tempDirPrefix;
    llvm::sys::path::system_temp_directory(true, tempDirPrefix);
    llvm::sys::path::append(tempDirPrefix, namePrefix);

    std::error_code ec = llvm::sys::fs::createUniqueDirectory(
        tempDirPrefix.str(), tempDir);
    assert(!ec);
    (void)ec;
}

mkdone::TmpDir::~TmpDir() {
    auto fs = basic::createLocalFileSystem();
    bool result = fs->remove(tempDir.c_str());
    assert(result);
    (void)result;
}

const char *mkdone::TmpDir::c_str() { return tempDir.c_str(); }
std::string mkdone::TmpDir::str() const { return tempDir.str().str(); }

std::string mkdone::TmpDir::path(llvm::StringRef name) const {
    llvm::SmallString<256> result(tempDir);
    llvm::sys::path::append(result, name);
    return result.str().str();
}

void mkdone::writeFile(llvm::StringRef path, llvm::StringRef contents) {
    std::error_code ec = llvm::sys::fs::create_directories(
        llvm::sys::path::parent_path(path));
    EXPECT_FALSE(ec) << path.str();

    llvm::raw_fd_ostream os(path, ec, llvm::sys::fs::OF_Text);
    EXPECT_FALSE(ec) << path.str();
    os << contents;
    os.close();
}

void mkdone::setModificationTime(llvm::StringRef path,
                                 llvm::sys::TimePoint<> time) {
    int fd;
    std::error_code ec = llvm::sys::fs::openFileForWrite(
        path, fd, llvm::sys::fs::CD_OpenExisting, llvm::sys::fs::OF_None);
    ASSERT_FALSE(ec) << path.str();

    ec = llvm::sys::fs::setLastAccessAndModificationTime(fd, time);
    EXPECT_FALSE(ec) << path.str();
    EXPECT_FALSE(llvm::sys::Process::SafelyCloseFileDescriptor(fd));
}

void mkdone::setModificationTime(llvm::StringRef path, unsigned secondsAgo) {
    setModificationTime(
        path, std::chrono::time_point_cast<std::chrono::nanoseconds>(
                  std::chrono::system_clock::now() -
                  std::chrono::seconds(secondsAgo)));
}
