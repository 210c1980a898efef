//===- unittests/Core/RunJournalTest.cpp ----------------------------------===//
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

#include "MockTaskEngineDelegate.h"
#include "TempDir.h"

#include "mkdone/Basic/FileSystem.h"
#include "mkdone/Core/RunJournal.h"
#include "mkdone/Core/StampStore.h"
#include "mkdone/Core/TaskEngine.h"
#include "mkdone/Core/TaskRegistry.h"

#include "gtest/gtest.h"

using namespace mkdone;
using namespace mkdone::core;
using namespace mkdone::unittests;

namespace {

TEST(RunJournalTest, basic) {
  TmpDir tempDir(__func__);
  std::string path = tempDir.path("journal.db");

  std::string error;
  {
    auto journal = createSQLiteRunJournal(path, &error);
    ASSERT_TRUE(journal != nullptr) << error;
    ASSERT_TRUE(journal->beginSession(10.0, &error)) << error;

    RunRecord record;
    record.kind = RunRecord::Kind::Tool;
    record.owner = "pytest";
    record.command = "env/bin/pip install pytest";
    record.start = 10.5;
    record.end = 12.25;
    record.exitStatus = 0;
    ASSERT_TRUE(journal->recordRun(record, &error)) << error;

    record.kind = RunRecord::Kind::Task;
    record.owner = "test";
    record.command = "env/bin/pytest";
    record.start = 12.5;
    record.end = 13.0;
    record.exitStatus = 2;
    ASSERT_TRUE(journal->recordRun(record, &error)) << error;
  }

  // Records persist, and a reopened journal appends to them.
  auto journal = createSQLiteRunJournal(path, &error);
  ASSERT_TRUE(journal != nullptr) << error;

  RunRecord record;
  record.kind = RunRecord::Kind::Clean;
  record.owner = "test-clean";
  record.command = "rm -rf .pytest_cache";
  ASSERT_TRUE(journal->recordRun(record, &error)) << error;

  std::vector<RunRecord> records;
  ASSERT_TRUE(journal->getRecords(records, &error)) << error;
  ASSERT_EQ(records.size(), 3u);

  EXPECT_EQ(records[0].kind, RunRecord::Kind::Tool);
  EXPECT_EQ(records[0].owner, "pytest");
  EXPECT_EQ(records[0].command, "env/bin/pip install pytest");
  EXPECT_EQ(records[0].start, 10.5);
  EXPECT_EQ(records[0].end, 12.25);
  EXPECT_EQ(records[0].exitStatus, 0);

  EXPECT_EQ(records[1].kind, RunRecord::Kind::Task);
  EXPECT_EQ(records[1].exitStatus, 2);

  EXPECT_EQ(records[2].kind, RunRecord::Kind::Clean);
  EXPECT_EQ(records[2].owner, "test-clean");
}

TEST(RunJournalTest, numericLookingText) {
  TmpDir tempDir(__func__);

  std::string error;
  auto journal = createSQLiteRunJournal(tempDir.path("journal.db"), &error);
  ASSERT_TRUE(journal != nullptr) << error;
  ASSERT_TRUE(journal->beginSession(1.0, &error)) << error;

  RunRecord record;
  record.kind = RunRecord::Kind::Task;
  record.owner = "007";
  record.command = "1e3";
  ASSERT_TRUE(journal->recordRun(record, &error)) << error;

  std::vector<RunRecord> records;
  ASSERT_TRUE(journal->getRecords(records, &error)) << error;
  ASSERT_EQ(records.size(), 1u);
  EXPECT_EQ(records[0].owner, "007");
  EXPECT_EQ(records[0].command, "1e3");
}

TEST(RunJournalTest, kindNames) {
  EXPECT_EQ(RunRecord::getKindName(RunRecord::Kind::Task), "task");
  EXPECT_EQ(RunRecord::getKindName(RunRecord::Kind::Clean), "clean");
  EXPECT_EQ(RunRecord::getKindName(RunRecord::Kind::Tool), "tool");
  EXPECT_EQ(RunRecord::getKindName(RunRecord::Kind::Environment),
            "environment");
}

TEST(RunJournalTest, invalidPath) {
  TmpDir tempDir(__func__);

  std::string error;
  auto journal = createSQLiteRunJournal(tempDir.path("missing/journal.db"),
                                        &error);
  EXPECT_TRUE(journal == nullptr);
  EXPECT_FALSE(error.empty());
}

TEST(RunJournalTest, engineRecordsCommands) {
  TmpDir tempDir(__func__);
  auto fs = basic::createLocalFileSystem();
  StampStore store(*fs, tempDir.path(".mkdone"));
  TaskRegistry registry(store);

  std::string error;
  ASSERT_NE(registry.declareTask("build", &error), nullptr);
  RunOperation operation;
  operation.commands = { "cc", "ld" };
  ASSERT_TRUE(registry.defineRunOperation("build", operation, &error));
  ASSERT_TRUE(registry.finalizeRegistration(&error)) << error;

  auto journal = createSQLiteRunJournal(tempDir.path("journal.db"), &error);
  ASSERT_TRUE(journal != nullptr) << error;

  MockCommandRunner runner;
  runner.setFails("ld");
  MockTaskEngineDelegate delegate;
  TaskEngine engine(registry, runner, delegate);
  engine.setJournal(journal.get());

  EXPECT_FALSE(engine.build("build"));
  ASSERT_TRUE(engine.cleanTask("build"));

  std::vector<RunRecord> records;
  ASSERT_TRUE(journal->getRecords(records, &error)) << error;
  ASSERT_EQ(records.size(), 2u);
  EXPECT_EQ(records[0].owner, "build");
  EXPECT_EQ(records[0].command, "cc");
  EXPECT_EQ(records[0].exitStatus, 0);
  EXPECT_LE(records[0].start, records[0].end);
  EXPECT_EQ(records[1].command, "ld");
  EXPECT_EQ(records[1].exitStatus, 1);

  // The journal is never consulted for staleness.
  EXPECT_FALSE(store.exists(store.getStampPath("build")));
  EXPECT_FALSE(engine.isUpToDate("build"));
}

}
