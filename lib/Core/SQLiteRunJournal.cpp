//===-- SQLiteRunJournal.cpp ----------------------------------------------===//
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

#include "mkdone/Core/RunJournal.h"

#include "llvm/Support/raw_ostream.h"

#include <cassert>

#include <sqlite3.h>

using namespace mkdone;
using namespace mkdone::core;

// Helper macro checking and returning error messages for failed SQLite calls
#define checkSQLiteResultOKReturnFalse(result) \
if (result != SQLITE_OK) { \
  *error_out = getCurrentErrorMessage(); \
  return false; \
}

RunJournal::~RunJournal() {}

StringRef RunRecord::getKindName(Kind kind) {
  switch (kind) {
  case Kind::Task: return "task";
  case Kind::Clean: return "clean";
  case Kind::Tool: return "tool";
  case Kind::Environment: return "environment";
  }
  return "<unknown>";
}

namespace {

class SQLiteRunJournal : public RunJournal {
  /// Version History:
  /// * 2: Store owners and commands with TEXT affinity.
  /// * 1: Initial version.
  static const int currentSchemaVersion = 2;

  std::string path;

  sqlite3 *db = nullptr;

  /// The identifier of the current session, or -1 if none has begun.
  int64_t sessionID = -1;

  std::string getCurrentErrorMessage() {
    const char* err_message = sqlite3_errmsg(db);
    const char* filename = sqlite3_db_filename(db, "main");

    std::string out;
    llvm::raw_string_ostream outStream(out);
    outStream << "accessing run journal \"" << filename << "\": "
              << err_message;
    outStream.flush();
    return out;
  }

  bool createSchema(std::string* error_out) {
    char *cError = nullptr;

    // Create the schema in a single transaction.
    int result = sqlite3_exec(db, "BEGIN EXCLUSIVE;", nullptr, nullptr,
                              &cError);
    if (result == SQLITE_OK) {
      result = sqlite3_exec(
        db, ("CREATE TABLE info ("
             "id INTEGER PRIMARY KEY, "
             "version INTEGER);"),
        nullptr, nullptr, &cError);
    }
    if (result == SQLITE_OK) {
      char* query = sqlite3_mprintf("INSERT INTO info VALUES (0, %d);",
                                    currentSchemaVersion);
      result = sqlite3_exec(db, query, nullptr, nullptr, &cError);
      sqlite3_free(query);
    }
    if (result == SQLITE_OK) {
      result = sqlite3_exec(
        db, ("CREATE TABLE sessions ("
             "id INTEGER PRIMARY KEY, "
             "start_time REAL);"),
        nullptr, nullptr, &cError);
    }
    if (result == SQLITE_OK) {
      result = sqlite3_exec(
        db, ("CREATE TABLE runs ("
             "id INTEGER PRIMARY KEY, "
             "session_id INTEGER, "
             "kind INTEGER, "
             "owner TEXT, "
             "command TEXT, "
             "start_time REAL, "
             "end_time REAL, "
             "exit_status INTEGER, "
             "FOREIGN KEY(session_id) REFERENCES sessions(id));"),
        nullptr, nullptr, &cError);
    }

    // Sync changes to disk.
    if (result == SQLITE_OK) {
      result = sqlite3_exec(db, "END;", nullptr, nullptr, &cError);
    }

    if (result != SQLITE_OK) {
      *error_out = (std::string("unable to initialize run journal (") +
                    (cError ? cError : sqlite3_errstr(result)) + ")");
      sqlite3_free(cError);
      return false;
    }
    return true;
  }

public:
  explicit SQLiteRunJournal(StringRef path) : path(path) {}

  virtual ~SQLiteRunJournal() {
    close();
  }

  bool open(std::string* error_out) {
    int result = sqlite3_open(path.c_str(), &db);
    if (result != SQLITE_OK) {
      *error_out = "unable to open run journal '" + path + "': " +
        std::string(sqlite3_errstr(result));
      sqlite3_close(db);
      db = nullptr;
      return false;
    }

    sqlite3_busy_timeout(db, 5000);

    // Check the schema version, if the database already existed.
    int version = -1;
    sqlite3_stmt* stmt;
    result = sqlite3_prepare_v2(
      db, "SELECT version FROM info LIMIT 1", -1, &stmt, nullptr);
    if (result == SQLITE_OK) {
      result = sqlite3_step(stmt);
      if (result == SQLITE_ROW) {
        assert(sqlite3_column_count(stmt) == 1);
        version = sqlite3_column_int(stmt, 0);
      } else if (result != SQLITE_DONE) {
        *error_out = getCurrentErrorMessage();
        sqlite3_finalize(stmt);
        return false;
      }
      sqlite3_finalize(stmt);
    } else if (result != SQLITE_ERROR) {
      *error_out = getCurrentErrorMessage();
      return false;
    }

    if (version == -1)
      return createSchema(error_out);

    if (version != currentSchemaVersion) {
      *error_out = "run journal '" + path + "' has unsupported version " +
        std::to_string(version);
      return false;
    }
    return true;
  }

  void close() {
    if (!db) return;

    int result = sqlite3_close(db);
    (void)result;
    assert(result == SQLITE_OK && "unfinalized statements on close");
    db = nullptr;
  }

  virtual bool beginSession(double start, std::string* error_out) override {
    sqlite3_stmt* stmt;
    int result = sqlite3_prepare_v2(
      db, "INSERT INTO sessions (start_time) VALUES (?);", -1, &stmt,
      nullptr);
    checkSQLiteResultOKReturnFalse(result);

    result = sqlite3_bind_double(stmt, /*index=*/1, start);
    if (result != SQLITE_OK) {
      *error_out = getCurrentErrorMessage();
      sqlite3_finalize(stmt);
      return false;
    }

    result = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (result != SQLITE_DONE) {
      *error_out = getCurrentErrorMessage();
      return false;
    }

    sessionID = sqlite3_last_insert_rowid(db);
    return true;
  }

  virtual bool recordRun(const RunRecord& record,
                         std::string* error_out) override {
    if (sessionID < 0 && !beginSession(record.start, error_out))
      return false;

    sqlite3_stmt* stmt;
    int result = sqlite3_prepare_v2(
      db, ("INSERT INTO runs (session_id, kind, owner, command, start_time, "
           "end_time, exit_status) VALUES (?, ?, ?, ?, ?, ?, ?);"),
      -1, &stmt, nullptr);
    checkSQLiteResultOKReturnFalse(result);

    result = sqlite3_bind_int64(stmt, /*index=*/1, sessionID);
    if (result == SQLITE_OK)
      result = sqlite3_bind_int(stmt, /*index=*/2, int(record.kind));
    if (result == SQLITE_OK)
      result = sqlite3_bind_text(stmt, /*index=*/3, record.owner.data(),
                                 record.owner.size(), SQLITE_TRANSIENT);
    if (result == SQLITE_OK)
      result = sqlite3_bind_text(stmt, /*index=*/4, record.command.data(),
                                 record.command.size(), SQLITE_TRANSIENT);
    if (result == SQLITE_OK)
      result = sqlite3_bind_double(stmt, /*index=*/5, record.start);
    if (result == SQLITE_OK)
      result = sqlite3_bind_double(stmt, /*index=*/6, record.end);
    if (result == SQLITE_OK)
      result = sqlite3_bind_int(stmt, /*index=*/7, record.exitStatus);
    if (result == SQLITE_OK)
      result = sqlite3_step(stmt);

    if (result != SQLITE_DONE) {
      *error_out = getCurrentErrorMessage();
      sqlite3_finalize(stmt);
      return false;
    }

    sqlite3_finalize(stmt);
    return true;
  }

  virtual bool getRecords(std::vector<RunRecord>& records_out,
                          std::string* error_out) override {
    sqlite3_stmt* stmt;
    int result = sqlite3_prepare_v2(
      db, ("SELECT kind, owner, command, start_time, end_time, exit_status "
           "FROM runs ORDER BY id;"),
      -1, &stmt, nullptr);
    checkSQLiteResultOKReturnFalse(result);

    while ((result = sqlite3_step(stmt)) == SQLITE_ROW) {
      assert(sqlite3_column_count(stmt) == 6);

      RunRecord record;
      int kind = sqlite3_column_int(stmt, 0);
      if (kind < int(RunRecord::Kind::Task) ||
          kind > int(RunRecord::Kind::Environment)) {
        *error_out = "run journal contains invalid record kind " +
          std::to_string(kind);
        sqlite3_finalize(stmt);
        return false;
      }
      record.kind = RunRecord::Kind(kind);
      record.owner.assign(
        (const char*)sqlite3_column_text(stmt, 1),
        sqlite3_column_bytes(stmt, 1));
      record.command.assign(
        (const char*)sqlite3_column_text(stmt, 2),
        sqlite3_column_bytes(stmt, 2));
      record.start = sqlite3_column_double(stmt, 3);
      record.end = sqlite3_column_double(stmt, 4);
      record.exitStatus = sqlite3_column_int(stmt, 5);
      records_out.push_back(std::move(record));
    }

    sqlite3_finalize(stmt);
    if (result != SQLITE_DONE) {
      *error_out = getCurrentErrorMessage();
      return false;
    }
    return true;
  }
};

}

std::unique_ptr<RunJournal>
core::createSQLiteRunJournal(StringRef path, std::string* error_out) {
  auto journal = std::make_unique<SQLiteRunJournal>(path);
  if (!journal->open(error_out))
    return nullptr;
  return std::move(journal);
}
