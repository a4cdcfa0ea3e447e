#pragma once

#include <sqlite3.h>

#include <string>

namespace macrelay::db::sqlite {

/*
  Owns the channel cache connection.

  Opening creates the parent directory of a file path and applies the
  connection pragmas. One connection is shared by every caller; the
  store above it serializes access.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  // Throws std::runtime_error with sqlite's message.
  void Exec(const std::string& sql);

  // Returns the sqlite result code instead of throwing.
  int TryExec(const char* sql);

  sqlite3_stmt* Prepare(const std::string& sql);

 private:
  void ApplyPragmas();

  sqlite3*    db_ = nullptr;
  std::string path_;
};

/*
  Owns one prepared statement; finalized on scope exit.
*/
class Statement {
 public:
  Statement(SqliteDB& db, const std::string& sql) : stmt_(db.Prepare(sql)) {
  }
  ~Statement() {
    sqlite3_finalize(stmt_);
  }

  Statement(const Statement&)            = delete;
  Statement& operator=(const Statement&) = delete;

  sqlite3_stmt* get() const {
    return stmt_;
  }

  // Ready for the next set of bindings.
  void Reset() {
    sqlite3_reset(stmt_);
    sqlite3_clear_bindings(stmt_);
  }

 private:
  sqlite3_stmt* stmt_;
};

/*
  BEGIN IMMEDIATE on construction; rolls back unless Commit() succeeded.
*/
class WriteTransaction {
 public:
  explicit WriteTransaction(SqliteDB& db);
  ~WriteTransaction();

  WriteTransaction(const WriteTransaction&)            = delete;
  WriteTransaction& operator=(const WriteTransaction&) = delete;

  // sqlite result code of BEGIN
  int BeginResult() const {
    return begin_rc_;
  }

  int Commit();

 private:
  SqliteDB& db_;
  int       begin_rc_;
  bool      open_;
};

} // namespace macrelay::db::sqlite
