#include "sqlite_db.hpp"

#include <filesystem>
#include <stdexcept>

namespace macrelay::db::sqlite {

namespace {

constexpr int kBusyTimeoutMs = 5000;

bool IsInMemory(const std::string& path) {
  return path.empty() || path == ":memory:" || path.rfind("file:", 0) == 0;
}

} // namespace

SqliteDB::SqliteDB(std::string path) : path_(std::move(path)) {
  if (!IsInMemory(path_)) {
    const auto parent = std::filesystem::path(path_).parent_path();
    std::error_code ec;
    if (!parent.empty()) std::filesystem::create_directories(parent, ec);
    if (ec) throw std::runtime_error("cannot create directory for channel cache " + path_ + ": " + ec.message());
  }

  const int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX | SQLITE_OPEN_URI;
  if (sqlite3_open_v2(path_.c_str(), &db_, flags, nullptr) != SQLITE_OK) {
    std::string msg = "cannot open channel cache " + path_ + ": " + (db_ ? sqlite3_errmsg(db_) : "out of memory");
    sqlite3_close(db_);
    db_ = nullptr;
    throw std::runtime_error(msg);
  }

  try {
    ApplyPragmas();
  } catch (...) {
    sqlite3_close(db_);
    db_ = nullptr;
    throw;
  }
}

SqliteDB::~SqliteDB() {
  if (db_) sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char* err = nullptr;
  if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
    std::string msg = err ? err : sqlite3_errmsg(db_);
    sqlite3_free(err);
    throw std::runtime_error(msg);
  }
}

int SqliteDB::TryExec(const char* sql) {
  return sqlite3_exec(db_, sql, nullptr, nullptr, nullptr);
}

sqlite3_stmt* SqliteDB::Prepare(const std::string& sql) {
  sqlite3_stmt* stmt = nullptr;
  if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
    throw std::runtime_error("sqlite prepare: " + std::string(sqlite3_errmsg(db_)));
  }
  return stmt;
}

void SqliteDB::ApplyPragmas() {
  // request-path lookups keep reading while a refresh rewrites a portal
  Exec("PRAGMA journal_mode=WAL;");
  Exec("PRAGMA synchronous=NORMAL;");
  Exec("PRAGMA temp_store=MEMORY;");
  Exec("PRAGMA cache_size=-8000;");

  if (sqlite3_busy_timeout(db_, kBusyTimeoutMs) != SQLITE_OK) {
    throw std::runtime_error("sqlite busy_timeout: " + std::string(sqlite3_errmsg(db_)));
  }
}

// ---------------------------------------------------------------------------
// WriteTransaction
// ---------------------------------------------------------------------------

WriteTransaction::WriteTransaction(SqliteDB& db) : db_(db), begin_rc_(db.TryExec("BEGIN IMMEDIATE;")), open_(begin_rc_ == SQLITE_OK) {
}

WriteTransaction::~WriteTransaction() {
  if (open_) db_.TryExec("ROLLBACK;");
}

int WriteTransaction::Commit() {
  const int rc = db_.TryExec("COMMIT;");
  if (rc == SQLITE_OK) open_ = false;
  return rc;
}

} // namespace macrelay::db::sqlite
