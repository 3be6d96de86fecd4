#include "sqlite_db.hpp"

namespace airspace::db::sqlite {

Result Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  std::string msg = db ? sqlite3_errmsg(db) : sqlite3_errstr(rc);

  switch (rc & 0xff) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, std::move(msg));
    case SQLITE_CONSTRAINT:
      return Result::Err(ErrorCode::ConstraintViolation, std::move(msg));
    case SQLITE_INTERRUPT:
      return Result::Err(ErrorCode::Cancelled, std::move(msg));
    case SQLITE_IOERR:
    case SQLITE_FULL:
    case SQLITE_CANTOPEN:
      return Result::Err(ErrorCode::IOError, std::move(msg));
    case SQLITE_CORRUPT:
    case SQLITE_NOTADB:
      return Result::Err(ErrorCode::Corruption, std::move(msg));
    default:
      return Result::Err(ErrorCode::InternalError, std::move(msg));
  }
}

SqliteDB::SqliteDB(std::string path, std::chrono::milliseconds busy_timeout)
    : path_(std::move(path)), busy_timeout_(busy_timeout) {
  int rc = sqlite3_open_v2(path_.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);

  if (rc != SQLITE_OK) {
    Result err = Translate(db_, rc);
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    throw DbError(err.code, "sqlite open " + path_ + ": " + err.message);
  }

  sqlite3_extended_result_codes(db_, 1);
  Configure();
}

SqliteDB::~SqliteDB() {
  if (db_) sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char* err = nullptr;
  int   rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    Result result = Translate(db_, rc);
    if (err) {
      result.message = err;
      sqlite3_free(err);
    }
    throw DbError(result);
  }
}

void SqliteDB::Configure() {
  // WAL lets readers in other processes proceed while a writer holds the lock.
  // In-memory databases report "memory" and keep working.
  Exec("PRAGMA journal_mode=WAL;");
  Exec("PRAGMA synchronous=NORMAL;");

  // wait for locks held by other processes instead of failing immediately
  int rc = sqlite3_busy_timeout(db_, static_cast<int>(busy_timeout_.count()));
  if (rc != SQLITE_OK) throw DbError(Translate(db_, rc));

  Exec("PRAGMA temp_store=MEMORY;");
  Exec("PRAGMA cache_size=-20000;"); // ~20MB (negative means KB)
}

} // namespace airspace::db::sqlite
