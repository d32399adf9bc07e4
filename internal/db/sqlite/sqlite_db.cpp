#include "sqlite_db.hpp"

#include "internal/util/errors.hpp"

namespace netcrawl::db::sqlite {

namespace {

void ThrowIf(int rc, sqlite3* db, const std::string& what) {
  if (rc != SQLITE_OK) {
    throw util::StoreError(what + ": " + sqlite3_errmsg(db));
  }
}

} // namespace

SqliteDB::SqliteDB(std::string path, SqliteOptions options) : path_(std::move(path)), options_(options) {
  const int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
  int       rc    = sqlite3_open_v2(path_.c_str(), &db_, flags, nullptr);

  if (rc != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : "out of memory";
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    throw util::StoreError("cannot open inventory " + path_ + ": " + msg);
  }

  try {
    Configure();
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
  int   rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string msg = err ? err : sqlite3_errstr(rc);
    sqlite3_free(err);
    throw util::StoreError(path_ + ": " + msg);
  }
}

int SqliteDB::SchemaVersion() {
  sqlite3_stmt* st = nullptr;
  ThrowIf(sqlite3_prepare_v2(db_, "PRAGMA user_version;", -1, &st, nullptr), db_, "read schema version");

  int version = 0;
  if (sqlite3_step(st) == SQLITE_ROW) version = sqlite3_column_int(st, 0);
  sqlite3_finalize(st);
  return version;
}

void SqliteDB::SetSchemaVersion(int version) {
  Exec("PRAGMA user_version=" + std::to_string(version) + ";");
}

void SqliteDB::Configure() {
  // in-memory databases silently stay on journal_mode=memory
  Exec("PRAGMA journal_mode=WAL;");
  Exec("PRAGMA synchronous=NORMAL;");

  ThrowIf(sqlite3_busy_timeout(db_, static_cast<int>(options_.busy_timeout.count())), db_, "busy_timeout");
}

} // namespace netcrawl::db::sqlite
