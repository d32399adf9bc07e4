#pragma once

#include <sqlite3.h>

#include <chrono>
#include <string>

namespace netcrawl::db::sqlite {

struct SqliteOptions {
  // how long a writer waits on another connection's lock before SQLITE_BUSY
  std::chrono::milliseconds busy_timeout{5000};
};

/*
  Owns the sqlite3* of the inventory file.

  Opened in serialized (FULLMUTEX) mode; every crawl worker shares this one
  connection and BEGIN IMMEDIATE serializes their write transactions.
  ":memory:" is accepted for tests.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path, SqliteOptions options = {});
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  // Runs one or more statements without results. Throws StoreError.
  void Exec(const std::string& sql);

  // PRAGMA user_version; 0 on a fresh file.
  int SchemaVersion();
  void SetSchemaVersion(int version);

 private:
  void Configure();

  sqlite3*      db_ = nullptr;
  std::string   path_;
  SqliteOptions options_;
};

} // namespace netcrawl::db::sqlite
