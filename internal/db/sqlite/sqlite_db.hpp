#pragma once

#include <sqlite3.h>

#include <mutex>
#include <string>

namespace prdchat::db::sqlite {

/*
  Thin RAII wrapper around one sqlite3* connection.

  The connection is shared by every transaction; a transaction holds
  WriterMutex() for its whole lifetime so statements of concurrent
  transactions never interleave on the handle.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path, bool wal_mode = true);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  std::mutex& WriterMutex() {
    return mutex_;
  }

  // Execute a SQL string (used for pragmas/migrations). Throws on failure.
  void Exec(const std::string& sql);

  // Execute and return the sqlite result code instead of throwing.
  int TryExec(const std::string& sql, std::string* error = nullptr);

  // Configure PRAGMAs (journal mode, foreign keys, busy timeout).
  void Configure(bool wal_mode);

 private:
  sqlite3*    db_ = nullptr;
  std::string path_;
  std::mutex  mutex_;
};

} // namespace prdchat::db::sqlite
