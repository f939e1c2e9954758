#pragma once

#include <sqlite3.h>

#include <memory>
#include <mutex>
#include <string>

namespace resource::db::sqlite {

/*
  Thin RAII wrapper around sqlite3*.

  One connection is shared by every thread; TransactionMutex() keeps
  transactions from interleaving on it.
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

  // Execute a SQL string (used for pragmas/schema)
  void Exec(const std::string& sql);

  // Prepare a statement (caller must sqlite3_finalize)
  sqlite3_stmt* Prepare(const std::string& sql);

  // Configure recommended PRAGMAs (WAL, busy timeout, etc.)
  void Configure();

  std::mutex& TransactionMutex() {
    return tx_mutex_;
  }

  const std::string& Path() const {
    return path_;
  }

 private:
  sqlite3*    db_ = nullptr;
  std::string path_;
  std::mutex  tx_mutex_;
};

} // namespace resource::db::sqlite
