#pragma once

#include <sqlite3.h>

#include <memory>
#include <mutex>
#include <string>

namespace upload::db::sqlite {

/*
  Thin RAII wrapper around one sqlite3* connection.

  The connection is shared by every transaction; writer_mutex() keeps a
  single BEGIN..COMMIT in flight on it at a time.
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

  std::mutex& writer_mutex() {
    return writer_mutex_;
  }

  // Execute a SQL string (pragmas, schema, BEGIN/COMMIT)
  void Exec(const std::string& sql);

 private:
  void Configure();

  sqlite3*    db_ = nullptr;
  std::string path_;
  std::mutex  writer_mutex_;
};

} // namespace upload::db::sqlite
