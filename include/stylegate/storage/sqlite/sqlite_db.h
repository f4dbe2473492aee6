#pragma once

#include "stylegate/core/result.h"

#include <memory>
#include <optional>
#include <string>

// Forward declare sqlite3 to keep the SQLite header out of the public API
struct sqlite3;
struct sqlite3_stmt;

namespace stylegate::storage::sqlite {

// SqliteDb owns one SQLite connection holding the audit trail tables.
// ":memory:" opens an in-memory database.
class SqliteDb {
 public:
  [[nodiscard]] static core::Result<std::shared_ptr<SqliteDb>, std::string> open(
      const std::string& path);

  SqliteDb(const SqliteDb&) = delete;
  SqliteDb& operator=(const SqliteDb&) = delete;
  SqliteDb(SqliteDb&&) = delete;
  SqliteDb& operator=(SqliteDb&&) = delete;
  ~SqliteDb() = default;

  // 0 before ensure_audit_schema() has run.
  [[nodiscard]] int get_schema_version() const;

  // Creates the audit tables up to core::kAuditSchemaVersion. Idempotent.
  [[nodiscard]] core::Result<bool, std::string> ensure_audit_schema();

  [[nodiscard]] std::string last_error_message() const;

 private:
  friend class PreparedStatement;

  struct SqliteDeleter {
    void operator()(sqlite3* db) const;
  };

  explicit SqliteDb(sqlite3* db);

  std::unique_ptr<sqlite3, SqliteDeleter> db_;
};

// One prepared statement. Bind indices and columns follow SQLite: binds start at 1,
// columns at 0.
class PreparedStatement {
 public:
  PreparedStatement(const SqliteDb& db, const std::string& sql);

  PreparedStatement(const PreparedStatement&) = delete;
  PreparedStatement& operator=(const PreparedStatement&) = delete;
  PreparedStatement(PreparedStatement&&) = delete;
  PreparedStatement& operator=(PreparedStatement&&) = delete;
  ~PreparedStatement() = default;

  [[nodiscard]] bool is_valid() const { return stmt_ != nullptr; }
  [[nodiscard]] const std::string& error() const { return error_; }

  [[nodiscard]] bool bind_text(int index, const std::string& value);
  [[nodiscard]] bool bind_int(int index, int value);

  // True while a result row is available.
  [[nodiscard]] bool step_row();
  // True when the statement ran to completion without error.
  [[nodiscard]] bool step_done();

  [[nodiscard]] std::string column_text(int column) const;
  [[nodiscard]] std::optional<int> column_int(int column) const;

 private:
  struct StmtDeleter {
    void operator()(sqlite3_stmt* stmt) const;
  };

  std::unique_ptr<sqlite3_stmt, StmtDeleter> stmt_;
  std::string error_;
};

}  // namespace stylegate::storage::sqlite
