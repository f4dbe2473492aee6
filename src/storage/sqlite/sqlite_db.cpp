#include "stylegate/storage/sqlite/sqlite_db.h"

#include "stylegate/core/version.h"

#include <sqlite3.h>

namespace stylegate::storage::sqlite {

void SqliteDb::SqliteDeleter::operator()(sqlite3* db) const {
  if (db != nullptr) {
    sqlite3_close(db);
  }
}

void PreparedStatement::StmtDeleter::operator()(sqlite3_stmt* stmt) const {
  if (stmt != nullptr) {
    sqlite3_finalize(stmt);
  }
}

namespace {

// idx orders the events of one trace; rowid orders the whole log.
constexpr const char* kAuditSchemaV1 = R"(
CREATE TABLE IF NOT EXISTS schema_version (
  version INTEGER PRIMARY KEY,
  applied_at TEXT NOT NULL
);

CREATE TABLE IF NOT EXISTS audit_events (
  event_id TEXT PRIMARY KEY,
  trace_id TEXT NOT NULL,
  idx INTEGER NOT NULL,
  event_type TEXT NOT NULL,
  payload TEXT NOT NULL,
  created_at TEXT NOT NULL,
  refs_json TEXT NOT NULL
);

CREATE INDEX IF NOT EXISTS idx_audit_events_trace ON audit_events(trace_id, idx);

INSERT OR IGNORE INTO schema_version (version, applied_at)
VALUES (1, datetime('now'));
)";

}  // namespace

SqliteDb::SqliteDb(sqlite3* db) : db_(db) {}

core::Result<std::shared_ptr<SqliteDb>, std::string> SqliteDb::open(const std::string& path) {
  using OpenResult = core::Result<std::shared_ptr<SqliteDb>, std::string>;

  sqlite3* raw = nullptr;
  if (sqlite3_open(path.c_str(), &raw) != SQLITE_OK) {
    const std::string reason = raw != nullptr ? sqlite3_errmsg(raw) : "out of memory";
    sqlite3_close(raw);
    return OpenResult::err("Failed to open " + path + ": " + reason);
  }
  return OpenResult::ok(std::shared_ptr<SqliteDb>(new SqliteDb(raw)));
}

int SqliteDb::get_schema_version() const {
  PreparedStatement stmt(*this, "SELECT MAX(version) FROM schema_version");
  if (!stmt.is_valid() || !stmt.step_row()) {
    return 0;  // No schema_version table yet
  }
  return stmt.column_int(0).value_or(0);
}

core::Result<bool, std::string> SqliteDb::ensure_audit_schema() {
  if (get_schema_version() >= core::kAuditSchemaVersion) {
    return core::Result<bool, std::string>::ok(true);
  }

  char* message = nullptr;
  if (sqlite3_exec(db_.get(), kAuditSchemaV1, nullptr, nullptr, &message) != SQLITE_OK) {
    const std::string reason = message != nullptr ? message : last_error_message();
    sqlite3_free(message);
    return core::Result<bool, std::string>::err("Failed to create audit schema: " + reason);
  }
  return core::Result<bool, std::string>::ok(true);
}

std::string SqliteDb::last_error_message() const {
  return sqlite3_errmsg(db_.get());
}

PreparedStatement::PreparedStatement(const SqliteDb& db, const std::string& sql) {
  sqlite3_stmt* raw = nullptr;
  if (sqlite3_prepare_v2(db.db_.get(), sql.c_str(), -1, &raw, nullptr) != SQLITE_OK) {
    error_ = db.last_error_message();
    sqlite3_finalize(raw);
    return;
  }
  stmt_.reset(raw);
}

bool PreparedStatement::bind_text(const int index, const std::string& value) {
  return sqlite3_bind_text(stmt_.get(), index, value.c_str(), -1, SQLITE_TRANSIENT) == SQLITE_OK;
}

bool PreparedStatement::bind_int(const int index, const int value) {
  return sqlite3_bind_int(stmt_.get(), index, value) == SQLITE_OK;
}

bool PreparedStatement::step_row() {
  return sqlite3_step(stmt_.get()) == SQLITE_ROW;
}

bool PreparedStatement::step_done() {
  return sqlite3_step(stmt_.get()) == SQLITE_DONE;
}

std::string PreparedStatement::column_text(const int column) const {
  const unsigned char* text = sqlite3_column_text(stmt_.get(), column);
  return text != nullptr ? reinterpret_cast<const char*>(text) : std::string{};  // NOLINT
}

std::optional<int> PreparedStatement::column_int(const int column) const {
  if (sqlite3_column_type(stmt_.get(), column) == SQLITE_NULL) {
    return std::nullopt;
  }
  return sqlite3_column_int(stmt_.get(), column);
}

}  // namespace stylegate::storage::sqlite
