#pragma once

#include "stylegate/storage/audit_log.h"
#include "stylegate/storage/sqlite/sqlite_db.h"

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace stylegate::storage::sqlite {

// SqliteAuditLog persists audit events in the audit_events table.
// Events of a trace are ordered by a per-trace idx column that only advances on a
// successful insert. Appends are serialized by mutex_. A failed write is kept in
// last_error() for the caller to report.
class SqliteAuditLog final : public IAuditLog {
 public:
  explicit SqliteAuditLog(std::shared_ptr<SqliteDb> db);

  void append(const AuditEvent& event) override;
  [[nodiscard]] std::vector<AuditEvent> query(const std::string& trace_id) const override;
  [[nodiscard]] std::vector<std::string> list_trace_ids() const override;

  [[nodiscard]] std::optional<std::string> last_error() const;

 private:
  std::shared_ptr<SqliteDb> db_;

  mutable std::mutex mutex_;
  std::map<std::string, int> next_index_;
  std::optional<std::string> last_error_;

  int peek_index(const std::string& trace_id);
};

}  // namespace stylegate::storage::sqlite
