#include "stylegate/storage/sqlite/sqlite_audit_log.h"

#include <nlohmann/json.hpp>

#include <utility>

namespace stylegate::storage::sqlite {

namespace {

constexpr const char* kSelectColumns =
    "SELECT event_id, trace_id, event_type, payload, created_at, refs_json FROM audit_events";

AuditEvent read_event(const PreparedStatement& stmt) {
  AuditEvent event;
  event.event_id = stmt.column_text(0);
  event.trace_id = stmt.column_text(1);
  event.event_type = stmt.column_text(2);
  event.payload = stmt.column_text(3);
  event.created_at = stmt.column_text(4);

  const auto refs = nlohmann::json::parse(stmt.column_text(5), nullptr, false);
  if (refs.is_array()) {
    for (const auto& ref : refs) {
      if (ref.is_string()) {
        event.refs.push_back(ref.get<std::string>());
      }
    }
  }
  return event;
}

}  // namespace

SqliteAuditLog::SqliteAuditLog(std::shared_ptr<SqliteDb> db) : db_(std::move(db)) {}

void SqliteAuditLog::append(const AuditEvent& event) {
  std::lock_guard<std::mutex> lock(mutex_);

  PreparedStatement stmt(*db_,
                         "INSERT INTO audit_events"
                         " (event_id, trace_id, idx, event_type, payload, created_at, refs_json)"
                         " VALUES (?, ?, ?, ?, ?, ?, ?)");
  if (!stmt.is_valid()) {
    last_error_ = "Failed to prepare audit insert: " + stmt.error();
    return;
  }

  const bool bound = stmt.bind_text(1, event.event_id) && stmt.bind_text(2, event.trace_id) &&
                     stmt.bind_int(3, peek_index(event.trace_id)) &&
                     stmt.bind_text(4, event.event_type) && stmt.bind_text(5, event.payload) &&
                     stmt.bind_text(6, event.created_at) &&
                     stmt.bind_text(7, nlohmann::json(event.refs).dump());
  if (!bound || !stmt.step_done()) {
    last_error_ =
        "Failed to append audit event " + event.event_id + ": " + db_->last_error_message();
    return;
  }
  ++next_index_[event.trace_id];
}

std::vector<AuditEvent> SqliteAuditLog::query(const std::string& trace_id) const {
  const std::string sql = trace_id.empty()
                              ? std::string(kSelectColumns) + " ORDER BY rowid"
                              : std::string(kSelectColumns) + " WHERE trace_id = ? ORDER BY idx";
  PreparedStatement stmt(*db_, sql);
  if (!stmt.is_valid()) {
    return {};
  }
  if (!trace_id.empty() && !stmt.bind_text(1, trace_id)) {
    return {};
  }

  std::vector<AuditEvent> events;
  while (stmt.step_row()) {
    events.push_back(read_event(stmt));
  }
  return events;
}

std::vector<std::string> SqliteAuditLog::list_trace_ids() const {
  PreparedStatement stmt(*db_, "SELECT DISTINCT trace_id FROM audit_events ORDER BY trace_id");
  if (!stmt.is_valid()) {
    return {};
  }

  std::vector<std::string> ids;
  while (stmt.step_row()) {
    ids.push_back(stmt.column_text(0));
  }
  return ids;
}

std::optional<std::string> SqliteAuditLog::last_error() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return last_error_;
}

// Caller holds mutex_. A trace first seen by this instance continues after the rows
// already stored for it.
int SqliteAuditLog::peek_index(const std::string& trace_id) {
  const auto it = next_index_.find(trace_id);
  if (it != next_index_.end()) {
    return it->second;
  }

  int next = 0;
  PreparedStatement stmt(*db_, "SELECT MAX(idx) FROM audit_events WHERE trace_id = ?");
  if (stmt.is_valid() && stmt.bind_text(1, trace_id)) {
    if (stmt.step_row()) {
      next = stmt.column_int(0).value_or(-1) + 1;
    }
  }
  next_index_[trace_id] = next;
  return next;
}

}  // namespace stylegate::storage::sqlite
