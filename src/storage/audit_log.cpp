#include "stylegate/storage/audit_log.h"

namespace stylegate::storage {

void InMemoryAuditLog::append(const AuditEvent& event) {
  by_trace_[event.trace_id].push_back(events_.size());
  events_.push_back(event);
}

std::vector<AuditEvent> InMemoryAuditLog::query(const std::string& trace_id) const {
  if (trace_id.empty()) {
    return events_;
  }

  const auto it = by_trace_.find(trace_id);
  if (it == by_trace_.end()) {
    return {};
  }
  std::vector<AuditEvent> trace;
  trace.reserve(it->second.size());
  for (const std::size_t pos : it->second) {
    trace.push_back(events_[pos]);
  }
  return trace;
}

std::vector<std::string> InMemoryAuditLog::list_trace_ids() const {
  std::vector<std::string> ids;
  ids.reserve(by_trace_.size());
  for (const auto& [trace_id, positions] : by_trace_) {
    ids.push_back(trace_id);
  }
  return ids;
}

}  // namespace stylegate::storage
