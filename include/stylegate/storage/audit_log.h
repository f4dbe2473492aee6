#pragma once

#include "stylegate/storage/audit_event.h"

#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace stylegate::storage {

// Sink for the audit trail of styling runs.
class IAuditLog {
 public:
  virtual ~IAuditLog() = default;
  virtual void append(const AuditEvent& event) = 0;
  // Events of one trace in append order. An empty trace_id returns every event.
  [[nodiscard]] virtual std::vector<AuditEvent> query(const std::string& trace_id) const = 0;
  // Sorted, without duplicates.
  [[nodiscard]] virtual std::vector<std::string> list_trace_ids() const = 0;
};

// Process-local audit log used when no database is configured.
class InMemoryAuditLog final : public IAuditLog {
 public:
  void append(const AuditEvent& event) override;
  [[nodiscard]] std::vector<AuditEvent> query(const std::string& trace_id) const override;
  [[nodiscard]] std::vector<std::string> list_trace_ids() const override;

  [[nodiscard]] std::size_t size() const { return events_.size(); }

 private:
  std::vector<AuditEvent> events_;
  // trace_id -> positions in events_
  std::map<std::string, std::vector<std::size_t>> by_trace_;
};

}  // namespace stylegate::storage
