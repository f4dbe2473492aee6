#pragma once

namespace stylegate::core {

constexpr const char* kBuildVersion = "0.3.0";

// Highest schema_version row SqliteDb::ensure_audit_schema() writes.
constexpr int kAuditSchemaVersion = 1;

}  // namespace stylegate::core
