#pragma once

#include <string>
#include <vector>

namespace stylegate::storage {

// AuditEvent is one structured record of a pipeline stage. payload is serialized JSON.
struct AuditEvent {
  std::string event_id;
  std::string trace_id;
  std::string event_type;
  std::string payload;
  std::string created_at;
  std::vector<std::string> refs;  // Draft ids or item ids the event talks about

  bool operator==(const AuditEvent&) const = default;
};

namespace event_types {

inline constexpr const char* kRunStarted = "RunStarted";
inline constexpr const char* kWardrobeProfiled = "WardrobeProfiled";
inline constexpr const char* kCandidatesRanked = "CandidatesRanked";
inline constexpr const char* kOutfitsGrounded = "OutfitsGrounded";
inline constexpr const char* kRunCompleted = "RunCompleted";

}  // namespace event_types

}  // namespace stylegate::storage
