#include "stylegate/core/clock.h"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace stylegate::core {

std::string format_iso8601_utc(const std::chrono::system_clock::time_point at) {
  const std::time_t seconds = std::chrono::system_clock::to_time_t(at);
  std::tm utc{};
  gmtime_r(&seconds, &utc);

  std::ostringstream out;
  out << std::put_time(&utc, "%Y-%m-%dT%H:%M:%SZ");
  return out.str();
}

}  // namespace stylegate::core
