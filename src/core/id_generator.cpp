#include "stylegate/core/id_generator.h"

#include <chrono>

namespace stylegate::core {

namespace {

std::string with_prefix(std::string_view prefix, const std::string& body) {
  std::string id(prefix);
  id += '-';
  id += body;
  return id;
}

}  // namespace

std::string SystemIdGenerator::next(std::string_view prefix) {
  const auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
  const auto micros = std::chrono::duration_cast<std::chrono::microseconds>(since_epoch).count();
  const auto n = sequence_.fetch_add(1, std::memory_order_relaxed);
  return with_prefix(prefix, std::to_string(micros) + "-" + std::to_string(n));
}

std::string DeterministicIdGenerator::next(std::string_view prefix) {
  return with_prefix(prefix, std::to_string(sequence_++));
}

}  // namespace stylegate::core
