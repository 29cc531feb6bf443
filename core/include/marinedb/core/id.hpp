#pragma once

#include <cstdint>
#include <iomanip>
#include <sstream>
#include <string>
#include <string_view>

namespace marinedb::core {

using ObjectId = std::uint64_t;
constexpr ObjectId kInvalidObjectId = 0;

using Timestamp = std::uint64_t;

// Per-store identifier counter. Issued ids are never handed out twice.
class IdGenerator {
 public:
  explicit IdGenerator(ObjectId next_id = 1) : next_id_(next_id) {}

  [[nodiscard]] ObjectId next() { return next_id_++; }

  [[nodiscard]] ObjectId peek() const { return next_id_; }

 private:
  ObjectId next_id_ = 1;
};

// Monotonic logical time shared by the stores of one registry.
class LogicalClock {
 public:
  explicit LogicalClock(Timestamp start = 1) : next_tick_(start) {}

  [[nodiscard]] Timestamp tick() { return next_tick_++; }

  [[nodiscard]] Timestamp now() const { return next_tick_ - 1; }

 private:
  Timestamp next_tick_ = 1;
};

inline std::string make_display_id(std::string_view prefix, ObjectId id, int pad_width = 6) {
  std::ostringstream oss;
  oss << prefix << "-" << std::setw(pad_width) << std::setfill('0') << id;
  return oss.str();
}

}  // namespace marinedb::core
