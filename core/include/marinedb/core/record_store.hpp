#pragma once

#include <concepts>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include "marinedb/core/id.hpp"
#include "marinedb/core/result.hpp"

namespace marinedb::core {

template <typename T>
concept StoredRecord = requires(T value) {
  { value.id } -> std::convertible_to<ObjectId>;
  { value.created_at } -> std::convertible_to<Timestamp>;
  { value.updated_at } -> std::convertible_to<std::optional<Timestamp>>;
};

// Keyed storage for one record type. Records live densely in a vector with an
// id -> slot index; removal moves the last record into the freed slot, so
// iteration order is not insertion order.
template <StoredRecord T>
class RecordStore {
 public:
  RecordStore(std::string_view label, LogicalClock& clock) : label_(label), clock_(&clock) {}

  [[nodiscard]] std::size_t size() const { return items_.size(); }

  [[nodiscard]] bool empty() const { return items_.empty(); }

  [[nodiscard]] bool contains(ObjectId id) const { return index_by_id_.contains(id); }

  [[nodiscard]] std::string_view label() const { return label_; }

  [[nodiscard]] ObjectId next_id() { return id_generator_.next(); }

  [[nodiscard]] ObjectId peek_next_id() const { return id_generator_.peek(); }

  [[nodiscard]] const T* find(ObjectId id) const {
    auto it = index_by_id_.find(id);
    if (it == index_by_id_.end()) {
      return nullptr;
    }
    return &items_[it->second];
  }

  [[nodiscard]] Result<T> get(ObjectId id) const {
    const T* record = find(id);
    if (record == nullptr) {
      return not_found(id);
    }
    return *record;
  }

  T insert(T record) {
    record.id = next_id();
    record.created_at = clock_->tick();
    record.updated_at.reset();
    items_.push_back(std::move(record));
    index_by_id_[items_.back().id] = items_.size() - 1;
    return items_.back();
  }

  // Applies mutate to the stored record. id and created_at survive whatever the
  // mutator does to them.
  template <typename Mutator>
  Result<T> update(ObjectId id, Mutator&& mutate) {
    auto it = index_by_id_.find(id);
    if (it == index_by_id_.end()) {
      return not_found(id);
    }

    T& record = items_[it->second];
    const Timestamp created_at = record.created_at;
    mutate(record);
    record.id = id;
    record.created_at = created_at;
    record.updated_at = clock_->tick();
    return record;
  }

  Result<T> remove(ObjectId id) {
    auto it = index_by_id_.find(id);
    if (it == index_by_id_.end()) {
      return not_found(id);
    }

    const std::size_t remove_index = it->second;
    const std::size_t last_index = items_.size() - 1;
    T removed = std::move(items_[remove_index]);

    if (remove_index != last_index) {
      items_[remove_index] = std::move(items_[last_index]);
      index_by_id_[items_[remove_index].id] = remove_index;
    }

    items_.pop_back();
    index_by_id_.erase(id);
    return removed;
  }

  template <typename Predicate>
  [[nodiscard]] std::vector<T> scan(Predicate&& predicate) const {
    std::vector<T> matches;
    for (const T& record : items_) {
      if (predicate(record)) {
        matches.push_back(record);
      }
    }
    return matches;
  }

  [[nodiscard]] const std::vector<T>& items() const { return items_; }

 private:
  [[nodiscard]] Error not_found(ObjectId id) const {
    return NotFound{label_ + " with id=" + std::to_string(id) + " not found"};
  }

  std::string label_;
  LogicalClock* clock_ = nullptr;
  IdGenerator id_generator_{};
  std::vector<T> items_;
  std::unordered_map<ObjectId, std::size_t> index_by_id_;
};

}  // namespace marinedb::core
