#pragma once

#include <optional>
#include <vector>

#include "marinedb/core/entities.hpp"
#include "marinedb/core/id.hpp"
#include "marinedb/core/record_store.hpp"
#include "marinedb/core/result.hpp"

namespace marinedb::core {

class TaxonomyService {
 public:
  explicit TaxonomyService(RecordStore<Taxonomy>& store) : store_(store) {}

  Result<Taxonomy> Add(const TaxonomyPayload& payload);
  [[nodiscard]] Result<Taxonomy> Get(ObjectId id) const;
  [[nodiscard]] std::vector<Taxonomy> GetAll() const;
  Result<Taxonomy> Update(ObjectId id, const TaxonomyPayload& payload);
  Result<Taxonomy> Delete(ObjectId id);

  [[nodiscard]] static std::optional<Error> ValidatePayload(const TaxonomyPayload& payload);

 private:
  RecordStore<Taxonomy>& store_;
};

}  // namespace marinedb::core
