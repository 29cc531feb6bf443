#pragma once

#include <optional>
#include <string_view>
#include <vector>

#include "marinedb/core/entities.hpp"
#include "marinedb/core/id.hpp"
#include "marinedb/core/record_store.hpp"
#include "marinedb/core/result.hpp"
#include "marinedb/core/taxonomy_service.hpp"

namespace marinedb::core {

// Species writes are accepted only when taxonomy_id resolves at write time.
// Nothing re-checks the reference later; deleting a taxonomy leaves its
// species untouched.
class SpeciesService {
 public:
  SpeciesService(RecordStore<MarineSpecie>& store, const TaxonomyService& taxonomy)
      : store_(store), taxonomy_(taxonomy) {}

  Result<MarineSpecie> Add(const MarineSpeciePayload& payload);
  [[nodiscard]] Result<MarineSpecie> Get(ObjectId id) const;
  [[nodiscard]] std::vector<MarineSpecie> GetAll() const;
  [[nodiscard]] std::vector<MarineSpecie> GetByConservationStatus(std::string_view conservation_status) const;
  Result<MarineSpecie> Update(ObjectId id, const MarineSpeciePayload& payload);
  Result<MarineSpecie> Delete(ObjectId id);

  [[nodiscard]] static std::optional<Error> ValidatePayload(const MarineSpeciePayload& payload);

 private:
  [[nodiscard]] std::optional<Error> check_taxonomy_reference(ObjectId taxonomy_id) const;

  RecordStore<MarineSpecie>& store_;
  const TaxonomyService& taxonomy_;
};

}  // namespace marinedb::core
