#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "marinedb/core/entities.hpp"
#include "marinedb/core/id.hpp"
#include "marinedb/core/result.hpp"
#include "marinedb/core/species_service.hpp"
#include "marinedb/core/taxonomy_service.hpp"

namespace marinedb::core {

enum class Operation : std::uint8_t {
  kAddTaxonomy = 0,
  kGetTaxonomy = 1,
  kGetAllTaxonomy = 2,
  kUpdateTaxonomy = 3,
  kDeleteTaxonomy = 4,
  kAddMarineSpecie = 5,
  kGetMarineSpecie = 6,
  kGetAllMarineSpecie = 7,
  kGetMarineSpecieByConservationStatus = 8,
  kUpdateMarineSpecie = 9,
  kDeleteMarineSpecie = 10,
};

constexpr std::size_t kOperationCount = 11;

[[nodiscard]] const std::array<Operation, kOperationCount>& all_operations();
[[nodiscard]] std::string_view operation_name(Operation operation);
[[nodiscard]] std::optional<Operation> parse_operation(std::string_view name);
// Queries never mutate a store.
[[nodiscard]] bool is_query(Operation operation);

// External call surface. Each call maps onto exactly one service call.
class CallDispatcher {
 public:
  CallDispatcher(TaxonomyService& taxonomy, SpeciesService& species) : taxonomy_(taxonomy), species_(species) {}

  Result<Taxonomy> add_taxonomy(const TaxonomyPayload& payload);
  [[nodiscard]] Result<Taxonomy> get_taxonomy(ObjectId id) const;
  [[nodiscard]] Result<std::vector<Taxonomy>> get_all_taxonomy() const;
  Result<Taxonomy> update_taxonomy(ObjectId id, const TaxonomyPayload& payload);
  Result<Taxonomy> delete_taxonomy(ObjectId id);

  Result<MarineSpecie> add_marinespecie(const MarineSpeciePayload& payload);
  [[nodiscard]] Result<MarineSpecie> get_marinespecie(ObjectId id) const;
  [[nodiscard]] Result<std::vector<MarineSpecie>> get_all_marinespecie() const;
  [[nodiscard]] Result<std::vector<MarineSpecie>> get_marinespecie_by_conservation_status(
      std::string_view conservation_status) const;
  Result<MarineSpecie> update_marinespecie(ObjectId id, const MarineSpeciePayload& payload);
  Result<MarineSpecie> delete_marinespecie(ObjectId id);

 private:
  TaxonomyService& taxonomy_;
  SpeciesService& species_;
};

}  // namespace marinedb::core
