#include "marinedb/core/species_service.hpp"

#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace marinedb::core {

std::optional<Error> SpeciesService::ValidatePayload(const MarineSpeciePayload& payload) {
  const auto empty = empty_required_fields(payload);
  if (empty.empty()) {
    return std::nullopt;
  }
  return empty_fields_error(empty);
}

std::optional<Error> SpeciesService::check_taxonomy_reference(ObjectId taxonomy_id) const {
  if (!taxonomy_.Get(taxonomy_id).ok()) {
    return InvalidInput{};
  }
  return std::nullopt;
}

Result<MarineSpecie> SpeciesService::Add(const MarineSpeciePayload& payload) {
  if (auto error = ValidatePayload(payload)) {
    return *error;
  }
  if (auto error = check_taxonomy_reference(payload.taxonomy_id)) {
    return *error;
  }

  MarineSpecie specie{};
  apply_payload(specie, payload);
  return store_.insert(std::move(specie));
}

Result<MarineSpecie> SpeciesService::Get(ObjectId id) const { return store_.get(id); }

std::vector<MarineSpecie> SpeciesService::GetAll() const { return store_.items(); }

std::vector<MarineSpecie> SpeciesService::GetByConservationStatus(std::string_view conservation_status) const {
  return store_.scan(
      [conservation_status](const MarineSpecie& specie) { return specie.conservation_status == conservation_status; });
}

Result<MarineSpecie> SpeciesService::Update(ObjectId id, const MarineSpeciePayload& payload) {
  if (auto error = ValidatePayload(payload)) {
    return *error;
  }
  if (!store_.contains(id)) {
    return store_.get(id).error();
  }
  if (auto error = check_taxonomy_reference(payload.taxonomy_id)) {
    return *error;
  }
  return store_.update(id, [&payload](MarineSpecie& specie) { apply_payload(specie, payload); });
}

Result<MarineSpecie> SpeciesService::Delete(ObjectId id) { return store_.remove(id); }

} // namespace marinedb::core
