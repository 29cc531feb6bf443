#include "marinedb/core/taxonomy_service.hpp"

#include <optional>
#include <utility>
#include <vector>

namespace marinedb::core {

std::optional<Error> TaxonomyService::ValidatePayload(const TaxonomyPayload& payload) {
  const auto empty = empty_required_fields(payload);
  if (empty.empty()) {
    return std::nullopt;
  }
  return empty_fields_error(empty);
}

Result<Taxonomy> TaxonomyService::Add(const TaxonomyPayload& payload) {
  if (auto error = ValidatePayload(payload)) {
    return *error;
  }

  Taxonomy taxonomy{};
  apply_payload(taxonomy, payload);
  return store_.insert(std::move(taxonomy));
}

Result<Taxonomy> TaxonomyService::Get(ObjectId id) const { return store_.get(id); }

std::vector<Taxonomy> TaxonomyService::GetAll() const { return store_.items(); }

Result<Taxonomy> TaxonomyService::Update(ObjectId id, const TaxonomyPayload& payload) {
  if (auto error = ValidatePayload(payload)) {
    return *error;
  }
  return store_.update(id, [&payload](Taxonomy& taxonomy) { apply_payload(taxonomy, payload); });
}

Result<Taxonomy> TaxonomyService::Delete(ObjectId id) { return store_.remove(id); }

} // namespace marinedb::core
