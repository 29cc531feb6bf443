#include "marinedb/core/entities.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace marinedb::core {

namespace {

struct NamedField {
  std::string_view name;
  const std::string* value;
};

template <std::size_t N> std::vector<std::string_view> collect_empty(const NamedField (&fields)[N]) {
  std::vector<std::string_view> empty;
  for (const NamedField& field : fields) {
    if (field.value->empty()) {
      empty.push_back(field.name);
    }
  }
  return empty;
}

template <typename TTaxonomyLike> std::vector<std::string_view> empty_taxonomy_fields(const TTaxonomyLike& value) {
  const NamedField fields[] = {
      {"kingdom", &value.kingdom}, {"phylum", &value.phylum}, {"class", &value.class_name},
      {"order", &value.order},     {"family", &value.family}, {"genus", &value.genus},
      {"species", &value.species},
  };
  return collect_empty(fields);
}

template <typename TSpecieLike> std::vector<std::string_view> empty_specie_fields(const TSpecieLike& value) {
  const NamedField fields[] = {
      {"name", &value.name},
      {"habitat", &value.habitat},
      {"conservation_status", &value.conservation_status},
  };
  return collect_empty(fields);
}

} // namespace

std::vector<std::string_view> empty_required_fields(const TaxonomyPayload& payload) {
  return empty_taxonomy_fields(payload);
}

std::vector<std::string_view> empty_required_fields(const MarineSpeciePayload& payload) {
  return empty_specie_fields(payload);
}

std::vector<std::string_view> empty_required_fields(const Taxonomy& taxonomy) {
  return empty_taxonomy_fields(taxonomy);
}

std::vector<std::string_view> empty_required_fields(const MarineSpecie& specie) {
  return empty_specie_fields(specie);
}

void apply_payload(Taxonomy& taxonomy, const TaxonomyPayload& payload) {
  taxonomy.kingdom = payload.kingdom;
  taxonomy.phylum = payload.phylum;
  taxonomy.class_name = payload.class_name;
  taxonomy.order = payload.order;
  taxonomy.family = payload.family;
  taxonomy.genus = payload.genus;
  taxonomy.species = payload.species;
}

void apply_payload(MarineSpecie& specie, const MarineSpeciePayload& payload) {
  specie.taxonomy_id = payload.taxonomy_id;
  specie.name = payload.name;
  specie.habitat = payload.habitat;
  specie.conservation_status = payload.conservation_status;
}

std::string display_id(const Taxonomy& taxonomy) { return make_display_id(kTaxonomyDisplayPrefix, taxonomy.id); }

std::string display_id(const MarineSpecie& specie) {
  return make_display_id(kMarineSpecieDisplayPrefix, specie.id);
}

} // namespace marinedb::core
