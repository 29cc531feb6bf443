#include "marinedb/core/registry.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace marinedb::core {

namespace {

struct DemoSpecie {
  std::size_t taxonomy_index;
  const char* name;
  const char* habitat;
  const char* conservation_status;
};

template <typename TRecord>
void validate_common(const RecordStore<TRecord>& store, RecordKind kind, ValidationResult& result) {
  for (const TRecord& record : store.items()) {
    if (record.id == kInvalidObjectId || record.id >= store.peek_next_id()) {
      result.issues.push_back({ValidationSeverity::kError, "IdOutOfRange",
                               std::string(store.label()) + " id was never issued by its store", kind, record.id});
    }
    if (record.updated_at.has_value() && *record.updated_at < record.created_at) {
      result.issues.push_back(
          {ValidationSeverity::kError, "TimestampOrder", "updated_at is earlier than created_at", kind, record.id});
    }
    const auto empty = empty_required_fields(record);
    if (!empty.empty()) {
      result.issues.push_back({ValidationSeverity::kError, "RequiredFieldEmpty",
                               empty_fields_error(empty).content, kind, record.id});
    }
  }
}

} // namespace

bool ValidationResult::has_errors() const {
  for (const ValidationIssue& issue : issues) {
    if (issue.severity == ValidationSeverity::kError) {
      return true;
    }
  }
  return false;
}

Registry::Registry()
    : taxonomies_("taxonomy", clock_),
      species_("marine specie", clock_),
      taxonomy_service_(taxonomies_),
      species_service_(species_, taxonomy_service_),
      dispatcher_(taxonomy_service_, species_service_) {}

ValidationResult Registry::Validate() const {
  ValidationResult result;
  validate_common(taxonomies_, RecordKind::kTaxonomy, result);
  validate_common(species_, RecordKind::kMarineSpecie, result);

  // References are checked at write time only; a later taxonomy delete is
  // reported but never treated as an error.
  for (const MarineSpecie& specie : species_.items()) {
    if (!taxonomies_.contains(specie.taxonomy_id)) {
      result.issues.push_back({
          ValidationSeverity::kWarning,
          "TaxonomyReferenceDangling",
          "taxonomy id=" + std::to_string(specie.taxonomy_id) + " no longer exists",
          RecordKind::kMarineSpecie,
          specie.id,
      });
    }
  }
  return result;
}

bool SeedDemoRecords(Registry& registry, std::string* error_message) {
  const TaxonomyPayload taxonomies[] = {
      {"Animalia", "Chordata", "Actinopterygii", "Perciformes", "Pomacentridae", "Amphiprion", "ocellaris"},
      {"Animalia", "Chordata", "Reptilia", "Testudines", "Cheloniidae", "Chelonia", "mydas"},
      {"Animalia", "Cnidaria", "Anthozoa", "Scleractinia", "Acroporidae", "Acropora", "palmata"},
      {"Animalia", "Chordata", "Chondrichthyes", "Orectolobiformes", "Rhincodontidae", "Rhincodon", "typus"},
  };
  const DemoSpecie species[] = {
      {0, "Clownfish", "Reef", "Least Concern"},
      {1, "Green Sea Turtle", "Coastal seagrass", "Endangered"},
      {2, "Elkhorn Coral", "Shallow reef", "Critically Endangered"},
      {3, "Whale Shark", "Open ocean", "Endangered"},
  };

  CallDispatcher& dispatcher = registry.dispatcher();
  std::vector<ObjectId> taxonomy_ids;
  for (const TaxonomyPayload& payload : taxonomies) {
    const auto result = dispatcher.add_taxonomy(payload);
    if (!result.ok()) {
      if (error_message != nullptr) {
        *error_message = describe(result.error());
      }
      return false;
    }
    taxonomy_ids.push_back(result.value().id);
  }

  for (const DemoSpecie& demo : species) {
    const auto result = dispatcher.add_marinespecie(
        {taxonomy_ids[demo.taxonomy_index], demo.name, demo.habitat, demo.conservation_status});
    if (!result.ok()) {
      if (error_message != nullptr) {
        *error_message = describe(result.error());
      }
      return false;
    }
  }
  return true;
}

} // namespace marinedb::core
