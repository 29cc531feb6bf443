#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "marinedb/core/dispatcher.hpp"
#include "marinedb/core/entities.hpp"
#include "marinedb/core/id.hpp"
#include "marinedb/core/record_store.hpp"
#include "marinedb/core/species_service.hpp"
#include "marinedb/core/taxonomy_service.hpp"

namespace marinedb::core {

enum class ValidationSeverity : std::uint8_t {
  kError = 0,
  kWarning = 1,
};

enum class RecordKind : std::uint8_t {
  kTaxonomy = 0,
  kMarineSpecie = 1,
};

struct ValidationIssue {
  ValidationSeverity severity = ValidationSeverity::kError;
  std::string code{};
  std::string message{};
  RecordKind record_kind = RecordKind::kTaxonomy;
  ObjectId object_id = kInvalidObjectId;
};

struct ValidationResult {
  std::vector<ValidationIssue> issues;

  [[nodiscard]] bool has_errors() const;
  [[nodiscard]] bool ok() const { return !has_errors(); }
};

// Owns all service state for one process: the logical clock, both record
// stores, the services over them and the call surface. Services keep
// references into the stores, so a registry never moves.
class Registry {
 public:
  Registry();
  Registry(const Registry&) = delete;
  Registry& operator=(const Registry&) = delete;
  Registry(Registry&&) = delete;
  Registry& operator=(Registry&&) = delete;

  [[nodiscard]] CallDispatcher& dispatcher() { return dispatcher_; }
  [[nodiscard]] const CallDispatcher& dispatcher() const { return dispatcher_; }

  [[nodiscard]] const RecordStore<Taxonomy>& taxonomies() const { return taxonomies_; }
  [[nodiscard]] const RecordStore<MarineSpecie>& species() const { return species_; }
  [[nodiscard]] const LogicalClock& clock() const { return clock_; }

  [[nodiscard]] ValidationResult Validate() const;

 private:
  LogicalClock clock_{};
  RecordStore<Taxonomy> taxonomies_;
  RecordStore<MarineSpecie> species_;
  TaxonomyService taxonomy_service_;
  SpeciesService species_service_;
  CallDispatcher dispatcher_;
};

// Fills an empty registry with a handful of reef records for the browser.
[[nodiscard]] bool SeedDemoRecords(Registry& registry, std::string* error_message);

}  // namespace marinedb::core
