#include <algorithm>
#include <cstddef>
#include <functional>
#include <iostream>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "marinedb/core/registry.hpp"

namespace {

using marinedb::core::CallDispatcher;
using marinedb::core::ErrorKind;
using marinedb::core::LogicalClock;
using marinedb::core::MarineSpecie;
using marinedb::core::MarineSpeciePayload;
using marinedb::core::ObjectId;
using marinedb::core::Operation;
using marinedb::core::RecordStore;
using marinedb::core::Registry;
using marinedb::core::Taxonomy;
using marinedb::core::TaxonomyPayload;
using marinedb::core::ValidationSeverity;

struct TestCase {
  const char* name;
  const char* intent;
  std::function<bool(void)> run;
};

TaxonomyPayload clownfish_taxonomy() {
  return {"Animalia", "Chordata", "Actinopterygii", "Perciformes", "Pomacentridae", "Amphiprion", "ocellaris"};
}

TaxonomyPayload turtle_taxonomy() {
  return {"Animalia", "Chordata", "Reptilia", "Testudines", "Cheloniidae", "Chelonia", "mydas"};
}

MarineSpeciePayload specie_payload(ObjectId taxonomy_id, const std::string& name, const std::string& status) {
  return {taxonomy_id, name, "Reef", status};
}

bool contains_id(const std::vector<MarineSpecie>& species, ObjectId id) {
  return std::any_of(species.begin(), species.end(), [id](const MarineSpecie& s) { return s.id == id; });
}

bool has_issue_code(const marinedb::core::ValidationResult& validation, const std::string& code) {
  for (const auto& issue : validation.issues) {
    if (issue.code == code) {
      return true;
    }
  }
  return false;
}

bool starts_with(const std::string& value, const std::string& prefix) { return value.rfind(prefix, 0) == 0; }

// Intent: ids keep increasing after deletes and are never handed out again.
bool test_store_ids_monotonic_after_delete() {
  LogicalClock clock;
  RecordStore<Taxonomy> store("taxonomy", clock);
  const ObjectId a = store.insert({}).id;
  const ObjectId b = store.insert({}).id;
  if (a != 1 || b != 2) {
    return false;
  }
  if (!store.remove(b).ok()) {
    return false;
  }
  const ObjectId c = store.insert({}).id;
  return c == 3 && !store.contains(b) && store.size() == 2;
}

// Intent: insert stamps created_at and clears any caller supplied updated_at.
bool test_store_insert_sets_timestamps() {
  LogicalClock clock;
  RecordStore<Taxonomy> store("taxonomy", clock);
  Taxonomy draft{};
  draft.id = 77;
  draft.created_at = 500;
  draft.updated_at = 600;
  const Taxonomy stored = store.insert(draft);
  return stored.id == 1 && stored.created_at == clock.now() && !stored.updated_at.has_value();
}

// Intent: update keeps id and created_at even if the mutator touches them.
bool test_store_update_preserves_identity() {
  LogicalClock clock;
  RecordStore<Taxonomy> store("taxonomy", clock);
  const Taxonomy stored = store.insert({});
  const auto updated = store.update(stored.id, [](Taxonomy& t) {
    t.id = 999;
    t.created_at = 0;
    t.kingdom = "Plantae";
  });
  if (!updated.ok()) {
    return false;
  }
  const Taxonomy* found = store.find(stored.id);
  return found != nullptr && found->kingdom == "Plantae" && updated.value().id == stored.id &&
         updated.value().created_at == stored.created_at && updated.value().updated_at.has_value() &&
         *updated.value().updated_at > stored.created_at && !store.contains(999);
}

// Intent: missing ids surface as NotFound naming the entity kind.
bool test_store_missing_id_not_found() {
  LogicalClock clock;
  RecordStore<MarineSpecie> store("marine specie", clock);
  const auto got = store.get(5);
  const auto removed = store.remove(5);
  const auto updated = store.update(5, [](MarineSpecie&) {});
  if (!got.has_error(ErrorKind::kNotFound) || !removed.has_error(ErrorKind::kNotFound) ||
      !updated.has_error(ErrorKind::kNotFound)) {
    return false;
  }
  const auto& not_found = std::get<marinedb::core::NotFound>(got.error());
  return not_found.msg == "marine specie with id=5 not found" && store.peek_next_id() == 1;
}

// Intent: removal swaps the tail into the hole and keeps lookups consistent.
bool test_store_remove_keeps_index_consistent() {
  LogicalClock clock;
  RecordStore<Taxonomy> store("taxonomy", clock);
  for (int i = 0; i < 4; ++i) {
    Taxonomy t{};
    t.genus = "g" + std::to_string(i);
    (void)store.insert(t);
  }
  const auto removed = store.remove(2);
  if (!removed.ok() || removed.value().genus != "g1") {
    return false;
  }
  for (ObjectId id : {ObjectId{1}, ObjectId{3}, ObjectId{4}}) {
    const Taxonomy* t = store.find(id);
    if (t == nullptr || t->genus != "g" + std::to_string(id - 1)) {
      return false;
    }
  }
  const auto evens = store.scan([](const Taxonomy& t) { return t.id % 2 == 0; });
  return evens.size() == 1 && evens.front().id == 4;
}

// Intent: a taxonomy with any empty field is rejected and nothing is stored.
bool test_add_taxonomy_empty_field_rejected() {
  Registry registry;
  TaxonomyPayload payload = clownfish_taxonomy();
  payload.class_name.clear();
  payload.genus.clear();
  const auto result = registry.dispatcher().add_taxonomy(payload);
  if (!result.has_error(ErrorKind::kValidationFailed)) {
    return false;
  }
  const auto& failed = std::get<marinedb::core::ValidationFailed>(result.error());
  return failed.content == "required field(s) empty: class, genus" && registry.taxonomies().empty() &&
         registry.taxonomies().peek_next_id() == 1;
}

// Intent: update_taxonomy validates before looking anything up or writing.
bool test_update_taxonomy_validates_and_stamps() {
  Registry registry;
  CallDispatcher& calls = registry.dispatcher();
  const Taxonomy created = calls.add_taxonomy(clownfish_taxonomy()).value();

  TaxonomyPayload bad = turtle_taxonomy();
  bad.kingdom.clear();
  if (!calls.update_taxonomy(created.id, bad).has_error(ErrorKind::kValidationFailed)) {
    return false;
  }
  if (calls.get_taxonomy(created.id).value().updated_at.has_value()) {
    return false;
  }
  if (!calls.update_taxonomy(42, turtle_taxonomy()).has_error(ErrorKind::kNotFound)) {
    return false;
  }

  const auto updated = calls.update_taxonomy(created.id, turtle_taxonomy());
  return updated.ok() && updated.value().class_name == "Reptilia" && updated.value().species == "mydas" &&
         updated.value().created_at == created.created_at && updated.value().updated_at.has_value() &&
         *updated.value().updated_at >= created.created_at;
}

// Intent: get after delete reports NotFound; delete returns the removed record.
bool test_delete_taxonomy_then_get_not_found() {
  Registry registry;
  CallDispatcher& calls = registry.dispatcher();
  const Taxonomy created = calls.add_taxonomy(clownfish_taxonomy()).value();
  const auto deleted = calls.delete_taxonomy(created.id);
  if (!deleted.ok() || deleted.value().genus != "Amphiprion") {
    return false;
  }
  return calls.get_taxonomy(created.id).has_error(ErrorKind::kNotFound) &&
         calls.delete_taxonomy(created.id).has_error(ErrorKind::kNotFound);
}

// Intent: a species pointing at a missing taxonomy is rejected without writing.
bool test_add_marinespecie_unknown_taxonomy_invalid_input() {
  Registry registry;
  CallDispatcher& calls = registry.dispatcher();
  (void)calls.add_taxonomy(clownfish_taxonomy());
  const auto result = calls.add_marinespecie(specie_payload(999, "Ghost", "Least Concern"));
  const auto zero = calls.add_marinespecie(specie_payload(0, "Ghost", "Least Concern"));
  return result.has_error(ErrorKind::kInvalidInput) && zero.has_error(ErrorKind::kInvalidInput) &&
         registry.species().empty() && registry.species().peek_next_id() == 1;
}

// Intent: empty species text fields fail validation before the reference check.
bool test_add_marinespecie_empty_field_rejected() {
  Registry registry;
  CallDispatcher& calls = registry.dispatcher();
  MarineSpeciePayload payload = specie_payload(999, "Clownfish", "");
  payload.habitat.clear();
  const auto result = calls.add_marinespecie(payload);
  if (!result.has_error(ErrorKind::kValidationFailed)) {
    return false;
  }
  const auto& failed = std::get<marinedb::core::ValidationFailed>(result.error());
  return failed.content == "required field(s) empty: habitat, conservation_status" && registry.species().empty();
}

// Intent: update_marinespecie rewrites every payload field and stamps updated_at.
bool test_update_marinespecie_reflects_payload() {
  Registry registry;
  CallDispatcher& calls = registry.dispatcher();
  const ObjectId fish_tx = calls.add_taxonomy(clownfish_taxonomy()).value().id;
  const ObjectId turtle_tx = calls.add_taxonomy(turtle_taxonomy()).value().id;
  const MarineSpecie created = calls.add_marinespecie(specie_payload(fish_tx, "Clownfish", "Least Concern")).value();

  const MarineSpeciePayload payload{turtle_tx, "Green Sea Turtle", "Seagrass", "Endangered"};
  const auto updated = calls.update_marinespecie(created.id, payload);
  if (!updated.ok()) {
    return false;
  }
  const MarineSpecie& s = updated.value();
  const MarineSpecie stored = calls.get_marinespecie(created.id).value();
  return s.taxonomy_id == turtle_tx && s.name == "Green Sea Turtle" && s.habitat == "Seagrass" &&
         s.conservation_status == "Endangered" && s.updated_at.has_value() && *s.updated_at >= s.created_at &&
         s.created_at == created.created_at && stored.name == s.name && stored.updated_at == s.updated_at;
}

// Intent: update_marinespecie reports NotFound before checking the reference, and
// a dangling reference leaves the record unchanged.
bool test_update_marinespecie_failure_order() {
  Registry registry;
  CallDispatcher& calls = registry.dispatcher();
  const ObjectId tx = calls.add_taxonomy(clownfish_taxonomy()).value().id;
  const MarineSpecie created = calls.add_marinespecie(specie_payload(tx, "Clownfish", "Least Concern")).value();

  if (!calls.update_marinespecie(50, specie_payload(999, "X", "Y")).has_error(ErrorKind::kNotFound)) {
    return false;
  }
  if (!calls.update_marinespecie(created.id, specie_payload(999, "X", "Y")).has_error(ErrorKind::kInvalidInput)) {
    return false;
  }
  const MarineSpecie stored = calls.get_marinespecie(created.id).value();
  return stored.name == "Clownfish" && stored.taxonomy_id == tx && !stored.updated_at.has_value();
}

// Intent: update_marinespecie checks fields before existence and the reference.
bool test_update_marinespecie_empty_field_rejected() {
  Registry registry;
  CallDispatcher& calls = registry.dispatcher();
  const ObjectId tx = calls.add_taxonomy(clownfish_taxonomy()).value().id;
  const MarineSpecie created = calls.add_marinespecie(specie_payload(tx, "Clownfish", "Least Concern")).value();

  const auto existing = calls.update_marinespecie(created.id, specie_payload(999, "", "Least Concern"));
  if (!existing.has_error(ErrorKind::kValidationFailed)) {
    return false;
  }
  const auto& failed = std::get<marinedb::core::ValidationFailed>(existing.error());
  if (failed.content != "required field(s) empty: name") {
    return false;
  }
  if (!calls.update_marinespecie(77, specie_payload(tx, "", "Least Concern")).has_error(ErrorKind::kValidationFailed)) {
    return false;
  }
  const MarineSpecie stored = calls.get_marinespecie(created.id).value();
  return stored.name == "Clownfish" && stored.taxonomy_id == tx && !stored.updated_at.has_value();
}

// Intent: delete_marinespecie returns the record once, then reports NotFound.
bool test_delete_marinespecie_then_not_found() {
  Registry registry;
  CallDispatcher& calls = registry.dispatcher();
  const ObjectId tx = calls.add_taxonomy(clownfish_taxonomy()).value().id;
  const ObjectId id = calls.add_marinespecie(specie_payload(tx, "Clownfish", "Least Concern")).value().id;
  const auto deleted = calls.delete_marinespecie(id);
  if (!deleted.ok() || deleted.value().name != "Clownfish") {
    return false;
  }
  return calls.get_marinespecie(id).has_error(ErrorKind::kNotFound) &&
         calls.delete_marinespecie(id).has_error(ErrorKind::kNotFound) && registry.taxonomies().contains(tx) &&
         calls.add_marinespecie(specie_payload(tx, "Nemo", "Least Concern")).value().id == id + 1;
}

// Intent: status lookup matches exactly and an empty match is still ok.
bool test_get_by_conservation_status_exact_match() {
  Registry registry;
  CallDispatcher& calls = registry.dispatcher();
  const ObjectId tx = calls.add_taxonomy(clownfish_taxonomy()).value().id;
  const ObjectId a = calls.add_marinespecie(specie_payload(tx, "A", "Endangered")).value().id;
  const ObjectId b = calls.add_marinespecie(specie_payload(tx, "B", "Least Concern")).value().id;
  const ObjectId c = calls.add_marinespecie(specie_payload(tx, "C", "Endangered")).value().id;
  (void)calls.add_marinespecie(specie_payload(tx, "D", "Critically Endangered"));
  (void)calls.add_marinespecie(specie_payload(tx, "E", "endangered"));

  const auto endangered = calls.get_marinespecie_by_conservation_status("Endangered");
  if (!endangered.ok() || endangered.value().size() != 2) {
    return false;
  }
  if (!contains_id(endangered.value(), a) || !contains_id(endangered.value(), c) ||
      contains_id(endangered.value(), b)) {
    return false;
  }
  const auto extinct = calls.get_marinespecie_by_conservation_status("Extinct");
  return extinct.ok() && extinct.value().empty();
}

// Intent: get_all on empty stores is ok and lists every live record otherwise.
bool test_get_all_lists_live_records() {
  Registry registry;
  CallDispatcher& calls = registry.dispatcher();
  const auto empty_tx = calls.get_all_taxonomy();
  const auto empty_ms = calls.get_all_marinespecie();
  if (!empty_tx.ok() || !empty_tx.value().empty() || !empty_ms.ok() || !empty_ms.value().empty()) {
    return false;
  }
  const ObjectId a = calls.add_taxonomy(clownfish_taxonomy()).value().id;
  const ObjectId b = calls.add_taxonomy(turtle_taxonomy()).value().id;
  (void)calls.delete_taxonomy(a);
  const auto all = calls.get_all_taxonomy();
  return all.ok() && all.value().size() == 1 && all.value().front().id == b;
}

// Intent: end to end flow; deleting a taxonomy does not cascade to species.
bool test_scenario_no_cascade_delete() {
  Registry registry;
  CallDispatcher& calls = registry.dispatcher();
  const auto taxonomy = calls.add_taxonomy(clownfish_taxonomy());
  if (!taxonomy.ok() || taxonomy.value().id != 1) {
    return false;
  }
  const auto clownfish = calls.add_marinespecie({1, "Clownfish", "Reef", "Least Concern"});
  if (!clownfish.ok() || clownfish.value().id != 1) {
    return false;
  }
  if (!calls.add_marinespecie({999, "Clownfish", "Reef", "Least Concern"}).has_error(ErrorKind::kInvalidInput)) {
    return false;
  }
  if (!calls.delete_taxonomy(1).ok()) {
    return false;
  }
  const auto still_there = calls.get_marinespecie(1);
  return still_there.ok() && still_there.value().taxonomy_id == 1;
}

// Intent: species and taxonomy ids are counted independently.
bool test_stores_have_independent_counters() {
  Registry registry;
  CallDispatcher& calls = registry.dispatcher();
  const ObjectId t1 = calls.add_taxonomy(clownfish_taxonomy()).value().id;
  const ObjectId t2 = calls.add_taxonomy(turtle_taxonomy()).value().id;
  const ObjectId s1 = calls.add_marinespecie(specie_payload(t2, "Turtle", "Endangered")).value().id;
  return t1 == 1 && t2 == 2 && s1 == 1;
}

// Intent: Validate flags a dangling reference as a warning only.
bool test_validate_reports_dangling_reference_as_warning() {
  Registry registry;
  CallDispatcher& calls = registry.dispatcher();
  const ObjectId tx = calls.add_taxonomy(clownfish_taxonomy()).value().id;
  (void)calls.add_marinespecie(specie_payload(tx, "Clownfish", "Least Concern"));
  if (!registry.Validate().issues.empty()) {
    return false;
  }
  (void)calls.delete_taxonomy(tx);
  const auto validation = registry.Validate();
  return validation.ok() && has_issue_code(validation, "TaxonomyReferenceDangling") &&
         validation.issues.front().severity == ValidationSeverity::kWarning;
}

// Intent: demo seeding produces a consistent registry.
bool test_seed_demo_records_is_consistent() {
  Registry registry;
  std::string error;
  if (!marinedb::core::SeedDemoRecords(registry, &error)) {
    std::cerr << "seed failed: " << error << "\n";
    return false;
  }
  const auto endangered = registry.dispatcher().get_marinespecie_by_conservation_status("Endangered");
  return registry.taxonomies().size() == 4 && registry.species().size() == 4 && endangered.ok() &&
         endangered.value().size() == 2 && registry.Validate().issues.empty();
}

// Intent: operation catalogue names match the call surface and reads are queries.
bool test_operation_catalogue() {
  std::size_t queries = 0;
  for (Operation op : marinedb::core::all_operations()) {
    const auto parsed = marinedb::core::parse_operation(marinedb::core::operation_name(op));
    if (!parsed.has_value() || *parsed != op) {
      return false;
    }
    if (marinedb::core::is_query(op)) {
      ++queries;
    }
  }
  return queries == 5 && marinedb::core::is_query(Operation::kGetMarineSpecieByConservationStatus) &&
         !marinedb::core::is_query(Operation::kDeleteTaxonomy) &&
         marinedb::core::operation_name(Operation::kAddMarineSpecie) == "add_marinespecie" &&
         !marinedb::core::parse_operation("greet").has_value();
}

// Intent: errors render with their kind label for logs and clients.
bool test_error_description() {
  const marinedb::core::Error not_found = marinedb::core::NotFound{"taxonomy with id=3 not found"};
  const marinedb::core::Error invalid = marinedb::core::InvalidInput{};
  const marinedb::core::Error failed = marinedb::core::ValidationFailed{"required field(s) empty: name"};
  return marinedb::core::kind_of(failed) == ErrorKind::kValidationFailed &&
         marinedb::core::kind_of(not_found) == ErrorKind::kNotFound &&
         marinedb::core::error_kind_label(failed) == "ValidationFailed" &&
         marinedb::core::error_kind_label(not_found) == "NotFound" &&
         marinedb::core::describe(not_found) == "NotFound: taxonomy with id=3 not found" &&
         marinedb::core::describe(invalid) == "InvalidInput" &&
         marinedb::core::kind_of(invalid) == ErrorKind::kInvalidInput;
}

// Intent: display ids are prefixed per record kind and zero padded.
bool test_display_ids() {
  Taxonomy t{};
  t.id = 12;
  MarineSpecie s{};
  s.id = 3;
  return marinedb::core::display_id(t) == "TX-000012" && marinedb::core::display_id(s) == "MS-000003" &&
         starts_with(marinedb::core::make_display_id("TX", 1234567), "TX-1234567");
}

}  // namespace

int main() {
  const std::vector<TestCase> tests = {
      {"Store_Ids_MonotonicAfterDelete", "Ids strictly increase and are never reused", test_store_ids_monotonic_after_delete},
      {"Store_Insert_Timestamps", "Insert stamps created_at and clears updated_at", test_store_insert_sets_timestamps},
      {"Store_Update_PreservesIdentity", "Update keeps id/created_at and stamps updated_at", test_store_update_preserves_identity},
      {"Store_MissingId_NotFound", "Get/update/remove on missing id report NotFound", test_store_missing_id_not_found},
      {"Store_Remove_IndexConsistent", "Swap-remove keeps id lookups valid", test_store_remove_keeps_index_consistent},
      {"Taxonomy_Add_EmptyFieldRejected", "Empty taxonomy field fails without mutation", test_add_taxonomy_empty_field_rejected},
      {"Taxonomy_Update_ValidatesAndStamps", "update_taxonomy validates then stamps updated_at", test_update_taxonomy_validates_and_stamps},
      {"Taxonomy_Delete_ThenGetNotFound", "get after delete is NotFound", test_delete_taxonomy_then_get_not_found},
      {"Specie_Add_UnknownTaxonomy", "Unresolved taxonomy_id is InvalidInput without mutation", test_add_marinespecie_unknown_taxonomy_invalid_input},
      {"Specie_Add_EmptyFieldRejected", "Empty specie field fails validation", test_add_marinespecie_empty_field_rejected},
      {"Specie_Update_ReflectsPayload", "update_marinespecie rewrites fields and stamps time", test_update_marinespecie_reflects_payload},
      {"Specie_Update_FailureOrder", "NotFound before InvalidInput; failures leave record intact", test_update_marinespecie_failure_order},
      {"Specie_Update_EmptyFieldRejected", "Field validation runs before NotFound and InvalidInput", test_update_marinespecie_empty_field_rejected},
      {"Specie_Delete_ThenNotFound", "delete_marinespecie removes once and ids move on", test_delete_marinespecie_then_not_found},
      {"Specie_ByStatus_ExactMatch", "Status lookup is exact and empty result is ok", test_get_by_conservation_status_exact_match},
      {"Dispatcher_GetAll_LiveRecords", "get_all lists live records and is ok when empty", test_get_all_lists_live_records},
      {"Scenario_NoCascadeDelete", "Deleting taxonomy keeps dependent species", test_scenario_no_cascade_delete},
      {"Registry_IndependentCounters", "Each store issues its own ids", test_stores_have_independent_counters},
      {"Registry_Validate_DanglingWarning", "Dangling reference is a warning", test_validate_reports_dangling_reference_as_warning},
      {"Registry_SeedDemo_Consistent", "Demo seeding yields a valid registry", test_seed_demo_records_is_consistent},
      {"Dispatcher_OperationCatalogue", "Operation names round trip and reads are queries", test_operation_catalogue},
      {"Result_ErrorDescription", "Errors render with kind labels", test_error_description},
      {"Id_DisplayIds", "Display ids use per-kind prefixes", test_display_ids},
  };

  bool all_passed = true;
  for (const TestCase& test : tests) {
    const bool passed = test.run();
    std::cout << (passed ? "[PASS] " : "[FAIL] ") << test.name << " - " << test.intent << "\n";
    all_passed = all_passed && passed;
  }

  if (!all_passed) {
    std::cerr << "core tests failed\n";
    return 1;
  }

  std::cout << "core tests passed (" << tests.size() << " cases)\n";
  return 0;
}
