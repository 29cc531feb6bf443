#include "marinedb/core/dispatcher.hpp"

#include <array>
#include <cstddef>
#include <optional>
#include <string_view>
#include <vector>

namespace marinedb::core {

namespace {

struct OperationInfo {
  Operation operation;
  std::string_view name;
  bool query;
};

constexpr std::array<OperationInfo, kOperationCount> kOperationTable = {{
    {Operation::kAddTaxonomy, "add_taxonomy", false},
    {Operation::kGetTaxonomy, "get_taxonomy", true},
    {Operation::kGetAllTaxonomy, "get_all_taxonomy", true},
    {Operation::kUpdateTaxonomy, "update_taxonomy", false},
    {Operation::kDeleteTaxonomy, "delete_taxonomy", false},
    {Operation::kAddMarineSpecie, "add_marinespecie", false},
    {Operation::kGetMarineSpecie, "get_marinespecie", true},
    {Operation::kGetAllMarineSpecie, "get_all_marinespecie", true},
    {Operation::kGetMarineSpecieByConservationStatus, "get_marinespecie_by_conservation_status", true},
    {Operation::kUpdateMarineSpecie, "update_marinespecie", false},
    {Operation::kDeleteMarineSpecie, "delete_marinespecie", false},
}};

const OperationInfo& info_of(Operation operation) { return kOperationTable[static_cast<std::size_t>(operation)]; }

} // namespace

const std::array<Operation, kOperationCount>& all_operations() {
  static const std::array<Operation, kOperationCount> operations = [] {
    std::array<Operation, kOperationCount> out{};
    for (std::size_t i = 0; i < kOperationTable.size(); ++i) {
      out[i] = kOperationTable[i].operation;
    }
    return out;
  }();
  return operations;
}

std::string_view operation_name(Operation operation) { return info_of(operation).name; }

std::optional<Operation> parse_operation(std::string_view name) {
  for (const OperationInfo& info : kOperationTable) {
    if (info.name == name) {
      return info.operation;
    }
  }
  return std::nullopt;
}

bool is_query(Operation operation) { return info_of(operation).query; }

Result<Taxonomy> CallDispatcher::add_taxonomy(const TaxonomyPayload& payload) { return taxonomy_.Add(payload); }

Result<Taxonomy> CallDispatcher::get_taxonomy(ObjectId id) const { return taxonomy_.Get(id); }

Result<std::vector<Taxonomy>> CallDispatcher::get_all_taxonomy() const { return taxonomy_.GetAll(); }

Result<Taxonomy> CallDispatcher::update_taxonomy(ObjectId id, const TaxonomyPayload& payload) {
  return taxonomy_.Update(id, payload);
}

Result<Taxonomy> CallDispatcher::delete_taxonomy(ObjectId id) { return taxonomy_.Delete(id); }

Result<MarineSpecie> CallDispatcher::add_marinespecie(const MarineSpeciePayload& payload) {
  return species_.Add(payload);
}

Result<MarineSpecie> CallDispatcher::get_marinespecie(ObjectId id) const { return species_.Get(id); }

Result<std::vector<MarineSpecie>> CallDispatcher::get_all_marinespecie() const { return species_.GetAll(); }

Result<std::vector<MarineSpecie>>
CallDispatcher::get_marinespecie_by_conservation_status(std::string_view conservation_status) const {
  return species_.GetByConservationStatus(conservation_status);
}

Result<MarineSpecie> CallDispatcher::update_marinespecie(ObjectId id, const MarineSpeciePayload& payload) {
  return species_.Update(id, payload);
}

Result<MarineSpecie> CallDispatcher::delete_marinespecie(ObjectId id) { return species_.Delete(id); }

} // namespace marinedb::core
