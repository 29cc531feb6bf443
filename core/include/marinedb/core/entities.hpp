#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "marinedb/core/id.hpp"

namespace marinedb::core {

constexpr std::string_view kTaxonomyDisplayPrefix = "TX";
constexpr std::string_view kMarineSpecieDisplayPrefix = "MS";

struct TaxonomyPayload {
  std::string kingdom{};
  std::string phylum{};
  std::string class_name{};
  std::string order{};
  std::string family{};
  std::string genus{};
  std::string species{};
};

struct Taxonomy {
  ObjectId id = kInvalidObjectId;
  std::string kingdom{};
  std::string phylum{};
  std::string class_name{};
  std::string order{};
  std::string family{};
  std::string genus{};
  std::string species{};
  Timestamp created_at = 0;
  std::optional<Timestamp> updated_at{};
};

struct MarineSpeciePayload {
  ObjectId taxonomy_id = kInvalidObjectId;
  std::string name{};
  std::string habitat{};
  // e.g. Extinct, Critically Endangered, Endangered, Vulnerable, Least Concern.
  std::string conservation_status{};
};

struct MarineSpecie {
  ObjectId id = kInvalidObjectId;
  ObjectId taxonomy_id = kInvalidObjectId;
  std::string name{};
  std::string habitat{};
  std::string conservation_status{};
  Timestamp created_at = 0;
  std::optional<Timestamp> updated_at{};
};

// Names of required text fields that are empty, in declaration order.
// Field names are the external names ("class", not "class_name").
[[nodiscard]] std::vector<std::string_view> empty_required_fields(const TaxonomyPayload& payload);
[[nodiscard]] std::vector<std::string_view> empty_required_fields(const MarineSpeciePayload& payload);
[[nodiscard]] std::vector<std::string_view> empty_required_fields(const Taxonomy& taxonomy);
[[nodiscard]] std::vector<std::string_view> empty_required_fields(const MarineSpecie& specie);

void apply_payload(Taxonomy& taxonomy, const TaxonomyPayload& payload);
void apply_payload(MarineSpecie& specie, const MarineSpeciePayload& payload);

[[nodiscard]] std::string display_id(const Taxonomy& taxonomy);
[[nodiscard]] std::string display_id(const MarineSpecie& specie);

}  // namespace marinedb::core
