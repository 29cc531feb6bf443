#include "marinedb/core/result.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>
#include <vector>

namespace marinedb::core {

ErrorKind kind_of(const Error& error) {
  switch (error.index()) {
  case 0:
    return ErrorKind::kValidationFailed;
  case 1:
    return ErrorKind::kInvalidInput;
  case 2:
    return ErrorKind::kNotFound;
  default:
    break;
  }
  throw std::bad_variant_access();
}

std::string_view error_kind_label(const Error& error) {
  switch (kind_of(error)) {
  case ErrorKind::kValidationFailed:
    return "ValidationFailed";
  case ErrorKind::kInvalidInput:
    return "InvalidInput";
  case ErrorKind::kNotFound:
    return "NotFound";
  }
  return "Unknown";
}

std::string describe(const Error& error) {
  return std::visit(
      [](const auto& alternative) -> std::string {
        using T = std::decay_t<decltype(alternative)>;
        if constexpr (std::is_same_v<T, ValidationFailed>) {
          return "ValidationFailed: " + alternative.content;
        } else if constexpr (std::is_same_v<T, NotFound>) {
          return "NotFound: " + alternative.msg;
        } else {
          return "InvalidInput";
        }
      },
      error);
}

ValidationFailed empty_fields_error(const std::vector<std::string_view>& field_names) {
  std::string content = "required field(s) empty: ";
  for (std::size_t i = 0; i < field_names.size(); ++i) {
    if (i > 0) {
      content += ", ";
    }
    content += field_names[i];
  }
  return {content};
}

} // namespace marinedb::core
