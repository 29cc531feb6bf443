#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace marinedb::core {

// A required text field was empty. content names the offending fields.
struct ValidationFailed {
  std::string content;
};

// A reference in the payload does not resolve.
struct InvalidInput {};

struct NotFound {
  std::string msg;
};

using Error = std::variant<ValidationFailed, InvalidInput, NotFound>;

enum class ErrorKind : std::uint8_t {
  kValidationFailed = 0,
  kInvalidInput = 1,
  kNotFound = 2,
};

[[nodiscard]] ErrorKind kind_of(const Error& error);
[[nodiscard]] std::string_view error_kind_label(const Error& error);
[[nodiscard]] std::string describe(const Error& error);

// "required field(s) empty: kingdom, order"
[[nodiscard]] ValidationFailed empty_fields_error(const std::vector<std::string_view>& field_names);

template <typename TValue>
class Result {
 public:
  Result(TValue value) : data_(std::in_place_index<0>, std::move(value)) {}
  Result(Error error) : data_(std::in_place_index<1>, std::move(error)) {}

  [[nodiscard]] bool ok() const { return data_.index() == 0; }

  [[nodiscard]] const TValue& value() const& { return std::get<0>(data_); }
  [[nodiscard]] TValue& value() & { return std::get<0>(data_); }
  [[nodiscard]] TValue&& value() && { return std::get<0>(std::move(data_)); }

  [[nodiscard]] const Error& error() const { return std::get<1>(data_); }

  [[nodiscard]] bool has_error(ErrorKind kind) const { return !ok() && kind_of(error()) == kind; }

 private:
  std::variant<TValue, Error> data_;
};

}  // namespace marinedb::core
