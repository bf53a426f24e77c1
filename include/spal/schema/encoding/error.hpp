#pragma once

#include <spal/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace spal::schema::encoding {

enum class decoding_error_kind : uint8_t {
  wrong_field_count = 0,
  wrong_constructor_shape = 1,
  type_mismatch = 2,
  invalid_boolean = 3,
  malformed_encoding = 4,  // byte level: truncated, trailing, unsupported
};

}  // namespace spal::schema::encoding

namespace spal::schema {

template <>
struct enum_names<encoding::decoding_error_kind> final {
  using kind = encoding::decoding_error_kind;
  static constexpr auto kNames = std::array{
      enum_name_t<kind>{"wrong_field_count", kind::wrong_field_count},
      enum_name_t<kind>{"wrong_constructor_shape",
                        kind::wrong_constructor_shape},
      enum_name_t<kind>{"type_mismatch", kind::type_mismatch},
      enum_name_t<kind>{"invalid_boolean", kind::invalid_boolean},
      enum_name_t<kind>{"malformed_encoding", kind::malformed_encoding},
  };
};

}  // namespace spal::schema

namespace spal::schema::encoding {

inline constexpr std::string_view to_string(const decoding_error_kind value) {
  return spal::schema::name_of(value);
}

/// Raised when a domain value cannot be represented on the wire. Only
/// reachable through a broken caller invariant (e.g. non UTF-8 text).
class encoding_error final : public std::logic_error {
 public:
  explicit encoding_error(const std::string& message)
      : std::logic_error{message} {}
};

/// Raised for malformed or adversarial datum/redeemer input. Callers reject
/// the offending output and carry on.
class decoding_error final : public std::runtime_error {
 public:
  decoding_error(const decoding_error_kind kind, const std::string& message)
      : std::runtime_error{std::string{to_string(kind)} + ": " + message},
        kind_{kind} {}

  decoding_error_kind kind() const noexcept { return kind_; }

 private:
  decoding_error_kind kind_;
};

}  // namespace spal::schema::encoding
