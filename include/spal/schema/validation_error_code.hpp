#pragma once

#include <spal/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <string_view>

// Reasons the off-chain mirror rejects a request, in evaluation order.
namespace spal::schema {

enum class validation_error_code : uint32_t {
  ephemeral_identity_required = 1,
  insufficient_payment = 2,
  proof_reference_required = 3,
};

template <>
struct enum_names<validation_error_code> final {
  static constexpr auto kNames = std::array{
      enum_name_t<validation_error_code>{
          "ephemeral_identity_required",
          validation_error_code::ephemeral_identity_required},
      enum_name_t<validation_error_code>{
          "insufficient_payment", validation_error_code::insufficient_payment},
      enum_name_t<validation_error_code>{
          "proof_reference_required",
          validation_error_code::proof_reference_required},
  };
};

inline constexpr std::string_view to_string(const validation_error_code value) {
  return name_of(value);
}

}  // namespace spal::schema
