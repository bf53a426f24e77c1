#pragma once

#include <spal/schema/validation_error_code.hpp>
#include <cstdint>
#include <optional>
#include <string>

namespace spal::schema {

template <uint16_t Version>
struct validation_outcome;

template <>
struct validation_outcome<1> final {
  bool valid{};
  std::optional<validation_error_code> code;
  std::optional<std::string> reason;
};

using validation_outcome_t = validation_outcome<1>;

}  // namespace spal::schema
