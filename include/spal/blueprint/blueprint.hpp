#pragma once

#include <spal/schema/script_artifact.hpp>
#include <istream>
#include <optional>
#include <string_view>

namespace spal::blueprint {

/// Title the Aiken build gives the policy enforcer's spend handler.
inline constexpr auto kDefaultValidatorTitle = std::string_view{"spal.spal.spend"};

/// Read a CIP-57 blueprint (`plutus.json`) and extract one validator.
///
/// Returns std::nullopt, logging the cause, when the document is not valid
/// JSON, no validator carries `title`, or its `compiledCode`/`hash` fields
/// are missing or not hex (the hash must be 28 bytes).
std::optional<spal::schema::script_artifact_t> parse(
    std::istream& input,
    std::string_view title = kDefaultValidatorTitle);

std::optional<spal::schema::script_artifact_t> load(
    std::string_view path,
    std::string_view title = kDefaultValidatorTitle);

}  // namespace spal::blueprint
